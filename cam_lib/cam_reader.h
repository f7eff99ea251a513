#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <fstream>

#include "cam_error.h"

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////
    // cam_reader hands out the input one line at a time, DXF being
    // a stream of alternating group code / value lines

    struct cam_reader
    {
        cam_reader() = default;

        cam_error_code open(char const *file_path);

        cam_error_code open(char const *data, size_t size);

        void close();

        bool eof() const;

        cam_error_code read_line(std::string_view *line);

        void skip_line();

        //////////////////////////////////////////////////////////////////////

        int line_number{};

        char const *file_data{ nullptr };
        size_t file_size{};
        size_t file_pos{};

        std::string filename;
        std::vector<char> file_buffer;
    };

    //////////////////////////////////////////////////////////////////////
    // value decoders, the argument should already be trimmed

    // decimal first, then hexadecimal
    bool parse_group_code(std::string_view text, int *code);

    bool parse_double(std::string_view text, double *value);

    bool parse_int(std::string_view text, int *value);

}    // namespace cam_lib
