#pragma once

#include <list>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "cam_entity.h"
#include "cam_error.h"
#include "cam_reader.h"

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////
    // dxf_drawing is filled by parse_file() or parse_memory() and not
    // modified after that, everything downstream just reads it

    struct dxf_drawing
    {
        // coordinates and sizes are multiples of 1/subdivisions
        static constexpr int subdivisions = 8;

        std::string filename;

        std::vector<dxf_entity> circles;
        std::vector<dxf_entity> polylines;

        std::list<cam_error> errors;

        bool loaded{ false };

        dxf_drawing() = default;

        cam_error_code parse_file(char const *file_path);
        cam_error_code parse_memory(char const *data, size_t size);

        std::set<std::string> layer_names() const;

        std::vector<dxf_entity const *> circles_on_layer(std::string_view layer) const;
        std::vector<dxf_entity const *> polylines_on_layer(std::string_view layer) const;
        std::vector<dxf_entity const *> open_polylines_on_layer(std::string_view layer) const;
        std::vector<dxf_entity const *> closed_polylines_on_layer(std::string_view layer) const;

        cam_reader reader;

        void reset();

        cam_error_code do_parse();

        cam_error_code read_entity(dxf_entity *entity);
        cam_error_code read_circle();
        cam_error_code read_polyline();

        cam_error_code decode_field(dxf_entity *entity, int code, std::string_view value);

        template <typename... args> cam_error_code error(cam_error_code code, char const *format, args &&...arguments)
        {
            LOG_CONTEXT("error", debug);

            std::string error_msg = fmt::vformat(format, fmt::make_format_args(arguments...));

            std::string error_message =
                fmt::format("error {} ({}) at line {} of {}: {}", static_cast<int>(code), get_error_text(code), reader.line_number, reader.filename, error_msg);

            errors.emplace_back(code, error_message, reader.filename, reader.line_number);
            LOG_ERROR("{}", error_message);
            return code;
        }
    };

}    // namespace cam_lib
