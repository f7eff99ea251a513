//////////////////////////////////////////////////////////////////////

#include <filesystem>
#include <charconv>
#include <cmath>
#include <cstring>
#include <cerrno>

#include "cam_error.h"
#include "cam_reader.h"

LOG_CONTEXT("line_reader", info);

namespace
{
    //////////////////////////////////////////////////////////////////////
    // from_chars won't take a leading '+'

    std::string_view skip_plus(std::string_view text)
    {
        if(!text.empty() && text[0] == '+') {
            text.remove_prefix(1);
        }
        return text;
    }

    //////////////////////////////////////////////////////////////////////

    template <typename T> bool parse_whole(std::string_view text, T *value, int base = 10)
    {
        if(text.empty()) {
            return false;
        }
        T result{};
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result, base);
        if(ec != std::errc{} || ptr != text.data() + text.size()) {
            return false;
        }
        *value = result;
        return true;
    }

}    // namespace

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

    cam_error_code cam_reader::open(char const *data, size_t size)
    {
        if(data == nullptr) {
            return error_invalid_parameter;
        }
        if(size == 0) {
            return error_empty_file;
        }
        file_buffer.clear();
        file_data = data;
        file_size = size;
        file_pos = 0;
        line_number = 0;
        filename = fmt::format("mem:{}:{}", static_cast<void const *>(file_data), file_size);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code cam_reader::open(char const *file_path)
    {
        if(file_path == nullptr) {
            return error_internal_bad_pointer;
        }

        std::error_code ec;

        if(!std::filesystem::exists(file_path, ec)) {
            return error_file_not_found;
        }

        if(!std::filesystem::is_regular_file(file_path, ec)) {
            return error_invalid_file_attributes;
        }

        size_t file_bytes = std::filesystem::file_size(file_path, ec);

        if(ec || file_bytes == 0) {
            return error_empty_file;
        }

        std::ifstream in_stream(file_path, std::ios::binary);

        if(!in_stream.is_open()) {
            LOG_ERROR("Error opening file {}: {}", file_path, std::strerror(errno));
            return error_cant_open_file;
        }

        file_buffer.clear();
        file_buffer.reserve(file_bytes);
        file_buffer.assign(std::istreambuf_iterator<char>(in_stream), std::istreambuf_iterator<char>());

        file_data = file_buffer.data();
        file_size = file_buffer.size();

        filename.assign(file_path);
        LOG_VERBOSE("Opened file {}, {} bytes available", filename, file_size);
        file_pos = 0;
        line_number = 0;
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    void cam_reader::close()
    {
        file_data = nullptr;
        file_size = 0;
        file_pos = 0;
        file_buffer.clear();
    }

    //////////////////////////////////////////////////////////////////////

    bool cam_reader::eof() const
    {
        return file_pos >= file_size;
    }

    //////////////////////////////////////////////////////////////////////
    // the line returned points into the file data and excludes the '\n'
    // it is not trimmed, a trailing '\r' is still there

    cam_error_code cam_reader::read_line(std::string_view *line)
    {
        if(line == nullptr) {
            return error_internal_bad_pointer;
        }
        if(eof()) {
            return error_end_of_file;
        }
        size_t start = file_pos;
        while(file_pos < file_size && file_data[file_pos] != '\n') {
            file_pos += 1;
        }
        *line = std::string_view(file_data + start, file_pos - start);
        if(file_pos < file_size) {
            file_pos += 1;
        }
        line_number += 1;
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    void cam_reader::skip_line()
    {
        std::string_view discard;
        if(read_line(&discard) == ok) {
            LOG_DEBUG("Skipped line {}: '{}'", line_number, discard);
        }
    }

    //////////////////////////////////////////////////////////////////////

    bool parse_group_code(std::string_view text, int *code)
    {
        if(parse_whole(skip_plus(text), code)) {
            return true;
        }

        // hexadecimal, with optional sign and 0x prefix
        bool negate = !text.empty() && text[0] == '-';
        if(negate || (!text.empty() && text[0] == '+')) {
            text.remove_prefix(1);
        }
        if(text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
            text.remove_prefix(2);
        }
        int value;
        if(!parse_whole(text, &value, 16)) {
            return false;
        }
        *code = negate ? -value : value;
        return true;
    }

    //////////////////////////////////////////////////////////////////////

    bool parse_double(std::string_view text, double *value)
    {
        text = skip_plus(text);
        if(text.empty()) {
            return false;
        }
        double result{};
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
        if(ec != std::errc{} || ptr != text.data() + text.size()) {
            return false;
        }
        // from_chars takes nan and inf
        if(!std::isfinite(result)) {
            return false;
        }
        *value = result;
        return true;
    }

    //////////////////////////////////////////////////////////////////////

    bool parse_int(std::string_view text, int *value)
    {
        return parse_whole(skip_plus(text), value);
    }

}    // namespace cam_lib
