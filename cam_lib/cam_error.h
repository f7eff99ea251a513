//////////////////////////////////////////////////////////////////////

#pragma once

#include <cstdint>
#include <string>

#include "cam_log.h"

//////////////////////////////////////////////////////////////////////

namespace
{
    constexpr char const *get_file_name(char const *const path)
    {
        char const *start_position = path;
        for(char const *c = path; *c != '\0'; ++c) {
            if(*c == '\\' || *c == '/') {
                start_position = c;
            }
        }
        if(start_position != path) {
            ++start_position;
        }
        return start_position;
    }
}    // namespace

//////////////////////////////////////////////////////////////////////

#define CHECK(x)                                                                                                                      \
    do {                                                                                                                              \
        ::cam_lib::cam_error_code __error = (x);                                                                                      \
        if(__error != ::cam_lib::ok) {                                                                                                \
            LOG_ERROR("{}(error {}): `{}` (line {} of {})", ::cam_lib::get_error_text(__error), static_cast<int>(__error), #x, __LINE__, \
                      get_file_name(__FILE__));                                                                                       \
            return __error;                                                                                                           \
        }                                                                                                                             \
    } while(false)

//////////////////////////////////////////////////////////////////////

#define FAIL_IF(condition, error_code)                                                                                                              \
    do {                                                                                                                                            \
        if(condition) {                                                                                                                             \
            LOG_ERROR("{}(error {}) because `{}` (at line {} of {})", ::cam_lib::get_error_text(error_code), static_cast<int>(error_code), #condition, \
                      __LINE__, get_file_name(__FILE__));                                                                                           \
            return error_code;                                                                                                                      \
        }                                                                                                                                           \
    } while(false)

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

#undef CAM_ERROR_CODE
#undef CAM_ERROR_CODES
#define CAM_ERROR_CODE(a) error_##a,
#include "cam_error_codes.h"

    enum cam_error_code : uint32_t
    {
        ok,
        CAM_ERROR_CODES
    };

    char const *get_error_text(cam_error_code error_code);

    //////////////////////////////////////////////////////////////////////

    struct cam_error
    {
        cam_error_code error_code{};
        std::string message{};
        std::string filename{};
        int line_number{};

        cam_error() = default;

        cam_error(cam_error_code code, std::string const &msg, std::string const &file, int line)
            : error_code(code), message(msg), filename(file), line_number(line)
        {
        }
    };

}    // namespace cam_lib
