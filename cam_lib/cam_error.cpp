//////////////////////////////////////////////////////////////////////

#include "cam_error.h"
#include <map>

namespace
{
#undef CAM_ERROR_CODES
#undef CAM_ERROR_CODE
#define CAM_ERROR_CODE(a) { cam_lib::error_##a, #a },
#include "cam_error_codes.h"

    std::map<uint32_t, char const *> error_names_map = { { cam_lib::ok, "ok" }, CAM_ERROR_CODES };
}    // namespace

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

    char const *get_error_text(cam_error_code error_code)
    {
        auto f = error_names_map.find(static_cast<uint32_t>(error_code));
        if(f == error_names_map.end()) {
            return "?";
        }
        return f->second;
    }
}    // namespace cam_lib
