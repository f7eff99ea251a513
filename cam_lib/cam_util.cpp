//////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cctype>

#include "cam_util.h"

namespace cam_util
{
    //////////////////////////////////////////////////////////////////////

    std::string to_lowercase(std::string const &s)
    {
        std::string r = s;
        std::transform(r.begin(), r.end(), r.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        return r;
    }

    //////////////////////////////////////////////////////////////////////
    // trim is not locale-aware, ascii whitespace only

    std::string_view trim(std::string_view s)
    {
        constexpr std::string_view whitespace{ " \t\r\n\f\v" };
        size_t begin = s.find_first_not_of(whitespace);
        if(begin == std::string_view::npos) {
            return {};
        }
        size_t end = s.find_last_not_of(whitespace);
        return s.substr(begin, end - begin + 1);
    }

}    // namespace cam_util
