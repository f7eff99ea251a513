#pragma once

#include <string>

#include <fmt/format.h>

#include "cam_util.h"

namespace cam_lib
{
    namespace cam_2d
    {
        //////////////////////////////////////////////////////////////////////

        struct vec2d
        {
            double x{};
            double y{};

            vec2d() = default;

            vec2d(double x, double y) : x(x), y(y)
            {
            }

            //////////////////////////////////////////////////////////////////////

            vec2d scale(double scale) const
            {
                return { x * scale, y * scale };
            }

            //////////////////////////////////////////////////////////////////////

            bool is_origin() const
            {
                return x == 0.0 && y == 0.0;
            }

            //////////////////////////////////////////////////////////////////////

            bool operator==(vec2d const &o) const
            {
                return x == o.x && y == o.y;
            }

            //////////////////////////////////////////////////////////////////////

            std::string to_string() const
            {
                return fmt::format("(X:{:g},Y:{:g})", x, y);
            }
        };
    }    // namespace cam_2d
}    // namespace cam_lib

CAM_MAKE_FORMATTER(cam_lib::cam_2d::vec2d);
