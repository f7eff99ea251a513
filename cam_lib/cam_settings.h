#pragma once

#include <string>

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////
    // output format options, each writer gets its own copy

    struct cam_settings
    {
        // Gerber coordinate format, FSLAX26Y26 by default
        int integer_digits{ 2 };
        int decimal_digits{ 6 };

        // applied to every coordinate and size written
        double scale{ 1.0 };

        // stands in for a missing line width
        double default_diameter{ 0.01 };

        int drill_decimal_places{ 2 };

        std::string title{ "cam_lib" };

        cam_settings() = default;
    };

}    // namespace cam_lib
