#pragma once

#include <cmath>

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////
    // snap x to the nearest multiple of 1/subdivisions, ties away from zero

    inline double quantize(double x, int subdivisions)
    {
        return std::round(x * subdivisions) / subdivisions;
    }

    //////////////////////////////////////////////////////////////////////

    inline double round_precise(double x, int precision)
    {
        double p = std::pow(10.0, precision);
        return std::round(x * p) / p;
    }

    //////////////////////////////////////////////////////////////////////
    // round up to `precision` decimal places, ignoring representation noise
    // (0.3 * 10 is 3.0000000000000004 which must not ceil to 4)

    inline double ceil_precise(double x, int precision)
    {
        double p = std::pow(10.0, precision);
        return std::ceil(round_precise(x * p, 9)) / p;
    }

}    // namespace cam_lib
