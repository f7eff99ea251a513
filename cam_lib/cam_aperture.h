//////////////////////////////////////////////////////////////////////

#pragma once

#include <map>
#include <set>
#include <string>

#include <fmt/format.h>

#include "cam_error.h"
#include "cam_util.h"

namespace cam_lib
{
    struct dxf_drawing;

    //////////////////////////////////////////////////////////////////////
    // every circle diameter and polyline width in the whole drawing
    // a polyline with no width contributes 0, which has no physical size
    // std::set so the codes come out in ascending diameter order

    std::set<double> measure_drawing(dxf_drawing const &drawing);

    //////////////////////////////////////////////////////////////////////
    // diameter <-> code, one per output file

    struct cam_aperture_table
    {
        int first_code{};
        int next_code{};

        std::map<double, int> codes;

        explicit cam_aperture_table(int first) : first_code(first), next_code(first)
        {
        }

        int define(double diameter);

        cam_error_code get_code(double diameter, int *code) const;

        size_t size() const
        {
            return codes.size();
        }

        std::string to_string() const
        {
            return fmt::format("APERTURE TABLE: FIRST: {}, COUNT: {}", first_code, codes.size());
        }
    };

}    // namespace cam_lib

CAM_MAKE_FORMATTER(cam_lib::cam_aperture_table);
