//////////////////////////////////////////////////////////////////////

#pragma once

#include <string>

#include <fmt/format.h>

#include "cam_util.h"

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////
    // what a writer emitted for one file

    struct cam_stats
    {
        int d1{};    // draws
        int d2{};    // moves
        int d3{};    // flashes
        int g36{};
        int g37{};
        int aperture_selects{};
        int apertures_defined{};

        int tools_defined{};
        int tool_selects{};
        int drill_hits{};

        int zero_width_tracks{};
        int origin_flashes{};
        int duplicates_removed{};
        int empty_polylines{};

        cam_stats() = default;

        void cleanup();

        std::string to_string() const;
    };

}    // namespace cam_lib

CAM_MAKE_FORMATTER(cam_lib::cam_stats);
