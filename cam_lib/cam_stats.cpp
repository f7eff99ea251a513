//////////////////////////////////////////////////////////////////////

#include "cam_stats.h"

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

    void cam_stats::cleanup()
    {
        *this = cam_stats{};
    }

    //////////////////////////////////////////////////////////////////////

    std::string cam_stats::to_string() const
    {
        return fmt::format("STATS: D01: {}, D02: {}, D03: {}, G36: {}, G37: {}, APERTURES: {}/{} selected, TOOLS: {}/{} selected, HITS: {}, "
                           "ZERO WIDTH: {}, AT ORIGIN: {}, DUPLICATES: {}, EMPTY: {}",
                           d1,
                           d2,
                           d3,
                           g36,
                           g37,
                           apertures_defined,
                           aperture_selects,
                           tools_defined,
                           tool_selects,
                           drill_hits,
                           zero_width_tracks,
                           origin_flashes,
                           duplicates_removed,
                           empty_polylines);
    }

}    // namespace cam_lib
