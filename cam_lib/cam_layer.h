#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "cam_enums.h"
#include "cam_entity.h"
#include "cam_util.h"

namespace cam_lib
{
    struct dxf_drawing;

    //////////////////////////////////////////////////////////////////////
    // a layer role is one output file, e.g. ".gtl" <- "Top Copper", "Top"

    struct cam_layer_role
    {
        std::string extension;
        cam_output_kind output_kind{ output_kind_artwork };
        std::vector<std::string> aliases;

        std::string const &name() const
        {
            static std::string const unnamed{ "?" };
            return aliases.empty() ? unnamed : aliases.front();
        }

        std::string to_string() const
        {
            return fmt::format("LAYER ROLE {} ({}): {}", extension, output_kind, fmt::join(aliases, ", "));
        }
    };

    //////////////////////////////////////////////////////////////////////

    std::vector<cam_layer_role> default_layer_roles();

    //////////////////////////////////////////////////////////////////////
    // trim, lower case, spaces become underscores

    std::string normalize_layer_name(std::string_view name);

    bool layer_matches(std::string_view a, std::string_view b);

    //////////////////////////////////////////////////////////////////////
    // what an emitter needs from the drawing for one output file
    // entities are borrowed from the drawing

    struct cam_entities
    {
        std::vector<dxf_entity const *> tracks;     // open polylines
        std::vector<dxf_entity const *> regions;    // closed polylines
        std::vector<dxf_entity const *> circles;    // flashes or holes

        bool empty() const
        {
            return tracks.empty() && regions.empty() && circles.empty();
        }

        std::string to_string() const
        {
            return fmt::format("{} regions, {} tracks and {} circles", regions.size(), tracks.size(), circles.size());
        }
    };

    cam_entities classify_entities(dxf_drawing const &drawing, std::vector<std::string> const &aliases);

    //////////////////////////////////////////////////////////////////////
    // sort by X, then Y, then diameter and drop all but the first of
    // each run with the same X and Y

    std::vector<dxf_entity const *> sort_unique_points(std::vector<dxf_entity const *> const &points, int *duplicates_removed = nullptr);

}    // namespace cam_lib

CAM_MAKE_FORMATTER(cam_lib::cam_layer_role);
CAM_MAKE_FORMATTER(cam_lib::cam_entities);
