//////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <iterator>

#include "cam_util.h"
#include "cam_drawing.h"
#include "cam_layer.h"

LOG_CONTEXT("layer", info);

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////
    // where 'artwork' becomes a Gerber file and 'drill' an Excellon file
    //
    // closed polylines -> filled areas of copper, open solder masks, filled overlay
    // open polylines -> tracks on the copper layer, lines on the overlay
    // circles -> circular flashes, or drilled holes on the drill layer

    std::vector<cam_layer_role> default_layer_roles()
    {
        return {
            { ".gbl", output_kind_artwork, { "Bottom Copper", "Bottom" } },
            { ".gbo", output_kind_artwork, { "Bottom Outlines", "Bottom Overlay" } },
            { ".gbs", output_kind_artwork, { "Bottom Soldermask" } },
            { ".gtl", output_kind_artwork, { "Top Copper", "Top" } },
            { ".gto", output_kind_artwork, { "Top Outlines", "Top Overlay" } },
            { ".gts", output_kind_artwork, { "Top Soldermask" } },
            { ".gdd", output_kind_drill, { "Drill" } },
            { ".gm1", output_kind_mechanical, { "Mechanical", "Cutout", "Cut Out" } },
        };
    }

    //////////////////////////////////////////////////////////////////////

    std::string normalize_layer_name(std::string_view name)
    {
        std::string result = cam_util::to_lowercase(std::string(cam_util::trim(name)));
        std::replace(result.begin(), result.end(), ' ', '_');
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    bool layer_matches(std::string_view a, std::string_view b)
    {
        return normalize_layer_name(a) == normalize_layer_name(b);
    }

    //////////////////////////////////////////////////////////////////////
    // grouped by alias, then drawing order within an alias
    // aliases which normalize to the same name only count once

    cam_entities classify_entities(dxf_drawing const &drawing, std::vector<std::string> const &aliases)
    {
        cam_entities result;

        std::vector<std::string> unique_aliases;
        std::vector<std::string> seen;
        for(auto const &layer : aliases) {
            std::string normalized = normalize_layer_name(layer);
            if(std::find(seen.begin(), seen.end(), normalized) == seen.end()) {
                seen.push_back(normalized);
                unique_aliases.push_back(layer);
            }
        }

        for(auto const &layer : unique_aliases) {
            auto tracks = drawing.open_polylines_on_layer(layer);
            result.tracks.insert(result.tracks.end(), tracks.begin(), tracks.end());
        }

        for(auto const &layer : unique_aliases) {
            auto regions = drawing.closed_polylines_on_layer(layer);
            result.regions.insert(result.regions.end(), regions.begin(), regions.end());
        }

        for(auto const &layer : unique_aliases) {
            auto circles = drawing.circles_on_layer(layer);
            result.circles.insert(result.circles.end(), circles.begin(), circles.end());
        }

        LOG_DEBUG("Layers [{}]: {}", fmt::join(aliases, ", "), result);
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<dxf_entity const *> sort_unique_points(std::vector<dxf_entity const *> const &points, int *duplicates_removed)
    {
        std::vector<dxf_entity const *> sorted(points);

        std::stable_sort(sorted.begin(), sorted.end(), [](dxf_entity const *a, dxf_entity const *b) {
            cam_2d::vec2d pa = a->position();
            cam_2d::vec2d pb = b->position();
            if(pa.x != pb.x) {
                return pa.x < pb.x;
            }
            if(pa.y != pb.y) {
                return pa.y < pb.y;
            }
            return a->diameter.value_or(0.0) < b->diameter.value_or(0.0);
        });

        auto last = std::unique(sorted.begin(), sorted.end(), [](dxf_entity const *a, dxf_entity const *b) { return a->position() == b->position(); });

        if(duplicates_removed != nullptr) {
            *duplicates_removed = static_cast<int>(std::distance(last, sorted.end()));
        }
        sorted.erase(last, sorted.end());
        return sorted;
    }

}    // namespace cam_lib
