#pragma once

#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "cam_2d.h"
#include "cam_enums.h"
#include "cam_util.h"

// An entity might be one of:
// circle (centre, diameter)
// polyline (flags, width, ordered vertices)
// vertex of a polyline (position, bulge)

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

    struct dxf_entity
    {
        dxf_entity_type entity_type{ entity_type_none };
        int line_number{};

        std::optional<double> x;
        std::optional<double> y;
        std::optional<double> z;
        std::optional<double> diameter;
        std::optional<double> width;
        std::optional<double> bulge;
        std::optional<int> flags;
        std::optional<std::string> layer;

        std::vector<dxf_entity> vertices;

        dxf_entity() = default;

        explicit dxf_entity(dxf_entity_type type) : entity_type(type)
        {
        }

        //////////////////////////////////////////////////////////////////////

        cam_2d::vec2d position() const
        {
            return { x.value_or(0.0), y.value_or(0.0) };
        }

        //////////////////////////////////////////////////////////////////////
        // no flags field means open

        bool is_closed() const
        {
            return flags.has_value() && (flags.value() & polyline_flag_closed) != 0;
        }

        //////////////////////////////////////////////////////////////////////

        std::string const &layer_name() const
        {
            static std::string const no_layer;
            return layer.has_value() ? layer.value() : no_layer;
        }

        //////////////////////////////////////////////////////////////////////

        std::string to_string() const
        {
            return fmt::format("{} AT {} LAYER '{}', DIAMETER {}, WIDTH {}, FLAGS {}, VERTICES {}",
                               entity_type,                                                //
                               position(),                                                 //
                               layer_name(),                                               //
                               diameter.has_value() ? fmt::format("{:g}", *diameter) : "-",    //
                               width.has_value() ? fmt::format("{:g}", *width) : "-",          //
                               flags.has_value() ? fmt::format("{}", *flags) : "-",            //
                               vertices.size());
        }
    };

}    // namespace cam_lib

CAM_MAKE_FORMATTER(cam_lib::dxf_entity);
