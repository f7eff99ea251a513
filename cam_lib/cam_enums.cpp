#include <map>

#include "cam_enums.h"

#define ENUM_NAMES_MAP(CAM_ENUM) std::map<CAM_ENUM, char const *> CAM_ENUM##_names_map

namespace cam_lib::cam_enum_names
{
    //////////////////////////////////////////////////////////////////////

    ENUM_NAMES_MAP(dxf_field) = {
        { field_x, "x" },
        { field_y, "y" },
        { field_z, "z" },
        { field_diameter, "diameter" },
        { field_width, "width" },
        { field_bulge, "bulge" },
        { field_flags, "flags" },
        { field_layer, "layer" },
    };

    //////////////////////////////////////////////////////////////////////

    ENUM_NAMES_MAP(dxf_entity_type) = {
        { entity_type_none, "none" },
        { entity_type_circle, "CIRCLE" },
        { entity_type_polyline, "POLYLINE" },
        { entity_type_vertex, "VERTEX" },
    };

    //////////////////////////////////////////////////////////////////////

    ENUM_NAMES_MAP(cam_output_kind) = {
        { output_kind_artwork, "artwork" },
        { output_kind_drill, "drill" },
        { output_kind_mechanical, "mechanical" },
    };

}    // namespace cam_lib::cam_enum_names
