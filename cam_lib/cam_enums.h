#pragma once

#include <map>

#include <fmt/format.h>

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////
    // DXF group codes the reader knows about

    enum dxf_group_code : int
    {
        group_code_entity = 0,    // entity boundary, value is the next entity type
        group_code_layer = 8,
        group_code_x = 10,
        group_code_y = 20,
        group_code_z = 30,
        group_code_radius = 40,    // stored as a diameter
        group_code_width = 41,
        group_code_bulge = 42,
        group_code_flags = 70
    };

    //////////////////////////////////////////////////////////////////////

    enum dxf_field
    {
        field_x,
        field_y,
        field_z,
        field_diameter,
        field_width,
        field_bulge,
        field_flags,
        field_layer
    };

    //////////////////////////////////////////////////////////////////////

    enum dxf_decode_rule
    {
        decode_quantized,    // float, snapped to 1/8 of a unit
        decode_string,       // trimmed text
        decode_integer       // decimal integer
    };

    //////////////////////////////////////////////////////////////////////

    enum dxf_entity_type
    {
        entity_type_none,
        entity_type_circle,
        entity_type_polyline,
        entity_type_vertex
    };

    //////////////////////////////////////////////////////////////////////

    enum dxf_polyline_flags : int
    {
        polyline_flag_closed = 1
    };

    //////////////////////////////////////////////////////////////////////

    enum cam_output_kind
    {
        output_kind_artwork,
        output_kind_drill,
        output_kind_mechanical
    };

}    // namespace cam_lib

// this relies on an extern std::map<ENUM_TYPE, char const *> ENUM_TYPE_names_map; in cam_lib namespace

#define CAM_MAKE_ENUM_FORMATTER(CAM_ENUM)                                                                             \
    namespace cam_lib::cam_enum_names                                                                                 \
    {                                                                                                                 \
        extern std::map<CAM_ENUM, char const *> CAM_ENUM##_names_map;                                                 \
    }                                                                                                                 \
    template <> struct fmt::formatter<::cam_lib::CAM_ENUM> : fmt::formatter<std::string>                              \
    {                                                                                                                 \
        auto format(::cam_lib::CAM_ENUM const &e, fmt::format_context &ctx) const                                     \
        {                                                                                                             \
            auto f = ::cam_lib::cam_enum_names::CAM_ENUM##_names_map.find(e);                                         \
            if(f != ::cam_lib::cam_enum_names::CAM_ENUM##_names_map.end()) {                                          \
                return fmt::format_to(ctx.out(), "{}", f->second);                                                    \
            }                                                                                                         \
            return fmt::format_to(ctx.out(), "@ERROR: Can't find enum value {} for {}", static_cast<int>(e), #CAM_ENUM); \
        }                                                                                                             \
    }

CAM_MAKE_ENUM_FORMATTER(dxf_field);
CAM_MAKE_ENUM_FORMATTER(dxf_entity_type);
CAM_MAKE_ENUM_FORMATTER(cam_output_kind);
