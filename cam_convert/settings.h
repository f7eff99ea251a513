#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "cam_enums.h"
#include "cam_error.h"
#include "cam_layer.h"
#include "cam_settings.h"

namespace cam_lib
{
    NLOHMANN_JSON_SERIALIZE_ENUM(cam_output_kind,
                                 {
                                     { output_kind_artwork, "artwork" },
                                     { output_kind_drill, "drill" },
                                     { output_kind_mechanical, "mechanical" },
                                 })
}

//////////////////////////////////////////////////////////////////////

struct layer_t
{
    std::string extension;
    cam_lib::cam_output_kind kind{ cam_lib::output_kind_artwork };
    std::vector<std::string> aliases;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(layer_t, extension, kind, aliases)
};

//////////////////////////////////////////////////////////////////////
// empty `layers` means use the built in table

#define SETTINGS_FIELDS                         \
    X(int, integer_digits, 2)                   \
    X(int, decimal_digits, 6)                   \
    X(double, scale, 1.0)                       \
    X(double, default_diameter, 0.01)           \
    X(int, drill_decimal_places, 2)             \
    X(std::string, title, "cam_convert")        \
    X(std::vector<layer_t>, layers, {})

struct settings_t
{
#define X(type, name, ...) type name = __VA_ARGS__;
    SETTINGS_FIELDS
#undef X

    cam_lib::cam_error_code load(std::filesystem::path const &path);
    cam_lib::cam_error_code parse(std::string const &json_text);

    cam_lib::cam_settings output_settings() const;
    std::vector<cam_lib::cam_layer_role> layer_roles() const;

    void to_json(nlohmann::json &j) const
    {
#define X(type, name, ...) j[#name] = name;
        SETTINGS_FIELDS
#undef X
    }

    void from_json(const nlohmann::json &j)
    {
        LOG_CONTEXT("from_json", info);
#define X(type, name, ...)                      \
    if(j.contains(#name)) {                     \
        LOG_DEBUG("Setting {}", #name);         \
        name = j.at(#name).get<type>();         \
    } else {                                    \
        name = __VA_ARGS__;                     \
    }
        SETTINGS_FIELDS
#undef X
    }
};
