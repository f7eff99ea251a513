//////////////////////////////////////////////////////////////////////

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "cam_log.h"
#include "settings.h"

LOG_CONTEXT("settings", info);

//////////////////////////////////////////////////////////////////////

cam_lib::cam_error_code settings_t::load(std::filesystem::path const &path)
{
    std::ifstream load(path);
    if(!load.is_open()) {
        LOG_ERROR("Can't open settings file {}", path.string());
        return cam_lib::error_cant_open_file;
    }
    std::stringstream text;
    text << load.rdbuf();
    load.close();
    return parse(text.str());
}

//////////////////////////////////////////////////////////////////////

cam_lib::cam_error_code settings_t::parse(std::string const &json_text)
{
    try {
        nlohmann::json json = nlohmann::json::parse(json_text);
        from_json(json);
    } catch(nlohmann::json::exception const &e) {
        LOG_ERROR("Bad settings: {}", e.what());
        return cam_lib::error_bad_settings_file;
    }
    if(integer_digits < 1 || decimal_digits < 0 || integer_digits + decimal_digits > 9 || drill_decimal_places < 0 || scale <= 0.0 ||
       default_diameter <= 0.0) {
        LOG_ERROR("Bad settings: coordinate format {}.{}, drill places {}, scale {:g}, default diameter {:g}", integer_digits, decimal_digits,
                  drill_decimal_places, scale, default_diameter);
        return cam_lib::error_bad_settings_file;
    }
    return cam_lib::ok;
}

//////////////////////////////////////////////////////////////////////

cam_lib::cam_settings settings_t::output_settings() const
{
    cam_lib::cam_settings s;
    s.integer_digits = integer_digits;
    s.decimal_digits = decimal_digits;
    s.scale = scale;
    s.default_diameter = default_diameter;
    s.drill_decimal_places = drill_decimal_places;
    s.title = title;
    return s;
}

//////////////////////////////////////////////////////////////////////

std::vector<cam_lib::cam_layer_role> settings_t::layer_roles() const
{
    if(layers.empty()) {
        return cam_lib::default_layer_roles();
    }
    std::vector<cam_lib::cam_layer_role> roles;
    for(auto const &l : layers) {
        roles.push_back({ l.extension, l.kind, l.aliases });
    }
    return roles;
}
