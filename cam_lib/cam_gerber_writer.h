//////////////////////////////////////////////////////////////////////

#pragma once

#include <optional>
#include <ostream>
#include <set>
#include <string>

#include "cam_2d.h"
#include "cam_enums.h"
#include "cam_error.h"
#include "cam_stats.h"
#include "cam_layer.h"
#include "cam_settings.h"
#include "cam_aperture.h"

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////
    // where the plotter is, per output file

    struct cam_plot_state
    {
        // unset until the first coordinate goes out
        std::optional<double> current_x;
        std::optional<double> current_y;

        int current_aperture{ -1 };

        bool is_region_fill{ false };

        cam_plot_state() = default;
    };

    //////////////////////////////////////////////////////////////////////
    // Gerber (RS-274X) artwork for one layer role
    //
    // header, aperture table, tracks by width, flashes by diameter,
    // regions, trailer

    struct gerber_writer
    {
        static constexpr int min_aperture = 10;

        cam_settings settings;
        std::set<double> diameters;

        cam_aperture_table apertures{ min_aperture };
        cam_plot_state state{};
        cam_stats stats{};

        std::ostream *out{ nullptr };

        gerber_writer(cam_settings const &output_settings, std::set<double> const &drawing_diameters);

        bool has_output(cam_entities const &entities) const;

        cam_error_code write(std::ostream &output, cam_entities const &entities);

        //////////////////////////////////////////////////////////////////////

        void reset();

        std::string emit_coord(double d) const;
        std::string emit_point(cam_2d::vec2d const &p);

        void emit_command(std::string const &symbol, std::string const &value = {});
        void emit_parameter(std::string const &parameter, std::string const &value);
        void emit_comment(std::string const &text);

        void move_to(cam_2d::vec2d const &p);
        void draw_to(cam_2d::vec2d const &p);
        void flash_at(cam_2d::vec2d const &p);

        void ensure_region(bool region);

        cam_error_code select_aperture(double diameter);
        cam_error_code check_apertures(cam_entities const &entities) const;

        void write_header();
        void write_apertures();
        cam_error_code write_track(dxf_entity const &polyline);
        cam_error_code write_flash(dxf_entity const &circle);
        void write_region(dxf_entity const &polyline);
        void write_trailer();
    };

}    // namespace cam_lib
