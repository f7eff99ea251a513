//////////////////////////////////////////////////////////////////////

#pragma once

#include <ostream>
#include <set>
#include <string>

#include "cam_2d.h"
#include "cam_error.h"
#include "cam_stats.h"
#include "cam_layer.h"
#include "cam_settings.h"
#include "cam_aperture.h"

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////
    // Excellon drill file for one layer role
    //
    // header, tool table (non zero diameters only), holes by ascending
    // diameter, trailer. Routing of tracks and regions is not implemented.

    struct excellon_writer
    {
        static constexpr int first_tool = 1;

        cam_settings settings;
        std::set<double> diameters;

        cam_aperture_table tools{ first_tool };
        int current_tool{ -1 };
        cam_stats stats{};

        std::ostream *out{ nullptr };

        excellon_writer(cam_settings const &output_settings, std::set<double> const &drawing_diameters);

        bool has_output(cam_entities const &entities) const;

        cam_error_code write(std::ostream &output, cam_entities const &entities);

        //////////////////////////////////////////////////////////////////////

        void reset();

        std::string emit_coord(double d) const;
        std::string emit_point(cam_2d::vec2d const &p) const;

        void emit_line(std::string const &line);

        cam_error_code select_tool(double diameter);

        void write_header();
        void write_tools();
        cam_error_code write_drill_point(dxf_entity const &circle);
        void write_cuts(cam_entities const &entities);
        void write_trailer();
    };

}    // namespace cam_lib
