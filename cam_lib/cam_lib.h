//////////////////////////////////////////////////////////////////////
// DXF drawing -> Gerber artwork + Excellon drill files
//
// Layer names in the drawing say where things go, see cam_layer.cpp
// for the default table. Only polylines and circles are handled.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "cam_error.h"
#include "cam_stats.h"
#include "cam_layer.h"
#include "cam_drawing.h"
#include "cam_settings.h"
#include "cam_gerber_writer.h"
#include "cam_excellon_writer.h"

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

    struct cam_output_file
    {
        std::filesystem::path path;
        cam_layer_role role;
        bool written{ false };
        cam_stats stats{};
    };

    //////////////////////////////////////////////////////////////////////
    // one job per drawing, every output file gets a fresh writer

    struct cam_job
    {
        cam_settings settings;
        std::vector<cam_layer_role> layer_roles;

        std::vector<cam_output_file> outputs;

        explicit cam_job(cam_settings const &output_settings, std::vector<cam_layer_role> const &roles = default_layer_roles());

        // writes <base_path><extension> for every layer role
        cam_error_code process(dxf_drawing const &drawing, std::string const &base_path);

        // the input file name without its extension
        static std::string base_path_for(std::string const &input_path);

        //////////////////////////////////////////////////////////////////////

        template <typename WRITER> cam_error_code write_output(WRITER &writer, cam_entities const &entities, cam_output_file *output);

        cam_error_code remove_stale_file(std::filesystem::path const &path);
    };

}    // namespace cam_lib
