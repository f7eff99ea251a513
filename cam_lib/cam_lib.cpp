//////////////////////////////////////////////////////////////////////

#include <fstream>
#include <system_error>

#include "cam_error.h"
#include "cam_util.h"
#include "cam_lib.h"

LOG_CONTEXT("cam_lib", info);

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

    cam_job::cam_job(cam_settings const &output_settings, std::vector<cam_layer_role> const &roles) : settings(output_settings), layer_roles(roles)
    {
    }

    //////////////////////////////////////////////////////////////////////

    std::string cam_job::base_path_for(std::string const &input_path)
    {
        return std::filesystem::path(input_path).replace_extension().string();
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code cam_job::remove_stale_file(std::filesystem::path const &path)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if(ec) {
            LOG_ERROR("Can't delete {}: {}", path.string(), ec.message());
            return error_cant_delete_file;
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // an empty file is not written, and an old one is deleted

    template <typename WRITER> cam_error_code cam_job::write_output(WRITER &writer, cam_entities const &entities, cam_output_file *output)
    {
        LOG_INFO("File will contain {}", entities);

        if(!writer.has_output(entities)) {
            LOG_INFO("File will be empty: Skipping file {}", output->path.string());
            return remove_stale_file(output->path);
        }

        std::ofstream file(output->path, std::ios::out | std::ios::trunc);
        if(!file.is_open()) {
            LOG_ERROR("Can't open {} for writing", output->path.string());
            return error_cant_write_file;
        }

        auto remove_partial = SCOPED([&]() {
            file.close();
            std::error_code ec;
            std::filesystem::remove(output->path, ec);
        });

        CHECK(writer.write(file, entities));

        file.flush();
        FAIL_IF(!file.good(), error_cant_write_file);

        remove_partial.cancel();
        output->written = true;
        output->stats = writer.stats;
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code cam_job::process(dxf_drawing const &drawing, std::string const &base_path)
    {
        FAIL_IF(!drawing.loaded, error_drawing_not_loaded);

        outputs.clear();

        // apertures and tools are numbered over the whole drawing, not per layer
        std::set<double> diameters = measure_drawing(drawing);

        for(auto const &role : layer_roles) {

            cam_output_file output;
            output.path = base_path + role.extension;
            output.role = role;

            cam_entities entities = classify_entities(drawing, role.aliases);

            switch(role.output_kind) {

            case output_kind_artwork: {
                LOG_INFO("Writing Gerber file {} ({})", output.path.string(), role.name());
                gerber_writer writer(settings, diameters);
                CHECK(write_output(writer, entities, &output));
            } break;

            case output_kind_drill: {
                LOG_INFO("Writing Excellon file {} ({})", output.path.string(), role.name());
                excellon_writer writer(settings, diameters);
                CHECK(write_output(writer, entities, &output));
            } break;

            case output_kind_mechanical:
                if(!entities.empty()) {
                    LOG_WARNING("Not writing {} ({}): {} ignored, cut-outs are not implemented", output.path.string(), role.name(), entities);
                }
                break;
            }

            outputs.push_back(std::move(output));
        }
        return ok;
    }

}    // namespace cam_lib
