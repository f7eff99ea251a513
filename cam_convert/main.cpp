//////////////////////////////////////////////////////////////////////
// cam_convert [--settings file.json] [--verbose] [--quiet] drawing.dxf...
//
// For each drawing, writes drawing.gtl, drawing.gdd etc next to it.
// See cam_lib/cam_layer.cpp for which DXF layers go where.

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "cam_lib.h"
#include "cam_util.h"
#include "settings.h"

LOG_CONTEXT("main", info);

//////////////////////////////////////////////////////////////////////

namespace
{
    int flushed_puts(char const *s)
    {
        int x = puts(s);
        fflush(stdout);
        return x;
    }

    //////////////////////////////////////////////////////////////////////

    void usage()
    {
        puts("usage: cam_convert [--settings file.json] [--verbose] [--quiet] drawing.dxf...");
    }

    //////////////////////////////////////////////////////////////////////

    bool convert(char const *input_path, settings_t const &settings)
    {
        cam_util::cam_timer timer;
        timer.reset();

        LOG_INFO("Processing file {}", input_path);

        cam_lib::dxf_drawing drawing;
        if(drawing.parse_file(input_path) != cam_lib::ok) {
            LOG_ERROR("Can't convert {} ({} errors), no files written", input_path, drawing.errors.size());
            return false;
        }

        LOG_VERBOSE("Layers: {}", fmt::join(drawing.layer_names(), ", "));

        cam_lib::cam_job job(settings.output_settings(), settings.layer_roles());
        if(job.process(drawing, cam_lib::cam_job::base_path_for(input_path)) != cam_lib::ok) {
            LOG_ERROR("Conversion of {} failed", input_path);
            return false;
        }

        for(auto const &output : job.outputs) {
            if(output.written) {
                LOG_INFO("Wrote {}", output.path.string());
            }
        }
        LOG_INFO("Done with {} in {:.3f} seconds", input_path, timer.elapsed_seconds());
        return true;
    }

}    // namespace

//////////////////////////////////////////////////////////////////////

int main(int argc, char **argv)
{
    cam_lib::log_set_level(cam_lib::log_level_info);
    cam_lib::log_set_emitter_function(flushed_puts);

    settings_t settings;
    std::vector<char const *> inputs;

    for(int i = 1; i < argc; ++i) {
        char const *arg = argv[i];
        if(strcmp(arg, "--settings") == 0) {
            if(i + 1 >= argc) {
                usage();
                return 2;
            }
            if(settings.load(argv[++i]) != cam_lib::ok) {
                return 2;
            }
        } else if(strcmp(arg, "--verbose") == 0) {
            cam_lib::log_set_level(cam_lib::log_level_verbose);
        } else if(strcmp(arg, "--quiet") == 0) {
            cam_lib::log_set_level(cam_lib::log_level_warning);
        } else if(strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            usage();
            return 0;
        } else if(arg[0] == '-') {
            usage();
            return 2;
        } else {
            inputs.push_back(arg);
        }
    }

    if(inputs.empty()) {
        usage();
        return 2;
    }

    int failures = 0;
    for(auto input : inputs) {
        if(!convert(input, settings)) {
            failures += 1;
        }
    }
    return failures == 0 ? 0 : 1;
}
