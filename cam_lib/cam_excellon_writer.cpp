//////////////////////////////////////////////////////////////////////

#include <cmath>

#include "cam_error.h"
#include "cam_math.h"
#include "cam_excellon_writer.h"

LOG_CONTEXT("excellon", info);

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

    excellon_writer::excellon_writer(cam_settings const &output_settings, std::set<double> const &drawing_diameters)
        : settings(output_settings), diameters(drawing_diameters)
    {
    }

    //////////////////////////////////////////////////////////////////////
    // something to drill: a circle with a size, not at the origin

    bool excellon_writer::has_output(cam_entities const &entities) const
    {
        for(auto const *c : entities.circles) {
            if(c->diameter.value_or(0.0) > 0.0 && !c->position().is_origin()) {
                return true;
            }
        }
        return false;
    }

    //////////////////////////////////////////////////////////////////////

    void excellon_writer::reset()
    {
        tools = cam_aperture_table(first_tool);
        current_tool = -1;
        stats.cleanup();
    }

    //////////////////////////////////////////////////////////////////////
    // fixed point with 3 integer digits, leading zeros removed

    std::string excellon_writer::emit_coord(double d) const
    {
        int places = settings.drill_decimal_places;
        std::string s = fmt::format("{:0{}.{}f}", d * settings.scale, places + 4, places);
        size_t nonzero = s.find_first_not_of('0');
        if(nonzero == std::string::npos) {
            return s;
        }
        return s.substr(nonzero);
    }

    //////////////////////////////////////////////////////////////////////

    std::string excellon_writer::emit_point(cam_2d::vec2d const &p) const
    {
        return fmt::format("X{}Y{}", emit_coord(p.x), emit_coord(p.y));
    }

    //////////////////////////////////////////////////////////////////////

    void excellon_writer::emit_line(std::string const &line)
    {
        CAM_ASSERT(out != nullptr);
        *out << line << '\n';
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code excellon_writer::select_tool(double diameter)
    {
        int code;
        if(tools.get_code(diameter, &code) != ok) {
            LOG_ERROR("No tool for diameter {:g}", diameter);
            return error_undefined_tool;
        }
        if(current_tool != code) {
            emit_line(fmt::format("T{:02d}", code));
            current_tool = code;
            stats.tool_selects += 1;
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    void excellon_writer::write_header()
    {
        emit_line("%");
        emit_line("M48");
        emit_line("METRIC,TZ");
        emit_line("M71");
    }

    //////////////////////////////////////////////////////////////////////
    // tool sizes are rounded up to 0.1mm

    void excellon_writer::write_tools()
    {
        for(double d : diameters) {
            if(d == 0.0) {
                continue;
            }
            int code = tools.define(d);
            emit_line(fmt::format("T{:02d}C{:4.3f}", code, ceil_precise(d * settings.scale, 1)));
            stats.tools_defined += 1;
        }
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code excellon_writer::write_drill_point(dxf_entity const &circle)
    {
        cam_2d::vec2d pos = circle.position();
        if(pos.is_origin()) {
            LOG_VERBOSE("Not drilling circle at the origin (line {})", circle.line_number);
            stats.origin_flashes += 1;
            return ok;
        }
        CHECK(select_tool(circle.diameter.value_or(0.0)));
        emit_line(emit_point(pos));
        stats.drill_hits += 1;
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // TODO(routing): G00/G01 cut paths for slots (open polylines) and cut-outs (closed polylines)

    void excellon_writer::write_cuts(cam_entities const &entities)
    {
        if(!entities.tracks.empty() || !entities.regions.empty()) {
            LOG_WARNING("Not cutting {} slots and {} cut-outs, routing is not implemented", entities.tracks.size(), entities.regions.size());
        }
    }

    //////////////////////////////////////////////////////////////////////

    void excellon_writer::write_trailer()
    {
        emit_line("M30");
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code excellon_writer::write(std::ostream &output, cam_entities const &entities)
    {
        out = &output;
        reset();

        write_header();
        write_tools();

        int code;
        for(auto const *c : entities.circles) {
            double d = c->diameter.value_or(0.0);
            FAIL_IF(d != 0.0 && tools.get_code(d, &code) != ok, error_undefined_tool);
        }

        emit_line("%");
        emit_line("G05");

        int duplicates = 0;
        auto holes = sort_unique_points(entities.circles, &duplicates);
        stats.duplicates_removed += duplicates;

        for(double dia : diameters) {

            if(dia == 0.0) {
                LOG_VERBOSE("Skipping diameter 0 holes");
                continue;
            }

            LOG_VERBOSE("Processing entries for drill diameter {:g}", dia);

            for(auto const *c : holes) {
                if(c->diameter.value_or(0.0) == dia) {
                    CHECK(write_drill_point(*c));
                }
            }
        }

        write_cuts(entities);
        write_trailer();

        LOG_INFO("Drilled {} holes with {} tools", stats.drill_hits, stats.tools_defined);
        LOG_VERBOSE("{}", stats);
        out = nullptr;
        return ok;
    }

}    // namespace cam_lib
