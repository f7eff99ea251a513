//////////////////////////////////////////////////////////////////////

#include <cmath>

#include "cam_error.h"
#include "cam_gerber_writer.h"

LOG_CONTEXT("gerber", info);

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

    gerber_writer::gerber_writer(cam_settings const &output_settings, std::set<double> const &drawing_diameters)
        : settings(output_settings), diameters(drawing_diameters)
    {
    }

    //////////////////////////////////////////////////////////////////////

    bool gerber_writer::has_output(cam_entities const &entities) const
    {
        return !entities.empty();
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_writer::reset()
    {
        apertures = cam_aperture_table(min_aperture);
        state = cam_plot_state{};
        stats.cleanup();
    }

    //////////////////////////////////////////////////////////////////////

    std::string gerber_writer::emit_coord(double d) const
    {
        double s = d * settings.scale * std::pow(10.0, settings.decimal_digits);
        return fmt::format("{}", std::llround(s));
    }

    //////////////////////////////////////////////////////////////////////
    // only the axes which changed are written

    std::string gerber_writer::emit_point(cam_2d::vec2d const &p)
    {
        std::string result;
        if(!state.current_x.has_value() || state.current_x.value() != p.x) {
            result += "X" + emit_coord(p.x);
            state.current_x = p.x;
        }
        if(!state.current_y.has_value() || state.current_y.value() != p.y) {
            result += "Y" + emit_coord(p.y);
            state.current_y = p.y;
        }
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_writer::emit_command(std::string const &symbol, std::string const &value)
    {
        CAM_ASSERT(out != nullptr);
        *out << fmt::format("{}{}*\n", symbol, value);
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_writer::emit_parameter(std::string const &parameter, std::string const &value)
    {
        CAM_ASSERT(out != nullptr);
        *out << fmt::format("%{}{}*%\n", parameter, value);
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_writer::emit_comment(std::string const &text)
    {
        emit_command("G04 ", std::string(cam_util::trim(text)));
    }


    //////////////////////////////////////////////////////////////////////

    void gerber_writer::move_to(cam_2d::vec2d const &p)
    {
        emit_command(emit_point(p), "D02");
        stats.d2 += 1;
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_writer::draw_to(cam_2d::vec2d const &p)
    {
        emit_command(emit_point(p), "D01");
        stats.d1 += 1;
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_writer::flash_at(cam_2d::vec2d const &p)
    {
        emit_command(emit_point(p), "D03");
        stats.d3 += 1;
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_writer::ensure_region(bool region)
    {
        if(state.is_region_fill != region) {
            if(region) {
                emit_command("G36");
                stats.g36 += 1;
            } else {
                emit_command("G37");
                stats.g37 += 1;
            }
            state.is_region_fill = region;
        }
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code gerber_writer::select_aperture(double diameter)
    {
        int code;
        CHECK(apertures.get_code(diameter, &code));
        if(state.current_aperture != code) {
            emit_command(fmt::format("D{}", code));
            state.current_aperture = code;
            stats.aperture_selects += 1;
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // tracks and flashes are visited by looping over the known diameters, so
    // one with a diameter nobody measured would silently go missing

    cam_error_code gerber_writer::check_apertures(cam_entities const &entities) const
    {
        int code;
        for(auto const *p : entities.tracks) {
            CHECK(apertures.get_code(p->width.value_or(0.0), &code));
        }
        for(auto const *c : entities.circles) {
            CHECK(apertures.get_code(c->diameter.value_or(0.0), &code));
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_writer::write_header()
    {
        emit_comment(settings.title);
        emit_parameter("FS", fmt::format("LAX{0}{1}Y{0}{1}", settings.integer_digits, settings.decimal_digits));
        emit_parameter("MO", "MM");
        emit_parameter("SR", "X1Y1I0J0");
        emit_parameter("LP", "D");
    }

    //////////////////////////////////////////////////////////////////////
    // 0 is a polyline with no width, it gets the default size

    void gerber_writer::write_apertures()
    {
        for(double d : diameters) {
            int code = apertures.define(d);
            double size = d == 0.0 ? settings.default_diameter : d;
            emit_parameter(fmt::format("ADD{}", code), fmt::format("C,{:f}", size * settings.scale));
            stats.apertures_defined += 1;
        }
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code gerber_writer::write_track(dxf_entity const &polyline)
    {
        if(polyline.vertices.empty()) {
            LOG_WARNING("Skipping track with no vertices on layer '{}' (line {})", polyline.layer_name(), polyline.line_number);
            stats.empty_polylines += 1;
            return ok;
        }

        ensure_region(false);

        if(!polyline.width.has_value()) {
            LOG_WARNING("Zero width track on layer '{}' (line {}), using {:g}mm", polyline.layer_name(), polyline.line_number, settings.default_diameter);
            stats.zero_width_tracks += 1;
        }
        CHECK(select_aperture(polyline.width.value_or(0.0)));

        auto vertex = polyline.vertices.begin();
        move_to(vertex->position());
        for(++vertex; vertex != polyline.vertices.end(); ++vertex) {
            draw_to(vertex->position());
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code gerber_writer::write_flash(dxf_entity const &circle)
    {
        cam_2d::vec2d pos = circle.position();
        if(pos.is_origin()) {
            LOG_VERBOSE("Not flashing circle at the origin (line {})", circle.line_number);
            stats.origin_flashes += 1;
            return ok;
        }
        CHECK(select_aperture(circle.diameter.value_or(0.0)));
        flash_at(pos);
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // regions are filled, the aperture doesn't matter

    void gerber_writer::write_region(dxf_entity const &polyline)
    {
        if(polyline.vertices.empty()) {
            LOG_WARNING("Skipping region with no vertices on layer '{}' (line {})", polyline.layer_name(), polyline.line_number);
            stats.empty_polylines += 1;
            return;
        }

        ensure_region(true);

        cam_2d::vec2d first_point = polyline.vertices.front().position();
        move_to(first_point);
        for(size_t i = 1; i < polyline.vertices.size(); ++i) {
            draw_to(polyline.vertices[i].position());
        }
        draw_to(first_point);
    }

    //////////////////////////////////////////////////////////////////////

    void gerber_writer::write_trailer()
    {
        ensure_region(false);
        emit_command("M02");
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code gerber_writer::write(std::ostream &output, cam_entities const &entities)
    {
        out = &output;
        reset();

        write_header();
        write_apertures();

        CHECK(check_apertures(entities));

        LOG_INFO("Writing {} tracks", entities.tracks.size());

        for(double d : diameters) {
            for(auto const *p : entities.tracks) {
                if(p->width.value_or(0.0) == d) {
                    CHECK(write_track(*p));
                }
            }
        }

        int duplicates = 0;
        auto flashes = sort_unique_points(entities.circles, &duplicates);
        stats.duplicates_removed += duplicates;

        LOG_INFO("Flashing {} circles with {} apertures", flashes.size(), diameters.size());

        for(double d : diameters) {
            for(auto const *c : flashes) {
                if(c->diameter.value_or(0.0) == d) {
                    CHECK(write_flash(*c));
                }
            }
        }

        LOG_INFO("Writing {} regions", entities.regions.size());

        for(auto const *r : entities.regions) {
            write_region(*r);
        }

        write_trailer();

        LOG_VERBOSE("{}", stats);
        out = nullptr;
        return ok;
    }

}    // namespace cam_lib
