#include <sstream>

#include "tests/test_common.h"

namespace cam_test
{
    std::vector<std::string> log_capture::messages;

    namespace
    {
        int capture_message(char const *s)
        {
            log_capture::messages.emplace_back(s);
            return 0;
        }

        std::string polyline_header(std::string const &layer, std::optional<double> width, std::optional<int> flags)
        {
            std::string s = fmt::format("  0\nPOLYLINE\n  8\n{}\n 66\n1\n", layer);
            if(flags.has_value()) {
                s += fmt::format(" 70\n{}\n", *flags);
            }
            if(width.has_value()) {
                s += fmt::format(" 41\n{}\n", *width);
            }
            return s;
        }
    }    // namespace

    //////////////////////////////////////////////////////////////////////

    std::string dxf_circle(std::string const &layer, double x, double y, double radius)
    {
        return fmt::format("  0\nCIRCLE\n  5\n2F\n  8\n{}\n 10\n{}\n 20\n{}\n 30\n0.0\n 40\n{}\n", layer, x, y, radius);
    }

    //////////////////////////////////////////////////////////////////////

    std::string dxf_polyline(std::string const &layer, std::vector<vec2d> const &points, std::optional<double> width, std::optional<int> flags)
    {
        std::string s = polyline_header(layer, width, flags);
        for(auto const &p : points) {
            s += fmt::format("  0\nVERTEX\n  8\n{}\n 10\n{}\n 20\n{}\n 30\n0.0\n", layer, p.x, p.y);
        }
        s += fmt::format("  0\nSEQEND\n  8\n{}\n", layer);
        return s;
    }

    //////////////////////////////////////////////////////////////////////

    std::string dxf_document(std::string const &entities)
    {
        return "  0\nSECTION\n  2\nENTITIES\n" + entities + "  0\nENDSEC\n  0\nEOF\n";
    }

    //////////////////////////////////////////////////////////////////////

    cam_lib::dxf_entity make_circle(std::string const &layer, double x, double y, double diameter)
    {
        cam_lib::dxf_entity c(cam_lib::entity_type_circle);
        c.layer = layer;
        c.x = x;
        c.y = y;
        c.diameter = diameter;
        return c;
    }

    //////////////////////////////////////////////////////////////////////

    cam_lib::dxf_entity make_polyline(std::string const &layer, std::vector<vec2d> const &points, std::optional<double> width, std::optional<int> flags)
    {
        cam_lib::dxf_entity p(cam_lib::entity_type_polyline);
        p.layer = layer;
        p.width = width;
        p.flags = flags;
        for(auto const &point : points) {
            cam_lib::dxf_entity v(cam_lib::entity_type_vertex);
            v.layer = layer;
            v.x = point.x;
            v.y = point.y;
            p.vertices.push_back(v);
        }
        return p;
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<std::string> split_lines(std::string const &text)
    {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while(std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    //////////////////////////////////////////////////////////////////////

    int count_lines(std::string const &text, std::string const &line)
    {
        int n = 0;
        for(auto const &l : split_lines(text)) {
            if(l == line) {
                n += 1;
            }
        }
        return n;
    }

    //////////////////////////////////////////////////////////////////////

    log_capture::log_capture()
    {
        messages.clear();
        cam_lib::log_set_level(cam_lib::log_level_warning);
        cam_lib::log_set_emitter_function(capture_message);
    }

    //////////////////////////////////////////////////////////////////////

    log_capture::~log_capture()
    {
        cam_lib::log_set_emitter_function(nullptr);
        cam_lib::log_set_level(cam_lib::log_level_error);
    }

    //////////////////////////////////////////////////////////////////////

    bool log_capture::contains(std::string const &text) const
    {
        for(auto const &m : messages) {
            if(m.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

}    // namespace cam_test
