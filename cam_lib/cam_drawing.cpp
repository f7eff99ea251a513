//////////////////////////////////////////////////////////////////////

#include <algorithm>

#include "cam_error.h"
#include "cam_util.h"
#include "cam_math.h"
#include "cam_layer.h"
#include "cam_drawing.h"

LOG_CONTEXT("dxf_drawing", info);

//////////////////////////////////////////////////////////////////////

namespace
{
    using namespace cam_lib;
    using namespace cam_util;

    //////////////////////////////////////////////////////////////////////

    struct field_descriptor
    {
        int group_code;
        dxf_field field;
        dxf_decode_rule decode_rule;
    };

    field_descriptor field_descriptors[] = {
        { group_code_x, field_x, decode_quantized },                  //
        { group_code_y, field_y, decode_quantized },                  //
        { group_code_z, field_z, decode_quantized },                  //
        { group_code_radius, field_diameter, decode_quantized },      //
        { group_code_width, field_width, decode_quantized },          //
        { group_code_bulge, field_bulge, decode_quantized },          //
        { group_code_flags, field_flags, decode_integer },            //
        { group_code_layer, field_layer, decode_string },             //
    };

    //////////////////////////////////////////////////////////////////////

    field_descriptor const *find_field(int group_code)
    {
        for(auto const &f : field_descriptors) {
            if(f.group_code == group_code) {
                return &f;
            }
        }
        return nullptr;
    }

    //////////////////////////////////////////////////////////////////////

    void store_double(dxf_entity *entity, dxf_field field, double value)
    {
        switch(field) {
        case field_x:
            entity->x = value;
            break;
        case field_y:
            entity->y = value;
            break;
        case field_z:
            entity->z = value;
            break;
        case field_diameter:
            entity->diameter = value;
            break;
        case field_width:
            entity->width = value;
            break;
        case field_bulge:
            entity->bulge = value;
            break;
        default:
            break;
        }
    }

    //////////////////////////////////////////////////////////////////////

    template <typename T> std::vector<dxf_entity const *> select(std::vector<dxf_entity> const &entities, T predicate)
    {
        std::vector<dxf_entity const *> result;
        for(auto const &e : entities) {
            if(predicate(e)) {
                result.push_back(&e);
            }
        }
        return result;
    }

}    // namespace

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

    void dxf_drawing::reset()
    {
        circles.clear();
        polylines.clear();
        errors.clear();
        filename.clear();
        loaded = false;
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code dxf_drawing::parse_file(char const *file_path)
    {
        reset();
        cam_error_code rc = reader.open(file_path);
        if(rc != ok) {
            filename = file_path != nullptr ? file_path : "";
            return error(rc, "can't read {}", filename);
        }
        return do_parse();
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code dxf_drawing::parse_memory(char const *data, size_t size)
    {
        reset();
        cam_error_code rc = reader.open(data, size);
        if(rc != ok) {
            return error(rc, "can't read {} bytes of memory", size);
        }
        return do_parse();
    }

    //////////////////////////////////////////////////////////////////////
    // a failed parse leaves the drawing empty, only the errors remain

    cam_error_code dxf_drawing::do_parse()
    {
        filename = reader.filename;

        cam_error_code rc = ok;

        while(true) {
            std::string_view line;
            if(reader.read_line(&line) != ok) {
                LOG_WARNING("No EOF marker in {}, stopped at line {}", filename, reader.line_number);
                break;
            }
            line = trim(line);
            if(line == "EOF") {
                break;
            }
            if(line == "CIRCLE") {
                rc = read_circle();
            } else if(line == "POLYLINE") {
                rc = read_polyline();
            }
            if(rc != ok) {
                break;
            }
        }

        reader.close();

        if(rc != ok) {
            circles.clear();
            polylines.clear();
            return rc;
        }

        loaded = true;
        LOG_VERBOSE("Parsing complete after {} lines, found {} circles and {} polylines", reader.line_number, circles.size(), polylines.size());
        return ok;
    }

    //////////////////////////////////////////////////////////////////////
    // read group code / value pairs until group code 0 or end of input
    // the value after group code 0 is left for the caller

    cam_error_code dxf_drawing::read_entity(dxf_entity *entity)
    {
        entity->line_number = reader.line_number;

        while(true) {
            std::string_view line;
            if(reader.read_line(&line) != ok) {
                break;
            }

            int code;
            if(!parse_group_code(trim(line), &code)) {
                // not a group code, drop it and what would have been its value
                LOG_DEBUG("Bad group code '{}' at line {}", trim(line), reader.line_number);
                reader.skip_line();
                continue;
            }

            if(code == group_code_entity) {
                break;
            }

            std::string_view value;
            if(reader.read_line(&value) != ok) {
                return error(error_unexpected_end_of_file, "missing value for group code {}", code);
            }
            CHECK(decode_field(entity, code, trim(value)));
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code dxf_drawing::decode_field(dxf_entity *entity, int code, std::string_view value)
    {
        field_descriptor const *descriptor = find_field(code);

        if(descriptor == nullptr) {
            return ok;
        }

        switch(descriptor->decode_rule) {

        case decode_quantized: {
            double number;
            if(!parse_double(value, &number)) {
                return error(error_bad_number, "'{}' is not a number (group code {}, {})", value, code, descriptor->field);
            }
            store_double(entity, descriptor->field, quantize(number, subdivisions));
        } break;

        case decode_integer: {
            int number;
            if(!parse_int(value, &number)) {
                return error(error_bad_integer, "'{}' is not an integer (group code {}, {})", value, code, descriptor->field);
            }
            entity->flags = number;
        } break;

        case decode_string:
            entity->layer = std::string(value);
            break;
        }
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code dxf_drawing::read_circle()
    {
        dxf_entity circle(entity_type_circle);
        CHECK(read_entity(&circle));

        // group code 40 is the radius
        if(circle.diameter.has_value()) {
            circle.diameter = circle.diameter.value() * 2.0;
        }
        LOG_DEBUG("{}", circle);
        circles.push_back(std::move(circle));
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code dxf_drawing::read_polyline()
    {
        dxf_entity polyline(entity_type_polyline);
        CHECK(read_entity(&polyline));

        int start_line = polyline.line_number;
        bool has_bulge = false;

        while(true) {
            std::string_view line;
            if(reader.read_line(&line) != ok) {
                return error(error_unexpected_end_of_file, "POLYLINE from line {} has no SEQEND", start_line);
            }
            line = trim(line);

            if(line == "SEQEND") {
                break;
            }

            if(line == "VERTEX") {
                dxf_entity vertex(entity_type_vertex);
                CHECK(read_entity(&vertex));
                has_bulge |= vertex.bulge.value_or(0.0) != 0.0;
                polyline.vertices.push_back(std::move(vertex));
            }
        }

        if(has_bulge) {
            LOG_WARNING("POLYLINE at line {} on layer '{}' has arc segments, they will be straight lines", start_line, polyline.layer_name());
        }
        LOG_DEBUG("{}", polyline);
        polylines.push_back(std::move(polyline));
        return ok;
    }

    //////////////////////////////////////////////////////////////////////

    std::set<std::string> dxf_drawing::layer_names() const
    {
        std::set<std::string> result;
        for(auto const &c : circles) {
            result.insert(c.layer_name());
        }
        for(auto const &p : polylines) {
            result.insert(p.layer_name());
        }
        return result;
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<dxf_entity const *> dxf_drawing::circles_on_layer(std::string_view layer) const
    {
        return select(circles, [&](dxf_entity const &c) { return layer_matches(c.layer_name(), layer); });
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<dxf_entity const *> dxf_drawing::polylines_on_layer(std::string_view layer) const
    {
        return select(polylines, [&](dxf_entity const &p) { return layer_matches(p.layer_name(), layer); });
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<dxf_entity const *> dxf_drawing::open_polylines_on_layer(std::string_view layer) const
    {
        return select(polylines, [&](dxf_entity const &p) { return layer_matches(p.layer_name(), layer) && !p.is_closed(); });
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<dxf_entity const *> dxf_drawing::closed_polylines_on_layer(std::string_view layer) const
    {
        return select(polylines, [&](dxf_entity const &p) { return layer_matches(p.layer_name(), layer) && p.is_closed(); });
    }

}    // namespace cam_lib
