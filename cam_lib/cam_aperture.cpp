//////////////////////////////////////////////////////////////////////

#include "cam_error.h"
#include "cam_drawing.h"
#include "cam_aperture.h"

LOG_CONTEXT("aperture", info);

namespace cam_lib
{
    //////////////////////////////////////////////////////////////////////

    std::set<double> measure_drawing(dxf_drawing const &drawing)
    {
        std::set<double> diameters;

        for(auto const &c : drawing.circles) {
            diameters.insert(c.diameter.value_or(0.0));
        }

        for(auto const &p : drawing.polylines) {
            diameters.insert(p.width.value_or(0.0));
        }

        LOG_VERBOSE("{} distinct diameters in {}", diameters.size(), drawing.filename);
        return diameters;
    }

    //////////////////////////////////////////////////////////////////////

    int cam_aperture_table::define(double diameter)
    {
        auto f = codes.find(diameter);
        if(f != codes.end()) {
            return f->second;
        }
        int code = next_code;
        next_code += 1;
        codes[diameter] = code;
        LOG_DEBUG("Code {} is diameter {:g}", code, diameter);
        return code;
    }

    //////////////////////////////////////////////////////////////////////

    cam_error_code cam_aperture_table::get_code(double diameter, int *code) const
    {
        if(code == nullptr) {
            return error_internal_bad_pointer;
        }
        if(!cam_util::map_get_if_found(codes, diameter, code)) {
            LOG_ERROR("No code defined for diameter {:g}", diameter);
            return error_undefined_aperture;
        }
        return ok;
    }

}    // namespace cam_lib
