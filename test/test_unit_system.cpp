#include "tcd_unit_system.h"
#include "tcd_geo_field.h"
#include "tcd_error.h"
#include "tcd_common.h"
#include "tcd_test_util.h"

#include <cmath>
#include <string>

using tcd_test_util::close;

int main(int, char **)
{
    tcd_unit_system units;

    // spellings of the same unit
    if (!units.is_known("hPa") || !units.is_known("mb") ||
        !units.is_known("degC") || !units.is_known("mps") ||
        !units.is_known(" Kg/Kg ") || units.is_known("furlongs"))
    {
        TCD_ERROR("Unit recognition is wrong")
        return -1;
    }

    // conversions
    double p = 1013.25;
    double t = 26.0;
    double v = 10.0;
    double h = 58.3e7;
    if (units.convert(p, "hPa", "Pa") || units.convert(t, "degC", "K") ||
        units.convert(v, "kts", "m/s") || units.convert(h, "J/m2", "kJ/cm2"))
    {
        TCD_ERROR("Conversion failed")
        return -1;
    }

    if (!close(p, 101325.0, 1e-12) || !close(t, 299.15, 1e-12) ||
        !close(v, 10.0*1852.0/3600.0, 1e-12) || !close(h, 58.3, 1e-12))
    {
        TCD_ERROR("Wrong conversions p=" << p << " t=" << t << " v=" << v
            << " h=" << h)
        return -1;
    }

    // there and back
    double x = 18.5;
    if (units.convert(x, "degF", "degC") || units.convert(x, "degC", "degF") ||
        !close(x, 18.5, 1e-12))
    {
        TCD_ERROR("Temperature round trip gave " << x)
        return -1;
    }

    // aliases share the dimension of their unit
    std::string dim;
    if (units.get_dimension("mb", dim) || (dim != "pressure") ||
        (units.get_dimension("furlongs", dim) != tcd_error::unit_error))
    {
        TCD_ERROR("Wrong dimension \"" << dim << "\" for millibars")
        return -1;
    }

    // incompatible and unknown units
    double y = 1.0;
    if (units.compatible("Pa", "K") ||
        (units.convert(y, "Pa", "K") != tcd_error::unit_error) ||
        (units.convert(y, "parsecs", "m") != tcd_error::unit_error))
    {
        TCD_ERROR("Invalid conversions were not reported as unit errors")
        return -1;
    }

    // fields keep missing values and take the new unit string
    p_tcd_geo_field lat;
    p_tcd_geo_field lon;
    tcd_test_util::make_coordinates(-10.0, 10.0, 3, 0.0, 20.0, 3, lat, lon);

    p_tcd_geo_field f = tcd_test_util::make_field("temperature", "K", 0, lat, lon,
        [](unsigned long, double, double) -> double { return 273.15; });

    double fill = f->get_fill_value();
    (*f)[4] = fill;

    if (units.convert(*f, "degC"))
    {
        TCD_ERROR("Field conversion failed")
        return -1;
    }

    if (!close((*f)[0], 0.0, 1e-12) || ((*f)[4] != fill) ||
        (f->get_units() != "degC"))
    {
        TCD_ERROR("Wrong field conversion " << (*f)[0] << " " << (*f)[4]
            << " " << f->get_units())
        return -1;
    }

    return 0;
}
