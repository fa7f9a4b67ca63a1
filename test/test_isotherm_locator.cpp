#include "tcd_isotherm_locator.h"
#include "tcd_isotherm_profile.h"
#include "tcd_geo_field.h"
#include "tcd_error.h"
#include "tcd_common.h"
#include "tcd_test_util.h"

#include <cmath>
#include <vector>

int main(int, char **)
{
    std::vector<double> depth = {0.0, 25.0, 50.0, 75.0, 100.0};

    // single columns
    double temp[] = {28.0, 27.0, 26.5, 25.0, 20.0};

    tcd_isotherm_locator loc;
    loc.set_isotherm(26.0);

    double z = 0.0;
    if (loc.locate_isotherm(temp, depth.data(), 5, z) ||
        !tcd_test_util::close(z, 50.0 + 25.0/3.0, 1e-12))
    {
        TCD_ERROR("Wrong linear isotherm depth " << z)
        return -1;
    }

    loc.set_interp_type("nearest");
    if (loc.locate_isotherm(temp, depth.data(), 5, z) || (z != 50.0))
    {
        TCD_ERROR("Wrong nearest isotherm depth " << z)
        return -1;
    }
    loc.set_interp_type("linear");

    double warm[] = {30.0, 29.0, 28.0, 27.5, 27.0};
    if (!loc.locate_isotherm(warm, depth.data(), 5, z) ||
        (z != loc.get_fill_value()))
    {
        TCD_ERROR("The isotherm was extrapolated to " << z)
        return -1;
    }

    // T = 30 - z/10 reaches 26 degC at 40 m and the heat content is
    // rho cp (4*40 - 40*40/20)
    double lin_t[] = {30.0, 25.0, 20.0};
    double lin_z[] = {0.0, 50.0, 100.0};

    loc.set_rho(1000.0);
    loc.set_cp(4000.0);

    double tchp = loc.integrate(lin_t, lin_z, 3, 40.0);
    if (!tcd_test_util::close(tchp, 80.0*1000.0*4000.0, 1e-9))
    {
        TCD_ERROR("Wrong heat content " << tchp)
        return -1;
    }

    // a grid of three columns. the first holds the profile above, the
    // second never cools to the isotherm, the third is colder than it
    p_tcd_geo_field lat;
    p_tcd_geo_field lon;
    tcd_test_util::make_coordinates(20.0, 20.0, 1, 0.0, 2.0, 3, lat, lon);

    p_tcd_geo_field ocean_t = tcd_test_util::make_field("ocean_temperature",
        "degC", 5, lat, lon, [&](unsigned long k, double, double x) -> double
        {
            if (x < 0.5)
                return temp[k];
            if (x < 1.5)
                return warm[k];
            return 20.0 - k;
        });

    p_tcd_geo_field ocean_z = tcd_geo_field::New("depth", {5});
    ocean_z->set_units("m");
    ocean_z->get_values() = depth;

    tcd_warning_log log;
    tcd_isotherm_profile profile;
    if (loc.execute(*ocean_t, *ocean_z, log, profile))
    {
        TCD_ERROR("Failed to locate the isotherm")
        return -1;
    }

    if (!tcd_test_util::close((*profile.depth)[0], 50.0 + 25.0/3.0, 1e-12) ||
        ((*profile.depth)[1] != loc.get_fill_value()) ||
        ((*profile.depth)[2] != loc.get_fill_value()))
    {
        TCD_ERROR("Wrong isotherm depths " << profile.depth->get_values())
        return -1;
    }

    if (!((*profile.tchp)[0] > 0.0) ||
        ((*profile.tchp)[1] != loc.get_fill_value()) ||
        ((*profile.tchp)[2] != 0.0))
    {
        TCD_ERROR("Wrong heat content " << profile.tchp->get_values())
        return -1;
    }

    if ((profile.number_not_found != 2) ||
        (log.count(tcd_warning_log::isotherm_not_found_warning) != 1))
    {
        TCD_ERROR("Columns without the isotherm were not reported")
        return -1;
    }

    // invalid parameters
    loc.set_interp_type("cubic");
    if (loc.execute(*ocean_t, *ocean_z, log, profile) != tcd_error::config_error)
    {
        TCD_ERROR("An unknown interp_type was accepted")
        return -1;
    }

    loc.set_interp_type("linear");
    loc.set_deltaz(0.0);
    if (loc.validate() != tcd_error::config_error)
    {
        TCD_ERROR("A zero integration step was accepted")
        return -1;
    }

    return 0;
}
