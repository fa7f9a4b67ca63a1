#include "tcd_steering_flow.h"
#include "tcd_streamfunction.h"
#include "tcd_geo_field.h"
#include "tcd_tc_fix.h"
#include "tcd_error.h"
#include "tcd_common.h"
#include "tcd_test_util.h"

#include <cmath>
#include <vector>

namespace
{
// --------------------------------------------------------------------------
int check_partition(const const_p_tcd_geo_field &lat,
    const const_p_tcd_geo_field &lon)
{
    const double d2r = M_PI/180.0;

    p_tcd_geo_field u = tcd_test_util::make_field("u", "m/s", 2, lat, lon,
        [d2r](unsigned long k, double y, double x) -> double
        { return (k + 1.0)*10.0*std::cos(y*d2r)*std::sin(4.0*x*d2r); });

    p_tcd_geo_field v = tcd_test_util::make_field("v", "m/s", 2, lat, lon,
        [d2r](unsigned long, double y, double x) -> double
        { return 5.0*std::cos(3.0*x*d2r)*std::sin(2.0*y*d2r); });

    // one missing wind
    unsigned long n_horiz = u->get_horizontal_size();
    unsigned long q_miss = n_horiz + 7*u->get_number_of_lon() + 9;
    (*u)[q_miss] = u->get_fill_value();

    tcd_streamfunction sf;
    tcd_wind_partition parts;
    if (sf.partition(*u, *v, parts))
    {
        TCD_ERROR("Failed to partition the wind")
        return -1;
    }

    for (unsigned long q = 0; q < u->size(); ++q)
    {
        if (q == q_miss)
        {
            if (!parts.urot->is_missing((*parts.urot)[q]) ||
                !parts.uhrm->is_missing((*parts.uhrm)[q]))
            {
                TCD_ERROR("The partition of a missing wind is not missing")
                return -1;
            }
            continue;
        }

        double u_sum = (*parts.urot)[q] + (*parts.udiv)[q] + (*parts.uhrm)[q];
        double v_sum = (*parts.vrot)[q] + (*parts.vdiv)[q] + (*parts.vhrm)[q];

        if (!tcd_test_util::close(u_sum, (*u)[q], 1e-9) ||
            !tcd_test_util::close(v_sum, (*v)[q], 1e-9))
        {
            TCD_ERROR("The parts do not sum to the wind at " << q)
            return -1;
        }
    }

    // psi and chi vanish on the boundary of a regional grid
    unsigned long n_lon = u->get_number_of_lon();
    for (unsigned long i = 0; i < n_lon; ++i)
    {
        if (((*parts.psi)[i] != 0.0) || ((*parts.chi)[i] != 0.0))
        {
            TCD_ERROR("The streamfunction is not zero on the boundary")
            return -1;
        }
    }

    // mismatched shapes
    p_tcd_geo_field v2d = tcd_test_util::make_field("v", "m/s", 0, lat, lon,
        [](unsigned long, double, double) -> double { return 0.0; });

    if (sf.partition(*u, *v2d, parts) != tcd_error::config_error)
    {
        TCD_ERROR("Winds of different shapes were partitioned")
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int check_uniform_steering(const const_p_tcd_geo_field &lat,
    const const_p_tcd_geo_field &lon)
{
    std::vector<double> plev = {100000.0, 90000.0, 70000.0, 50000.0,
        30000.0, 15000.0};

    unsigned long n_lev = plev.size();

    p_tcd_geo_field u = tcd_test_util::make_field("u", "m/s", n_lev, lat, lon,
        [](unsigned long, double, double) -> double { return 5.0; });

    p_tcd_geo_field v = tcd_test_util::make_field("v", "m/s", n_lev, lat, lon,
        [](unsigned long, double, double) -> double { return -3.0; });

    p_tcd_geo_field pres = tcd_test_util::make_field("pressure", "Pa", n_lev,
        lat, lon, [&plev](unsigned long k, double, double) -> double
        { return plev[k]; });

    tcd_steering_flow steer;
    steer.set_isolevels({100000.0, 85000.0, 70000.0, 50000.0, 30000.0,
        20000.0});
    steer.set_layers({85000.0, 20000.0});
    steer.set_ncoeffs(5);

    tcd_steering_products products;
    tcd_steering_layer_list layers;
    if (steer.prepare(*u, *v, *pres, products, layers))
    {
        TCD_ERROR("Failed to prepare the steering flow")
        return -1;
    }

    if ((layers.size() != 1) || (layers[0].number_of_levels != 5) ||
        (layers[0].get_name() != "850_200"))
    {
        TCD_ERROR("Wrong layers")
        return -1;
    }

    tcd_tc_fix fix("01W", 15.0, 140.0);
    tcd_warning_log log;
    tcd_steering_vector result;
    if (steer.execute(fix, layers[0], log, result))
    {
        TCD_ERROR("Failed to compute the steering flow")
        return -1;
    }

    // a uniform wind has rank one
    if ((result.ncoeffs != 1) ||
        (log.count(tcd_warning_log::rank_deficiency_warning) != 2))
    {
        TCD_ERROR("Expected rank deficiency warnings for both components."
            " ncoeffs = " << result.ncoeffs << " warnings = "
            << log.count(tcd_warning_log::rank_deficiency_warning))
        return -1;
    }

    double heading = std::atan2(5.0, -3.0)*180.0/M_PI;

    if (!tcd_test_util::close(result.u_steer, 5.0, 1e-9) ||
        !tcd_test_util::close(result.v_steer, -3.0, 1e-9) ||
        !tcd_test_util::close(result.speed, std::sqrt(34.0), 1e-9) ||
        !tcd_test_util::close(result.heading, heading, 1e-9))
    {
        TCD_ERROR("Wrong steering vector (" << result.u_steer << ", "
            << result.v_steer << ") heading " << result.heading)
        return -1;
    }

    // a TC far from the grid
    tcd_tc_fix far("02W", -60.0, 20.0);
    if (steer.execute(far, layers[0], log, result) != tcd_error::config_error)
    {
        TCD_ERROR("A TC outside the grid was processed")
        return -1;
    }

    // a layer holding no level
    p_tcd_geo_field mean;
    if (tcd_steering_flow::layer_mean(*products.uwnd, 19000.0, 16000.0,
        mean) != tcd_error::config_error)
    {
        TCD_ERROR("An empty layer was averaged")
        return -1;
    }

    // bottom above top
    steer.set_layers({20000.0, 85000.0});
    if (steer.validate() != tcd_error::config_error)
    {
        TCD_ERROR("An inverted layer was accepted")
        return -1;
    }

    return 0;
}
}

int main(int, char **)
{
    p_tcd_geo_field lat;
    p_tcd_geo_field lon;
    tcd_test_util::make_coordinates(0.0, 30.0, 31, 120.0, 160.0, 41, lat, lon);

    if (check_partition(lat, lon) || check_uniform_steering(lat, lon))
        return -1;

    return 0;
}
