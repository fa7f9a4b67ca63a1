#include "tcd_potential_intensity.h"
#include "tcd_geo_field.h"
#include "tcd_error.h"
#include "tcd_common.h"
#include "tcd_test_util.h"

#include <cmath>
#include <vector>

namespace
{
// a mean tropical sounding, pressure (hPa), temperature (degC) and mixing
// ratio (g/kg), surface first
const double sounding_p[] = {1000.0, 950.0, 900.0, 850.0, 800.0, 700.0,
    600.0, 500.0, 400.0, 300.0, 250.0, 200.0, 150.0, 100.0, 70.0, 50.0};

const double sounding_t[] = {26.5, 23.0, 20.0, 17.5, 14.5, 9.0, 2.5, -5.0,
    -15.5, -30.5, -40.0, -52.5, -66.0, -78.0, -72.0, -65.0};

const double sounding_r[] = {18.0, 16.0, 13.5, 11.0, 9.0, 5.8, 3.5, 2.0,
    0.9, 0.3, 0.1, 0.05, 0.02, 0.01, 0.01, 0.01};

const unsigned long n_levels = sizeof(sounding_p)/sizeof(double);
}

int main(int, char **)
{
    std::vector<double> p(n_levels);
    std::vector<double> t(n_levels);
    std::vector<double> r(n_levels);
    for (unsigned long k = 0; k < n_levels; ++k)
    {
        p[k] = 100.0*sounding_p[k];
        t[k] = sounding_t[k] + 273.15;
        r[k] = sounding_r[k]/1000.0;
    }

    double sst = 302.0;
    double msl = 101500.0;

    tcd_potential_intensity pi;

    tcd_pi_column col;
    if (pi.compute(sst, msl, p.data(), t.data(), r.data(), n_levels, 1, col)
        != tcd_potential_intensity::success)
    {
        TCD_ERROR("Failed to compute the potential intensity. status "
            << tcd_potential_intensity::get_status_name(col.status))
        return -1;
    }

    if ((col.vmax < 20.0) || (col.vmax > 120.0) || (col.pmin < 85000.0) ||
        (col.pmin > msl) || (col.tout < 180.0) || (col.tout > 240.0) ||
        (col.pout < 5000.0) || (col.pout > 30000.0))
    {
        TCD_ERROR("Unphysical potential intensity vmax=" << col.vmax
            << " pmin=" << col.pmin << " tout=" << col.tout
            << " pout=" << col.pout)
        return -1;
    }

    // dissipative heating raises the intensity
    tcd_potential_intensity pi_nd;
    pi_nd.set_diss_flag(0);

    tcd_pi_column col_nd;
    if ((pi_nd.compute(sst, msl, p.data(), t.data(), r.data(), n_levels, 1,
        col_nd) != tcd_potential_intensity::success) ||
        !(col_nd.vmax < col.vmax))
    {
        TCD_ERROR("Dissipative heating did not raise vmax " << col_nd.vmax
            << " >= " << col.vmax)
        return -1;
    }

    // cold water
    if (pi.compute(276.0, msl, p.data(), t.data(), r.data(), n_levels, 1, col)
        != tcd_potential_intensity::cold_sst)
    {
        TCD_ERROR("A cold SST was not flagged")
        return -1;
    }

    // a grid of two columns, the second over land
    p_tcd_geo_field lat;
    p_tcd_geo_field lon;
    tcd_test_util::make_coordinates(15.0, 15.0, 1, 140.0, 141.0, 2, lat, lon);

    p_tcd_geo_field pres = tcd_test_util::make_field("pressure", "Pa",
        n_levels, lat, lon, [&p](unsigned long k, double, double) -> double
        { return p[k]; });

    p_tcd_geo_field temp = tcd_test_util::make_field("temperature", "K",
        n_levels, lat, lon, [&t](unsigned long k, double, double) -> double
        { return t[k]; });

    p_tcd_geo_field mxrt = tcd_test_util::make_field("mixing_ratio", "kg/kg",
        n_levels, lat, lon, [&r](unsigned long k, double, double) -> double
        { return r[k]; });

    p_tcd_geo_field sstf = tcd_test_util::make_field("sst", "K", 0, lat, lon,
        [sst](unsigned long, double, double) -> double { return sst; });

    p_tcd_geo_field mslf = tcd_test_util::make_field("msl", "Pa", 0, lat, lon,
        [msl](unsigned long, double, double) -> double { return msl; });

    p_tcd_geo_field zsfc = tcd_test_util::make_field("zsfc", "m", 0, lat, lon,
        [](unsigned long, double, double x) -> double
        { return x < 140.5 ? 0.0 : 500.0; });

    tcd_pi_fields out;
    if (pi.execute(sstf.get(), *mslf, *zsfc, *pres, *temp, *mxrt, out))
    {
        TCD_ERROR("Failed to compute the potential intensity of the grid")
        return -1;
    }

    if ((*out.status)[0] != tcd_potential_intensity::success)
    {
        TCD_ERROR("The ocean column was not computed")
        return -1;
    }

    tcd_pi_column ref;
    if ((pi.compute(sst, msl, p.data(), t.data(), r.data(), n_levels, 1, ref)
        != tcd_potential_intensity::success) ||
        !tcd_test_util::close((*out.vmax)[0], ref.vmax, 1e-12) ||
        !tcd_test_util::close((*out.pmin)[0], ref.pmin, 1e-12))
    {
        TCD_ERROR("The grid and column results differ")
        return -1;
    }

    if (((*out.status)[1] != tcd_potential_intensity::not_computed) ||
        !out.vmax->is_missing((*out.vmax)[1]) ||
        !out.pmin->is_missing((*out.pmin)[1]))
    {
        TCD_ERROR("The land column was computed")
        return -1;
    }

    // parameters
    pi.set_ascent_flag(2.0);
    if (pi.validate() != tcd_error::config_error)
    {
        TCD_ERROR("An invalid ascent_flag was accepted")
        return -1;
    }

    pi.set_ascent_flag(0.0);
    pi.set_mslp_max(1050.0);
    if (pi.get_mslp_max_pa() != 105000.0)
    {
        TCD_ERROR("mslp_max in hPa was not converted")
        return -1;
    }

    return 0;
}
