#include "tcd_spectral_decomposer.h"
#include "tcd_polar_field.h"
#include "tcd_wavenumber_spectrum.h"
#include "tcd_array_attributes.h"
#include "tcd_tc_fix.h"
#include "tcd_error.h"
#include "tcd_common.h"
#include "tcd_test_util.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <vector>

namespace
{
// make a polar field with values f(r, azimuth)
p_tcd_polar_field make_polar(unsigned long n_rad, unsigned long n_az,
    const std::function<double(double, double)> &f)
{
    std::vector<double> radial(n_rad);
    for (unsigned long i = 0; i < n_rad; ++i)
        radial[i] = 1.0e4*i;

    std::vector<double> azimuth(n_az);
    for (unsigned long j = 0; j < n_az; ++j)
        azimuth[j] = 2.0*M_PI*j/n_az;

    p_tcd_polar_field p = tcd_polar_field::New("wspd", radial, azimuth,
        tcd_tc_fix("09L", 25.0, -75.0));

    p->set_attributes(tcd_array_attributes("m/s", "wind speed", "", 1,
        tcd_array_attributes::default_fill_value()));

    for (unsigned long i = 0; i < n_rad; ++i)
        for (unsigned long j = 0; j < n_az; ++j)
            (*p)(i, j) = f(radial[i], azimuth[j]);

    return p;
}

// the largest magnitude of a field
double max_abs(const tcd_polar_field &p)
{
    double m = 0.0;
    for (double v : p.get_values())
        m = std::max(m, std::fabs(v));
    return m;
}
}

int main(int, char **)
{
    tcd_spectral_decomposer dec;
    dec.set_max_wavenumber(3);

    // a uniform azimuthally symmetric wind is all wavenumber 0
    p_tcd_polar_field uniform = make_polar(11, 16,
        [](double, double) -> double { return 10.0; });

    p_tcd_wavenumber_spectrum spec;
    tcd_spectral_summary summary;
    if (dec.decompose(uniform, spec) ||
        tcd_spectral_decomposer::summarize(*spec, summary))
    {
        TCD_ERROR("Failed to decompose the uniform field")
        return -1;
    }

    if ((summary.wn_max.size() != 4) ||
        !tcd_test_util::close(summary.wn_max[0], 10.0, 1e-9) ||
        (summary.wn_max[1] > 1e-9) || (summary.wn_max[2] > 1e-9) ||
        (summary.wn_max[3] > 1e-9) ||
        !tcd_test_util::close(summary.vmax, 10.0, 1e-12) ||
        (std::fabs(summary.epsilon_max) > 1e-9))
    {
        TCD_ERROR("Wrong decomposition of the uniform field " << summary.wn_max)
        return -1;
    }

    // components sum to the truncated field and the residual holds the rest
    p_tcd_polar_field mixed = make_polar(11, 16,
        [](double r, double a) -> double
        {
            double s = r/1.0e5;
            return 5.0 + 3.0*s*std::cos(a) + 2.0*std::sin(2.0*a) +
                std::cos(5.0*a);
        });

    if (dec.decompose(mixed, spec) ||
        tcd_spectral_decomposer::summarize(*spec, summary))
    {
        TCD_ERROR("Failed to decompose the mixed field")
        return -1;
    }

    double err = 1.0;
    if (spec->get_reconstruction_error(err) || (err > 1e-6))
    {
        TCD_ERROR("Reconstruction error " << err << " is too large")
        return -1;
    }

    if (!tcd_test_util::close(max_abs(*spec->get_component(1)), 3.0, 1e-9) ||
        !tcd_test_util::close(max_abs(*spec->get_component(2)), 2.0, 1e-9) ||
        (max_abs(*spec->get_component(3)) > 1e-9) ||
        !tcd_test_util::close(max_abs(*spec->get_residual()), 1.0, 1e-9))
    {
        TCD_ERROR("Wrong components of the mixed field")
        return -1;
    }

    for (unsigned long i = 0; i < mixed->get_number_of_radii(); ++i)
    {
        for (unsigned long j = 0; j < mixed->get_number_of_azimuths(); ++j)
        {
            double sum = (*spec->get_truncated())(i, j) +
                (*spec->get_residual())(i, j);

            if (!tcd_test_util::close(sum, (*mixed)(i, j), 1e-9))
            {
                TCD_ERROR("truncated + residual != original at " << i
                    << ", " << j)
                return -1;
            }
        }
    }

    // rings with missing values are missing in every component
    p_tcd_polar_field holes = mixed->new_copy();
    (*holes)(4, 3) = tcd_array_attributes::default_fill_value();
    if (dec.decompose(holes, spec))
    {
        TCD_ERROR("Failed to decompose a field with missing values")
        return -1;
    }

    for (unsigned int k = 0; k < spec->get_number_of_components(); ++k)
    {
        if (!spec->get_component(k)->ring_has_missing(4) ||
            spec->get_component(k)->ring_has_missing(5))
        {
            TCD_ERROR("Missing values were not carried into component " << k)
            return -1;
        }
    }

    // the azimuthal sampling must resolve the largest wavenumber
    p_tcd_polar_field coarse = make_polar(3, 6,
        [](double, double) -> double { return 1.0; });

    if (dec.decompose(coarse, spec) != tcd_error::config_error)
    {
        TCD_ERROR("An unresolved wavenumber was accepted")
        return -1;
    }

    return 0;
}
