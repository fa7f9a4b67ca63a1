#include "tcd_spectral_decomposer.h"
#include "tcd_coordinate_util.h"
#include "tcd_physical_constants.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <unsupported/Eigen/FFT>

#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>

// --------------------------------------------------------------------------
int tcd_spectral_decomposer::decompose(const const_p_tcd_polar_field &field,
    p_tcd_wavenumber_spectrum &spectrum) const
{
    unsigned long n_rad = field->get_number_of_radii();
    unsigned long n_az = field->get_number_of_azimuths();
    unsigned int max_wn = this->max_wavenumber;

    if (2ul*max_wn >= n_az)
    {
        TCD_ERROR("Wavenumber " << max_wn << " can't be resolved by "
            << n_az << " azimuths. The largest wavenumber must be less than"
            " half the number of azimuths")
        return tcd_error::config_error;
    }

    double fill_value = field->get_fill_value();
    const std::string &name = field->get_name();

    std::vector<p_tcd_polar_field> comps(max_wn + 1);
    for (unsigned int k = 0; k <= max_wn; ++k)
    {
        comps[k] = tcd_polar_field::New(name + "_wn" + std::to_string(k), *field);
        comps[k]->set_attributes(field->get_attributes());
    }

    p_tcd_polar_field truncated = tcd_polar_field::New(name + "_truncated", *field);
    truncated->set_attributes(field->get_attributes());

    p_tcd_polar_field residual = tcd_polar_field::New(name + "_residual", *field);
    residual->set_attributes(field->get_attributes());

    Eigen::FFT<double> fft;
    std::vector<double> ring(n_az);
    std::vector<std::complex<double>> coefs;
    std::vector<std::complex<double>> comp_coefs(n_az);
    std::vector<std::complex<double>> comp_vals;

    for (unsigned long i = 0; i < n_rad; ++i)
    {
        unsigned long q0 = i*n_az;

        if (field->ring_has_missing(i))
        {
            for (unsigned int k = 0; k <= max_wn; ++k)
                std::fill_n(comps[k]->data() + q0, n_az, fill_value);
            std::fill_n(truncated->data() + q0, n_az, fill_value);
            std::fill_n(residual->data() + q0, n_az, fill_value);
            continue;
        }

        const double *p_ring = field->data() + q0;
        ring.assign(p_ring, p_ring + n_az);

        fft.fwd(coefs, ring);

        double *p_trunc = truncated->data() + q0;
        std::fill_n(p_trunc, n_az, 0.0);

        for (unsigned int k = 0; k <= max_wn; ++k)
        {
            // keep the Hermitian pair so that the component is real
            std::fill(comp_coefs.begin(), comp_coefs.end(),
                std::complex<double>(0.0, 0.0));

            comp_coefs[k] = coefs[k];
            if (k > 0)
                comp_coefs[n_az - k] = coefs[n_az - k];

            fft.inv(comp_vals, comp_coefs);

            double *p_comp = comps[k]->data() + q0;
            for (unsigned long j = 0; j < n_az; ++j)
            {
                p_comp[j] = comp_vals[j].real();
                p_trunc[j] += p_comp[j];
            }
        }

        double *p_resid = residual->data() + q0;
        for (unsigned long j = 0; j < n_az; ++j)
            p_resid[j] = p_ring[j] - p_trunc[j];
    }

    spectrum = tcd_wavenumber_spectrum::New(field, max_wn);
    for (unsigned int k = 0; k <= max_wn; ++k)
        spectrum->set_component(k, comps[k]);
    spectrum->set_truncated(truncated);
    spectrum->set_residual(residual);

    return 0;
}

// --------------------------------------------------------------------------
int tcd_spectral_decomposer::summarize(const tcd_wavenumber_spectrum &spectrum,
    tcd_spectral_summary &summary)
{
    const_p_tcd_polar_field original = spectrum.get_original();

    unsigned long n_rad = original->get_number_of_radii();
    unsigned long n_az = original->get_number_of_azimuths();
    unsigned long n = original->size();

    summary = tcd_spectral_summary();

    // location of the maximum of the original field
    const double *p_orig = original->data();
    unsigned long q_max = n;
    for (unsigned long q = 0; q < n; ++q)
    {
        if (original->is_missing(p_orig[q]))
            continue;

        if ((q_max == n) || (p_orig[q] > p_orig[q_max]))
            q_max = q;
    }

    if (q_max == n)
    {
        TCD_ERROR("All values of \"" << original->get_name() << "\" are missing")
        return tcd_error::numerical_error;
    }

    unsigned long i_max = q_max/n_az;
    unsigned long j_max = q_max % n_az;

    summary.vmax = p_orig[q_max];
    summary.rmw = original->get_radial()[i_max];
    summary.azimuth = original->get_azimuth()[j_max]*
        tcd_physical_constants::rad_to_deg();

    const tcd_tc_fix &fix = original->get_tc_fix();
    tcd_coordinate_util::great_circle_destination(fix.lat_deg, fix.lon_deg,
        original->get_azimuth()[j_max], summary.rmw, summary.lat_rmw,
        summary.lon_rmw);

    // per wavenumber maxima
    unsigned int n_comp = spectrum.get_number_of_components();
    summary.wn_max.assign(n_comp, 0.0);

    std::vector<double> wn0p1(n, 0.0);
    for (unsigned int k = 0; k < n_comp; ++k)
    {
        const_p_tcd_polar_field comp = spectrum.get_component(k);
        const double *p_comp = comp->data();

        double max_abs = 0.0;
        for (unsigned long q = 0; q < n; ++q)
        {
            if (comp->is_missing(p_comp[q]))
                continue;

            max_abs = std::max(max_abs, std::fabs(p_comp[q]));

            if (k < 2)
                wn0p1[q] += p_comp[q];
        }

        summary.wn_max[k] = max_abs;
    }

    double wn0p1_max = -std::numeric_limits<double>::max();
    for (unsigned long i = 0; i < n_rad; ++i)
    {
        if (original->ring_has_missing(i))
            continue;

        for (unsigned long j = 0; j < n_az; ++j)
            wn0p1_max = std::max(wn0p1_max, wn0p1[i*n_az + j]);
    }

    summary.wn0p1_max = wn0p1_max;
    summary.epsilon_max = summary.vmax - summary.wn0p1_max;

    return 0;
}

// --------------------------------------------------------------------------
void tcd_spectral_decomposer::get_wavenumber_table(
    const tcd_spectral_summary &summary, const std::string &units,
    tcd_table &table)
{
    table.declare_columns({"wavenumber", "max (" + units + ")"});

    unsigned int n_comp = summary.wn_max.size();
    for (unsigned int k = 0; k < n_comp; ++k)
        table.append(k, summary.wn_max[k]);
}
