#include "tcd_wavenumber_spectrum.h"

#include <algorithm>
#include <cmath>

// --------------------------------------------------------------------------
p_tcd_wavenumber_spectrum tcd_wavenumber_spectrum::New(
    const const_p_tcd_polar_field &original, unsigned int max_wavenumber)
{
    p_tcd_wavenumber_spectrum spec(new tcd_wavenumber_spectrum);
    spec->original = original;
    spec->components.resize(max_wavenumber + 1);
    return spec;
}

// --------------------------------------------------------------------------
int tcd_wavenumber_spectrum::get_reconstruction_error(double &err) const
{
    err = 0.0;

    if (!this->original || !this->residual)
        return -1;

    for (const const_p_tcd_polar_field &comp : this->components)
    {
        if (!comp)
            return -1;
    }

    unsigned long n = this->original->size();
    const double *p_orig = this->original->data();
    const double *p_resid = this->residual->data();

    double max_abs = 0.0;
    double max_err = 0.0;
    for (unsigned long i = 0; i < n; ++i)
    {
        if (this->original->is_missing(p_orig[i]))
            continue;

        double sum = p_resid[i];
        for (const const_p_tcd_polar_field &comp : this->components)
            sum += comp->data()[i];

        max_err = std::max(max_err, std::fabs(sum - p_orig[i]));
        max_abs = std::max(max_abs, std::fabs(p_orig[i]));
    }

    err = max_abs > 0.0 ? max_err/max_abs : max_err;

    return 0;
}
