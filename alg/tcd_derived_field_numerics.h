#ifndef tcd_derived_field_numerics_h
#define tcd_derived_field_numerics_h

/// @file

#include "tcd_config.h"
#include "tcd_physical_constants.h"

#include <cmath>

/** Point wise kernels used by the derived field methods. Inputs are in the
 * units of the method's contract. A value is missing in the output wherever
 * any of the values it depends on is missing.
 */
namespace tcd_derived_field_numerics
{
/** integrate layer thickness upward from the surface. level 0 is the
 * surface.
 *
 * p(0) = psfc
 * p(k) = p(k-1) - dp(k)
 */
template <typename num_t, typename missing_t>
void pressure_from_thickness(unsigned long n_lev, unsigned long n_horiz,
    const num_t *dp, const num_t *psfc, const missing_t &is_missing,
    num_t fill_value, num_t *p)
{
    for (unsigned long i = 0; i < n_horiz; ++i)
        p[i] = is_missing(psfc[i]) ? fill_value : psfc[i];

    for (unsigned long k = 1; k < n_lev; ++k)
    {
        const num_t *p_below = p + (k - 1)*n_horiz;
        const num_t *dp_k = dp + k*n_horiz;
        num_t *p_k = p + k*n_horiz;

        for (unsigned long i = 0; i < n_horiz; ++i)
        {
            p_k[i] = (is_missing(p_below[i]) || is_missing(dp_k[i])) ?
                fill_value : p_below[i] - dp_k[i];
        }
    }
}

/** height in the standard atmosphere.
 *
 * h = T0/G (1 - (p/p0)^(Rd G/g))
 */
template <typename num_t, typename missing_t>
void height_from_pressure(unsigned long n, const num_t *p,
    const missing_t &is_missing, num_t fill_value, num_t *h)
{
    using namespace tcd_physical_constants;

    num_t t0 = standard_temperature<num_t>();
    num_t lapse = standard_lapse_rate<num_t>();
    num_t p0 = standard_pressure<num_t>();
    num_t ex = rd<num_t>()*lapse/gravity<num_t>();

    for (unsigned long i = 0; i < n; ++i)
    {
        h[i] = (is_missing(p[i]) || (p[i] <= num_t(0))) ? fill_value :
            t0/lapse*(num_t(1) - std::pow(p[i]/p0, ex));
    }
}

/** reduce surface pressure to sea level using the mean virtual temperature
 * of a column of air extending from the surface down to sea level.
 *
 * Tv = T (1 + q (1/eps - 1))
 * Tm = Tv + G z/2
 * pslp = psfc exp(g z/(Rd Tm))
 */
template <typename num_t, typename missing_t>
void pressure_to_sealevel(unsigned long n, const num_t *psfc,
    const num_t *zsfc, const num_t *t, const num_t *q,
    const missing_t &is_missing, num_t fill_value, num_t *pslp)
{
    using namespace tcd_physical_constants;

    num_t g = gravity<num_t>();
    num_t r_d = rd<num_t>();
    num_t lapse = standard_lapse_rate<num_t>();
    num_t q_fac = num_t(1)/epsilon<num_t>() - num_t(1);

    for (unsigned long i = 0; i < n; ++i)
    {
        if (is_missing(psfc[i]) || is_missing(zsfc[i]) ||
            is_missing(t[i]) || is_missing(q[i]))
        {
            pslp[i] = fill_value;
            continue;
        }

        num_t tv = t[i]*(num_t(1) + q_fac*q[i]);
        num_t tm = tv + num_t(0.5)*lapse*zsfc[i];

        pslp[i] = psfc[i]*std::exp(g*zsfc[i]/(r_d*tm));
    }
}

/// mixing ratio from specific humidity, r = q/(1 - q)
template <typename num_t, typename missing_t>
void spfh_to_mxrt(unsigned long n, const num_t *q,
    const missing_t &is_missing, num_t fill_value, num_t *r)
{
    for (unsigned long i = 0; i < n; ++i)
    {
        r[i] = (is_missing(q[i]) || (q[i] >= num_t(1))) ? fill_value :
            q[i]/(num_t(1) - q[i]);
    }
}

/// magnitude of the horizontal wind
template <typename num_t, typename missing_t>
void wind_speed(unsigned long n, const num_t *u, const num_t *v,
    const missing_t &is_missing, num_t fill_value, num_t *w)
{
    for (unsigned long i = 0; i < n; ++i)
    {
        w[i] = (is_missing(u[i]) || is_missing(v[i])) ? fill_value :
            std::sqrt(u[i]*u[i] + v[i]*v[i]);
    }
}

/** sea water pressure from depth after Saunders (1981). depth in meters,
 * latitude in degrees, result in Pa.
 *
 * c1 = (5.92 + 5.25 sin^2(lat)) 10^-3
 * p = ((1 - c1) - sqrt((1 - c1)^2 - 8.84e-6 z))/4.42e-6 dbar
 */
template <typename num_t>
num_t seawater_pressure(num_t depth, num_t lat)
{
    using namespace tcd_physical_constants;

    num_t s = std::sin(lat*deg_to_rad<num_t>());
    num_t c1 = (num_t(5.92) + num_t(5.25)*s*s)*num_t(1.0e-3);
    num_t a = num_t(1) - c1;

    num_t p_dbar = (a - std::sqrt(a*a - num_t(8.84e-6)*depth))/num_t(4.42e-6);

    return p_dbar*num_t(1.0e4);
}
}

#endif
