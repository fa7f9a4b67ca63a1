#ifndef tcd_vertical_interp_h
#define tcd_vertical_interp_h

/// @file

#include "tcd_config.h"
#include "tcd_geo_field.h"

#include <cmath>
#include <vector>

/// Codes dealing with interpolation along the vertical axis
namespace tcd_vertical_interp
{
/// interpolation modes
enum
{
    linear = 0,         ///< linear in the vertical coordinate, e.g. height
    linear_log = 1      ///< linear in the log of the coordinate, e.g. pressure
};

/** interpolate the column y(x) of length n to xt. x must be monotonic over
 * the values that are not missing. values where x or y is missing are
 * skipped. returns 0 if xt is bracketed by the column and -1 otherwise.
 */
template <typename missing_t>
int interpolate_column(const double *x, const double *y, unsigned long n,
    unsigned long stride, double xt, int mode, const missing_t &is_missing,
    double &yt);

/** interpolate every column of the 3-D field to the target levels. coord
 * holds the vertical coordinate of each value and has the field's shape.
 * out has shape [targets, lat, lon], the target values as its levels, and
 * the field's coordinates and units. targets that a column does not
 * bracket are missing. returns 0 if successful and tcd_error::config_error
 * when the shapes do not match or a log mode coordinate is not positive.
 */
TCD_EXPORT
int interpolate(const tcd_geo_field &field, const tcd_geo_field &coord,
    const std::vector<double> &targets, int mode, p_tcd_geo_field &out);

/** interpolate every column of the 3-D field to a single level, producing a
 * 2-D field. columns that do not bracket the target take the value of the
 * lowest level when fallback is set and are missing otherwise. returns 0
 * if successful.
 */
TCD_EXPORT
int interpolate(const tcd_geo_field &field, const tcd_geo_field &coord,
    double target, int mode, int fallback, p_tcd_geo_field &out);
}

// --------------------------------------------------------------------------
template <typename missing_t>
int tcd_vertical_interp::interpolate_column(const double *x, const double *y,
    unsigned long n, unsigned long stride, double xt, int mode,
    const missing_t &is_missing, double &yt)
{
    // find the first pair of valid neighbors bracketing xt
    bool have_prev = false;
    double x0 = 0.0;
    double y0 = 0.0;

    double xt_m = mode == linear_log ? std::log(xt) : xt;

    for (unsigned long k = 0; k < n; ++k)
    {
        double xk = x[k*stride];
        double yk = y[k*stride];

        if (is_missing(xk) || is_missing(yk) ||
            ((mode == linear_log) && (xk <= 0.0)))
            continue;

        double xk_m = mode == linear_log ? std::log(xk) : xk;

        if (xk_m == xt_m)
        {
            yt = yk;
            return 0;
        }

        if (have_prev && ((x0 - xt_m)*(xk_m - xt_m) < 0.0))
        {
            double w = (xt_m - x0)/(xk_m - x0);
            yt = (1.0 - w)*y0 + w*yk;
            return 0;
        }

        have_prev = true;
        x0 = xk_m;
        y0 = yk;
    }

    return -1;
}

#endif
