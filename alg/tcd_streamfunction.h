#ifndef tcd_streamfunction_h
#define tcd_streamfunction_h

/// @file

#include "tcd_config.h"
#include "tcd_property.h"
#include "tcd_geo_field.h"

#include <vector>

/// The partition of a horizontal wind into its components
struct TCD_EXPORT tcd_wind_partition
{
    p_tcd_geo_field vort;
    p_tcd_geo_field divg;
    p_tcd_geo_field psi;
    p_tcd_geo_field chi;
    p_tcd_geo_field urot;
    p_tcd_geo_field vrot;
    p_tcd_geo_field udiv;
    p_tcd_geo_field vdiv;
    p_tcd_geo_field uhrm;
    p_tcd_geo_field vhrm;
};

/** @brief
 * Partitions a horizontal wind on a regular lat/lon grid into rotational,
 * divergent and harmonic parts.
 *
 * @details
 * Vorticity and divergence are computed with centered differences in
 * spherical coordinates,
 *
 *     vort = 1/(a cos(phi)) (dv/dlambda - d(u cos(phi))/dphi)
 *     divg = 1/(a cos(phi)) (du/dlambda + d(v cos(phi))/dphi)
 *
 * and the streamfunction and velocity potential are found by inverting
 *
 *     laplacian(psi) = vort, laplacian(chi) = divg
 *
 * with a five point finite difference Laplacian and psi = chi = 0 on the
 * boundary of the domain. Global grids are periodic in longitude. The
 * symmetric linear system is assembled as a sparse matrix and solved with
 * preconditioned conjugate gradients. Then
 *
 *     urot = -1/a dpsi/dphi, vrot = 1/(a cos(phi)) dpsi/dlambda
 *     udiv = 1/(a cos(phi)) dchi/dlambda, vdiv = 1/a dchi/dphi
 *
 * and the harmonic wind is what remains, uhrm = u - urot - udiv and
 * vhrm = v - vrot - vdiv. Derivatives next to missing winds are missing;
 * missing vorticity and divergence are treated as 0 in the inversion.
 */
class TCD_EXPORT tcd_streamfunction
{
public:
    tcd_streamfunction() : tolerance(1.0e-6), max_iterations(20000), verbose(0) {}
    ~tcd_streamfunction() = default;

    /// relative residual at which the solve has converged
    TCD_PROPERTY(double, tolerance)

    /// iteration limit of the solve
    TCD_PROPERTY(unsigned long, max_iterations)

    TCD_PROPERTY(int, verbose)

    /** partition every level of the wind. u and v must have the same shape
     * and carry their coordinates. returns 0 if successful,
     * tcd_error::config_error if the winds are not on a regular grid, and
     * tcd_error::numerical_error if an inversion does not converge.
     */
    int partition(const tcd_geo_field &u, const tcd_geo_field &v,
        tcd_wind_partition &parts) const;

    /** solve laplacian(f) = rhs for one 2-D slice with f = 0 on the
     * boundary. lat and lon are the 1-D axes in degrees. returns 0 if
     * successful and tcd_error::numerical_error if the solve does not
     * converge.
     */
    int solve_poisson(const std::vector<double> &lat,
        const std::vector<double> &lon, const double *rhs, double *f) const;

private:
    double tolerance;
    unsigned long max_iterations;
    int verbose;
};

#endif
