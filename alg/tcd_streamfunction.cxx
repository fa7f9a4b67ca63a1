#include "tcd_streamfunction.h"
#include "tcd_coordinate_util.h"
#include "tcd_physical_constants.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <Eigen/Sparse>
#include <Eigen/IterativeLinearSolvers>

#include <algorithm>
#include <cmath>

using tcd_physical_constants::deg_to_rad;
using tcd_physical_constants::earth_radius;

namespace
{
// the grid in radians
struct grid_t
{
    unsigned long n_lat;
    unsigned long n_lon;
    std::vector<double> phi;
    std::vector<double> cos_phi;
    double dlam;
    bool periodic;
};

// --------------------------------------------------------------------------
int make_grid(const std::vector<double> &lat, const std::vector<double> &lon,
    grid_t &g)
{
    g.n_lat = lat.size();
    g.n_lon = lon.size();

    if ((g.n_lat < 3) || (g.n_lon < 3))
    {
        TCD_ERROR("The wind partition needs at least 3 x 3 points, the grid"
            " has " << g.n_lat << " x " << g.n_lon)
        return tcd_error::config_error;
    }

    g.phi.resize(g.n_lat);
    g.cos_phi.resize(g.n_lat);
    for (unsigned long j = 0; j < g.n_lat; ++j)
    {
        g.phi[j] = lat[j]*deg_to_rad();
        g.cos_phi[j] = std::max(std::cos(g.phi[j]), 1.0e-6);
    }

    g.dlam = (lon[g.n_lon - 1] - lon[0])/(g.n_lon - 1)*deg_to_rad();
    g.periodic = tcd_coordinate_util::is_periodic_longitude(lon);

    return 0;
}

// --------------------------------------------------------------------------
// neighbors in longitude. returns the number of grid spacings between them.
double lon_neighbors(const grid_t &g, unsigned long i, unsigned long &im,
    unsigned long &ip)
{
    unsigned long last = g.n_lon - 1;
    if (i == 0)
    {
        im = g.periodic ? last : 0;
        ip = 1;
        return g.periodic ? 2.0 : 1.0;
    }
    if (i == last)
    {
        im = last - 1;
        ip = g.periodic ? 0 : last;
        return g.periodic ? 2.0 : 1.0;
    }
    im = i - 1;
    ip = i + 1;
    return 2.0;
}

// --------------------------------------------------------------------------
// df/dlambda at j,i. returns false next to missing values.
template <typename missing_t>
bool d_dlambda(const grid_t &g, const double *f, unsigned long j,
    unsigned long i, const missing_t &is_missing, double &df)
{
    unsigned long im = 0;
    unsigned long ip = 0;
    double n = lon_neighbors(g, i, im, ip);

    double f_p = f[j*g.n_lon + ip];
    double f_m = f[j*g.n_lon + im];
    if (is_missing(f_p) || is_missing(f_m))
        return false;

    df = (f_p - f_m)/(n*g.dlam);
    return true;
}

// --------------------------------------------------------------------------
// d(w f)/dphi at j,i where w is a per row weight or 1 when w is null.
// returns false next to missing values.
template <typename missing_t>
bool d_dphi(const grid_t &g, const double *f, const double *w,
    unsigned long j, unsigned long i, const missing_t &is_missing,
    double &df)
{
    unsigned long jm = j ? j - 1 : j;
    unsigned long jp = j < g.n_lat - 1 ? j + 1 : j;

    double f_p = f[jp*g.n_lon + i];
    double f_m = f[jm*g.n_lon + i];
    if (is_missing(f_p) || is_missing(f_m))
        return false;

    double w_p = w ? w[jp] : 1.0;
    double w_m = w ? w[jm] : 1.0;

    df = (w_p*f_p - w_m*f_m)/(g.phi[jp] - g.phi[jm]);
    return true;
}
}

// --------------------------------------------------------------------------
int tcd_streamfunction::solve_poisson(const std::vector<double> &lat,
    const std::vector<double> &lon, const double *rhs, double *f) const
{
    int ierr = 0;
    grid_t g;
    if ((ierr = make_grid(lat, lon, g)))
        return ierr;

    unsigned long n_lat = g.n_lat;
    unsigned long n_lon = g.n_lon;
    unsigned long n_horiz = n_lat*n_lon;

    std::fill(f, f + n_horiz, 0.0);

    // number the unknowns. the boundary is held at 0.
    unsigned long i0 = g.periodic ? 0 : 1;
    unsigned long i1 = g.periodic ? n_lon : n_lon - 1;

    std::vector<long> ids(n_horiz, -1);
    long n_unknown = 0;
    for (unsigned long j = 1; j < n_lat - 1; ++j)
    {
        for (unsigned long i = i0; i < i1; ++i)
            ids[j*n_lon + i] = n_unknown++;
    }

    if (n_unknown == 0)
        return 0;

    double a_sq = earth_radius()*earth_radius();
    double dphi = std::fabs(g.phi[n_lat - 1] - g.phi[0])/(n_lat - 1);
    double dphi_sq = dphi*dphi;
    double dlam_sq = g.dlam*g.dlam;

    // the symmetric form of the spherical Laplacian scaled by -a^2 cos(phi)
    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(5*n_unknown);

    Eigen::VectorXd b(n_unknown);

    for (unsigned long j = 1; j < n_lat - 1; ++j)
    {
        double c_ew = 1.0/(g.cos_phi[j]*dlam_sq);
        double c_n = std::cos(0.5*(g.phi[j] + g.phi[j + 1]))/dphi_sq;
        double c_s = std::cos(0.5*(g.phi[j] + g.phi[j - 1]))/dphi_sq;

        for (unsigned long i = i0; i < i1; ++i)
        {
            unsigned long q = j*n_lon + i;
            long row = ids[q];

            unsigned long im = 0;
            unsigned long ip = 0;
            lon_neighbors(g, i, im, ip);

            triplets.push_back(Eigen::Triplet<double>(row, row,
                2.0*c_ew + c_n + c_s));

            long nbrs[4] = {ids[j*n_lon + ip], ids[j*n_lon + im],
                ids[(j + 1)*n_lon + i], ids[(j - 1)*n_lon + i]};

            double coefs[4] = {c_ew, c_ew, c_n, c_s};

            for (int k = 0; k < 4; ++k)
            {
                if (nbrs[k] >= 0)
                    triplets.push_back(Eigen::Triplet<double>(row, nbrs[k],
                        -coefs[k]));
            }

            b[row] = -a_sq*g.cos_phi[j]*rhs[q];
        }
    }

    Eigen::SparseMatrix<double> A(n_unknown, n_unknown);
    A.setFromTriplets(triplets.begin(), triplets.end());

    Eigen::ConjugateGradient<Eigen::SparseMatrix<double>,
        Eigen::Lower|Eigen::Upper> solver;

    solver.setTolerance(this->tolerance);
    solver.setMaxIterations(this->max_iterations);
    solver.compute(A);

    if (solver.info() != Eigen::Success)
    {
        TCD_ERROR("Failed to set up the Poisson solve on the "
            << n_lat << " x " << n_lon << " grid")
        return tcd_error::numerical_error;
    }

    Eigen::VectorXd x = solver.solve(b);

    if (solver.info() != Eigen::Success)
    {
        TCD_ERROR("The Poisson solve did not converge to " << this->tolerance
            << " in " << solver.iterations() << " iterations, the residual is "
            << solver.error())
        return tcd_error::numerical_error;
    }

    if (this->verbose)
    {
        TCD_STATUS("Poisson solve converged in " << solver.iterations()
            << " iterations, residual " << solver.error())
    }

    for (unsigned long q = 0; q < n_horiz; ++q)
    {
        if (ids[q] >= 0)
            f[q] = x[ids[q]];
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_streamfunction::partition(const tcd_geo_field &u,
    const tcd_geo_field &v, tcd_wind_partition &parts) const
{
    if (u.get_shape() != v.get_shape())
    {
        TCD_ERROR("The wind components \"" << u.get_name() << "\" ["
            << u.get_shape() << "] and \"" << v.get_name() << "\" ["
            << v.get_shape() << "] have different shapes")
        return tcd_error::config_error;
    }

    if (!u.get_latitude() || !u.get_longitude())
    {
        TCD_ERROR("\"" << u.get_name() << "\" has no coordinates")
        return tcd_error::config_error;
    }

    std::vector<double> lat;
    std::vector<double> lon;
    if (tcd_coordinate_util::get_rectilinear_axes(*u.get_latitude(),
        *u.get_longitude(), lat, lon))
    {
        TCD_ERROR("The wind must be on a rectilinear grid")
        return tcd_error::config_error;
    }

    int ierr = 0;
    grid_t g;
    if ((ierr = make_grid(lat, lon, g)))
        return ierr;

    unsigned long n_lat = g.n_lat;
    unsigned long n_lon = g.n_lon;
    unsigned long n_horiz = n_lat*n_lon;
    unsigned long n_lev = u.get_number_of_levels();

    if (n_horiz != u.get_horizontal_size())
    {
        TCD_ERROR("The coordinates do not match the wind's shape ["
            << u.get_shape() << "]")
        return tcd_error::config_error;
    }

    double fill_value = tcd_array_attributes::default_fill_value();

    auto new_part = [&](const char *name, const char *units,
        const char *long_name) -> p_tcd_geo_field
    {
        p_tcd_geo_field f = tcd_geo_field::New(name, u);
        f->set_attributes(tcd_array_attributes(units, long_name, "", 1,
            fill_value));
        return f;
    };

    parts.vort = new_part("vort", "1/s", "vorticity");
    parts.divg = new_part("divg", "1/s", "divergence");
    parts.psi = new_part("psi", "m2/s", "streamfunction");
    parts.chi = new_part("chi", "m2/s", "velocity potential");
    parts.urot = new_part("urot", "m/s", "rotational zonal wind");
    parts.vrot = new_part("vrot", "m/s", "rotational meridional wind");
    parts.udiv = new_part("udiv", "m/s", "divergent zonal wind");
    parts.vdiv = new_part("vdiv", "m/s", "divergent meridional wind");
    parts.uhrm = new_part("uhrm", "m/s", "harmonic zonal wind");
    parts.vhrm = new_part("vhrm", "m/s", "harmonic meridional wind");

    auto u_missing = [&u](double x) { return u.is_missing(x); };
    auto never_missing = [](double) { return false; };

    double a = earth_radius();
    std::vector<double> rhs_vort(n_horiz);
    std::vector<double> rhs_divg(n_horiz);

    for (unsigned long k = 0; k < n_lev; ++k)
    {
        unsigned long q0 = k*n_horiz;

        const double *p_u = u.data() + q0;
        const double *p_v = v.data() + q0;

        double *p_vort = parts.vort->data() + q0;
        double *p_divg = parts.divg->data() + q0;

        // vorticity and divergence
        for (unsigned long j = 0; j < n_lat; ++j)
        {
            double a_cos = a*g.cos_phi[j];
            for (unsigned long i = 0; i < n_lon; ++i)
            {
                unsigned long q = j*n_lon + i;

                double dv_dlam = 0.0;
                double du_dlam = 0.0;
                double ducos_dphi = 0.0;
                double dvcos_dphi = 0.0;

                bool vort_ok = d_dlambda(g, p_v, j, i, u_missing, dv_dlam) &&
                    d_dphi(g, p_u, g.cos_phi.data(), j, i, u_missing, ducos_dphi);

                bool divg_ok = d_dlambda(g, p_u, j, i, u_missing, du_dlam) &&
                    d_dphi(g, p_v, g.cos_phi.data(), j, i, u_missing, dvcos_dphi);

                p_vort[q] = vort_ok ? (dv_dlam - ducos_dphi)/a_cos : fill_value;
                p_divg[q] = divg_ok ? (du_dlam + dvcos_dphi)/a_cos : fill_value;

                rhs_vort[q] = vort_ok ? p_vort[q] : 0.0;
                rhs_divg[q] = divg_ok ? p_divg[q] : 0.0;
            }
        }

        // streamfunction and velocity potential
        double *p_psi = parts.psi->data() + q0;
        double *p_chi = parts.chi->data() + q0;

        if ((ierr = this->solve_poisson(lat, lon, rhs_vort.data(), p_psi)) ||
            (ierr = this->solve_poisson(lat, lon, rhs_divg.data(), p_chi)))
        {
            TCD_ERROR("Failed to invert level " << k << " of the wind")
            return ierr;
        }

        // rotational, divergent and harmonic winds
        double *p_urot = parts.urot->data() + q0;
        double *p_vrot = parts.vrot->data() + q0;
        double *p_udiv = parts.udiv->data() + q0;
        double *p_vdiv = parts.vdiv->data() + q0;
        double *p_uhrm = parts.uhrm->data() + q0;
        double *p_vhrm = parts.vhrm->data() + q0;

        for (unsigned long j = 0; j < n_lat; ++j)
        {
            double a_cos = a*g.cos_phi[j];
            for (unsigned long i = 0; i < n_lon; ++i)
            {
                unsigned long q = j*n_lon + i;

                if (u.is_missing(p_u[q]) || v.is_missing(p_v[q]))
                {
                    p_urot[q] = fill_value;
                    p_vrot[q] = fill_value;
                    p_udiv[q] = fill_value;
                    p_vdiv[q] = fill_value;
                    p_uhrm[q] = fill_value;
                    p_vhrm[q] = fill_value;
                    continue;
                }

                double dpsi_dphi = 0.0;
                double dpsi_dlam = 0.0;
                double dchi_dphi = 0.0;
                double dchi_dlam = 0.0;

                d_dphi(g, p_psi, nullptr, j, i, never_missing, dpsi_dphi);
                d_dlambda(g, p_psi, j, i, never_missing, dpsi_dlam);
                d_dphi(g, p_chi, nullptr, j, i, never_missing, dchi_dphi);
                d_dlambda(g, p_chi, j, i, never_missing, dchi_dlam);

                p_urot[q] = -dpsi_dphi/a;
                p_vrot[q] = dpsi_dlam/a_cos;
                p_udiv[q] = dchi_dlam/a_cos;
                p_vdiv[q] = dchi_dphi/a;

                p_uhrm[q] = p_u[q] - p_urot[q] - p_udiv[q];
                p_vhrm[q] = p_v[q] - p_vrot[q] - p_vdiv[q];
            }
        }
    }

    return 0;
}
