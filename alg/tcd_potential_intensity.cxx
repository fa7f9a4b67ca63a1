#include "tcd_potential_intensity.h"
#include "tcd_physical_constants.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace
{
// thermodynamic constants of the algorithm. these differ slightly from
// the values in tcd_physical_constants and are kept to reproduce the
// published results.
constexpr double cpd = 1005.7;
constexpr double cpv = 1870.0;
constexpr double cl = 2500.0;
constexpr double cpvmcl = cpv - cl;
constexpr double rv = 461.5;
constexpr double rd = 287.04;
constexpr double eps = rd/rv;
constexpr double alv0 = 2.501e6;

// ratio of the gradient wind to the wind at the radius of maximum wind
constexpr double b_exp = 2.0;

// saturation vapor pressure (hPa) over water at tc (degC)
double es_hpa(double tc)
{
    return 6.112*std::exp(17.67*tc/(243.5 + tc));
}

// mixing ratio from vapor pressure e and pressure p
double mixing_ratio(double e, double p)
{
    return eps*e/(p - e);
}

// density temperature
double t_rho(double t, double r, double rt)
{
    return t*(1.0 + r/eps)/(1.0 + rt);
}

/* CAPE of a parcel with temperature tp (K), mixing ratio rp (kg/kg) and
 * pressure pp (hPa) lifted through the sounding p (hPa, decreasing),
 * t (K), r (kg/kg). sig is the fraction of condensate removed. the outflow
 * temperature tob (K) and pressure lnb (hPa) are at the level of neutral
 * buoyancy. returns 1 if successful, 0 for an invalid parcel and 2 when the
 * parcel temperature fails to converge.
 */
int cape(double tp, double rp, double pp, const std::vector<double> &t,
    const std::vector<double> &r, const std::vector<double> &p, double sig,
    double ptop, double &caped, double &tob, double &lnb)
{
    long n = t.size();

    caped = 0.0;
    tob = t[0];
    lnb = ptop;

    if ((rp < 1.0e-6) || (tp < 200.0))
        return 0;

    // parcel properties
    double tpc = tp - 273.15;
    double esp = es_hpa(tpc);
    double evp = rp*pp/(eps + rp);
    double rh = std::min(evp/esp, 1.0);
    double alv = alv0 + cpvmcl*tpc;
    double s = (cpd + rp*cl)*std::log(tp) - rd*std::log(pp - evp)
        + alv*rp/tp - rp*rv*std::log(rh);

    // lifted condensation level
    double chi = tp/(1669.0 - 122.0*rh - tp);
    double plcl = pp*std::pow(rh, chi);

    // buoyancy of the lifted parcel
    long jmin = n;
    std::vector<double> tvrdif(n, 0.0);
    for (long j = 0; j < n; ++j)
    {
        if ((p[j] < ptop) || (p[j] >= pp))
            continue;

        jmin = std::min(jmin, j);

        if (p[j] >= plcl)
        {
            // dry adiabatic below the condensation level
            double tg = tp*std::pow(p[j]/pp, rd/cpd);
            double rg = rp;
            tvrdif[j] = t_rho(tg, rg, rg) - t_rho(t[j], r[j], r[j]);
            continue;
        }

        // iterate on the temperature conserving entropy
        double tgnew = t[j];
        double tg = 0.0;
        double rg = mixing_ratio(es_hpa(t[j] - 273.15), p[j]);
        int nc = 0;
        while (std::fabs(tgnew - tg) > 0.001)
        {
            ++nc;

            double alvg = alv0 + cpvmcl*(tgnew - 273.15);
            double sl = (cpd + rp*cl + alvg*alvg*rg/(rv*tgnew*tgnew))/tgnew;
            double em = rg*p[j]/(eps + rg);
            double sg = (cpd + rp*cl)*std::log(tgnew) - rd*std::log(p[j] - em)
                + alvg*rg/tgnew;

            double ap = nc < 3 ? 0.3 : 1.0;
            tg = tgnew;
            tgnew = tg + ap*(s - sg)/sl;

            if ((nc > 500) || (tgnew < (tg - 40.0)))
            {
                caped = 0.0;
                tob = t[0];
                lnb = p[0];
                return 2;
            }

            rg = mixing_ratio(es_hpa(tgnew - 273.15), p[j]);
        }

        double rmean = sig*rg + (1.0 - sig)*rp;
        tvrdif[j] = t_rho(tg, rg, rmean) - t_rho(t[j], r[j], r[j]);
    }

    if (jmin >= n)
        return 1;

    // the highest level of positive buoyancy
    long inb = -1;
    for (long j = n - 1; j >= jmin; --j)
    {
        if (tvrdif[j] > 0.0)
        {
            inb = j;
            break;
        }
    }

    if (inb <= jmin)
        return 1;

    // positive and negative areas
    double pa = 0.0;
    double na = 0.0;
    for (long j = jmin + 1; j <= inb; ++j)
    {
        double pfac = rd*(tvrdif[j] + tvrdif[j-1])*(p[j-1] - p[j])/(p[j] + p[j-1]);
        pa += std::max(pfac, 0.0);
        na -= std::min(pfac, 0.0);
    }

    // between the parcel and the first level above it
    double pma = pp + p[jmin];
    double pfac = rd*(pp - p[jmin])/pma;
    pa += pfac*std::max(tvrdif[jmin], 0.0);
    na -= pfac*std::min(tvrdif[jmin], 0.0);

    // residual positive area above the level of neutral buoyancy
    double pat = 0.0;
    tob = t[inb];
    lnb = p[inb];
    if ((inb < n - 1) && (p[inb + 1] >= ptop))
    {
        double pinb = (p[inb + 1]*tvrdif[inb] - p[inb]*tvrdif[inb + 1])/
            (tvrdif[inb] - tvrdif[inb + 1]);

        lnb = pinb;
        pat = rd*tvrdif[inb]*(p[inb] - pinb)/(p[inb] + pinb);
        tob = (t[inb]*(pinb - p[inb + 1]) + t[inb + 1]*(p[inb] - pinb))/
            (p[inb] - p[inb + 1]);
    }

    caped = std::max(pa + pat - na, 0.0);

    return 1;
}
}

// --------------------------------------------------------------------------
tcd_potential_intensity::tcd_potential_intensity() : ckcd(0.9),
    ascent_flag(0.0), diss_flag(1), v_reduc(0.8), ptop(5000.0), zmax(0.0),
    mslp_max(2000.0), verbose(0)
{
}

// --------------------------------------------------------------------------
const char *tcd_potential_intensity::get_status_name(int status)
{
    switch (status)
    {
        case success: return "success";
        case not_computed: return "not computed";
        case no_convergence: return "no convergence";
        case cape_failure: return "CAPE failure";
        case cold_sst: return "cold SST";
        case invalid_profile: return "invalid profile";
    }
    return "unknown";
}

// --------------------------------------------------------------------------
int tcd_potential_intensity::validate() const
{
    if ((this->ckcd <= 0.0) || (this->v_reduc <= 0.0))
    {
        TCD_ERROR("Invalid ckcd=" << this->ckcd << " or v_reduc="
            << this->v_reduc << ". Both must be positive")
        return tcd_error::config_error;
    }

    if ((this->ascent_flag < 0.0) || (this->ascent_flag > 1.0))
    {
        TCD_ERROR("Invalid ascent_flag=" << this->ascent_flag
            << ". Use 0 for reversible and 1 for pseudo-adiabatic ascent")
        return tcd_error::config_error;
    }

    if (this->ptop <= 0.0)
    {
        TCD_ERROR("Invalid ptop=" << this->ptop)
        return tcd_error::config_error;
    }

    if (this->mslp_max <= 0.0)
    {
        TCD_ERROR("Invalid mslp_max=" << this->mslp_max)
        return tcd_error::config_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
double tcd_potential_intensity::get_mslp_max_pa() const
{
    return this->mslp_max < 1.0e4 ? 100.0*this->mslp_max : this->mslp_max;
}

// --------------------------------------------------------------------------
int tcd_potential_intensity::compute(double sst, double msl, const double *p,
    const double *t, const double *r, unsigned long n, unsigned long stride,
    tcd_pi_column &res) const
{
    double fill_value = tcd_array_attributes::default_fill_value();
    tcd_array_attributes atts;

    res.vmax = fill_value;
    res.pmin = fill_value;
    res.tout = fill_value;
    res.pout = fill_value;

    // the valid levels, in hPa and kg/kg
    std::vector<double> ph;
    std::vector<double> tk;
    std::vector<double> rk;
    ph.reserve(n);
    tk.reserve(n);
    rk.reserve(n);
    for (unsigned long k = 0; k < n; ++k)
    {
        double pk = p[k*stride];
        double tv = t[k*stride];
        double rv_k = r[k*stride];
        if (atts.is_missing(pk) || atts.is_missing(tv) || atts.is_missing(rv_k))
            continue;
        ph.push_back(pk/100.0);
        tk.push_back(tv);
        rk.push_back(std::max(rv_k, 0.0));
    }

    if ((ph.size() < 2) || atts.is_missing(sst) || atts.is_missing(msl) ||
        (*std::min_element(tk.begin(), tk.end()) <= 100.0))
    {
        res.status = invalid_profile;
        return res.status;
    }

    double sstc = sst - 273.15;
    if (sstc <= 5.0)
    {
        res.status = cold_sst;
        return res.status;
    }

    double msl_h = msl/100.0;
    double ptop_h = this->ptop/100.0;
    double sig = this->ascent_flag;
    double es0 = es_hpa(sstc);

    // environmental CAPE
    double capea = 0.0;
    double tob = 0.0;
    double lnb = 0.0;
    int iflag = cape(tk[0], rk[0], ph[0], tk, rk, ph, sig, ptop_h, capea, tob, lnb);
    int ifl = iflag == 1 ? success : cape_failure;

    // iterate to the minimum pressure
    double pm = 970.0;
    double pmold = pm;
    double pnew = 0.0;
    int np = 0;

    double capem = 0.0;
    double capems = 0.0;
    double toms = 0.0;
    double lnbs = 0.0;
    double rat = 1.0;
    double tvav = 0.0;

    while (std::fabs(pnew - pmold) > 0.5)
    {
        // CAPE at the radius of maximum winds
        double pp = std::min(pm, 1000.0);
        double rp = eps*rk[0]*msl_h/(pp*(eps + rk[0]) - rk[0]*msl_h);
        if (cape(tk[0], rp, pp, tk, rk, ph, sig, ptop_h, capem, tob, lnb) != 1)
            ifl = cape_failure;

        // saturation CAPE at the radius of maximum winds
        rp = mixing_ratio(es0, pp);
        if (cape(sst, rp, pp, tk, rk, ph, sig, ptop_h, capems, toms, lnbs) != 1)
            ifl = cape_failure;

        rat = this->diss_flag ? sst/toms : 1.0;

        // estimate of the pressure at the radius of maximum winds
        double tv0 = t_rho(tk[0], rk[0], rk[0]);
        double tvsst = t_rho(sst, rp, rp);
        tvav = 0.5*(tv0 + tvsst);

        double cat = std::max((capem - capea) +
            0.5*this->ckcd*rat*(capems - capem), 0.0);

        pnew = msl_h*std::exp(-cat/(rd*tvav));

        pmold = pm;
        pm = pnew;
        ++np;

        if ((np > 200) || (pm < 400.0))
        {
            res.status = no_convergence;
            return res.status;
        }
    }

    if (ifl != success)
    {
        res.status = ifl;
        return res.status;
    }

    double catfac = 0.5*(1.0 + 1.0/b_exp);
    double cat = std::max((capem - capea) +
        this->ckcd*rat*catfac*(capems - capem), 0.0);

    res.pmin = 100.0*msl_h*std::exp(-cat/(rd*tvav));
    res.vmax = this->v_reduc*std::sqrt(this->ckcd*rat*std::max(capems - capem, 0.0));
    res.tout = toms;
    res.pout = 100.0*lnbs;
    res.status = success;

    return res.status;
}

// --------------------------------------------------------------------------
int tcd_potential_intensity::execute(const tcd_geo_field *sst,
    const tcd_geo_field &msl, const tcd_geo_field &zsfc,
    const tcd_geo_field &p, const tcd_geo_field &t, const tcd_geo_field &r,
    tcd_pi_fields &out) const
{
    int ierr = 0;
    if ((ierr = this->validate()))
        return ierr;

    if ((t.get_number_of_dimensions() != 3) || (t.get_vertical_axis() != 0) ||
        (p.get_shape() != t.get_shape()) || (r.get_shape() != t.get_shape()))
    {
        TCD_ERROR("Pressure [" << p.get_shape() << "], temperature ["
            << t.get_shape() << "] and mixing ratio [" << r.get_shape()
            << "] must be [level, lat, lon] fields of the same shape")
        return tcd_error::config_error;
    }

    unsigned long n_lev = t.get_number_of_levels();
    unsigned long n_horiz = t.get_horizontal_size();

    if ((msl.size() != n_horiz) || (zsfc.size() != n_horiz) ||
        (sst && (sst->size() != n_horiz)))
    {
        TCD_ERROR("The surface fields do not match the " << n_horiz
            << " columns of \"" << t.get_name() << "\"")
        return tcd_error::config_error;
    }

    std::vector<unsigned long> shape_2d = {t.get_number_of_lat(),
        t.get_number_of_lon()};

    double fill_value = tcd_array_attributes::default_fill_value();

    auto new_field = [&](const char *name, const char *units,
        const char *long_name, const char *descr) -> p_tcd_geo_field
    {
        p_tcd_geo_field f = tcd_geo_field::New(name, shape_2d, fill_value);
        f->set_attributes(tcd_array_attributes(units, long_name, descr, 1,
            fill_value));
        f->set_coordinates(t.get_latitude(), t.get_longitude());
        return f;
    };

    out.vmax = new_field("vmax", "m/s",
        "maximum surface wind speed potential intensity",
        "tropical cyclone maximum surface wind speed potential intensity");

    out.pmin = new_field("pmin", "Pa",
        "minimum sea-level pressure potential intensity",
        "tropical cyclone minimum sea-level pressure potential intensity");

    out.tout = new_field("tout", "K", "outflow temperature",
        "outflow temperature of tropical cyclones of maximum potential intensity");

    out.pout = new_field("pout", "Pa", "outflow pressure level",
        "outflow pressure of tropical cyclones of maximum potential intensity");

    out.status = new_field("pi_status", "1", "potential intensity status",
        "1 success, 0 not computed, -1 no convergence, -2 CAPE failure,"
        " -3 cold SST, -4 invalid profile");

    double msl_max = this->get_mslp_max_pa();
    unsigned long n_success = 0;

    for (unsigned long q = 0; q < n_horiz; ++q)
    {
        double z = zsfc[q];
        double pq = msl[q];

        if (zsfc.is_missing(z) || (z > this->zmax) || msl.is_missing(pq) ||
            (pq > msl_max))
        {
            (*out.status)[q] = not_computed;
            continue;
        }

        double ts = sst ? (*sst)[q] : t[q];

        tcd_pi_column col;
        this->compute(ts, pq, p.data() + q, t.data() + q, r.data() + q,
            n_lev, n_horiz, col);

        (*out.status)[q] = col.status;

        if (col.status == success)
        {
            (*out.vmax)[q] = col.vmax;
            (*out.pmin)[q] = col.pmin;
            (*out.tout)[q] = col.tout;
            (*out.pout)[q] = col.pout;
            ++n_success;
        }
    }

    if (this->verbose)
    {
        TCD_STATUS("Computed the potential intensity of " << n_success
            << " of " << n_horiz << " columns")
    }

    return 0;
}
