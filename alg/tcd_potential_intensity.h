#ifndef tcd_potential_intensity_h
#define tcd_potential_intensity_h

/// @file

#include "tcd_config.h"
#include "tcd_property.h"
#include "tcd_geo_field.h"

/// The potential intensity of one column
struct TCD_EXPORT tcd_pi_column
{
    tcd_pi_column() : vmax(0.0), pmin(0.0), tout(0.0), pout(0.0), status(0)
    {}

    double vmax;    ///< maximum wind speed (m/s)
    double pmin;    ///< minimum central pressure (Pa)
    double tout;    ///< outflow temperature (K)
    double pout;    ///< outflow pressure (Pa)
    int status;     ///< one of the tcd_potential_intensity status codes
};

/// The potential intensity of every column of a grid
struct TCD_EXPORT tcd_pi_fields
{
    p_tcd_geo_field vmax;
    p_tcd_geo_field pmin;
    p_tcd_geo_field tout;
    p_tcd_geo_field pout;
    p_tcd_geo_field status;
};

/** @brief
 * Computes the maximum potential intensity of tropical cyclones following
 * Bister and Emanuel (2002).
 *
 * @details
 * The minimum central pressure is found by iterating on the CAPE of air
 * lifted from the radius of maximum wind, with and without saturation at
 * the sea surface temperature, starting from 970 hPa until successive
 * estimates agree to within 0.5 hPa. The maximum wind is then
 *
 *     vmax = v_reduc sqrt(ckcd (Ts/To) (CAPE* - CAPE))
 *
 * where To is the outflow temperature at the parcel's level of neutral
 * buoyancy. The Ts/To factor accounts for dissipative heating and is
 * dropped when diss_flag is 0. ascent_flag is the fraction of condensate
 * removed from ascending parcels, 0 for reversible and 1 for
 * pseudo-adiabatic ascent. Levels above ptop are ignored.
 *
 * Profiles are ordered surface first. A column is not computed (status
 * not_computed) when its surface is higher than zmax or its sea level
 * pressure exceeds mslp_max. Columns with a sea surface temperature at or
 * below 5 degC, that fail to converge or whose CAPE can't be computed get
 * missing values and a non-zero status.
 */
class TCD_EXPORT tcd_potential_intensity
{
public:
    tcd_potential_intensity();
    ~tcd_potential_intensity() = default;

    /// per column status codes
    enum
    {
        success = 1,
        not_computed = 0,
        no_convergence = -1,
        cape_failure = -2,
        cold_sst = -3,
        invalid_profile = -4
    };

    /// ratio of the enthalpy and momentum exchange coefficients
    TCD_PROPERTY(double, ckcd)

    /// fraction of condensate removed during ascent
    TCD_PROPERTY(double, ascent_flag)

    /// set to 1 to include dissipative heating
    TCD_PROPERTY(int, diss_flag)

    /// reduction of the gradient wind to the surface wind
    TCD_PROPERTY(double, v_reduc)

    /// pressure (Pa) above which the sounding is ignored
    TCD_PROPERTY(double, ptop)

    /// the highest surface (m) for which intensity is computed
    TCD_PROPERTY(double, zmax)

    /** the largest sea level pressure for which intensity is computed.
     * values below 1e4 are taken to be hPa, others Pa.
     */
    TCD_PROPERTY(double, mslp_max)

    TCD_PROPERTY(int, verbose)

    /** check the parameters. returns 0 if they are valid and
     * tcd_error::config_error otherwise.
     */
    int validate() const;

    /// get mslp_max in Pa
    double get_mslp_max_pa() const;

    /** compute the potential intensity of one column. sst is in K, msl in
     * Pa. p (Pa), t (K) and r (kg/kg) hold n levels, surface first, spaced
     * stride values apart. missing levels, marked by values of magnitude
     * 1e20 or NaN, are skipped. returns the status, also stored in res.
     */
    int compute(double sst, double msl, const double *p, const double *t,
        const double *r, unsigned long n, unsigned long stride,
        tcd_pi_column &res) const;

    /** compute the potential intensity of every column. sst, msl and zsfc
     * are 2-D, sst may be null in which case the lowest level temperature
     * is used. p, t and r are [level, lat, lon] with level 0 at the surface.
     * returns 0 if successful and tcd_error::config_error for invalid
     * parameters or mismatched shapes.
     */
    int execute(const tcd_geo_field *sst, const tcd_geo_field &msl,
        const tcd_geo_field &zsfc, const tcd_geo_field &p,
        const tcd_geo_field &t, const tcd_geo_field &r,
        tcd_pi_fields &out) const;

    /// get a name for a status code
    static const char *get_status_name(int status);

private:
    double ckcd;
    double ascent_flag;
    int diss_flag;
    double v_reduc;
    double ptop;
    double zmax;
    double mslp_max;
    int verbose;
};

#endif
