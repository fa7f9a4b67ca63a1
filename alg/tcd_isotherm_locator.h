#ifndef tcd_isotherm_locator_h
#define tcd_isotherm_locator_h

/// @file

#include "tcd_config.h"
#include "tcd_property.h"
#include "tcd_geo_field.h"
#include "tcd_isotherm_profile.h"

#include <string>
#include <vector>

class tcd_warning_log;

/** @brief
 * Locates the depth of an isotherm in ocean temperature profiles and
 * integrates the heat content above it (Leipper and Volgenau 1972).
 *
 * @details
 * In each column the depth at which the temperature crosses the isotherm is
 * found by interpolating the depth as a function of temperature between the
 * two levels that bracket it, linearly or by taking the nearer level. The
 * column is scanned from the surface down and ends at the first missing
 * value. The isotherm is never extrapolated: a column that does not bracket
 * it gets the fill value. The heat content of the column is
 *
 *     TCHP = rho cp sum (T(z) - isotherm) dz
 *
 * from the shallowest level down to the isotherm, evaluated at the midpoint
 * of steps of deltaz with the last step shortened to end at the isotherm.
 * A column whose surface is colder than the isotherm has no heat content,
 * TCHP = 0. Other columns in which the isotherm is not found have a TCHP of
 * fill_value.
 *
 * Temperatures are in degrees Celsius and depths in meters, positive down.
 */
class TCD_EXPORT tcd_isotherm_locator
{
public:
    tcd_isotherm_locator();
    ~tcd_isotherm_locator() = default;

    /// interpolation modes
    enum { interp_linear = 0, interp_nearest = 1 };

    /// the isotherm (degC)
    TCD_PROPERTY(double, isotherm)

    /// integration step (m)
    TCD_PROPERTY(double, deltaz)

    /// value marking columns where the isotherm was not found
    TCD_PROPERTY(double, fill_value)

    /// linear or nearest
    TCD_PROPERTY(std::string, interp_type)

    /// density (kg m-3) and specific heat (J kg-1 K-1) of sea water
    TCD_PROPERTY(double, rho)
    TCD_PROPERTY(double, cp)

    TCD_PROPERTY(int, verbose)

    /** check the parameters. returns 0 if valid and tcd_error::config_error
     * for an unknown interp_type or a non-positive deltaz.
     */
    int validate() const;

    /** convert an interp_type name to one of the modes. returns 0 if
     * successful and tcd_error::config_error for unknown names.
     */
    static int get_interp_mode(const std::string &name, int &mode);

    /** find the depth of the isotherm in a column of n values. temp and depth
     * are the temperature and depth of each level, depth increasing.
     * returns 0 if the isotherm was found, otherwise -1 with z set to
     * fill_value.
     */
    int locate_isotherm(const double *temp, const double *depth,
        unsigned long n, double &z) const;

    /** integrate the heat content of a column of n values down to the
     * isotherm depth z_iso.
     */
    double integrate(const double *temp, const double *depth, unsigned long n,
        double z_iso) const;

    /** locate the isotherm and integrate the heat content of every column of
     * the 3-D temperature field. depth is 1-D with one value per level or
     * has the temperature's shape. the number of columns where the isotherm
     * was not found is reported as a single isotherm_not_found_warning.
     * returns 0 if successful and tcd_error::config_error for invalid
     * parameters or mismatched shapes.
     */
    int execute(const tcd_geo_field &temperature, const tcd_geo_field &depth,
        tcd_warning_log &log, tcd_isotherm_profile &profile) const;

protected:
    /// interpolate the column temperature at depth z
    double interpolate_temperature(const double *temp, const double *depth,
        unsigned long n, double z, int mode) const;

private:
    double isotherm;
    double deltaz;
    double fill_value;
    std::string interp_type;
    double rho;
    double cp;
    int verbose;
};

#endif
