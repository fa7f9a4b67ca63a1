#ifndef tcd_spectral_decomposer_h
#define tcd_spectral_decomposer_h

/// @file

#include "tcd_config.h"
#include "tcd_property.h"
#include "tcd_polar_field.h"
#include "tcd_wavenumber_spectrum.h"
#include "tcd_table.h"

#include <vector>

/** @brief
 * The multi-scale intensity summary of a decomposed wind field (Vukicevic
 * et al. 2014).
 *
 * @details
 * | Member      | Description                                            |
 * | ------      | -----------                                            |
 * | vmax        | maximum of the original field                          |
 * | rmw         | radius of that maximum (m)                             |
 * | azimuth     | bearing of that maximum (degrees clockwise from north) |
 * | lat_rmw     | latitude of that maximum (degrees)                     |
 * | lon_rmw     | longitude of that maximum (degrees)                    |
 * | wn_max      | maximum magnitude of each wavenumber component         |
 * | wn0p1_max   | maximum of the sum of wavenumbers 0 and 1              |
 * | epsilon_max | vmax - wn0p1_max                                       |
 */
struct TCD_EXPORT tcd_spectral_summary
{
    tcd_spectral_summary() : vmax(0.0), rmw(0.0), azimuth(0.0), lat_rmw(0.0),
        lon_rmw(0.0), wn_max(), wn0p1_max(0.0), epsilon_max(0.0)
    {}

    double vmax;
    double rmw;
    double azimuth;
    double lat_rmw;
    double lon_rmw;
    std::vector<double> wn_max;
    double wn0p1_max;
    double epsilon_max;
};

/** @brief
 * Decomposes a polar field into its azimuthal wavenumber components.
 *
 * @details
 * Each ring of constant radius is transformed with a forward FFT over
 * azimuth. The component of wavenumber k is the inverse transform of the
 * Hermitian pair of coefficients (k, n - k), which makes each component
 * real, and the components sum exactly to the field truncated at
 * max_wavenumber. The residual is the original less the truncated field.
 * Rings containing a missing value are missing in every component.
 *
 * The azimuthal sampling must resolve max_wavenumber, 2 max_wavenumber <
 * number of azimuths, otherwise the decomposition fails with
 * tcd_error::config_error.
 */
class TCD_EXPORT tcd_spectral_decomposer
{
public:
    tcd_spectral_decomposer() : max_wavenumber(3) {}
    ~tcd_spectral_decomposer() = default;

    /// the largest wavenumber retained
    TCD_PROPERTY(unsigned int, max_wavenumber)

    /** decompose the field. returns 0 if successful and
     * tcd_error::config_error if the azimuthal sampling is too coarse.
     */
    int decompose(const const_p_tcd_polar_field &field,
        p_tcd_wavenumber_spectrum &spectrum) const;

    /** compute the multi-scale intensity summary. maxima skip missing
     * values. returns 0 if successful and tcd_error::numerical_error if
     * every value of the original field is missing.
     */
    static int summarize(const tcd_wavenumber_spectrum &spectrum,
        tcd_spectral_summary &summary);

    /** get a table of the maximum magnitude of each wavenumber component
     * with columns wavenumber | max
     */
    static void get_wavenumber_table(const tcd_spectral_summary &summary,
        const std::string &units, tcd_table &table);

private:
    unsigned int max_wavenumber;
};

#endif
