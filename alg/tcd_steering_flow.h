#ifndef tcd_steering_flow_h
#define tcd_steering_flow_h

/// @file

#include "tcd_config.h"
#include "tcd_property.h"
#include "tcd_geo_field.h"
#include "tcd_steering_layer.h"
#include "tcd_streamfunction.h"
#include "tcd_tc_fix.h"

#include <vector>

class tcd_warning_log;

/// the grid wide products of the steering flow on the isobaric levels
struct TCD_EXPORT tcd_steering_products
{
    p_tcd_geo_field uwnd;
    p_tcd_geo_field vwnd;
    tcd_wind_partition parts;
};

/** @brief
 * Computes the deep layer steering flow of tropical cyclones (after
 * Velden and Leslie 1991).
 *
 * @details
 * prepare works on the whole grid. The winds are interpolated to the
 * isobaric levels, linearly in log pressure, and partitioned into
 * rotational, divergent and harmonic parts at each level. For each layer
 * the pressure weighted mean of the total wind and of each part is then
 * computed, using the trapezoid thickness of the levels inside the layer as
 * weights. Layers are given as bottom, top pairs in Pa. When none are given
 * one layer spans the largest to the smallest isobaric level.
 *
 * execute works on one TC. The layer mean wind in the lat/lon index box
 * holding the points within distance + ddist of the TC is treated as a
 * matrix with a row per latitude. It is reconstructed from the leading
 * ncoeffs singular triplets of its SVD. The reconstruction replaces the
 * wind within distance of the TC, blends linearly into the original across
 * the next ddist meters, and leaves the wind beyond untouched. When the
 * matrix has rank less than ncoeffs all of the non-zero singular values are
 * kept and a rank_deficiency_warning is recorded. The steering vector is
 * the cos(latitude) weighted mean of the filtered wind within distance.
 */
class TCD_EXPORT tcd_steering_flow
{
public:
    tcd_steering_flow();
    ~tcd_steering_flow() = default;

    /// isobaric levels (Pa) the winds are interpolated to
    TCD_VECTOR_PROPERTY(double, isolevel)

    /// layer bounds, bottom and top pairs (Pa)
    TCD_VECTOR_PROPERTY(double, layer)

    /// radius (m) within which the filtered wind replaces the original
    TCD_PROPERTY(double, distance)

    /// width (m) of the annulus over which the filtered wind is blended in
    TCD_PROPERTY(double, ddist)

    /// number of singular triplets retained
    TCD_PROPERTY(unsigned int, ncoeffs)

    /// convergence control of the streamfunction solve
    TCD_PROPERTY(double, tolerance)
    TCD_PROPERTY(unsigned long, max_iterations)

    TCD_PROPERTY(int, verbose)

    /** check the parameters. returns 0 if they are valid and
     * tcd_error::config_error otherwise.
     */
    int validate() const;

    /** compute the grid wide products and the layer means. u, v and
     * pressure are [level, lat, lon] fields with the same shape. returns 0
     * if successful.
     */
    int prepare(const tcd_geo_field &u, const tcd_geo_field &v,
        const tcd_geo_field &pressure, tcd_steering_products &products,
        tcd_steering_layer_list &layers) const;

    /** compute the steering flow of the TC in the layer. returns 0 if
     * successful and tcd_error::numerical_error when the TC has no valid
     * wind within distance.
     */
    int execute(const tcd_tc_fix &fix, const tcd_steering_layer &layer,
        tcd_warning_log &log, tcd_steering_vector &result) const;

    /** filter the 2-D field about the TC. n_used receives the number of
     * singular triplets retained. returns 0 if successful,
     * tcd_error::config_error if no grid point is within distance + ddist
     * and tcd_error::numerical_error if every value in the window is
     * missing.
     */
    int filter(const tcd_geo_field &field, const tcd_tc_fix &fix,
        tcd_warning_log &log, p_tcd_geo_field &filtered,
        unsigned int &n_used) const;

    /** compute the pressure weighted mean of the levels of the 3-D field
     * in [top, bottom]. the field's levels are the isobaric levels.
     * returns 0 if successful and tcd_error::config_error if the layer
     * holds no level.
     */
    static int layer_mean(const tcd_geo_field &field, double bottom,
        double top, p_tcd_geo_field &mean);

    /** the cos(latitude) weighted mean of the 2-D field over the points
     * within distance of the TC. returns 0 if successful and -1 when no
     * valid point is within distance.
     */
    static int area_mean(const tcd_geo_field &field, const tcd_tc_fix &fix,
        double distance, double &mean);

private:
    std::vector<double> isolevels;
    std::vector<double> layers;
    double distance;
    double ddist;
    unsigned int ncoeffs;
    double tolerance;
    unsigned long max_iterations;
    int verbose;
};

#endif
