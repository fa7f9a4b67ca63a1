#ifndef tcd_tc_relative_projector_h
#define tcd_tc_relative_projector_h

/// @file

#include "tcd_config.h"
#include "tcd_property.h"
#include "tcd_geo_field.h"
#include "tcd_polar_field.h"
#include "tcd_polar_cache.h"
#include "tcd_tc_fix.h"

#include <vector>

/** @brief
 * Re-projects a field on a geographic grid onto a polar grid centered on a
 * TC.
 *
 * @details
 * The destination grid has radii 0, dradius, ... up to max_radius (meters)
 * and azimuths 0, dazimuth, ... below 2 pi (radians). dazimuth must divide
 * 2 pi evenly, otherwise validate reports a config_error. Azimuth is the bearing
 * measured clockwise from north. The geographic location of each
 * destination point is found by following the great circle from the TC
 * center, and the source field is interpolated there bilinearly on its
 * lat/lon mesh. Longitudes are wrapped into the source's range and global
 * grids are treated as periodic. Points outside the source domain, or next
 * to missing source values, are marked with the fill value.
 *
 * Projection is a pure function of the field, the fix and the grid. When a
 * cache is set, results are stored under the TC id, the field name and the
 * level, so the cache must only be shared among projectors with the same
 * grid.
 */
class TCD_EXPORT tcd_tc_relative_projector
{
public:
    tcd_tc_relative_projector();
    ~tcd_tc_relative_projector() = default;

    /// the largest radius in meters
    TCD_PROPERTY(double, max_radius)

    /// radial grid spacing in meters
    TCD_PROPERTY(double, dradius)

    /// azimuthal grid spacing in radians
    TCD_PROPERTY(double, dazimuth)

    /// optional cache of projected fields
    TCD_PROPERTY(p_tcd_polar_cache, cache)

    /** check the grid parameters. returns 0 if they are positive and
     * dradius does not exceed max_radius, and tcd_error::config_error
     * otherwise.
     */
    int validate() const;

    /// get the radii of the destination grid
    void get_radial(std::vector<double> &radial) const;

    /// get the azimuths of the destination grid
    void get_azimuth(std::vector<double> &azimuth) const;

    /** project the given level of the field. a 2-D field has one level.
     * the field must carry its latitude and longitude coordinates. returns
     * 0 if successful and tcd_error::config_error when the grid is invalid,
     * the level is out of range, or the field has no rectilinear
     * coordinates.
     */
    int project(const tcd_geo_field &field, const tcd_tc_fix &fix,
        unsigned long level, const_p_tcd_polar_field &polar) const;

private:
    double max_radius;
    double dradius;
    double dazimuth;
    p_tcd_polar_cache cache;
};

#endif
