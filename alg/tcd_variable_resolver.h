#ifndef tcd_variable_resolver_h
#define tcd_variable_resolver_h

/// @file

#include "tcd_config.h"
#include "tcd_property.h"
#include "tcd_geo_field.h"
#include "tcd_field_collection.h"
#include "tcd_variable_spec.h"

#include <string>
#include <vector>

class tcd_source_provider;
class tcd_array_source;
class tcd_unit_system;

/** @brief
 * Produces the fields named by a set of variable specs, reading them from
 * their sources and applying the declared transforms, then evaluating the
 * derived variables.
 *
 * @details
 * A file sourced variable is read and then transformed in the following
 * order:
 *
 * 1. missing values (the source's fill value, NaN, or magnitude >= 1e20) are
 *    replaced by the default fill value 1e20
 * 2. values are transformed by v*scale_mult + scale_add
 * 3. the length one axis squeeze_axis is dropped when squeeze is set
 * 4. axis roles are assigned from coords, else from the dimension names
 *    reported by the source, else by position, [..., z, lat, lon]
 * 5. the latitude and vertical axes are reversed when flip_lat and flip_z
 *    are set
 *
 * and is tagged with the declared units. Latitude and longitude must be the
 * last two axes.
 *
 * Orientation is enforced across one run: every variable that has a
 * latitude axis must agree on flip_lat, and every variable that has a
 * vertical axis must agree on flip_z. After flipping, vertical index 0 is
 * the surface.
 *
 * A derived variable that also names ncfile and ncvarname reads that array,
 * with its transforms, as the first input of its method. This supports
 * configurations where for example pressure is derived from a layer
 * thickness found in the same file.
 */
class TCD_EXPORT tcd_variable_resolver
{
public:
    tcd_variable_resolver(tcd_source_provider &sources,
        const tcd_unit_system &units);

    ~tcd_variable_resolver() = default;

    tcd_variable_resolver(const tcd_variable_resolver &) = delete;
    void operator=(const tcd_variable_resolver &) = delete;

    /// set to a non-zero value to report each resolved field
    TCD_PROPERTY(int, verbose)

    /** name of the latitude and longitude variables. these are resolved
     * before all others and broadcast to 2-D.
     */
    TCD_PROPERTY(std::string, latitude_variable)
    TCD_PROPERTY(std::string, longitude_variable)

    /** read and transform a file sourced variable. returns 0 if successful,
     * tcd_error::unit_error if the declared units are not recognized,
     * tcd_error::missing_variable_error if the array is not in the source,
     * tcd_error::io_error if the source can't be read, and
     * tcd_error::config_error if the transforms can't be applied.
     */
    int resolve(const tcd_variable_spec &spec, p_tcd_geo_field &field);

    /** resolve all of the specs. coordinates are resolved first and
     * broadcast to 2-D, then the remaining file sourced specs, then the
     * derived specs in dependency order. every resolved field is given the
     * coordinates. a variable that fails is recorded in fields with its
     * error code and the others continue. returns 0 if every variable was
     * resolved, and the first error code otherwise.
     */
    int resolve_all(const std::vector<tcd_variable_spec> &specs,
        tcd_field_collection &fields);

    /// forget the orientation seen in earlier calls to resolve
    void reset_orientation();

protected:
    // assign the lat, lon and vertical axis roles
    int assign_axes(const tcd_variable_spec &spec, tcd_geo_field &field);

    // enforce the run wide orientation convention
    int check_orientation(const tcd_variable_spec &spec,
        const tcd_geo_field &field);

    // read the coordinate values of the vertical axis if the source has them
    int read_levels(tcd_array_source &source, tcd_geo_field &field);

private:
    tcd_source_provider &sources;
    const tcd_unit_system &units;
    int verbose;
    std::string latitude_variable;
    std::string longitude_variable;
    int lat_orientation;
    int z_orientation;
    std::string lat_orientation_source;
    std::string z_orientation_source;
};

#endif
