#ifndef tcd_derived_field_h
#define tcd_derived_field_h

/// @file

#include "tcd_config.h"
#include "tcd_geo_field.h"
#include "tcd_field_collection.h"
#include "tcd_variable_spec.h"

#include <map>
#include <string>
#include <vector>

class tcd_unit_system;

/** @brief
 * The closed set of methods computing derived variables from resolved ones.
 *
 * @details
 * Each method has a fixed list of inputs, the units its inputs are
 * converted to before the computation, and the units of its result. The
 * result is converted to the units declared by the variable's spec.
 *
 * | method                  | inputs                                    |
 * | ------                  | ------                                    |
 * | pressure_from_thickness | pressure_thickness (Pa), surface_pressure |
 * |                         | (Pa). 3-D pressure, level 0 is the surface|
 * | height_from_pressure    | pressure (Pa). standard atmosphere height |
 * | pressure_to_sealevel    | surface_pressure (Pa), surface_height (m),|
 * |                         | temperature (K), specific_humidity (kg/kg)|
 * | spfh_to_mxrt            | specific_humidity (kg/kg)                 |
 * | wind_speed              | uwind (m/s), vwind (m/s)                  |
 * | depth_from_profile      | depth_profile (m), latitude (degrees)     |
 * | seawater_pressure       | depth (m), latitude (degrees)             |
 *
 * 3-D fields are laid out [level, lat, lon] with level 0 at the surface.
 * 2-D inputs of pressure_to_sealevel are combined with level 0 of the 3-D
 * temperature and humidity.
 */
namespace tcd_derived_field
{
/// method identifiers
enum
{
    pressure_from_thickness = 0,
    height_from_pressure,
    pressure_to_sealevel,
    spfh_to_mxrt,
    wind_speed,
    depth_from_profile,
    seawater_pressure,
    number_of_methods
};

/** get the identifier of the named method. returns 0 if successful and
 * tcd_error::config_error if there is no such method.
 */
TCD_EXPORT
int get_method(const std::string &name, int &method);

/// get the name of a method
TCD_EXPORT
const char *get_method_name(int method);

/// get the inputs a method consumes when a spec names none
TCD_EXPORT
const std::vector<std::string> &get_default_inputs(int method);

/// get the units the inputs are converted to
TCD_EXPORT
const std::vector<std::string> &get_input_units(int method);

/// get the units of the computed result
TCD_EXPORT
const char *get_output_units(int method);

/** get the inputs of a derived spec, the spec's list when given and the
 * method's default otherwise. returns 0 if successful.
 */
TCD_EXPORT
int get_inputs(const tcd_variable_spec &spec, std::vector<std::string> &inputs);

/** order derived specs for evaluation with a topological sort (Kahn's
 * algorithm). an input is satisfied by a field in resolved or by another
 * derived spec. a spec whose input is never satisfied, whose input failed,
 * or that is part of (or depends on) a cycle fails with
 * tcd_error::dependency_error. order receives the indices of the specs that
 * can be evaluated, dependencies first, failed the keys and codes of the
 * others. returns 0 when every spec can be evaluated and
 * tcd_error::dependency_error otherwise.
 */
TCD_EXPORT
int sort(const std::vector<tcd_variable_spec> &specs,
    const tcd_field_collection &resolved, std::vector<unsigned long> &order,
    std::map<std::string, int> &failed);

/** evaluate a derived spec from the fields in resolved. returns 0 if
 * successful, tcd_error::dependency_error if an input is not in resolved,
 * tcd_error::unit_error if units can't be converted, and
 * tcd_error::config_error for unknown methods or incompatible shapes.
 */
TCD_EXPORT
int evaluate(const tcd_variable_spec &spec, const tcd_field_collection &resolved,
    const tcd_unit_system &units, p_tcd_geo_field &field);
}

#endif
