#ifndef tcd_test_util_h
#define tcd_test_util_h

#include "tcd_config.h"
#include "tcd_geo_field.h"

#include <functional>
#include <string>

/// Codes shared among the tests
namespace tcd_test_util
{

/// computes the value of a field at level k and position lat, lon (degrees)
using field_function_t = std::function<double(unsigned long, double, double)>;

/** creates 2-D latitude and longitude coordinates on a regular grid with
 * n_lat values spanning lat0 to lat1 and n_lon values spanning lon0 to lon1
 */
void make_coordinates(double lat0, double lat1, unsigned long n_lat,
    double lon0, double lon1, unsigned long n_lon, p_tcd_geo_field &lat,
    p_tcd_geo_field &lon);

/** creates a field on the grid of the given coordinates. the field is 2-D
 * when n_lev is 0 and [level, lat, lon] otherwise.
 */
p_tcd_geo_field make_field(const std::string &name, const std::string &units,
    unsigned long n_lev, const const_p_tcd_geo_field &lat,
    const const_p_tcd_geo_field &lon, const field_function_t &f);

/// return true if a and b agree to within tol, relative to the larger
bool close(double a, double b, double tol);

}

#endif
