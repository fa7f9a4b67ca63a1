#ifndef tcd_coordinate_util_h
#define tcd_coordinate_util_h

/// @file

#include "tcd_config.h"
#include "tcd_geo_field.h"
#include "tcd_physical_constants.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <vector>

/// Codes dealing with operations on coordinate systems
namespace tcd_coordinate_util
{
/** @brief
 *  traits classes used to get default tolerances for comparing numbers
 *  of a given precision.
 *
 *  @details
 *  A relative tolerance is used for comparing large numbers and an absolute
 *  tolerance is used for comparing small numbers.
 */
template <typename n_t>
struct equal_tt {};

#define declare_equal_tt(cpp_t, atol, rtol)                                 \
/** Specialization for cpp_t with default absTol and relTol */              \
template <>                                                                 \
struct equal_tt<cpp_t>                                                      \
{                                                                           \
    static cpp_t absTol() { return atol; }                                  \
    static cpp_t relTol() { return rtol; }                                  \
};

declare_equal_tt(float, 10.0f*std::numeric_limits<float>::epsilon(),
    std::numeric_limits<float>::epsilon())

declare_equal_tt(double, 10.0*std::numeric_limits<double>::epsilon(),
    std::numeric_limits<float>::epsilon())

/** Compare two floating point numbers.  absTol handles comparing numbers very
 * close to zero.  relTol handles comparing larger values.
 */
template <typename T>
bool equal(T a, T b,
    T relTol = equal_tt<T>::relTol(), T absTol = equal_tt<T>::absTol(),
    typename std::enable_if<std::is_floating_point<T>::value>::type* = 0)
{
    T diff = std::abs(a - b);
    if (diff <= absTol)
        return true;
    a = std::abs(a);
    b = std::abs(b);
    b = (b > a) ? b : a;
    b *= relTol;
    if (diff <= b)
        return true;
    return false;
}

/// Less than or equal to predicate
template<typename data_t>
struct leq
{ static bool eval(const data_t &l, const data_t &r) { return l <= r; } };

/// Greater than or equal to predicate
template<typename data_t>
struct geq
{ static bool eval(const data_t &l, const data_t &r) { return l >= r; } };

/// comparator implementing bracket for ascending input arrays
template<typename data_t>
struct ascend_bracket
{
    // for data in ascending order: val >= data[m_0] && val <= data[m_1]
    using comp0_t = geq<data_t>;
    using comp1_t = leq<data_t>;
};

/// comparator implementing bracket for descending input arrays
template<typename data_t>
struct descend_bracket
{
    // for data in descending order: val <= data[m_0] && val >= data[m_1]
    using comp0_t = leq<data_t>;
    using comp1_t = geq<data_t>;
};

/** binary search that locates the index i such that val lies between data[i]
 * and data[i+1] on [l, r]. the bracket template parameter selects ascending
 * or descending input. return 0 if the value is found.
 */
template <typename data_t, typename bracket_t = ascend_bracket<data_t>>
int index_of(const data_t *data, unsigned long l, unsigned long r,
    data_t val, unsigned long &id)
{
    unsigned long m_0 = (r + l)/2;
    unsigned long m_1 = m_0 + 1;

    if (m_0 == r)
    {
        if (equal(val, data[m_0]))
        {
            id = m_0;
            return 0;
        }
        // not found
        return -1;
    }
    else
    if (bracket_t::comp0_t::eval(val, data[m_0]) &&
         bracket_t::comp1_t::eval(val, data[m_1]))
    {
        id = m_0;
        return 0;
    }
    else
    if (bracket_t::comp1_t::eval(val, data[m_0]))
    {
        // split range to the left
        return tcd_coordinate_util::index_of<data_t, bracket_t>(
            data, l, m_0, val, id);
    }

    // split the range to the right
    return tcd_coordinate_util::index_of<data_t, bracket_t>(
        data, m_1, r, val, id);
}

/** locate the bracketing index in a monotonic array of length n, ascending
 * or descending. return 0 if val is inside the array's range.
 */
template <typename data_t>
int bracket(const data_t *data, unsigned long n, data_t val, unsigned long &id)
{
    if (n < 2)
    {
        id = 0;
        return (n == 1) && equal(val, data[0]) ? 0 : -1;
    }

    if (data[n-1] >= data[0])
        return index_of<data_t, ascend_bracket<data_t>>(data, 0, n - 1, val, id);

    return index_of<data_t, descend_bracket<data_t>>(data, 0, n - 1, val, id);
}

/** 1st order (linear) interpolation for nodal data on a stretched 2D
 * lat/lon mesh. Both axes may be ascending or descending. cx, cy is the
 * location to interpolate to, p_x, p_y the source longitude and latitude
 * axes of length nx and ny. Returns 0 if successful, an error occurs if cx,
 * cy is outside of the source coordinate system or if any of the four
 * surrounding values is missing.
 */
template<typename CT, typename DT, typename missing_t>
int interpolate_linear(CT cx, CT cy, const CT *p_x, const CT *p_y,
    const DT *p_data, unsigned long nx, unsigned long ny,
    const missing_t &is_missing, DT &val)
{
    unsigned long i = 0;
    unsigned long j = 0;

    if (bracket(p_x, nx, cx, i) || bracket(p_y, ny, cy, j))
    {
        // cx,cy is outside the coordinate axes
        return -1;
    }

    unsigned long ii = std::min(i + 1, nx - 1);
    unsigned long jj = std::min(j + 1, ny - 1);

    CT wx = ii == i ? CT(0) : (cx - p_x[i])/(p_x[ii] - p_x[i]);
    CT wy = jj == j ? CT(0) : (cy - p_y[j])/(p_y[jj] - p_y[j]);

    CT vx = CT(1) - wx;
    CT vy = CT(1) - wy;

    DT f00 = p_data[ i +  j*nx];
    DT f10 = p_data[ii +  j*nx];
    DT f11 = p_data[ii + jj*nx];
    DT f01 = p_data[ i + jj*nx];

    if (is_missing(f00) || is_missing(f10) || is_missing(f11) || is_missing(f01))
        return -1;

    val = vx*vy*f00 + wx*vy*f10 + wx*wy*f11 + vx*wy*f01;

    return 0;
}

/** Linear interpolation of y(x) at xt where x is monotonic. Returns 0 if xt
 * is bracketed by x and -1 otherwise.
 */
TCD_EXPORT
int interpolate_linear(const double *x, const double *y, unsigned long n,
    double xt, double &yt);

/** Compute the destination of a great circle path starting at lat0, lon0
 * (degrees) with initial bearing (radians clockwise from north) after
 * traveling distance meters. Results are in degrees with the longitude in
 * [-180, 180).
 */
TCD_EXPORT
void great_circle_destination(double lat0, double lon0, double bearing,
    double distance, double &lat, double &lon);

/// great circle distance in meters between two points given in degrees
TCD_EXPORT
double haversine_distance(double lat0, double lon0, double lat1, double lon1);

/// Wrap lon (degrees) into the range [lon_min, lon_min + 360).
TCD_EXPORT
double wrap_longitude(double lon, double lon_min);

/** Extract the 1-D axes from 2-D latitude and longitude fields on a
 * rectilinear grid. lat_axis[j] = lat(j,0), lon_axis[i] = lon(0,i).
 * Returns 0 if successful.
 */
TCD_EXPORT
int get_rectilinear_axes(const tcd_geo_field &lat, const tcd_geo_field &lon,
    std::vector<double> &lat_axis, std::vector<double> &lon_axis);

/** return true if the ascending longitude axis spans the globe, in which
 * case the last point neighbors the first
 */
TCD_EXPORT
bool is_periodic_longitude(const std::vector<double> &lon_axis);

/** Broadcast 1-D latitude and longitude coordinate fields to the 2-D grid
 * shape (n_lat, n_lon). 2-D inputs are passed through unmodified.
 * Returns 0 if successful.
 */
TCD_EXPORT
int broadcast_coordinates(const p_tcd_geo_field &lat,
    const p_tcd_geo_field &lon);
}

#endif
