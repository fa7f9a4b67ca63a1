#ifndef tcd_physical_constants_h
#define tcd_physical_constants_h

/// @file

#define _USE_MATH_DEFINES
#include <cmath>

/// physical constants shared by the diagnostics. SI units unless noted.
namespace tcd_physical_constants
{
/// the factor converting degrees to radians
template <typename num_t = double>
constexpr num_t deg_to_rad() { return num_t(M_PI)/num_t(180); }

/// the factor converting radians to degrees
template <typename num_t = double>
constexpr num_t rad_to_deg() { return num_t(180)/num_t(M_PI); }

/// mean radius of the Earth (m)
template <typename num_t = double>
constexpr num_t earth_radius() { return num_t(6371.0e3); }

/// gravitational acceleration (m s-2)
template <typename num_t = double>
constexpr num_t gravity() { return num_t(9.80665); }

/// gas constant for dry air (J kg-1 K-1)
template <typename num_t = double>
constexpr num_t rd() { return num_t(287.04749); }

/// gas constant for water vapor (J kg-1 K-1)
template <typename num_t = double>
constexpr num_t rv() { return num_t(461.5); }

/// ratio of the gas constants rd/rv
template <typename num_t = double>
constexpr num_t epsilon() { return rd<num_t>()/rv<num_t>(); }

/// standard atmosphere sea level temperature (K)
template <typename num_t = double>
constexpr num_t standard_temperature() { return num_t(288.15); }

/// standard atmosphere sea level pressure (Pa)
template <typename num_t = double>
constexpr num_t standard_pressure() { return num_t(101325.0); }

/// standard atmosphere tropospheric lapse rate (K m-1)
template <typename num_t = double>
constexpr num_t standard_lapse_rate() { return num_t(0.0065); }

/// freezing point of water (K)
template <typename num_t = double>
constexpr num_t freezing_point() { return num_t(273.15); }

/// reference density of sea water (kg m-3)
template <typename num_t = double>
constexpr num_t seawater_density() { return num_t(1025.0); }

/// specific heat of sea water at constant pressure (J kg-1 K-1)
template <typename num_t = double>
constexpr num_t seawater_heat_capacity() { return num_t(3985.0); }
}

#endif
