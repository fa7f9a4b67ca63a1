#ifndef tcd_tc_fix_h
#define tcd_tc_fix_h

/// @file

#include "tcd_config.h"

#include <string>
#include <vector>
#include <ostream>

/// A tropical cyclone's identified center position at a given time.
struct TCD_EXPORT tcd_tc_fix
{
    tcd_tc_fix() : id(), lat_deg(0.0), lon_deg(0.0), valid_time()
    {}

    tcd_tc_fix(const std::string &a_id, double a_lat, double a_lon,
        const std::string &a_time = std::string()) :
        id(a_id), lat_deg(a_lat), lon_deg(a_lon), valid_time(a_time)
    {}

    /// return true if a validity time was provided
    bool have_valid_time() const { return !this->valid_time.empty(); }

    std::string id;
    double lat_deg;
    double lon_deg;
    std::string valid_time;
};

inline
std::ostream &operator<<(std::ostream &os, const tcd_tc_fix &fix)
{
    os << fix.id << " (" << fix.lat_deg << ", " << fix.lon_deg << ")";
    if (fix.have_valid_time())
        os << " " << fix.valid_time;
    return os;
}

using tcd_tc_fix_list = std::vector<tcd_tc_fix>;

#endif
