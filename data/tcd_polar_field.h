#ifndef tcd_polar_field_h
#define tcd_polar_field_h

/// @file

#include "tcd_config.h"
#include "tcd_shared_object.h"
#include "tcd_property.h"
#include "tcd_array_attributes.h"
#include "tcd_tc_fix.h"

#include <string>
#include <vector>

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_polar_field)

/** @brief
 * A field on a TC centered (radius, azimuth) grid.
 *
 * @details
 * Radii are in meters and azimuths in radians, measured clockwise from north.
 * Values are stored with the azimuth varying fastest, the value at radius i
 * and azimuth j is at index i*n_azimuth + j. Missing values are marked with
 * the fill value held in the attributes.
 */
class TCD_EXPORT tcd_polar_field
{
public:
    /// allocate a field on the given grid, initialized to init
    static p_tcd_polar_field New(const std::string &name,
        const std::vector<double> &radial, const std::vector<double> &azimuth,
        const tcd_tc_fix &fix, double init = 0.0);

    /// allocate a field on the same grid as other, initialized to init
    static p_tcd_polar_field New(const std::string &name,
        const tcd_polar_field &other, double init = 0.0);

    /// deep copy
    p_tcd_polar_field new_copy() const;

    TCD_PROPERTY(std::string, name)
    TCD_PROPERTY(tcd_array_attributes, attributes)

    const std::string &get_units() const { return this->attributes.units; }
    void set_units(const std::string &units) { this->attributes.units = units; }

    double get_fill_value() const { return this->attributes.fill_value; }
    bool is_missing(double v) const { return this->attributes.is_missing(v); }

    const std::vector<double> &get_radial() const { return this->radial; }
    const std::vector<double> &get_azimuth() const { return this->azimuth; }
    const tcd_tc_fix &get_tc_fix() const { return this->fix; }

    unsigned long get_number_of_radii() const { return this->radial.size(); }
    unsigned long get_number_of_azimuths() const { return this->azimuth.size(); }
    unsigned long size() const { return this->values.size(); }

    double *data() { return this->values.data(); }
    const double *data() const { return this->values.data(); }

    std::vector<double> &get_values() { return this->values; }
    const std::vector<double> &get_values() const { return this->values; }

    double &operator()(unsigned long i_rad, unsigned long i_az)
    { return this->values[i_rad*this->azimuth.size() + i_az]; }

    const double &operator()(unsigned long i_rad, unsigned long i_az) const
    { return this->values[i_rad*this->azimuth.size() + i_az]; }

    /// return true if any value on the given radius is missing
    bool ring_has_missing(unsigned long i_rad) const;

protected:
    tcd_polar_field() = default;
    tcd_polar_field(const tcd_polar_field &) = default;
    tcd_polar_field &operator=(const tcd_polar_field &) = default;

private:
    std::string name;
    tcd_array_attributes attributes;
    std::vector<double> radial;
    std::vector<double> azimuth;
    tcd_tc_fix fix;
    std::vector<double> values;
};

#endif
