#ifndef tcd_geo_field_h
#define tcd_geo_field_h

/// @file

#include "tcd_config.h"
#include "tcd_shared_object.h"
#include "tcd_property.h"
#include "tcd_array_attributes.h"

#include <string>
#include <vector>
#include <ostream>

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_geo_field)

/** @brief
 * An N-dimensional array of doubles on a geographic grid, tagged with units
 * and coordinates.
 *
 * @details
 * Multi-dimensional fields are stored in C order with the longitude varying
 * fastest, i.e. [..., vertical, lat, lon]. The roles of the axes are recorded
 * so that transforms such as flipping the latitude axis can be applied
 * without knowledge of the source. Latitude and longitude coordinates are 2-D
 * fields shared among all of the fields resolved from one source. Vertical
 * coordinates, when known, are held as a 1-D vector of levels.
 *
 * Fields are mutable while being produced by the resolver and are shared
 * read-only (const_p_tcd_geo_field) afterwards.
 */
class TCD_EXPORT tcd_geo_field
{
public:
    /// value used to indicate that a field has no axis with a given role
    enum { no_axis = -1 };

    /// allocate an empty field
    static p_tcd_geo_field New();

    /// allocate a field of the given shape, initialized to init
    static p_tcd_geo_field New(const std::string &name,
        const std::vector<unsigned long> &shape, double init = 0.0);

    /** allocate a field with the same shape, axes, levels and coordinates
     * as other, initialized to init. the attributes are defaulted.
     */
    static p_tcd_geo_field New(const std::string &name,
        const tcd_geo_field &other, double init = 0.0);

    /// deep copy of the values. coordinates are shared.
    p_tcd_geo_field new_copy() const;

    ~tcd_geo_field() = default;

    TCD_PROPERTY(std::string, name)
    TCD_PROPERTY(tcd_array_attributes, attributes)
    TCD_PROPERTY(std::vector<std::string>, dim_names)
    TCD_PROPERTY(int, lat_axis)
    TCD_PROPERTY(int, lon_axis)
    TCD_PROPERTY(int, vertical_axis)
    TCD_PROPERTY(std::vector<double>, levels)

    /// get/set the units
    const std::string &get_units() const { return this->attributes.units; }
    void set_units(const std::string &units) { this->attributes.units = units; }

    /// get the fill value used to mark missing data
    double get_fill_value() const { return this->attributes.fill_value; }

    /// set the fill value used to mark missing data
    void set_fill_value(double fv)
    {
        this->attributes.fill_value = fv;
        this->attributes.have_fill_value = 1;
    }

    /// return true if the value is missing
    bool is_missing(double v) const { return this->attributes.is_missing(v); }

    /// get the array shape
    const std::vector<unsigned long> &get_shape() const { return this->shape; }

    unsigned long get_number_of_dimensions() const { return this->shape.size(); }

    /// get the total number of values
    unsigned long size() const { return this->values.size(); }

    bool empty() const { return this->values.empty(); }

    /// reallocate to the given shape. axis roles and dim names are reset.
    void resize(const std::vector<unsigned long> &shape, double init = 0.0);

    double *data() { return this->values.data(); }
    const double *data() const { return this->values.data(); }

    std::vector<double> &get_values() { return this->values; }
    const std::vector<double> &get_values() const { return this->values; }

    double &operator[](unsigned long i) { return this->values[i]; }
    const double &operator[](unsigned long i) const { return this->values[i]; }

    /// number of latitudes, 1 if there is no latitude axis
    unsigned long get_number_of_lat() const;

    /// number of longitudes, 1 if there is no longitude axis
    unsigned long get_number_of_lon() const;

    /// number of vertical levels, 1 if there is no vertical axis
    unsigned long get_number_of_levels() const;

    /// the number of values in one horizontal slice
    unsigned long get_horizontal_size() const
    { return this->get_number_of_lat()*this->get_number_of_lon(); }

    /// return true if the horizontal grid of the other field matches ours
    bool same_horizontal_grid(const tcd_geo_field &other) const;

    /** drop the axis if its length is one. returns 0 if successful and -1 if
     * the axis does not exist or its length is not one.
     */
    int squeeze(unsigned int axis);

    /// reverse the values along the given axis. returns 0 if successful.
    int flip(unsigned int axis);

    /// apply the affine transform v*mult + add to all non-missing values
    void scale(double mult, double add);

    /// set the 2-D latitude and longitude coordinates
    void set_coordinates(const const_p_tcd_geo_field &lat,
        const const_p_tcd_geo_field &lon);

    const_p_tcd_geo_field get_latitude() const { return this->latitude; }
    const_p_tcd_geo_field get_longitude() const { return this->longitude; }

    /// send a summary in human readable form
    void to_stream(std::ostream &os) const;

protected:
    tcd_geo_field();
    tcd_geo_field(const tcd_geo_field &) = default;
    tcd_geo_field &operator=(const tcd_geo_field &) = default;

private:
    std::string name;
    tcd_array_attributes attributes;
    std::vector<std::string> dim_names;
    int lat_axis;
    int lon_axis;
    int vertical_axis;
    std::vector<double> levels;
    std::vector<unsigned long> shape;
    std::vector<double> values;
    const_p_tcd_geo_field latitude;
    const_p_tcd_geo_field longitude;
};

inline
std::ostream &operator<<(std::ostream &os, const tcd_geo_field &field)
{
    field.to_stream(os);
    return os;
}

#endif
