#include "tcd_geo_field.h"

#include <algorithm>

namespace
{
// product of the extents in [first, last)
unsigned long extent_product(const std::vector<unsigned long> &shape,
    unsigned long first, unsigned long last)
{
    unsigned long n = 1;
    for (unsigned long i = first; i < last; ++i)
        n *= shape[i];
    return n;
}
}

// --------------------------------------------------------------------------
tcd_geo_field::tcd_geo_field() : name(), attributes(), dim_names(),
    lat_axis(no_axis), lon_axis(no_axis), vertical_axis(no_axis), levels(),
    shape(), values(), latitude(), longitude()
{
}

// --------------------------------------------------------------------------
p_tcd_geo_field tcd_geo_field::New()
{
    return p_tcd_geo_field(new tcd_geo_field);
}

// --------------------------------------------------------------------------
p_tcd_geo_field tcd_geo_field::New(const std::string &name,
    const std::vector<unsigned long> &shape, double init)
{
    p_tcd_geo_field f(new tcd_geo_field);
    f->name = name;
    f->resize(shape, init);
    return f;
}

// --------------------------------------------------------------------------
p_tcd_geo_field tcd_geo_field::New(const std::string &name,
    const tcd_geo_field &other, double init)
{
    p_tcd_geo_field f(new tcd_geo_field(other));
    f->name = name;
    f->attributes = tcd_array_attributes();
    f->values.assign(other.values.size(), init);
    return f;
}

// --------------------------------------------------------------------------
p_tcd_geo_field tcd_geo_field::new_copy() const
{
    return p_tcd_geo_field(new tcd_geo_field(*this));
}

// --------------------------------------------------------------------------
void tcd_geo_field::resize(const std::vector<unsigned long> &a_shape, double init)
{
    this->shape = a_shape;
    this->values.assign(extent_product(a_shape, 0, a_shape.size()), init);
    this->dim_names.assign(a_shape.size(), std::string());

    long n = a_shape.size();
    this->lat_axis = n >= 2 ? n - 2 : no_axis;
    this->lon_axis = n >= 2 ? n - 1 : no_axis;
    this->vertical_axis = n >= 3 ? n - 3 : no_axis;
}

// --------------------------------------------------------------------------
unsigned long tcd_geo_field::get_number_of_lat() const
{
    return this->lat_axis == no_axis ? 1 : this->shape[this->lat_axis];
}

// --------------------------------------------------------------------------
unsigned long tcd_geo_field::get_number_of_lon() const
{
    return this->lon_axis == no_axis ? 1 : this->shape[this->lon_axis];
}

// --------------------------------------------------------------------------
unsigned long tcd_geo_field::get_number_of_levels() const
{
    return this->vertical_axis == no_axis ? 1 : this->shape[this->vertical_axis];
}

// --------------------------------------------------------------------------
bool tcd_geo_field::same_horizontal_grid(const tcd_geo_field &other) const
{
    return (this->get_number_of_lat() == other.get_number_of_lat()) &&
        (this->get_number_of_lon() == other.get_number_of_lon());
}

// --------------------------------------------------------------------------
int tcd_geo_field::squeeze(unsigned int axis)
{
    if ((axis >= this->shape.size()) || (this->shape[axis] != 1))
        return -1;

    this->shape.erase(this->shape.begin() + axis);
    this->dim_names.erase(this->dim_names.begin() + axis);

    int iaxis = axis;
    for (int *role : {&this->lat_axis, &this->lon_axis, &this->vertical_axis})
    {
        if (*role == iaxis)
            *role = no_axis;
        else if (*role > iaxis)
            *role -= 1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_geo_field::flip(unsigned int axis)
{
    if (axis >= this->shape.size())
        return -1;

    unsigned long n_outer = extent_product(this->shape, 0, axis);
    unsigned long n_axis = this->shape[axis];
    unsigned long n_inner = extent_product(this->shape, axis + 1, this->shape.size());

    double *p = this->values.data();
    for (unsigned long q = 0; q < n_outer; ++q)
    {
        double *block = p + q*n_axis*n_inner;
        for (unsigned long k = 0; k < n_axis/2; ++k)
        {
            std::swap_ranges(block + k*n_inner, block + (k + 1)*n_inner,
                block + (n_axis - 1 - k)*n_inner);
        }
    }

    if ((this->vertical_axis == int(axis)) && !this->levels.empty())
        std::reverse(this->levels.begin(), this->levels.end());

    return 0;
}

// --------------------------------------------------------------------------
void tcd_geo_field::scale(double mult, double add)
{
    if ((mult == 1.0) && (add == 0.0))
        return;

    unsigned long n = this->values.size();
    double *p = this->values.data();
    for (unsigned long i = 0; i < n; ++i)
    {
        if (!this->is_missing(p[i]))
            p[i] = p[i]*mult + add;
    }
}

// --------------------------------------------------------------------------
void tcd_geo_field::set_coordinates(const const_p_tcd_geo_field &lat,
    const const_p_tcd_geo_field &lon)
{
    this->latitude = lat;
    this->longitude = lon;
}

// --------------------------------------------------------------------------
void tcd_geo_field::to_stream(std::ostream &os) const
{
    os << this->name << "(";
    for (unsigned long i = 0; i < this->shape.size(); ++i)
    {
        os << (i ? ", " : "")
            << (this->dim_names[i].empty() ? "dim" : this->dim_names[i])
            << "=" << this->shape[i];
    }
    os << ") ";
    this->attributes.to_stream(os);
}
