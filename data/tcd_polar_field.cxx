#include "tcd_polar_field.h"

// --------------------------------------------------------------------------
p_tcd_polar_field tcd_polar_field::New(const std::string &name,
    const std::vector<double> &radial, const std::vector<double> &azimuth,
    const tcd_tc_fix &fix, double init)
{
    p_tcd_polar_field f(new tcd_polar_field);
    f->name = name;
    f->radial = radial;
    f->azimuth = azimuth;
    f->fix = fix;
    f->values.assign(radial.size()*azimuth.size(), init);
    return f;
}

// --------------------------------------------------------------------------
p_tcd_polar_field tcd_polar_field::New(const std::string &name,
    const tcd_polar_field &other, double init)
{
    p_tcd_polar_field f(new tcd_polar_field(other));
    f->name = name;
    f->values.assign(other.values.size(), init);
    return f;
}

// --------------------------------------------------------------------------
p_tcd_polar_field tcd_polar_field::new_copy() const
{
    return p_tcd_polar_field(new tcd_polar_field(*this));
}

// --------------------------------------------------------------------------
bool tcd_polar_field::ring_has_missing(unsigned long i_rad) const
{
    unsigned long n_az = this->azimuth.size();
    const double *ring = this->values.data() + i_rad*n_az;
    for (unsigned long j = 0; j < n_az; ++j)
    {
        if (this->is_missing(ring[j]))
            return true;
    }
    return false;
}
