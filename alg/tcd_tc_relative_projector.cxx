#include "tcd_tc_relative_projector.h"
#include "tcd_coordinate_util.h"
#include "tcd_physical_constants.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <algorithm>
#include <cmath>

// --------------------------------------------------------------------------
tcd_tc_relative_projector::tcd_tc_relative_projector() : max_radius(1.0e6),
    dradius(1.0e5), dazimuth(M_PI/4.0), cache()
{
}

// --------------------------------------------------------------------------
int tcd_tc_relative_projector::validate() const
{
    if ((this->max_radius <= 0.0) || (this->dradius <= 0.0) ||
        (this->dazimuth <= 0.0) || (this->dradius > this->max_radius) ||
        (this->dazimuth > 2.0*M_PI))
    {
        TCD_ERROR("Invalid polar grid max_radius=" << this->max_radius
            << " dradius=" << this->dradius << " dazimuth=" << this->dazimuth
            << ". Spacings must be positive and not exceed the extent")
        return tcd_error::config_error;
    }

    // the spokes must close the circle evenly
    double n_az = 2.0*M_PI/this->dazimuth;
    if (std::fabs(n_az - std::round(n_az)) > 1.0e-6*n_az)
    {
        TCD_ERROR("The azimuthal spacing " << this->dazimuth << " radians does"
            " not divide 2 pi evenly (" << n_az << " azimuths)")
        return tcd_error::config_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
void tcd_tc_relative_projector::get_radial(std::vector<double> &radial) const
{
    unsigned long n_rad = static_cast<unsigned long>(
        std::floor(this->max_radius/this->dradius + 1.0e-9)) + 1;

    radial.resize(n_rad);
    for (unsigned long i = 0; i < n_rad; ++i)
        radial[i] = i*this->dradius;
}

// --------------------------------------------------------------------------
void tcd_tc_relative_projector::get_azimuth(std::vector<double> &azimuth) const
{
    unsigned long n_az = static_cast<unsigned long>(
        std::round(2.0*M_PI/this->dazimuth));

    azimuth.resize(n_az);
    for (unsigned long j = 0; j < n_az; ++j)
        azimuth[j] = j*this->dazimuth;
}

// --------------------------------------------------------------------------
int tcd_tc_relative_projector::project(const tcd_geo_field &field,
    const tcd_tc_fix &fix, unsigned long level,
    const_p_tcd_polar_field &polar) const
{
    if (this->cache)
    {
        polar = this->cache->get(fix.id, field.get_name(), level);
        if (polar)
            return 0;
    }

    int ierr = 0;
    if ((ierr = this->validate()))
        return ierr;

    if (level >= field.get_number_of_levels())
    {
        TCD_ERROR("Can't project level " << level << " of \""
            << field.get_name() << "\" which has "
            << field.get_number_of_levels() << " levels")
        return tcd_error::config_error;
    }

    if (!field.get_latitude() || !field.get_longitude())
    {
        TCD_ERROR("\"" << field.get_name() << "\" has no coordinates")
        return tcd_error::config_error;
    }

    std::vector<double> lat_axis;
    std::vector<double> lon_axis;
    if (tcd_coordinate_util::get_rectilinear_axes(*field.get_latitude(),
        *field.get_longitude(), lat_axis, lon_axis))
    {
        TCD_ERROR("Can't project \"" << field.get_name() << "\"")
        return tcd_error::config_error;
    }

    unsigned long n_lat = lat_axis.size();
    unsigned long n_lon = lon_axis.size();
    unsigned long n_horiz = n_lat*n_lon;

    if (n_horiz != field.get_horizontal_size())
    {
        TCD_ERROR("The coordinates of \"" << field.get_name()
            << "\" do not match its shape [" << field.get_shape() << "]")
        return tcd_error::config_error;
    }

    const double *p_slice = field.data() + level*n_horiz;

    // periodic grids get a copy of the first column appended
    std::vector<double> wrapped;
    if (tcd_coordinate_util::is_periodic_longitude(lon_axis))
    {
        unsigned long n_lon_w = n_lon + 1;
        wrapped.resize(n_lat*n_lon_w);
        for (unsigned long j = 0; j < n_lat; ++j)
        {
            const double *row = p_slice + j*n_lon;
            double *row_w = wrapped.data() + j*n_lon_w;
            std::copy(row, row + n_lon, row_w);
            row_w[n_lon] = row[0];
        }
        lon_axis.push_back(lon_axis[0] + 360.0);
        p_slice = wrapped.data();
        n_lon = n_lon_w;
    }

    double lon_min = std::min(lon_axis[0], lon_axis[n_lon - 1]);

    std::vector<double> radial;
    std::vector<double> azimuth;
    this->get_radial(radial);
    this->get_azimuth(azimuth);

    unsigned long n_rad = radial.size();
    unsigned long n_az = azimuth.size();

    p_tcd_polar_field out = tcd_polar_field::New(field.get_name(), radial,
        azimuth, fix, field.get_fill_value());

    tcd_array_attributes atts = field.get_attributes();
    atts.have_fill_value = 1;
    out->set_attributes(atts);

    double fill_value = field.get_fill_value();
    auto is_missing = [&field](double v) { return field.is_missing(v); };

    for (unsigned long i = 0; i < n_rad; ++i)
    {
        for (unsigned long j = 0; j < n_az; ++j)
        {
            double lat = 0.0;
            double lon = 0.0;
            tcd_coordinate_util::great_circle_destination(fix.lat_deg,
                fix.lon_deg, azimuth[j], radial[i], lat, lon);

            lon = tcd_coordinate_util::wrap_longitude(lon, lon_min);

            double val = fill_value;
            if (tcd_coordinate_util::interpolate_linear(lon, lat,
                lon_axis.data(), lat_axis.data(), p_slice, n_lon, n_lat,
                is_missing, val))
                val = fill_value;

            (*out)(i, j) = val;
        }
    }

    polar = out;

    if (this->cache)
        this->cache->set(fix.id, field.get_name(), level, polar);

    return 0;
}
