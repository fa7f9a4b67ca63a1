#include "tcd_coordinate_util.h"
#include "tcd_common.h"

using tcd_physical_constants::deg_to_rad;
using tcd_physical_constants::rad_to_deg;
using tcd_physical_constants::earth_radius;

namespace tcd_coordinate_util
{
// --------------------------------------------------------------------------
int interpolate_linear(const double *x, const double *y, unsigned long n,
    double xt, double &yt)
{
    unsigned long i = 0;
    if (bracket(x, n, xt, i))
        return -1;

    unsigned long ii = std::min(i + 1, n - 1);
    if ((ii == i) || (x[ii] == x[i]))
    {
        yt = y[i];
        return 0;
    }

    double w = (xt - x[i])/(x[ii] - x[i]);
    yt = (1.0 - w)*y[i] + w*y[ii];

    return 0;
}

// --------------------------------------------------------------------------
void great_circle_destination(double lat0, double lon0, double bearing,
    double distance, double &lat, double &lon)
{
    double phi0 = lat0*deg_to_rad();
    double lam0 = lon0*deg_to_rad();
    double delta = distance/earth_radius();

    double sin_phi0 = std::sin(phi0);
    double cos_phi0 = std::cos(phi0);
    double sin_delta = std::sin(delta);
    double cos_delta = std::cos(delta);

    double sin_phi = sin_phi0*cos_delta + cos_phi0*sin_delta*std::cos(bearing);
    sin_phi = std::max(-1.0, std::min(1.0, sin_phi));
    double phi = std::asin(sin_phi);

    double lam = lam0 + std::atan2(std::sin(bearing)*sin_delta*cos_phi0,
        cos_delta - sin_phi0*sin_phi);

    lat = phi*rad_to_deg();
    lon = std::fmod(lam*rad_to_deg() + 540.0, 360.0) - 180.0;
}

// --------------------------------------------------------------------------
double haversine_distance(double lat0, double lon0, double lat1, double lon1)
{
    double phi0 = lat0*deg_to_rad();
    double phi1 = lat1*deg_to_rad();
    double dphi = phi1 - phi0;
    double dlam = (lon1 - lon0)*deg_to_rad();

    double sdphi = std::sin(0.5*dphi);
    double sdlam = std::sin(0.5*dlam);

    double a = sdphi*sdphi + std::cos(phi0)*std::cos(phi1)*sdlam*sdlam;
    a = std::min(1.0, a);

    return 2.0*earth_radius()*std::asin(std::sqrt(a));
}

// --------------------------------------------------------------------------
double wrap_longitude(double lon, double lon_min)
{
    double l = std::fmod(lon - lon_min, 360.0);
    if (l < 0.0)
        l += 360.0;
    return lon_min + l;
}

// --------------------------------------------------------------------------
int get_rectilinear_axes(const tcd_geo_field &lat, const tcd_geo_field &lon,
    std::vector<double> &lat_axis, std::vector<double> &lon_axis)
{
    if ((lat.get_number_of_dimensions() == 1) &&
        (lon.get_number_of_dimensions() == 1))
    {
        lat_axis = lat.get_values();
        lon_axis = lon.get_values();
        return 0;
    }

    if ((lat.get_number_of_dimensions() != 2) ||
        (lon.get_number_of_dimensions() != 2) ||
        (lat.get_shape() != lon.get_shape()))
    {
        TCD_ERROR("latitude and longitude must be 2-D fields of the same shape")
        return -1;
    }

    unsigned long n_lat = lat.get_shape()[0];
    unsigned long n_lon = lat.get_shape()[1];

    const double *p_lat = lat.data();
    const double *p_lon = lon.data();

    lat_axis.resize(n_lat);
    for (unsigned long j = 0; j < n_lat; ++j)
    {
        lat_axis[j] = p_lat[j*n_lon];
        if (!equal(p_lat[j*n_lon + n_lon - 1], lat_axis[j], 1.0e-6, 1.0e-6))
        {
            TCD_ERROR("latitude varies along row " << j
                << ", the grid is not rectilinear")
            return -1;
        }
    }

    lon_axis.assign(p_lon, p_lon + n_lon);

    return 0;
}

// --------------------------------------------------------------------------
bool is_periodic_longitude(const std::vector<double> &lon_axis)
{
    unsigned long n_lon = lon_axis.size();
    if ((n_lon < 2) || (lon_axis[n_lon - 1] <= lon_axis[0]))
        return false;

    double dlon = (lon_axis[n_lon - 1] - lon_axis[0])/(n_lon - 1);
    return lon_axis[n_lon - 1] - lon_axis[0] + dlon >= 360.0 - 1.0e-3;
}

// --------------------------------------------------------------------------
int broadcast_coordinates(const p_tcd_geo_field &lat,
    const p_tcd_geo_field &lon)
{
    unsigned long lat_dims = lat->get_number_of_dimensions();
    unsigned long lon_dims = lon->get_number_of_dimensions();

    if ((lat_dims == 2) && (lon_dims == 2))
        return 0;

    if ((lat_dims != 1) || (lon_dims != 1))
    {
        TCD_ERROR("Can't broadcast coordinates with " << lat_dims
            << " latitude and " << lon_dims << " longitude dimensions")
        return -1;
    }

    std::vector<double> lat_axis = lat->get_values();
    std::vector<double> lon_axis = lon->get_values();

    std::string lat_dim = lat->get_dim_names()[0];
    std::string lon_dim = lon->get_dim_names()[0];

    unsigned long n_lat = lat_axis.size();
    unsigned long n_lon = lon_axis.size();

    lat->resize({n_lat, n_lon});
    lon->resize({n_lat, n_lon});

    double *p_lat = lat->data();
    double *p_lon = lon->data();
    for (unsigned long j = 0; j < n_lat; ++j)
    {
        for (unsigned long i = 0; i < n_lon; ++i)
        {
            p_lat[j*n_lon + i] = lat_axis[j];
            p_lon[j*n_lon + i] = lon_axis[i];
        }
    }

    lat->set_dim_names({lat_dim, lon_dim});
    lon->set_dim_names({lat_dim, lon_dim});

    return 0;
}
}
