#include "tcd_test_util.h"
#include "tcd_array_attributes.h"

#include <algorithm>
#include <cmath>

namespace tcd_test_util
{

// --------------------------------------------------------------------------
void make_coordinates(double lat0, double lat1, unsigned long n_lat,
    double lon0, double lon1, unsigned long n_lon, p_tcd_geo_field &lat,
    p_tcd_geo_field &lon)
{
    lat = tcd_geo_field::New("latitude", {n_lat, n_lon});
    lon = tcd_geo_field::New("longitude", {n_lat, n_lon});

    lat->set_attributes(tcd_array_attributes("degrees_north", "latitude", "", 0,
        tcd_array_attributes::default_fill_value()));
    lon->set_attributes(tcd_array_attributes("degrees_east", "longitude", "", 0,
        tcd_array_attributes::default_fill_value()));

    lat->set_dim_names({"lat", "lon"});
    lon->set_dim_names({"lat", "lon"});

    double dlat = n_lat > 1 ? (lat1 - lat0)/(n_lat - 1) : 0.0;
    double dlon = n_lon > 1 ? (lon1 - lon0)/(n_lon - 1) : 0.0;

    for (unsigned long j = 0; j < n_lat; ++j)
    {
        for (unsigned long i = 0; i < n_lon; ++i)
        {
            (*lat)[j*n_lon + i] = lat0 + j*dlat;
            (*lon)[j*n_lon + i] = lon0 + i*dlon;
        }
    }
}

// --------------------------------------------------------------------------
p_tcd_geo_field make_field(const std::string &name, const std::string &units,
    unsigned long n_lev, const const_p_tcd_geo_field &lat,
    const const_p_tcd_geo_field &lon, const field_function_t &f)
{
    unsigned long n_lat = lat->get_shape()[0];
    unsigned long n_lon = lat->get_shape()[1];
    unsigned long n_horiz = n_lat*n_lon;

    p_tcd_geo_field field = n_lev ?
        tcd_geo_field::New(name, {n_lev, n_lat, n_lon}) :
        tcd_geo_field::New(name, {n_lat, n_lon});

    field->set_attributes(tcd_array_attributes(units, name, "test data", 1,
        tcd_array_attributes::default_fill_value()));

    if (n_lev)
        field->set_dim_names({"level", "lat", "lon"});
    else
        field->set_dim_names({"lat", "lon"});

    field->set_coordinates(lat, lon);

    unsigned long n = std::max(n_lev, 1ul);
    for (unsigned long k = 0; k < n; ++k)
    {
        for (unsigned long q = 0; q < n_horiz; ++q)
            (*field)[k*n_horiz + q] = f(k, (*lat)[q], (*lon)[q]);
    }

    return field;
}

// --------------------------------------------------------------------------
bool close(double a, double b, double tol)
{
    double scale = std::max(std::max(std::fabs(a), std::fabs(b)), 1.0);
    return std::fabs(a - b) <= tol*scale;
}

}
