#include "tcd_steering_flow.h"
#include "tcd_vertical_interp.h"
#include "tcd_coordinate_util.h"
#include "tcd_physical_constants.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>

using tcd_physical_constants::deg_to_rad;
using tcd_physical_constants::rad_to_deg;

namespace
{
// --------------------------------------------------------------------------
int get_axes(const tcd_geo_field &field, std::vector<double> &lat,
    std::vector<double> &lon)
{
    if (!field.get_latitude() || !field.get_longitude() ||
        tcd_coordinate_util::get_rectilinear_axes(*field.get_latitude(),
            *field.get_longitude(), lat, lon))
    {
        TCD_ERROR("\"" << field.get_name() << "\" is not on a rectilinear grid")
        return tcd_error::config_error;
    }

    if (lat.size()*lon.size() != field.get_horizontal_size())
    {
        TCD_ERROR("The coordinates of \"" << field.get_name()
            << "\" do not match its shape [" << field.get_shape() << "]")
        return tcd_error::config_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
void get_fix_distances(const std::vector<double> &lat, const std::vector<double> &lon,
    const tcd_tc_fix &fix, std::vector<double> &dist)
{
    unsigned long n_lat = lat.size();
    unsigned long n_lon = lon.size();

    dist.resize(n_lat*n_lon);
    for (unsigned long j = 0; j < n_lat; ++j)
    {
        for (unsigned long i = 0; i < n_lon; ++i)
        {
            dist[j*n_lon + i] = tcd_coordinate_util::haversine_distance(
                fix.lat_deg, fix.lon_deg, lat[j], lon[i]);
        }
    }
}
}

// --------------------------------------------------------------------------
tcd_steering_flow::tcd_steering_flow() : isolevels(), layers(),
    distance(1.6e6), ddist(1.0e5), ncoeffs(5), tolerance(1.0e-6),
    max_iterations(20000), verbose(0)
{
    for (int i = 10; i > 0; --i)
        this->isolevels.push_back(i*10000.0);
}

// --------------------------------------------------------------------------
int tcd_steering_flow::validate() const
{
    if (this->isolevels.empty())
    {
        TCD_ERROR("No isobaric levels were given")
        return tcd_error::config_error;
    }

    for (double p : this->isolevels)
    {
        if (p <= 0.0)
        {
            TCD_ERROR("Invalid isobaric level " << p << ". Levels must be"
                " positive pressures in Pa")
            return tcd_error::config_error;
        }
    }

    if (this->layers.size() % 2)
    {
        TCD_ERROR("Layers must be given as bottom, top pairs, "
            << this->layers.size() << " values were given")
        return tcd_error::config_error;
    }

    unsigned long n_layers = this->layers.size()/2;
    for (unsigned long i = 0; i < n_layers; ++i)
    {
        if (this->layers[2*i] <= this->layers[2*i + 1])
        {
            TCD_ERROR("Layer " << i << " has bottom " << this->layers[2*i]
                << " above its top " << this->layers[2*i + 1])
            return tcd_error::config_error;
        }
    }

    if ((this->distance <= 0.0) || (this->ddist < 0.0))
    {
        TCD_ERROR("Invalid steering distance " << this->distance
            << " and ddist " << this->ddist)
        return tcd_error::config_error;
    }

    if (this->ncoeffs < 1)
    {
        TCD_ERROR("At least one singular triplet must be retained")
        return tcd_error::config_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_steering_flow::layer_mean(const tcd_geo_field &field, double bottom,
    double top, p_tcd_geo_field &mean)
{
    const std::vector<double> &levels = field.get_levels();
    unsigned long n_lev = field.get_number_of_levels();

    if ((field.get_number_of_dimensions() != 3) || (levels.size() != n_lev))
    {
        TCD_ERROR("The layer mean of \"" << field.get_name() << "\" requires"
            " a [level, lat, lon] field with known levels")
        return tcd_error::config_error;
    }

    // the levels inside the layer, bottom first
    std::vector<unsigned long> ids;
    for (unsigned long k = 0; k < n_lev; ++k)
    {
        if ((levels[k] <= bottom) && (levels[k] >= top))
            ids.push_back(k);
    }

    if (ids.empty())
    {
        TCD_ERROR("No level of \"" << field.get_name() << "\" is in the layer "
            << bottom << " to " << top << " Pa")
        return tcd_error::config_error;
    }

    std::sort(ids.begin(), ids.end(), [&levels](unsigned long a, unsigned long b)
        { return levels[a] > levels[b]; });

    // trapezoid thickness of each level
    unsigned long n_ids = ids.size();
    std::vector<double> wgt(n_ids, 1.0);
    if (n_ids > 1)
    {
        wgt[0] = 0.5*(levels[ids[0]] - levels[ids[1]]);
        wgt[n_ids - 1] = 0.5*(levels[ids[n_ids - 2]] - levels[ids[n_ids - 1]]);
        for (unsigned long m = 1; m < n_ids - 1; ++m)
            wgt[m] = 0.5*(levels[ids[m - 1]] - levels[ids[m + 1]]);
    }

    unsigned long n_horiz = field.get_horizontal_size();
    double fill_value = tcd_array_attributes::default_fill_value();

    mean = tcd_geo_field::New(field.get_name(), {field.get_number_of_lat(),
        field.get_number_of_lon()}, fill_value);

    tcd_array_attributes atts = field.get_attributes();
    atts.have_fill_value = 1;
    atts.fill_value = fill_value;
    mean->set_attributes(atts);
    mean->set_coordinates(field.get_latitude(), field.get_longitude());

    const double *p_field = field.data();
    double *p_mean = mean->data();

    for (unsigned long q = 0; q < n_horiz; ++q)
    {
        double sum = 0.0;
        double sum_w = 0.0;
        for (unsigned long m = 0; m < n_ids; ++m)
        {
            double f = p_field[ids[m]*n_horiz + q];
            if (field.is_missing(f))
                continue;
            sum += wgt[m]*f;
            sum_w += wgt[m];
        }

        if (sum_w > 0.0)
            p_mean[q] = sum/sum_w;
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_steering_flow::area_mean(const tcd_geo_field &field,
    const tcd_tc_fix &fix, double distance, double &mean)
{
    std::vector<double> lat;
    std::vector<double> lon;
    if (get_axes(field, lat, lon))
        return -1;

    std::vector<double> dist;
    get_fix_distances(lat, lon, fix, dist);

    unsigned long n_lat = lat.size();
    unsigned long n_lon = lon.size();
    const double *p_field = field.data();

    double sum = 0.0;
    double sum_w = 0.0;
    for (unsigned long j = 0; j < n_lat; ++j)
    {
        double w = std::cos(lat[j]*deg_to_rad());
        for (unsigned long i = 0; i < n_lon; ++i)
        {
            unsigned long q = j*n_lon + i;
            if ((dist[q] > distance) || field.is_missing(p_field[q]))
                continue;
            sum += w*p_field[q];
            sum_w += w;
        }
    }

    if (sum_w <= 0.0)
        return -1;

    mean = sum/sum_w;
    return 0;
}

// --------------------------------------------------------------------------
int tcd_steering_flow::prepare(const tcd_geo_field &u, const tcd_geo_field &v,
    const tcd_geo_field &pressure, tcd_steering_products &products,
    tcd_steering_layer_list &layer_list) const
{
    int ierr = 0;
    if ((ierr = this->validate()))
        return ierr;

    // winds on the isobaric levels
    if ((ierr = tcd_vertical_interp::interpolate(u, pressure, this->isolevels,
        tcd_vertical_interp::linear_log, products.uwnd)) ||
        (ierr = tcd_vertical_interp::interpolate(v, pressure, this->isolevels,
        tcd_vertical_interp::linear_log, products.vwnd)))
    {
        TCD_ERROR("Failed to interpolate the wind to the isobaric levels")
        return ierr;
    }

    products.uwnd->set_name("uwnd");
    products.vwnd->set_name("vwnd");

    // partition
    tcd_streamfunction sf;
    sf.set_tolerance(this->tolerance);
    sf.set_max_iterations(this->max_iterations);
    sf.set_verbose(this->verbose);

    if ((ierr = sf.partition(*products.uwnd, *products.vwnd, products.parts)))
    {
        TCD_ERROR("Failed to partition the wind")
        return ierr;
    }

    tcd_wind_partition &parts = products.parts;

    // layer bounds
    std::vector<double> bounds(this->layers);
    if (bounds.empty())
    {
        bounds.push_back(*std::max_element(this->isolevels.begin(),
            this->isolevels.end()));
        bounds.push_back(*std::min_element(this->isolevels.begin(),
            this->isolevels.end()));
    }

    // layer means
    layer_list.clear();
    unsigned long n_layers = bounds.size()/2;
    for (unsigned long i = 0; i < n_layers; ++i)
    {
        tcd_steering_layer layer;
        layer.bottom = bounds[2*i];
        layer.top = bounds[2*i + 1];

        for (double p : this->isolevels)
            layer.number_of_levels += (p <= layer.bottom) && (p >= layer.top);

        const_p_tcd_geo_field *means[] = {&layer.u, &layer.v, &layer.urot,
            &layer.vrot, &layer.udiv, &layer.vdiv, &layer.uhrm, &layer.vhrm};

        p_tcd_geo_field sources[] = {products.uwnd, products.vwnd, parts.urot,
            parts.vrot, parts.udiv, parts.vdiv, parts.uhrm, parts.vhrm};

        for (int m = 0; m < 8; ++m)
        {
            p_tcd_geo_field mean;
            if ((ierr = layer_mean(*sources[m], layer.bottom, layer.top, mean)))
            {
                TCD_ERROR("Failed to compute the mean of the "
                    << layer.get_name() << " layer")
                return ierr;
            }
            mean->set_name(sources[m]->get_name() + "_" + layer.get_name());
            *means[m] = mean;
        }

        if (this->verbose)
        {
            TCD_STATUS("Computed the " << layer.bottom << " to " << layer.top
                << " Pa layer mean from " << layer.number_of_levels << " levels")
        }

        layer_list.push_back(layer);
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_steering_flow::filter(const tcd_geo_field &field,
    const tcd_tc_fix &fix, tcd_warning_log &log, p_tcd_geo_field &filtered,
    unsigned int &n_used) const
{
    int ierr = 0;
    std::vector<double> lat;
    std::vector<double> lon;
    if ((ierr = get_axes(field, lat, lon)))
        return ierr;

    unsigned long n_lat = lat.size();
    unsigned long n_lon = lon.size();

    std::vector<double> dist;
    get_fix_distances(lat, lon, fix, dist);

    // the index box holding the points within the outer radius
    double outer = this->distance + this->ddist;
    unsigned long j0 = n_lat;
    unsigned long j1 = 0;
    unsigned long i0 = n_lon;
    unsigned long i1 = 0;
    for (unsigned long j = 0; j < n_lat; ++j)
    {
        for (unsigned long i = 0; i < n_lon; ++i)
        {
            if (dist[j*n_lon + i] <= outer)
            {
                j0 = std::min(j0, j);
                j1 = std::max(j1, j);
                i0 = std::min(i0, i);
                i1 = std::max(i1, i);
            }
        }
    }

    if (j0 == n_lat)
    {
        TCD_ERROR("No point of \"" << field.get_name() << "\" is within "
            << outer << " m of TC " << fix)
        return tcd_error::config_error;
    }

    unsigned long n_rows = j1 - j0 + 1;
    unsigned long n_cols = i1 - i0 + 1;

    // missing values take the window mean
    const double *p_field = field.data();
    double sum = 0.0;
    unsigned long n_valid = 0;
    for (unsigned long j = j0; j <= j1; ++j)
    {
        for (unsigned long i = i0; i <= i1; ++i)
        {
            double f = p_field[j*n_lon + i];
            if (!field.is_missing(f))
            {
                sum += f;
                ++n_valid;
            }
        }
    }

    if (n_valid == 0)
    {
        TCD_ERROR("All values of \"" << field.get_name() << "\" near TC "
            << fix << " are missing")
        return tcd_error::numerical_error;
    }

    double fill = sum/n_valid;

    Eigen::MatrixXd mat(n_rows, n_cols);
    for (unsigned long j = 0; j < n_rows; ++j)
    {
        for (unsigned long i = 0; i < n_cols; ++i)
        {
            double f = p_field[(j + j0)*n_lon + i + i0];
            mat(j, i) = field.is_missing(f) ? fill : f;
        }
    }

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(mat,
        Eigen::ComputeThinU | Eigen::ComputeThinV);

    unsigned int rank = static_cast<unsigned int>(svd.rank());
    n_used = this->ncoeffs;
    if (n_used > rank)
    {
        TCD_RECORD_WARNING(log, tcd_warning_log::rank_deficiency_warning,
            field.get_name(), "The " << n_rows << " x " << n_cols
            << " window about TC " << fix.id << " has rank " << rank
            << ", retaining " << rank << " of " << this->ncoeffs
            << " singular values")
        n_used = rank;
    }

    Eigen::MatrixXd recon = svd.matrixU().leftCols(n_used)*
        svd.singularValues().head(n_used).asDiagonal()*
        svd.matrixV().leftCols(n_used).transpose();

    // blend the reconstruction into the original
    filtered = field.new_copy();
    double *p_filt = filtered->data();

    for (unsigned long j = 0; j < n_rows; ++j)
    {
        for (unsigned long i = 0; i < n_cols; ++i)
        {
            unsigned long q = (j + j0)*n_lon + i + i0;

            if (field.is_missing(p_field[q]) || (dist[q] > outer))
                continue;

            double w = dist[q] <= this->distance ? 0.0 :
                (dist[q] - this->distance)/this->ddist;

            p_filt[q] = (1.0 - w)*recon(j, i) + w*p_field[q];
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_steering_flow::execute(const tcd_tc_fix &fix,
    const tcd_steering_layer &layer, tcd_warning_log &log,
    tcd_steering_vector &result) const
{
    int ierr = 0;
    if ((ierr = this->validate()))
        return ierr;

    result = tcd_steering_vector();

    unsigned int n_used_u = 0;
    unsigned int n_used_v = 0;
    if ((ierr = this->filter(*layer.u, fix, log, result.u_filtered, n_used_u)) ||
        (ierr = this->filter(*layer.v, fix, log, result.v_filtered, n_used_v)))
    {
        TCD_ERROR("Failed to filter the " << layer.get_name()
            << " layer wind about TC " << fix.id)
        return ierr;
    }

    result.ncoeffs = std::min(n_used_u, n_used_v);

    if (area_mean(*result.u_filtered, fix, this->distance, result.u_steer) ||
        area_mean(*result.v_filtered, fix, this->distance, result.v_steer))
    {
        TCD_ERROR("TC " << fix << " has no valid " << layer.get_name()
            << " layer wind within " << this->distance << " m")
        return tcd_error::numerical_error;
    }

    result.speed = std::sqrt(result.u_steer*result.u_steer +
        result.v_steer*result.v_steer);

    result.heading = std::atan2(result.u_steer, result.v_steer)*rad_to_deg();
    if (result.heading < 0.0)
        result.heading += 360.0;

    // the partition near the TC. parts that are missing everywhere
    // near the TC are reported as missing.
    const_p_tcd_geo_field parts[] = {layer.urot, layer.vrot, layer.udiv,
        layer.vdiv, layer.uhrm, layer.vhrm};

    double *means[] = {&result.u_rot, &result.v_rot, &result.u_div,
        &result.v_div, &result.u_hrm, &result.v_hrm};

    for (int m = 0; m < 6; ++m)
    {
        if (area_mean(*parts[m], fix, this->distance, *means[m]))
            *means[m] = tcd_array_attributes::default_fill_value();
    }

    if (this->verbose)
    {
        TCD_STATUS("TC " << fix.id << " " << layer.get_name() << " steering ("
            << result.u_steer << ", " << result.v_steer << ") m/s heading "
            << result.heading << " using " << result.ncoeffs
            << " singular values")
    }

    return 0;
}
