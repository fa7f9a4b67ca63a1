#include "tcd_vertical_interp.h"
#include "tcd_common.h"
#include "tcd_error.h"

namespace
{
// --------------------------------------------------------------------------
int check_inputs(const tcd_geo_field &field, const tcd_geo_field &coord)
{
    if ((field.get_number_of_dimensions() != 3) ||
        (field.get_vertical_axis() != 0))
    {
        TCD_ERROR("Vertical interpolation of \"" << field.get_name()
            << "\" requires a [level, lat, lon] field, the shape is ["
            << field.get_shape() << "]")
        return tcd_error::config_error;
    }

    if (coord.get_shape() != field.get_shape())
    {
        TCD_ERROR("The vertical coordinate \"" << coord.get_name() << "\" ["
            << coord.get_shape() << "] does not match \"" << field.get_name()
            << "\" [" << field.get_shape() << "]")
        return tcd_error::config_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
p_tcd_geo_field new_output(const tcd_geo_field &field,
    const std::vector<unsigned long> &shape)
{
    p_tcd_geo_field out = tcd_geo_field::New(field.get_name(), shape,
        tcd_array_attributes::default_fill_value());

    tcd_array_attributes atts = field.get_attributes();
    atts.have_fill_value = 1;
    atts.fill_value = tcd_array_attributes::default_fill_value();
    out->set_attributes(atts);

    out->set_coordinates(field.get_latitude(), field.get_longitude());

    return out;
}
}

// --------------------------------------------------------------------------
int tcd_vertical_interp::interpolate(const tcd_geo_field &field,
    const tcd_geo_field &coord, const std::vector<double> &targets, int mode,
    p_tcd_geo_field &out)
{
    int ierr = 0;
    if ((ierr = check_inputs(field, coord)))
        return ierr;

    if (mode == linear_log)
    {
        for (double t : targets)
        {
            if (t <= 0.0)
            {
                TCD_ERROR("Log interpolation to the non-positive level " << t)
                return tcd_error::config_error;
            }
        }
    }

    unsigned long n_lev = field.get_number_of_levels();
    unsigned long n_horiz = field.get_horizontal_size();
    unsigned long n_targets = targets.size();

    out = new_output(field, {n_targets, field.get_number_of_lat(),
        field.get_number_of_lon()});

    std::vector<std::string> dims = field.get_dim_names();
    out->set_dim_names(dims);
    out->set_levels(targets);

    auto is_missing = [&](double v)
    { return field.is_missing(v) || coord.is_missing(v); };

    const double *p_x = coord.data();
    const double *p_y = field.data();
    double *p_out = out->data();

    for (unsigned long q = 0; q < n_horiz; ++q)
    {
        for (unsigned long t = 0; t < n_targets; ++t)
        {
            double yt = 0.0;
            if (!interpolate_column(p_x + q, p_y + q, n_lev, n_horiz,
                targets[t], mode, is_missing, yt))
                p_out[t*n_horiz + q] = yt;
        }
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_vertical_interp::interpolate(const tcd_geo_field &field,
    const tcd_geo_field &coord, double target, int mode, int fallback,
    p_tcd_geo_field &out)
{
    int ierr = 0;
    if ((ierr = check_inputs(field, coord)))
        return ierr;

    unsigned long n_lev = field.get_number_of_levels();
    unsigned long n_horiz = field.get_horizontal_size();

    out = new_output(field, {field.get_number_of_lat(),
        field.get_number_of_lon()});

    const std::vector<std::string> &dims = field.get_dim_names();
    if (dims.size() == 3)
        out->set_dim_names({dims[1], dims[2]});

    auto is_missing = [&](double v)
    { return field.is_missing(v) || coord.is_missing(v); };

    const double *p_x = coord.data();
    const double *p_y = field.data();
    double *p_out = out->data();

    for (unsigned long q = 0; q < n_horiz; ++q)
    {
        double yt = 0.0;
        if (!interpolate_column(p_x + q, p_y + q, n_lev, n_horiz, target,
            mode, is_missing, yt))
        {
            p_out[q] = yt;
        }
        else if (fallback && !field.is_missing(p_y[q]))
        {
            p_out[q] = p_y[q];
        }
    }

    return 0;
}
