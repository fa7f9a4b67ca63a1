#include "tcd_isotherm_locator.h"
#include "tcd_coordinate_util.h"
#include "tcd_physical_constants.h"
#include "tcd_string_util.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <algorithm>
#include <cmath>

// --------------------------------------------------------------------------
tcd_isotherm_locator::tcd_isotherm_locator() : isotherm(26.0), deltaz(1.0),
    fill_value(tcd_array_attributes::default_fill_value()),
    interp_type("linear"), rho(tcd_physical_constants::seawater_density()),
    cp(tcd_physical_constants::seawater_heat_capacity()), verbose(0)
{
}

// --------------------------------------------------------------------------
int tcd_isotherm_locator::get_interp_mode(const std::string &name, int &mode)
{
    std::string lname = tcd_string_util::to_lower(tcd_string_util::trim(name));
    if (lname == "linear")
    {
        mode = interp_linear;
        return 0;
    }
    else if (lname == "nearest")
    {
        mode = interp_nearest;
        return 0;
    }

    TCD_ERROR("Invalid interp_type \"" << name << "\". Use linear or nearest")
    return tcd_error::config_error;
}

// --------------------------------------------------------------------------
int tcd_isotherm_locator::validate() const
{
    int mode = 0;
    if (get_interp_mode(this->interp_type, mode))
        return tcd_error::config_error;

    if (this->deltaz <= 0.0)
    {
        TCD_ERROR("Invalid integration step deltaz=" << this->deltaz
            << ". The step must be positive")
        return tcd_error::config_error;
    }

    if ((this->rho <= 0.0) || (this->cp <= 0.0))
    {
        TCD_ERROR("Invalid sea water properties rho=" << this->rho
            << " cp=" << this->cp)
        return tcd_error::config_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_isotherm_locator::locate_isotherm(const double *temp,
    const double *depth, unsigned long n, double &z) const
{
    z = this->fill_value;

    int mode = interp_linear;
    if (get_interp_mode(this->interp_type, mode) || (n == 0))
        return -1;

    double iso = this->isotherm;

    if (temp[0] == iso)
    {
        z = depth[0];
        return 0;
    }

    for (unsigned long k = 0; k + 1 < n; ++k)
    {
        double t0 = temp[k];
        double t1 = temp[k + 1];

        if ((t0 - iso)*(t1 - iso) > 0.0)
            continue;

        if (t0 == t1)
        {
            z = depth[k];
        }
        else if (mode == interp_nearest)
        {
            z = std::fabs(t0 - iso) <= std::fabs(t1 - iso) ?
                depth[k] : depth[k + 1];
        }
        else
        {
            z = depth[k] + (iso - t0)/(t1 - t0)*(depth[k + 1] - depth[k]);
        }

        return 0;
    }

    return -1;
}

// --------------------------------------------------------------------------
double tcd_isotherm_locator::interpolate_temperature(const double *temp,
    const double *depth, unsigned long n, double z, int mode) const
{
    if (mode == interp_nearest)
    {
        unsigned long k_min = 0;
        for (unsigned long k = 1; k < n; ++k)
        {
            if (std::fabs(depth[k] - z) < std::fabs(depth[k_min] - z))
                k_min = k;
        }
        return temp[k_min];
    }

    double t = 0.0;
    if (tcd_coordinate_util::interpolate_linear(depth, temp, n, z, t))
        t = z <= depth[0] ? temp[0] : temp[n - 1];

    return t;
}

// --------------------------------------------------------------------------
double tcd_isotherm_locator::integrate(const double *temp, const double *depth,
    unsigned long n, double z_iso) const
{
    int mode = interp_linear;
    if ((n == 0) || get_interp_mode(this->interp_type, mode) ||
        (z_iso <= depth[0]))
        return 0.0;

    double z0 = depth[0];
    unsigned long n_steps = static_cast<unsigned long>(
        std::ceil((z_iso - z0)/this->deltaz - 1.0e-9));

    double sum = 0.0;
    for (unsigned long s = 0; s < n_steps; ++s)
    {
        double za = z0 + s*this->deltaz;
        double zb = std::min(za + this->deltaz, z_iso);
        double zm = 0.5*(za + zb);

        double t = this->interpolate_temperature(temp, depth, n, zm, mode);

        sum += (t - this->isotherm)*(zb - za);
    }

    return this->rho*this->cp*sum;
}

// --------------------------------------------------------------------------
int tcd_isotherm_locator::execute(const tcd_geo_field &temperature,
    const tcd_geo_field &depth, tcd_warning_log &log,
    tcd_isotherm_profile &profile) const
{
    int ierr = 0;
    if ((ierr = this->validate()))
        return ierr;

    if ((temperature.get_number_of_dimensions() != 3) ||
        (temperature.get_vertical_axis() != 0))
    {
        TCD_ERROR("The ocean temperature \"" << temperature.get_name()
            << "\" must be a [depth, lat, lon] field. The shape is ["
            << temperature.get_shape() << "]")
        return tcd_error::config_error;
    }

    unsigned long n_lev = temperature.get_number_of_levels();
    unsigned long n_horiz = temperature.get_horizontal_size();

    bool depth_1d = depth.get_number_of_dimensions() == 1;
    if (!((depth_1d && (depth.size() == n_lev)) ||
        (depth.get_shape() == temperature.get_shape())))
    {
        TCD_ERROR("The depth \"" << depth.get_name() << "\" [" << depth.get_shape()
            << "] does not match the temperature \"" << temperature.get_name()
            << "\" [" << temperature.get_shape() << "]")
        return tcd_error::config_error;
    }

    std::vector<unsigned long> shape_2d = {temperature.get_number_of_lat(),
        temperature.get_number_of_lon()};

    tcd_array_attributes atts("m", "isotherm depth", "depth of the "
        + std::to_string(this->isotherm) + " degC isotherm", 1, this->fill_value);

    profile = tcd_isotherm_profile();
    profile.isotherm = this->isotherm;

    profile.depth = tcd_geo_field::New("isotherm_depth", shape_2d, this->fill_value);
    profile.depth->set_attributes(atts);
    profile.depth->set_coordinates(temperature.get_latitude(),
        temperature.get_longitude());

    atts.units = "J/m2";
    atts.long_name = "tropical cyclone heat potential";
    atts.description = "heat content of the water warmer than the isotherm";

    profile.tchp = tcd_geo_field::New("tchp", shape_2d, this->fill_value);
    profile.tchp->set_attributes(atts);
    profile.tchp->set_coordinates(temperature.get_latitude(),
        temperature.get_longitude());

    const double *p_temp = temperature.data();
    const double *p_depth = depth.data();
    double *p_iso = profile.depth->data();
    double *p_tchp = profile.tchp->data();

    std::vector<double> col_t(n_lev);
    std::vector<double> col_z(n_lev);

    for (unsigned long q = 0; q < n_horiz; ++q)
    {
        // the valid part of the column
        unsigned long n = 0;
        for (unsigned long k = 0; k < n_lev; ++k)
        {
            double t = p_temp[k*n_horiz + q];
            double z = depth_1d ? p_depth[k] : p_depth[k*n_horiz + q];
            if (temperature.is_missing(t) || depth.is_missing(z))
                break;
            col_t[n] = t;
            col_z[n] = z;
            ++n;
        }

        if (n == 0)
            continue;

        if (col_z[n - 1] < col_z[0])
        {
            std::reverse(col_t.begin(), col_t.begin() + n);
            std::reverse(col_z.begin(), col_z.begin() + n);
        }

        double z_iso = 0.0;
        if (this->locate_isotherm(col_t.data(), col_z.data(), n, z_iso))
        {
            p_tchp[q] = col_t[0] < this->isotherm ? 0.0 : this->fill_value;
            ++profile.number_not_found;
            continue;
        }

        p_iso[q] = z_iso;
        p_tchp[q] = this->integrate(col_t.data(), col_z.data(), n, z_iso);
    }

    if (profile.number_not_found)
    {
        TCD_RECORD_WARNING(log, tcd_warning_log::isotherm_not_found_warning,
            temperature.get_name(), "The " << this->isotherm << " degC"
            " isotherm was not found in " << profile.number_not_found
            << " of " << n_horiz << " columns")
    }

    if (this->verbose)
    {
        TCD_STATUS("Located the " << this->isotherm << " degC isotherm in "
            << n_horiz - profile.number_not_found << " of " << n_horiz
            << " columns")
    }

    return 0;
}
