#include "tcd_msi_diagnostic.h"
#include "tcd_tc_relative_projector.h"
#include "tcd_spectral_decomposer.h"
#include "tcd_vertical_interp.h"
#include "tcd_physical_constants.h"
#include "tcd_schema.h"
#include "tcd_unit_system.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <cmath>

#if defined(TCD_HAS_BOOST)
#include <boost/program_options.hpp>
#endif

using tcd_physical_constants::deg_to_rad;

// --------------------------------------------------------------------------
tcd_msi_diagnostic::tcd_msi_diagnostic() : drho(100000.0), dphi(45.0),
    max_radius(1000000.0), max_wn(3), wind_height(10.0), wspd()
{
    this->output_file = "tcd_multiscale_intensity.nc";
}

#if defined(TCD_HAS_BOOST)
// --------------------------------------------------------------------------
void tcd_msi_diagnostic::get_properties_description(
    const std::string &prefix, options_description &global_opts)
{
    options_description opts("Options for "
        + (prefix.empty()?"tcd_msi_diagnostic":prefix));

    opts.add_options()
        TCD_POPTS_GET(double, prefix, drho, "radial resolution (m)")
        TCD_POPTS_GET(double, prefix, dphi, "azimuthal resolution (degrees)")
        TCD_POPTS_GET(double, prefix, max_radius, "radial extent (m)")
        TCD_POPTS_GET(unsigned int, prefix, max_wn,
            "the largest wavenumber retained")
        TCD_POPTS_GET(double, prefix, wind_height,
            "height (m) at which the wind is analyzed")
        ;

    this->tcd_diagnostic::get_properties_description(prefix, opts);

    global_opts.add(opts);
}

// --------------------------------------------------------------------------
void tcd_msi_diagnostic::set_properties(const std::string &prefix,
    variables_map &opts)
{
    this->tcd_diagnostic::set_properties(prefix, opts);

    TCD_POPTS_SET(opts, double, prefix, drho)
    TCD_POPTS_SET(opts, double, prefix, dphi)
    TCD_POPTS_SET(opts, double, prefix, max_radius)
    TCD_POPTS_SET(opts, unsigned int, prefix, max_wn)
    TCD_POPTS_SET(opts, double, prefix, wind_height)
}
#endif

// --------------------------------------------------------------------------
int tcd_msi_diagnostic::configure(const tcd_config_record &rec)
{
    int ierr = 0;
    if ((ierr = this->tcd_diagnostic::configure(rec)) ||
        (ierr = this->get_parameter(rec, "drho", this->drho)) ||
        (ierr = this->get_parameter(rec, "dphi", this->dphi)) ||
        (ierr = this->get_parameter(rec, "max_radius", this->max_radius)) ||
        (ierr = this->get_parameter(rec, "max_wn", this->max_wn)) ||
        (ierr = this->get_parameter(rec, "wind_height", this->wind_height)))
        return ierr;

    return this->validate();
}

// --------------------------------------------------------------------------
int tcd_msi_diagnostic::validate() const
{
    if ((this->drho <= 0.0) || (this->max_radius < this->drho) ||
        (this->dphi <= 0.0) || (this->dphi > 180.0))
    {
        TCD_ERROR("Invalid polar grid drho=" << this->drho << " dphi="
            << this->dphi << " max_radius=" << this->max_radius)
        return tcd_error::config_error;
    }

    // the spokes must close the circle evenly
    double n_spokes = 360.0/this->dphi;
    if (std::fabs(n_spokes - std::round(n_spokes)) > 1.0e-6*n_spokes)
    {
        TCD_ERROR("A dphi of " << this->dphi << " degrees does not divide 360"
            " degrees evenly (" << n_spokes << " azimuths)")
        return tcd_error::config_error;
    }

    // the number of spokes must resolve max_wn
    unsigned long n_az = static_cast<unsigned long>(std::round(n_spokes));

    if (2ul*this->max_wn >= n_az)
    {
        TCD_ERROR("Wavenumber " << this->max_wn << " can't be resolved with a"
            " dphi of " << this->dphi << " degrees (" << n_az << " azimuths)")
        return tcd_error::config_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
std::vector<std::string> tcd_msi_diagnostic::get_required_inputs() const
{
    return {"uwind", "vwind"};
}

// --------------------------------------------------------------------------
std::vector<std::string> tcd_msi_diagnostic::get_optional_inputs() const
{
    return {"height"};
}

// --------------------------------------------------------------------------
int tcd_msi_diagnostic::prepare(const tcd_field_collection &fields,
    const tcd_unit_system &units, tcd_warning_log &log,
    p_tcd_diagnostic_record &record)
{
    (void)log;

    this->wspd = nullptr;

    int ierr = 0;
    if ((ierr = this->validate()))
        return ierr;

    const_p_tcd_geo_field u;
    const_p_tcd_geo_field v;
    if ((ierr = this->get_field(fields, "uwind", "m/s", units, u)) ||
        (ierr = this->get_field(fields, "vwind", "m/s", units, v)))
        return ierr;

    if (u->get_shape() != v->get_shape())
    {
        TCD_ERROR("The wind components \"" << u->get_name() << "\" ["
            << u->get_shape() << "] and \"" << v->get_name() << "\" ["
            << v->get_shape() << "] have different shapes")
        return tcd_error::config_error;
    }

    p_tcd_geo_field speed = tcd_geo_field::New("wspd", *u);

    unsigned long n = u->size();
    const double *pu = u->data();
    const double *pv = v->data();
    double *ps = speed->data();
    double fill = tcd_array_attributes::default_fill_value();

    for (unsigned long i = 0; i < n; ++i)
    {
        ps[i] = (u->is_missing(pu[i]) || v->is_missing(pv[i])) ? fill :
            std::sqrt(pu[i]*pu[i] + pv[i]*pv[i]);
    }

    tcd_array_attributes atts("m/s", "wind speed", "wind speed at "
        + std::to_string(this->wind_height) + " m", 1, fill);
    speed->set_attributes(atts);

    if (speed->get_number_of_dimensions() == 3)
    {
        const_p_tcd_geo_field height;
        if ((ierr = this->get_field(fields, "height", "m", units, height)))
        {
            TCD_ERROR("The height is required to interpolate the 3-D winds to "
                << this->wind_height << " m")
            return ierr;
        }

        p_tcd_geo_field speed_2d;
        if ((ierr = tcd_vertical_interp::interpolate(*speed, *height,
            this->wind_height, tcd_vertical_interp::linear, 1, speed_2d)))
        {
            TCD_ERROR("Failed to interpolate the wind speed to "
                << this->wind_height << " m")
            return ierr;
        }

        speed_2d->set_name("wspd");
        speed_2d->set_attributes(atts);
        speed = speed_2d;
    }
    else if (speed->get_number_of_dimensions() != 2)
    {
        TCD_ERROR("The winds must be 2-D or 3-D. The shape is ["
            << u->get_shape() << "]")
        return tcd_error::config_error;
    }

    if ((ierr = record->add_field(speed)))
        return ierr;

    this->wspd = speed;

    if (this->verbose)
    {
        TCD_STATUS("Prepared the " << this->wind_height << " m wind speed")
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_msi_diagnostic::execute(const tcd_tc_fix &fix,
    const tcd_unit_system &units, tcd_warning_log &log,
    p_tcd_diagnostic_record &record)
{
    (void)units;
    (void)log;

    if (!this->wspd)
    {
        TCD_ERROR("The multiscale intensity of TC " << fix.id
            << " was requested before the grid was prepared")
        return tcd_error::config_error;
    }

    tcd_tc_relative_projector projector;
    projector.set_max_radius(this->max_radius);
    projector.set_dradius(this->drho);
    projector.set_dazimuth(this->dphi*deg_to_rad());

    int ierr = 0;
    const_p_tcd_polar_field polar;
    if ((ierr = projector.project(*this->wspd, fix, 0, polar)))
    {
        TCD_ERROR("Failed to project the wind speed about TC " << fix.id)
        return ierr;
    }

    tcd_spectral_decomposer decomposer;
    decomposer.set_max_wavenumber(this->max_wn);

    p_tcd_wavenumber_spectrum spectrum;
    if ((ierr = decomposer.decompose(polar, spectrum)))
    {
        TCD_ERROR("Failed to decompose the wind speed about TC " << fix.id)
        return ierr;
    }

    tcd_spectral_summary summary;
    if ((ierr = tcd_spectral_decomposer::summarize(*spectrum, summary)))
    {
        TCD_ERROR("Failed to summarize the wind speed about TC " << fix.id)
        return ierr;
    }

    if (this->verbose)
    {
        TCD_STATUS("TC " << fix.id << " vmax=" << summary.vmax << " m/s rmw="
            << summary.rmw << " m epsilon_max=" << summary.epsilon_max)
    }

    // polar fields
    if ((ierr = record->add_polar_field(polar)))
        return ierr;

    for (unsigned int k = 0; k < spectrum->get_number_of_components(); ++k)
    {
        if ((ierr = record->add_polar_field(spectrum->get_component(k))))
            return ierr;
    }

    if ((ierr = record->add_polar_field(spectrum->get_truncated())) ||
        (ierr = record->add_polar_field(spectrum->get_residual())))
        return ierr;

    // summary
    if ((ierr = record->add_scalar("vmax", summary.vmax, "m/s",
            "maximum wind speed")) ||
        (ierr = record->add_scalar("rmw", summary.rmw, "m",
            "radius of maximum wind")) ||
        (ierr = record->add_scalar("azimuth", summary.azimuth, "degrees",
            "bearing of the maximum wind from the TC center")) ||
        (ierr = record->add_scalar("lat_rmw", summary.lat_rmw, "degrees",
            "latitude of the maximum wind")) ||
        (ierr = record->add_scalar("lon_rmw", summary.lon_rmw, "degrees",
            "longitude of the maximum wind")))
        return ierr;

    for (unsigned int k = 0; k < summary.wn_max.size(); ++k)
    {
        std::string name = "wn" + std::to_string(k) + "_max";
        if ((ierr = record->add_scalar(name, summary.wn_max[k], "m/s",
            "maximum of the wavenumber " + std::to_string(k) + " wind speed")))
            return ierr;
    }

    if ((ierr = record->add_scalar("wn0p1_max", summary.wn0p1_max, "m/s",
            "maximum of the wavenumber 0 and 1 wind speed")) ||
        (ierr = record->add_scalar("epsilon_max", summary.epsilon_max, "m/s",
            "maximum wind speed less the wavenumber 0 and 1 maximum")))
        return ierr;

    tcd_table table;
    tcd_spectral_decomposer::get_wavenumber_table(summary, "m/s", table);

    if ((ierr = record->add_table("wavenumber_max", table)))
        return ierr;

    return 0;
}
