#include "tcd_pi_diagnostic.h"
#include "tcd_schema.h"
#include "tcd_unit_system.h"
#include "tcd_common.h"
#include "tcd_error.h"

#if defined(TCD_HAS_BOOST)
#include <boost/program_options.hpp>
#endif

// --------------------------------------------------------------------------
tcd_pi_diagnostic::tcd_pi_diagnostic() : zmax(0.0), mslp_max(2000.0),
    ckcd(0.9), ascent_flag(0.0), diss_flag(1), v_reduc(0.8), ptop(5000.0),
    products()
{
    this->output_file = "tcd_potential_intensity.nc";
}

#if defined(TCD_HAS_BOOST)
// --------------------------------------------------------------------------
void tcd_pi_diagnostic::get_properties_description(
    const std::string &prefix, options_description &global_opts)
{
    options_description opts("Options for "
        + (prefix.empty()?"tcd_pi_diagnostic":prefix));

    opts.add_options()
        TCD_POPTS_GET(double, prefix, zmax,
            "columns with a surface higher than this (m) are not computed")
        TCD_POPTS_GET(double, prefix, mslp_max,
            "columns with a sea level pressure above this are not computed."
            " values below 1e4 are hPa, others Pa")
        TCD_POPTS_GET(double, prefix, ckcd,
            "ratio of the enthalpy and momentum exchange coefficients")
        TCD_POPTS_GET(double, prefix, ascent_flag,
            "fraction of condensate removed during ascent, 0 reversible"
            " and 1 pseudo-adiabatic")
        TCD_POPTS_GET(int, prefix, diss_flag,
            "set to 1 to include dissipative heating")
        TCD_POPTS_GET(double, prefix, v_reduc,
            "reduction of the gradient wind to the surface wind")
        TCD_POPTS_GET(double, prefix, ptop,
            "pressure (Pa) above which the sounding is ignored")
        ;

    this->tcd_diagnostic::get_properties_description(prefix, opts);

    global_opts.add(opts);
}

// --------------------------------------------------------------------------
void tcd_pi_diagnostic::set_properties(const std::string &prefix,
    variables_map &opts)
{
    this->tcd_diagnostic::set_properties(prefix, opts);

    TCD_POPTS_SET(opts, double, prefix, zmax)
    TCD_POPTS_SET(opts, double, prefix, mslp_max)
    TCD_POPTS_SET(opts, double, prefix, ckcd)
    TCD_POPTS_SET(opts, double, prefix, ascent_flag)
    TCD_POPTS_SET(opts, int, prefix, diss_flag)
    TCD_POPTS_SET(opts, double, prefix, v_reduc)
    TCD_POPTS_SET(opts, double, prefix, ptop)
}
#endif

// --------------------------------------------------------------------------
int tcd_pi_diagnostic::configure(const tcd_config_record &rec)
{
    int ierr = 0;
    if ((ierr = this->tcd_diagnostic::configure(rec)) ||
        (ierr = this->get_parameter(rec, "zmax", this->zmax)) ||
        (ierr = this->get_parameter(rec, "mslp_max", this->mslp_max)) ||
        (ierr = this->get_parameter(rec, "ckcd", this->ckcd)) ||
        (ierr = this->get_parameter(rec, "ascent_flag", this->ascent_flag)) ||
        (ierr = this->get_parameter(rec, "diss_flag", this->diss_flag)) ||
        (ierr = this->get_parameter(rec, "v_reduc", this->v_reduc)) ||
        (ierr = this->get_parameter(rec, "ptop", this->ptop)))
        return ierr;

    tcd_potential_intensity pi;
    this->get_kernel(pi);

    return pi.validate();
}

// --------------------------------------------------------------------------
void tcd_pi_diagnostic::get_kernel(tcd_potential_intensity &pi) const
{
    pi.set_zmax(this->zmax);
    pi.set_mslp_max(this->mslp_max);
    pi.set_ckcd(this->ckcd);
    pi.set_ascent_flag(this->ascent_flag);
    pi.set_diss_flag(this->diss_flag);
    pi.set_v_reduc(this->v_reduc);
    pi.set_ptop(this->ptop);
    pi.set_verbose(this->verbose);
}

// --------------------------------------------------------------------------
std::vector<std::string> tcd_pi_diagnostic::get_required_inputs() const
{
    return {"pressure", "temperature", "mixing_ratio", "sea_level_pressure",
        "surface_height"};
}

// --------------------------------------------------------------------------
std::vector<std::string> tcd_pi_diagnostic::get_optional_inputs() const
{
    return {"sea_surface_temperature"};
}

// --------------------------------------------------------------------------
int tcd_pi_diagnostic::prepare(const tcd_field_collection &fields,
    const tcd_unit_system &units, tcd_warning_log &log,
    p_tcd_diagnostic_record &record)
{
    (void)log;

    this->products = tcd_pi_fields();

    const_p_tcd_geo_field p;
    const_p_tcd_geo_field t;
    const_p_tcd_geo_field r;
    const_p_tcd_geo_field msl;
    const_p_tcd_geo_field zsfc;

    int ierr = 0;
    if ((ierr = this->get_field(fields, "pressure", "Pa", units, p)) ||
        (ierr = this->get_field(fields, "temperature", "K", units, t)) ||
        (ierr = this->get_field(fields, "mixing_ratio", "kg/kg", units, r)) ||
        (ierr = this->get_field(fields, "sea_level_pressure", "Pa", units, msl)) ||
        (ierr = this->get_field(fields, "surface_height", "m", units, zsfc)))
        return ierr;

    const_p_tcd_geo_field sst;
    if (fields.has("sea_surface_temperature") &&
        (ierr = this->get_field(fields, "sea_surface_temperature", "K", units, sst)))
        return ierr;

    if (this->verbose)
    {
        TCD_STATUS("Computing potential intensity with the "
            << (sst ? "sea surface" : "lowest level") << " temperature")
    }

    tcd_potential_intensity pi;
    this->get_kernel(pi);

    if ((ierr = pi.execute(sst.get(), *msl, *zsfc, *p, *t, *r, this->products)))
    {
        TCD_ERROR("Failed to compute the potential intensity")
        return ierr;
    }

    if ((ierr = record->add_field(this->products.vmax)) ||
        (ierr = record->add_field(this->products.pmin)) ||
        (ierr = record->add_field(this->products.tout)) ||
        (ierr = record->add_field(this->products.pout)) ||
        (ierr = record->add_field(this->products.status)))
        return ierr;

    return 0;
}

// --------------------------------------------------------------------------
int tcd_pi_diagnostic::execute(const tcd_tc_fix &fix,
    const tcd_unit_system &units, tcd_warning_log &log,
    p_tcd_diagnostic_record &record)
{
    (void)units;
    (void)log;

    if (!this->products.vmax)
    {
        TCD_ERROR("The potential intensity of TC " << fix.id
            << " was requested before the grid was prepared")
        return tcd_error::config_error;
    }

    const tcd_geo_field *in[] = {this->products.vmax.get(),
        this->products.pmin.get(), this->products.tout.get(),
        this->products.pout.get()};

    for (const tcd_geo_field *f : in)
    {
        double val = 0.0;
        if (sample(*f, fix, val))
        {
            TCD_WARNING("TC " << fix.id << " at " << fix.lat_deg << ", "
                << fix.lon_deg << " has no " << f->get_name() << " value")
        }

        const tcd_array_attributes &atts = f->get_attributes();

        int ierr = 0;
        if ((ierr = record->add_scalar(f->get_name(), val, atts.units,
            atts.description)))
            return ierr;
    }

    return 0;
}
