#include "tcd_ohc_diagnostic.h"
#include "tcd_isotherm_locator.h"
#include "tcd_physical_constants.h"
#include "tcd_schema.h"
#include "tcd_unit_system.h"
#include "tcd_common.h"
#include "tcd_error.h"

#if defined(TCD_HAS_BOOST)
#include <boost/program_options.hpp>
#endif

namespace
{
// initialize the locator from the parameters
void get_locator(double isotherm, double deltaz, double fill_value,
    const std::string &interp_type, double rho, double cp, int verbose,
    tcd_isotherm_locator &loc)
{
    loc.set_isotherm(isotherm);
    loc.set_deltaz(deltaz);
    loc.set_fill_value(fill_value);
    loc.set_interp_type(interp_type);
    loc.set_rho(rho);
    loc.set_cp(cp);
    loc.set_verbose(verbose);
}
}

// --------------------------------------------------------------------------
tcd_ohc_diagnostic::tcd_ohc_diagnostic() : isotherm(26.0), deltaz(1.0),
    fill_value(tcd_array_attributes::default_fill_value()),
    interp_type("linear"), rho(tcd_physical_constants::seawater_density()),
    cp(tcd_physical_constants::seawater_heat_capacity()), profile()
{
    this->output_file = "tcd_ocean_heat_content.nc";
}

#if defined(TCD_HAS_BOOST)
// --------------------------------------------------------------------------
void tcd_ohc_diagnostic::get_properties_description(
    const std::string &prefix, options_description &global_opts)
{
    options_description opts("Options for "
        + (prefix.empty()?"tcd_ohc_diagnostic":prefix));

    opts.add_options()
        TCD_POPTS_GET(double, prefix, isotherm, "the isotherm (degC)")
        TCD_POPTS_GET(double, prefix, deltaz, "integration step (m)")
        TCD_POPTS_GET(double, prefix, fill_value,
            "value marking columns where the isotherm was not found")
        TCD_POPTS_GET(std::string, prefix, interp_type,
            "linear or nearest")
        TCD_POPTS_GET(double, prefix, rho, "sea water density (kg m-3)")
        TCD_POPTS_GET(double, prefix, cp,
            "sea water specific heat (J kg-1 K-1)")
        ;

    this->tcd_diagnostic::get_properties_description(prefix, opts);

    global_opts.add(opts);
}

// --------------------------------------------------------------------------
void tcd_ohc_diagnostic::set_properties(const std::string &prefix,
    variables_map &opts)
{
    this->tcd_diagnostic::set_properties(prefix, opts);

    TCD_POPTS_SET(opts, double, prefix, isotherm)
    TCD_POPTS_SET(opts, double, prefix, deltaz)
    TCD_POPTS_SET(opts, double, prefix, fill_value)
    TCD_POPTS_SET(opts, std::string, prefix, interp_type)
    TCD_POPTS_SET(opts, double, prefix, rho)
    TCD_POPTS_SET(opts, double, prefix, cp)
}
#endif

// --------------------------------------------------------------------------
int tcd_ohc_diagnostic::configure(const tcd_config_record &rec)
{
    int ierr = 0;
    if ((ierr = this->tcd_diagnostic::configure(rec)) ||
        (ierr = this->get_parameter(rec, "isotherm", this->isotherm)) ||
        (ierr = this->get_parameter(rec, "deltaz", this->deltaz)) ||
        (ierr = this->get_parameter(rec, "fill_value", this->fill_value)) ||
        (ierr = this->get_parameter(rec, "interp_type", this->interp_type)) ||
        (ierr = this->get_parameter(rec, "rho", this->rho)) ||
        (ierr = this->get_parameter(rec, "cp", this->cp)))
        return ierr;

    tcd_isotherm_locator loc;
    get_locator(this->isotherm, this->deltaz, this->fill_value,
        this->interp_type, this->rho, this->cp, this->verbose, loc);

    return loc.validate();
}

// --------------------------------------------------------------------------
std::vector<std::string> tcd_ohc_diagnostic::get_required_inputs() const
{
    return {"pottemp", "depth"};
}

// --------------------------------------------------------------------------
int tcd_ohc_diagnostic::prepare(const tcd_field_collection &fields,
    const tcd_unit_system &units, tcd_warning_log &log,
    p_tcd_diagnostic_record &record)
{
    this->profile = tcd_isotherm_profile();

    const_p_tcd_geo_field temp;
    const_p_tcd_geo_field depth;

    int ierr = 0;
    if ((ierr = this->get_field(fields, "pottemp", "degC", units, temp)) ||
        (ierr = this->get_field(fields, "depth", "m", units, depth)))
        return ierr;

    tcd_isotherm_locator loc;
    get_locator(this->isotherm, this->deltaz, this->fill_value,
        this->interp_type, this->rho, this->cp, this->verbose, loc);

    tcd_isotherm_profile prof;
    if ((ierr = loc.execute(*temp, *depth, log, prof)))
    {
        TCD_ERROR("Failed to compute the ocean heat content")
        return ierr;
    }

    if ((ierr = record->add_field(prof.depth)) ||
        (ierr = record->add_field(prof.tchp)))
        return ierr;

    this->profile = prof;

    return 0;
}

// --------------------------------------------------------------------------
int tcd_ohc_diagnostic::execute(const tcd_tc_fix &fix,
    const tcd_unit_system &units, tcd_warning_log &log,
    p_tcd_diagnostic_record &record)
{
    (void)log;

    if (!this->profile.tchp)
    {
        TCD_ERROR("The ocean heat content of TC " << fix.id
            << " was requested before the grid was prepared")
        return tcd_error::config_error;
    }

    int ierr = 0;
    double tchp = 0.0;
    if (sample(*this->profile.tchp, fix, tchp))
    {
        TCD_WARNING("TC " << fix.id << " at " << fix.lat_deg << ", "
            << fix.lon_deg << " has no heat content value")
    }
    else if ((ierr = units.convert(tchp, "J/m2", "kJ/cm2")))
    {
        return ierr;
    }

    double depth = 0.0;
    if (sample(*this->profile.depth, fix, depth))
    {
        TCD_WARNING("TC " << fix.id << " at " << fix.lat_deg << ", "
            << fix.lon_deg << " has no " << this->isotherm
            << " degC isotherm depth")
    }

    if ((ierr = record->add_scalar("tchp", tchp, "kJ/cm2",
            "tropical cyclone heat potential at the TC center")) ||
        (ierr = record->add_scalar("isotherm_depth", depth, "m",
            "depth of the isotherm at the TC center")))
        return ierr;

    return 0;
}
