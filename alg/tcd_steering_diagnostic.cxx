#include "tcd_steering_diagnostic.h"
#include "tcd_schema.h"
#include "tcd_unit_system.h"
#include "tcd_common.h"
#include "tcd_error.h"

#if defined(TCD_HAS_BOOST)
#include <boost/program_options.hpp>
#endif

// --------------------------------------------------------------------------
tcd_steering_diagnostic::tcd_steering_diagnostic() :
    isolevels({100000.0, 90000.0, 80000.0, 70000.0, 60000.0, 50000.0,
        40000.0, 30000.0, 20000.0, 10000.0}), layers(), distance(1.6e6),
    ddist(1.0e5), ncoeffs(5), tolerance(1.0e-6), max_iterations(20000),
    layer_means()
{
    this->output_file = "tcd_steering_flow.nc";
}

#if defined(TCD_HAS_BOOST)
// --------------------------------------------------------------------------
void tcd_steering_diagnostic::get_properties_description(
    const std::string &prefix, options_description &global_opts)
{
    options_description opts("Options for "
        + (prefix.empty()?"tcd_steering_diagnostic":prefix));

    opts.add_options()
        TCD_POPTS_MULTI_GET(std::vector<double>, prefix, isolevels,
            "isobaric levels (Pa) the winds are interpolated to")
        TCD_POPTS_MULTI_GET(std::vector<double>, prefix, layers,
            "layer bounds as bottom top pairs (Pa)")
        TCD_POPTS_GET(double, prefix, distance,
            "radius (m) of the region filtered about the TC")
        TCD_POPTS_GET(double, prefix, ddist,
            "width (m) of the annulus blending the filtered wind")
        TCD_POPTS_GET(unsigned int, prefix, ncoeffs,
            "number of singular values retained by the filter")
        TCD_POPTS_GET(double, prefix, tolerance,
            "relative tolerance of the streamfunction solve")
        TCD_POPTS_GET(unsigned long, prefix, max_iterations,
            "iteration limit of the streamfunction solve")
        ;

    this->tcd_diagnostic::get_properties_description(prefix, opts);

    global_opts.add(opts);
}

// --------------------------------------------------------------------------
void tcd_steering_diagnostic::set_properties(const std::string &prefix,
    variables_map &opts)
{
    this->tcd_diagnostic::set_properties(prefix, opts);

    TCD_POPTS_SET(opts, std::vector<double>, prefix, isolevels)
    TCD_POPTS_SET(opts, std::vector<double>, prefix, layers)
    TCD_POPTS_SET(opts, double, prefix, distance)
    TCD_POPTS_SET(opts, double, prefix, ddist)
    TCD_POPTS_SET(opts, unsigned int, prefix, ncoeffs)
    TCD_POPTS_SET(opts, double, prefix, tolerance)
    TCD_POPTS_SET(opts, unsigned long, prefix, max_iterations)
}
#endif

// --------------------------------------------------------------------------
int tcd_steering_diagnostic::configure(const tcd_config_record &rec)
{
    int ierr = 0;
    if ((ierr = this->tcd_diagnostic::configure(rec)) ||
        (ierr = this->get_parameter(rec, "isolevels", this->isolevels)) ||
        (ierr = this->get_parameter(rec, "layers", this->layers)) ||
        (ierr = this->get_parameter(rec, "distance", this->distance)) ||
        (ierr = this->get_parameter(rec, "ddist", this->ddist)) ||
        (ierr = this->get_parameter(rec, "ncoeffs", this->ncoeffs)) ||
        (ierr = this->get_parameter(rec, "tolerance", this->tolerance)) ||
        (ierr = this->get_parameter(rec, "max_iterations", this->max_iterations)))
        return ierr;

    tcd_steering_flow steer;
    this->get_kernel(steer);

    return steer.validate();
}

// --------------------------------------------------------------------------
void tcd_steering_diagnostic::get_kernel(tcd_steering_flow &steer) const
{
    steer.set_isolevels(this->isolevels);
    steer.set_layers(this->layers);
    steer.set_distance(this->distance);
    steer.set_ddist(this->ddist);
    steer.set_ncoeffs(this->ncoeffs);
    steer.set_tolerance(this->tolerance);
    steer.set_max_iterations(this->max_iterations);
    steer.set_verbose(this->verbose);
}

// --------------------------------------------------------------------------
std::vector<std::string> tcd_steering_diagnostic::get_required_inputs() const
{
    return {"uwind", "vwind", "pressure"};
}

// --------------------------------------------------------------------------
int tcd_steering_diagnostic::prepare(const tcd_field_collection &fields,
    const tcd_unit_system &units, tcd_warning_log &log,
    p_tcd_diagnostic_record &record)
{
    (void)log;

    this->layer_means.clear();

    const_p_tcd_geo_field u;
    const_p_tcd_geo_field v;
    const_p_tcd_geo_field p;

    int ierr = 0;
    if ((ierr = this->get_field(fields, "uwind", "m/s", units, u)) ||
        (ierr = this->get_field(fields, "vwind", "m/s", units, v)) ||
        (ierr = this->get_field(fields, "pressure", "Pa", units, p)))
        return ierr;

    tcd_steering_flow steer;
    this->get_kernel(steer);

    tcd_steering_products products;
    tcd_steering_layer_list means;
    if ((ierr = steer.prepare(*u, *v, *p, products, means)))
    {
        TCD_ERROR("Failed to compute the layer mean winds")
        return ierr;
    }

    const tcd_wind_partition &parts = products.parts;

    const_p_tcd_geo_field grid_fields[] = {products.uwnd, products.vwnd,
        parts.vort, parts.divg, parts.psi, parts.chi, parts.urot, parts.vrot,
        parts.udiv, parts.vdiv, parts.uhrm, parts.vhrm};

    for (const const_p_tcd_geo_field &f : grid_fields)
    {
        if ((ierr = record->add_field(f)))
            return ierr;
    }

    for (const tcd_steering_layer &layer : means)
    {
        const_p_tcd_geo_field layer_fields[] = {layer.u, layer.v, layer.urot,
            layer.vrot, layer.udiv, layer.vdiv, layer.uhrm, layer.vhrm};

        for (const const_p_tcd_geo_field &f : layer_fields)
        {
            if ((ierr = record->add_field(f)))
                return ierr;
        }
    }

    this->layer_means = means;

    return 0;
}

// --------------------------------------------------------------------------
int tcd_steering_diagnostic::execute(const tcd_tc_fix &fix,
    const tcd_unit_system &units, tcd_warning_log &log,
    p_tcd_diagnostic_record &record)
{
    (void)units;

    if (this->layer_means.empty())
    {
        TCD_ERROR("The steering flow of TC " << fix.id
            << " was requested before the grid was prepared")
        return tcd_error::config_error;
    }

    tcd_steering_flow steer;
    this->get_kernel(steer);

    int ierr = 0;
    for (const tcd_steering_layer &layer : this->layer_means)
    {
        std::string lname = layer.get_name();

        tcd_steering_vector sv;
        if ((ierr = steer.execute(fix, layer, log, sv)))
        {
            TCD_ERROR("Failed to compute the " << lname
                << " layer steering flow of TC " << fix.id)
            return ierr;
        }

        sv.u_filtered->set_name(layer.u->get_name() + "_filtered");
        sv.v_filtered->set_name(layer.v->get_name() + "_filtered");

        if ((ierr = record->add_field(sv.u_filtered)) ||
            (ierr = record->add_field(sv.v_filtered)))
            return ierr;

        struct { const char *name; double value; const char *units;
            const char *descr; } scalars[] = {
            {"u_steer", sv.u_steer, "m/s", "zonal steering wind"},
            {"v_steer", sv.v_steer, "m/s", "meridional steering wind"},
            {"speed_steer", sv.speed, "m/s", "steering wind speed"},
            {"heading_steer", sv.heading, "degrees",
                "steering direction, clockwise from north"},
            {"ncoeffs_used", double(sv.ncoeffs), "1",
                "number of singular values retained by the filter"},
            {"u_rot", sv.u_rot, "m/s", "mean rotational zonal wind"},
            {"v_rot", sv.v_rot, "m/s", "mean rotational meridional wind"},
            {"u_div", sv.u_div, "m/s", "mean divergent zonal wind"},
            {"v_div", sv.v_div, "m/s", "mean divergent meridional wind"},
            {"u_hrm", sv.u_hrm, "m/s", "mean harmonic zonal wind"},
            {"v_hrm", sv.v_hrm, "m/s", "mean harmonic meridional wind"}};

        for (const auto &s : scalars)
        {
            if ((ierr = record->add_scalar(std::string(s.name) + "_" + lname,
                s.value, s.units, std::string(s.descr) + " in the "
                + lname + " hPa layer")))
                return ierr;
        }
    }

    return 0;
}
