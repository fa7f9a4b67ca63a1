#include "tcd_config.h"
#include "tcd_common.h"
#include "tcd_error.h"
#include "tcd_schema.h"
#include "tcd_unit_system.h"
#include "tcd_array_source.h"
#include "tcd_field_collection.h"
#include "tcd_variable_spec.h"
#include "tcd_variable_resolver.h"
#include "tcd_diagnostics_orchestrator.h"
#include "tcd_pi_diagnostic.h"
#include "tcd_msi_diagnostic.h"
#include "tcd_steering_diagnostic.h"
#include "tcd_ohc_diagnostic.h"
#include "tcd_yaml_util.h"
#include "tcd_file_util.h"
#include "tcd_app_util.h"

#include <vector>
#include <string>
#include <map>
#include <algorithm>
#include <iostream>

#include <boost/program_options.hpp>

using std::cerr;
using std::endl;

using boost::program_options::value;

namespace
{
// resolve the variables declared in one inputs file and add them to fields.
// coordinates already present in fields are kept.
int resolve_inputs(const std::string &file_name,
    const tcd_schema_registry &schemas, const tcd_unit_system &units,
    tcd_source_provider &sources, tcd_warning_log &log, int verbose,
    tcd_field_collection &fields)
{
    int ierr = 0;
    std::vector<tcd_variable_spec> specs;
    if ((ierr = tcd_variable_spec::from_file(file_name, schemas, log,
        specs, verbose)))
    {
        TCD_ERROR("Some variables declared in \"" << file_name
            << "\" are invalid and will not be available")
    }

    tcd_variable_resolver resolver(sources, units);
    resolver.set_verbose(verbose);

    tcd_field_collection resolved;
    int rerr = resolver.resolve_all(specs, resolved);
    if (rerr)
    {
        TCD_ERROR("Some variables declared in \"" << file_name
            << "\" could not be resolved")
        ierr = ierr ? ierr : rerr;
    }

    for (const std::string &name : resolved.get_names())
    {
        if (!fields.has(name))
            fields.set(name, resolved.get(name));
    }

    for (const std::string &name : resolved.get_error_names())
    {
        if (!fields.has(name))
            fields.set_error(name, resolved.get_error(name));
    }

    return ierr;
}
}


int main(int argc, char **argv)
{
    // report setup failures and return rather than abort
    tcd_error::set_error_handler(tcd_error::error_message);

    // initialize command line options description
    // set up some common options to simplify use for most
    // common scenarios
    int help_width = 100;
    options_description basic_opt_defs(
        "Basic usage:\n\n"
        "The following options are the most commonly used. Information\n"
        "on advanced options can be displayed using --advanced_help\n\n"
        "Basic command line options", help_width, help_width - 4
        );
    basic_opt_defs.add_options()
        ("experiment", value<std::string>(), "\na YAML file naming the inputs, the"
            " TC fixes, and the YAML files configuring each application\n")

        ("tcinfo", value<std::string>(), "\na YAML file holding the TC fixes. overrides"
            " the file named in the experiment\n")

        ("applications", value<std::vector<std::string>>()->multitoken(),
            "\nthe applications to run. one or more of potential_intensity,"
            " multiscale_intensity, steering_flow and ocean_heat_content. when"
            " not given the applications configured in the experiment are run\n")

        ("output_dir", value<std::string>(), "\ndirectory where output files"
            " are written. overrides the experiment's\n")

        ("verbose", value<int>()->default_value(0), "\nset to non-zero to report"
            " progress\n")

        ("help", "\ndisplays documentation for application specific command line options\n")
        ("advanced_help", "\ndisplays documentation for algorithm specific command line options\n")
        ("full_help", "\ndisplays both basic and advanced documentation together\n")
        ;

    // add all options from each application for more advanced use
    options_description advanced_opt_defs(
        "Advanced usage:\n\n"
        "The following list contains the full set options giving one full\n"
        "control over all runtime modifiable parameters. Values given here\n"
        "override those found in the application's YAML file.\n\n"
        "Advanced command line options", help_width, help_width - 4
        );

    // create the applications here, they contain the
    // documentation and parse command line.
    std::vector<p_tcd_diagnostic> diags = {tcd_pi_diagnostic::New(),
        tcd_msi_diagnostic::New(), tcd_steering_diagnostic::New(),
        tcd_ohc_diagnostic::New()};

    // the experiment key naming each application's YAML file
    std::map<std::string, std::string> app_keys = {
        {"potential_intensity", "tcpi"}, {"multiscale_intensity", "tcmsi"},
        {"steering_flow", "tcsteering"}, {"ocean_heat_content", "tcohc"}};

    for (const p_tcd_diagnostic &diag : diags)
        diag->get_properties_description(diag->get_application_name(),
            advanced_opt_defs);

    std::vector<std::string> app_names;
    for (const p_tcd_diagnostic &diag : diags)
        app_names.push_back(diag->get_application_name());

    // package basic and advanced options for display
    options_description all_opt_defs(help_width, help_width - 4);
    all_opt_defs.add(basic_opt_defs).add(advanced_opt_defs);

    // parse the command line
    int ierr = 0;
    variables_map opt_vals;
    if ((ierr = tcd_app_util::process_command_line(argc, argv, app_names,
        basic_opt_defs, advanced_opt_defs, all_opt_defs, opt_vals)))
    {
        if (ierr == 1)
            return 0;
        return -1;
    }

    int verbose = opt_vals["verbose"].as<int>();

    // pass command line arguments into the applications. these override
    // the values found in the YAML files
    for (const p_tcd_diagnostic &diag : diags)
    {
        diag->set_verbose(verbose);
        diag->set_properties(diag->get_application_name(), opt_vals);
    }

    // now pass in the basic options
    if (!opt_vals.count("experiment"))
    {
        TCD_FATAL_ERROR("An experiment file must be specified with --experiment")
        return -1;
    }

    std::string exp_file = opt_vals["experiment"].as<std::string>();

    tcd_schema_registry schemas;
    tcd_unit_system units;
    tcd_diagnostics_orchestrator orchestrator(units, schemas);
    orchestrator.set_verbose(verbose);
    tcd_warning_log &log = orchestrator.get_warning_log();

    tcd_config_block exp_doc;
    tcd_config_record exp;
    if (tcd_yaml_util::load(exp_file, exp_doc) ||
        schemas.validate("experiment", exp_doc, exp, log))
    {
        TCD_FATAL_ERROR("Failed to load the experiment \"" << exp_file << "\"")
        return -1;
    }

    // file names in the experiment are relative to it
    auto get_file = [&exp, &exp_file](const std::string &key) -> std::string
    {
        std::string file_name;
        exp.get(key, file_name);
        return tcd_file_util::resolve(exp_file, file_name);
    };

    std::string tcinfo = get_file("tcinfo");
    if (opt_vals.count("tcinfo"))
        tcinfo = opt_vals["tcinfo"].as<std::string>();

    if (tcinfo.empty())
    {
        TCD_FATAL_ERROR("A TC fix file must be specified with --tcinfo or"
            " the experiment's tcinfo key")
        return -1;
    }

    tcd_tc_fix_list fixes;
    if (tcd_yaml_util::load_tc_fixes(tcinfo, fixes))
    {
        TCD_FATAL_ERROR("Failed to load the TC fixes from \"" << tcinfo << "\"")
        return -1;
    }

    if (verbose)
    {
        TCD_STATUS("Loaded " << fixes.size() << " TC fixes from \""
            << tcinfo << "\"")
    }

    std::string output_dir;
    exp.get("output_dir", output_dir);
    if (opt_vals.count("output_dir"))
        output_dir = opt_vals["output_dir"].as<std::string>();

    if (tcd_file_util::check_output_dir(output_dir))
    {
        TCD_FATAL_ERROR("Results can't be written to \"" << output_dir << "\"")
        return -1;
    }

    orchestrator.set_output_dir(output_dir);

    // select the applications to run
    std::vector<std::string> configured;
    for (const std::string &app : app_names)
    {
        if (!get_file(app_keys[app]).empty())
            configured.push_back(app);
    }

    std::vector<std::string> apps;
    if (tcd_app_util::select_applications(opt_vals, app_names, configured, apps))
    {
        TCD_FATAL_ERROR("Failed to select the applications to run")
        return -1;
    }

    // configure the applications. one that fails to configure is reported
    // and skipped by the orchestrator
    for (const p_tcd_diagnostic &diag : diags)
    {
        std::string app = diag->get_application_name();
        if (std::find(apps.begin(), apps.end(), app) == apps.end())
            continue;

        orchestrator.add_diagnostic(diag);

        std::string app_file = get_file(app_keys[app]);

        tcd_config_block app_doc;
        if (!app_file.empty() && tcd_yaml_util::load(app_file, app_doc))
        {
            TCD_ERROR("Failed to load the " << app << " configuration \""
                << app_file << "\". Defaults will be used")
        }

        if (orchestrator.configure(app, app_doc))
        {
            TCD_WARNING("The " << app << " application is misconfigured"
                " and will be skipped")
        }
    }

    // resolve the inputs
    tcd_source_provider sources;
    tcd_field_collection fields;

    // applications that need a variable that failed are skipped by the
    // orchestrator
    std::string inputs = get_file("inputs");
    if (resolve_inputs(inputs, schemas, units, sources, log, verbose, fields))
    {
        TCD_WARNING("Not all of the atmosphere inputs are available")
    }

    std::string ocean_inputs = get_file("ocean_inputs");
    if (!ocean_inputs.empty() && resolve_inputs(ocean_inputs, schemas,
        units, sources, log, verbose, fields))
    {
        TCD_WARNING("Not all of the ocean inputs are available")
    }

    // run
    int run_err = orchestrator.execute(fields, fixes);
    int write_err = orchestrator.write_output();

    orchestrator.to_stream(cerr);

    if (run_err || write_err)
    {
        TCD_ERROR("The run completed with errors. "
            << tcd_error::get_name(run_err ? run_err : write_err))
        return -1;
    }

    if (verbose)
    {
        TCD_STATUS("Processed " << fixes.size() << " TCs with "
            << apps.size() << " applications")
    }

    return 0;
}
