#include "tcd_app_util.h"

#include "tcd_config.h"
#include "tcd_common.h"
#include "tcd_error.h"
#include "tcd_file_util.h"

#include <algorithm>
#include <exception>
#include <iostream>

namespace
{
// print the help and option definitions when the flag is present.
int print_help(const std::string &app_name, const std::string &flag,
    const std::vector<std::string> &app_names,
    const boost::program_options::options_description &opt_defs,
    const boost::program_options::variables_map &opt_vals)
{
    if (!opt_vals.count(flag))
        return 0;

    std::cerr << std::endl
        << "TCD version " << TCD_VERSION_DESCR
        << " compiled on " << __DATE__ << " " << __TIME__ << std::endl
        << std::endl
        << "Application usage: " << app_name << " [options]" << std::endl
        << std::endl
        << "Applications: ";

    size_t n = app_names.size();
    for (size_t i = 0; i < n; ++i)
        std::cerr << (i ? ", " : "") << app_names[i];

    std::cerr << std::endl
        << std::endl
        << opt_defs << std::endl
        << std::endl;

    return 1;
}
}

namespace tcd_app_util
{
// --------------------------------------------------------------------------
int process_command_line(int argc, char **argv,
    const std::vector<std::string> &app_names,
    boost::program_options::options_description &basic_opt_defs,
    boost::program_options::options_description &advanced_opt_defs,
    boost::program_options::options_description &all_opt_defs,
    boost::program_options::variables_map &opt_vals)
{
    std::string prog = argc ? tcd_file_util::filename(argv[0]) : "tcd_diagnostics";

    // this will prevent typos from being treated as positionals.
    boost::program_options::positional_options_description pos_opt_defs;

    try
    {
        boost::program_options::store(
            boost::program_options::command_line_parser(argc, argv)
                .style(boost::program_options::command_line_style::unix_style ^
                       boost::program_options::command_line_style::allow_short)
                .options(all_opt_defs)
                .positional(pos_opt_defs)
                .run(),
            opt_vals);

        if (print_help(prog, "help", app_names, basic_opt_defs, opt_vals) ||
            print_help(prog, "advanced_help", app_names, advanced_opt_defs, opt_vals) ||
            print_help(prog, "full_help", app_names, all_opt_defs, opt_vals))
        {
            return 1;
        }

        boost::program_options::notify(opt_vals);
    }
    catch (std::exception &e)
    {
        TCD_ERROR("Error parsing command line options. See --help "
            "for a list of supported options. " << e.what())
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int select_applications(const boost::program_options::variables_map &opt_vals,
    const std::vector<std::string> &app_names,
    const std::vector<std::string> &configured,
    std::vector<std::string> &apps)
{
    apps.clear();

    if (opt_vals.count("applications"))
    {
        apps = opt_vals["applications"].as<std::vector<std::string>>();
        for (const std::string &app : apps)
        {
            if (std::find(app_names.begin(), app_names.end(), app) == app_names.end())
            {
                TCD_ERROR("\"" << app << "\" is not an application. Use one of "
                    << app_names)
                return tcd_error::config_error;
            }
        }
    }
    else
    {
        apps = configured;
    }

    if (apps.empty())
    {
        TCD_ERROR("No applications were requested. Name them with"
            " --applications or configure them in the experiment")
        return tcd_error::config_error;
    }

    return 0;
}
}
