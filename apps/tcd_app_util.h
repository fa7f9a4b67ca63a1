#ifndef tcd_app_util_h
#define tcd_app_util_h

/// @file

#include "tcd_config.h"

#include <string>
#include <vector>
#include <boost/program_options.hpp>

/// Codes shared by the command line drivers
namespace tcd_app_util
{
/** parses the command line and checks for the --help, --advanced_help and
 * --full_help flags. when one is found the matching option definitions are
 * printed along with the names of the available applications. returns 1 if
 * a help flag was found, -1 if the command line could not be parsed and 0
 * otherwise.
 */
int process_command_line(int argc, char **argv,
    const std::vector<std::string> &app_names,
    boost::program_options::options_description &basic_opt_defs,
    boost::program_options::options_description &advanced_opt_defs,
    boost::program_options::options_description &all_opt_defs,
    boost::program_options::variables_map &opt_vals);

/** selects the applications to run. the names given with --applications
 * are used when present and must each be one of app_names. otherwise the
 * configured applications are used. returns 0 if successful and
 * tcd_error::config_error if a name is unknown or none were selected.
 */
int select_applications(const boost::program_options::variables_map &opt_vals,
    const std::vector<std::string> &app_names,
    const std::vector<std::string> &configured,
    std::vector<std::string> &apps);
}

#endif
