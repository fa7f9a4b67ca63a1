#ifndef tcd_diagnostics_orchestrator_h
#define tcd_diagnostics_orchestrator_h

/// @file

#include "tcd_config.h"
#include "tcd_property.h"
#include "tcd_diagnostic.h"
#include "tcd_diagnostic_record.h"
#include "tcd_field_collection.h"
#include "tcd_tc_fix.h"
#include "tcd_error.h"

#include <map>
#include <string>
#include <vector>

class tcd_unit_system;
class tcd_schema_registry;
class tcd_config_block;

/** @brief
 * Runs the requested diagnostic applications over the resolved fields and
 * collects their results per TC.
 *
 * @details
 * Applications run in the order they were added. For each one the
 * required inputs are checked, the grid wide products are prepared, and
 * then each TC is processed. A failure is recorded with its error code and
 * does not stop the other applications, and a failing TC does not stop the
 * other TCs of its application. Warnings raised during the run are
 * collected in the run's warning log.
 *
 * Records are validated against the unit system before they are
 * published. When an application's write_output is set its records are
 * written to its output_file in output_dir, the TC records with the TC id
 * inserted before the file's extension.
 */
class TCD_EXPORT tcd_diagnostics_orchestrator
{
public:
    tcd_diagnostics_orchestrator(const tcd_unit_system &units,
        const tcd_schema_registry &schemas);

    ~tcd_diagnostics_orchestrator() = default;

    tcd_diagnostics_orchestrator(const tcd_diagnostics_orchestrator &) = delete;
    void operator=(const tcd_diagnostics_orchestrator &) = delete;

    TCD_PROPERTY(int, verbose)

    /// directory the output files are written to
    TCD_PROPERTY(std::string, output_dir)

    /** add an application. replaces an earlier one with the same name.
     */
    void add_diagnostic(const p_tcd_diagnostic &diag);

    /// get an application by name, nullptr if it was not added
    p_tcd_diagnostic get_diagnostic(const std::string &app) const;

    /// the names of the applications in the order they were added
    const std::vector<std::string> &get_application_names() const
    { return this->app_names; }

    /** validate the application's parameter block with its schema and
     * configure the application. a failure is also recorded as the
     * application's error, so that execute skips it. returns 0 if
     * successful.
     */
    int configure(const std::string &app, const tcd_config_block &block);

    /** run the applications. returns 0 when every application and TC
     * succeeded, otherwise the error code of the first failure. the results
     * of the applications and TCs that succeeded are available either way.
     */
    int execute(const tcd_field_collection &fields,
        const tcd_tc_fix_list &fixes);

    /** write the records of the applications with write_output set.
     * returns 0 if successful.
     */
    int write_output() const;

    /// the record of an application for one TC, nullptr if there is none
    const_p_tcd_diagnostic_record get_record(const std::string &tc_id,
        const std::string &app) const;

    /// the records of one TC keyed by application name
    const std::map<std::string, const_p_tcd_diagnostic_record> &
    get_records(const std::string &tc_id) const;

    /// the grid wide record of an application, nullptr if there is none
    const_p_tcd_diagnostic_record get_grid_record(const std::string &app) const;

    /// the identifiers of the TCs that have at least one record
    std::vector<std::string> get_tc_ids() const;

    /** the error code of an application, 0 if it succeeded. TC failures
     * are reported by get_tc_error.
     */
    int get_application_error(const std::string &app) const;

    /// the error code of one TC in one application, 0 if it succeeded
    int get_tc_error(const std::string &tc_id, const std::string &app) const;

    /// the warnings raised during configure and execute
    const tcd_warning_log &get_warning_log() const { return this->log; }
    tcd_warning_log &get_warning_log() { return this->log; }

    /// discard the results of an earlier run
    void clear_results();

    /// send a summary of the results in human readable form
    void to_stream(std::ostream &os) const;

protected:
    /** check that the application's inputs were resolved. returns 0 if
     * successful, missing_variable_error when an input is absent and the
     * input's own error when it failed to resolve.
     */
    int check_inputs(const tcd_diagnostic &diag,
        const tcd_field_collection &fields) const;

    /// run one application
    int execute(tcd_diagnostic &diag, const tcd_field_collection &fields,
        const tcd_tc_fix_list &fixes);

private:
    using record_map_t = std::map<std::string, const_p_tcd_diagnostic_record>;

    const tcd_unit_system &units;
    const tcd_schema_registry &schemas;
    int verbose;
    std::string output_dir;
    std::vector<std::string> app_names;
    std::map<std::string, p_tcd_diagnostic> diagnostics;
    std::map<std::string, int> config_errors;
    std::map<std::string, int> app_errors;
    std::map<std::string, std::map<std::string, int>> tc_errors;
    std::map<std::string, record_map_t> tc_records;
    record_map_t grid_records;
    tcd_warning_log log;
};

#endif
