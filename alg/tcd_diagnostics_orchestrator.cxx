#include "tcd_diagnostics_orchestrator.h"
#include "tcd_schema.h"
#include "tcd_unit_system.h"
#include "tcd_config_block.h"
#include "tcd_cf_writer.h"
#include "tcd_file_util.h"
#include "tcd_string_util.h"
#include "tcd_common.h"

#include <ostream>

// --------------------------------------------------------------------------
tcd_diagnostics_orchestrator::tcd_diagnostics_orchestrator(
    const tcd_unit_system &a_units, const tcd_schema_registry &a_schemas) :
    units(a_units), schemas(a_schemas), verbose(0), output_dir()
{
}

// --------------------------------------------------------------------------
void tcd_diagnostics_orchestrator::add_diagnostic(const p_tcd_diagnostic &diag)
{
    std::string app = diag->get_application_name();

    if (!this->diagnostics.count(app))
        this->app_names.push_back(app);

    this->diagnostics[app] = diag;
    this->config_errors.erase(app);
}

// --------------------------------------------------------------------------
p_tcd_diagnostic tcd_diagnostics_orchestrator::get_diagnostic(
    const std::string &app) const
{
    auto it = this->diagnostics.find(app);
    return it == this->diagnostics.end() ? nullptr : it->second;
}

// --------------------------------------------------------------------------
int tcd_diagnostics_orchestrator::configure(const std::string &app,
    const tcd_config_block &block)
{
    p_tcd_diagnostic diag = this->get_diagnostic(app);
    if (!diag)
    {
        TCD_ERROR("No application named \"" << app << "\"")
        return tcd_error::config_error;
    }

    int ierr = 0;
    tcd_config_record rec;
    if ((ierr = this->schemas.validate(app, block, rec, this->log)) ||
        (ierr = diag->configure(rec)))
    {
        TCD_ERROR("Failed to configure " << app)
        this->config_errors[app] = ierr;
        return ierr;
    }

    this->config_errors.erase(app);

    if (this->verbose)
    {
        TCD_STATUS("Configured " << app)
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_diagnostics_orchestrator::check_inputs(const tcd_diagnostic &diag,
    const tcd_field_collection &fields) const
{
    std::vector<std::string> inputs = diag.get_required_inputs();
    for (const std::string &input : inputs)
    {
        if (fields.has(input))
            continue;

        int code = fields.has_error(input) ? fields.get_error(input) :
            int(tcd_error::missing_variable_error);

        TCD_ERROR("Application " << diag.get_application_name() << " requires \"" << input
            << "\" which " << (fields.has_error(input) ?
            "failed to resolve" : "was not declared") << ". "
            << tcd_error::get_name(code))

        return code;
    }

    return 0;
}

// --------------------------------------------------------------------------
void tcd_diagnostics_orchestrator::clear_results()
{
    this->app_errors.clear();
    this->tc_errors.clear();
    this->tc_records.clear();
    this->grid_records.clear();
}

// --------------------------------------------------------------------------
int tcd_diagnostics_orchestrator::execute(const tcd_field_collection &fields,
    const tcd_tc_fix_list &fixes)
{
    this->clear_results();

    int first_error = 0;
    for (const std::string &app : this->app_names)
    {
        int ierr = 0;

        auto cit = this->config_errors.find(app);
        if (cit != this->config_errors.end())
        {
            TCD_ERROR("Skipping " << app << " which failed to configure")
            ierr = cit->second;
        }
        else
        {
            ierr = this->execute(*this->diagnostics[app], fields, fixes);
        }

        if (ierr)
        {
            this->app_errors[app] = ierr;
            first_error = first_error ? first_error : ierr;
        }
        else if (!this->tc_errors[app].empty() && !first_error)
        {
            first_error = this->tc_errors[app].begin()->second;
        }
    }

    return first_error;
}

// --------------------------------------------------------------------------
int tcd_diagnostics_orchestrator::execute(tcd_diagnostic &diag,
    const tcd_field_collection &fields, const tcd_tc_fix_list &fixes)
{
    std::string app = diag.get_application_name();
    tcd_message_scope app_scope(app);

    int ierr = 0;
    if ((ierr = this->check_inputs(diag, fields)))
    {
        TCD_ERROR("Application " << app << " can't run because its inputs are not available")
        return ierr;
    }

    if (this->verbose)
    {
        TCD_STATUS("Running " << app << " for " << fixes.size() << " TCs")
    }

    // grid wide products
    p_tcd_diagnostic_record grid_rec = tcd_diagnostic_record::New(app, "");
    if ((ierr = diag.prepare(fields, this->units, this->log, grid_rec)) ||
        (ierr = grid_rec->validate(this->units)))
    {
        TCD_ERROR("Application " << app << " failed to prepare the grid wide products")
        return ierr;
    }

    this->grid_records[app] = grid_rec;

    // per TC
    for (const tcd_tc_fix &fix : fixes)
    {
        tcd_message_scope tc_scope(fix.id);

        p_tcd_diagnostic_record rec = tcd_diagnostic_record::New(app, fix.id);
        if ((ierr = diag.execute(fix, this->units, this->log, rec)) ||
            (ierr = rec->validate(this->units)))
        {
            TCD_ERROR("Application " << app << " failed for TC " << fix)
            this->tc_errors[app][fix.id] = ierr;
            continue;
        }

        this->tc_records[fix.id][app] = rec;
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_diagnostics_orchestrator::write_output() const
{
    tcd_cf_writer writer;
    writer.set_verbose(this->verbose);

    int first_error = 0;
    for (const std::string &app : this->app_names)
    {
        const tcd_diagnostic &diag = *this->diagnostics.at(app);
        if (!diag.get_write_output())
            continue;

        std::string file_name = tcd_file_util::join(this->output_dir,
            diag.get_output_file());

        int ierr = 0;
        const_p_tcd_diagnostic_record grid_rec = this->get_grid_record(app);
        if (grid_rec && (ierr = writer.write(file_name, *grid_rec)))
        {
            TCD_ERROR("Failed to write the " << app << " grid to \""
                << file_name << "\"")
            first_error = first_error ? first_error : ierr;
        }

        for (const auto &tc : this->tc_records)
        {
            auto it = tc.second.find(app);
            if (it == tc.second.end())
                continue;

            std::string tc_file_name =
                tcd_string_util::insert_before_extension(file_name, tc.first);

            if ((ierr = writer.write(tc_file_name, *it->second)))
            {
                TCD_ERROR("Failed to write the " << app << " results of TC "
                    << tc.first << " to \"" << tc_file_name << "\"")
                first_error = first_error ? first_error : ierr;
            }
        }
    }

    return first_error;
}

// --------------------------------------------------------------------------
const_p_tcd_diagnostic_record tcd_diagnostics_orchestrator::get_record(
    const std::string &tc_id, const std::string &app) const
{
    auto it = this->tc_records.find(tc_id);
    if (it == this->tc_records.end())
        return nullptr;

    auto rit = it->second.find(app);
    return rit == it->second.end() ? nullptr : rit->second;
}

// --------------------------------------------------------------------------
const std::map<std::string, const_p_tcd_diagnostic_record> &
tcd_diagnostics_orchestrator::get_records(const std::string &tc_id) const
{
    static const record_map_t empty;
    auto it = this->tc_records.find(tc_id);
    return it == this->tc_records.end() ? empty : it->second;
}

// --------------------------------------------------------------------------
const_p_tcd_diagnostic_record tcd_diagnostics_orchestrator::get_grid_record(
    const std::string &app) const
{
    auto it = this->grid_records.find(app);
    return it == this->grid_records.end() ? nullptr : it->second;
}

// --------------------------------------------------------------------------
std::vector<std::string> tcd_diagnostics_orchestrator::get_tc_ids() const
{
    std::vector<std::string> ids;
    for (const auto &tc : this->tc_records)
        ids.push_back(tc.first);
    return ids;
}

// --------------------------------------------------------------------------
int tcd_diagnostics_orchestrator::get_application_error(
    const std::string &app) const
{
    auto it = this->app_errors.find(app);
    return it == this->app_errors.end() ? 0 : it->second;
}

// --------------------------------------------------------------------------
int tcd_diagnostics_orchestrator::get_tc_error(const std::string &tc_id,
    const std::string &app) const
{
    auto it = this->tc_errors.find(app);
    if (it == this->tc_errors.end())
        return 0;

    auto tit = it->second.find(tc_id);
    return tit == it->second.end() ? 0 : tit->second;
}

// --------------------------------------------------------------------------
void tcd_diagnostics_orchestrator::to_stream(std::ostream &os) const
{
    for (const std::string &app : this->app_names)
    {
        int ierr = this->get_application_error(app);
        os << app << ": " << (ierr ? tcd_error::get_name(ierr) : "ok");

        auto it = this->tc_errors.find(app);
        if ((it != this->tc_errors.end()) && !it->second.empty())
            os << ", " << it->second.size() << " TCs failed";

        os << std::endl;
    }

    for (const auto &tc : this->tc_records)
    {
        for (const auto &rec : tc.second)
            rec.second->to_stream(os);
    }

    if (!this->log.empty())
        this->log.to_stream(os);
}
