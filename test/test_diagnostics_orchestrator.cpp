#include "tcd_diagnostics_orchestrator.h"
#include "tcd_diagnostic.h"
#include "tcd_ohc_diagnostic.h"
#include "tcd_field_collection.h"
#include "tcd_schema.h"
#include "tcd_unit_system.h"
#include "tcd_config_block.h"
#include "tcd_error.h"
#include "tcd_common.h"
#include "tcd_test_util.h"

#include <memory>
#include <string>
#include <vector>

// reports the value of the sst field at the TC center
class center_value;
using p_center_value = std::shared_ptr<center_value>;

class center_value : public tcd_diagnostic
{
public:
    TCD_STATIC_NEW(center_value)
    TCD_DIAGNOSTIC_DELETE_COPY_ASSIGN(center_value)

    const char *get_class_name() const override
    { return "center_value"; }

    const char *get_application_name() const override
    { return "center_value"; }

    std::vector<std::string> get_required_inputs() const override
    { return {"sst"}; }

    int prepare(const tcd_field_collection &fields,
        const tcd_unit_system &units, tcd_warning_log &,
        p_tcd_diagnostic_record &) override
    {
        return this->get_field(fields, "sst", "K", units, this->sst);
    }

    int execute(const tcd_tc_fix &fix, const tcd_unit_system &,
        tcd_warning_log &, p_tcd_diagnostic_record &record) override
    {
        this->message_context = tcd_message_context::get();

        double val = 0.0;
        if (sample(*this->sst, fix, val))
            return tcd_error::numerical_error;

        return record->add_scalar("sst", val, "K", "sst at the TC center");
    }

protected:
    center_value() = default;

public:
    // the message context seen by the last call to execute
    std::string message_context;

private:
    const_p_tcd_geo_field sst;
};

int main(int, char **)
{
    p_tcd_geo_field lat;
    p_tcd_geo_field lon;
    tcd_test_util::make_coordinates(10.0, 30.0, 21, 130.0, 150.0, 21, lat, lon);

    double profile[] = {28.0, 27.0, 26.5, 25.0, 20.0};

    p_tcd_geo_field sst = tcd_test_util::make_field("sst", "K", 0, lat, lon,
        [](unsigned long, double y, double) -> double { return 300.0 + 0.1*y; });

    p_tcd_geo_field pottemp = tcd_test_util::make_field("pottemp", "degC", 5,
        lat, lon, [&profile](unsigned long k, double, double) -> double
        { return profile[k]; });

    p_tcd_geo_field depth = tcd_geo_field::New("depth", {5});
    depth->set_units("m");
    depth->get_values() = {0.0, 25.0, 50.0, 75.0, 100.0};

    tcd_field_collection fields;
    fields.set("sst", sst);
    fields.set("pottemp", pottemp);
    fields.set("depth", depth);

    tcd_tc_fix_list fixes = {tcd_tc_fix("01W", 20.0, 140.0),
        tcd_tc_fix("02W", 60.0, 140.0)};

    tcd_unit_system units;
    tcd_schema_registry schemas;

    // every input is available. the second TC is outside the grid
    {
    tcd_diagnostics_orchestrator orch(units, schemas);
    p_center_value cv = center_value::New();
    orch.add_diagnostic(cv);
    orch.add_diagnostic(tcd_ohc_diagnostic::New());

    if (orch.configure("ocean_heat_content", tcd_config_block()))
    {
        TCD_ERROR("Failed to configure with the defaults")
        return -1;
    }

    int ierr = orch.execute(fields, fixes);
    if (ierr != tcd_error::numerical_error)
    {
        TCD_ERROR("Expected the failure of TC 02W to be reported, got "
            << tcd_error::get_name(ierr))
        return -1;
    }

    double val = 0.0;
    const_p_tcd_diagnostic_record rec = orch.get_record("01W", "center_value");
    if (!rec || rec->get_scalar("sst", val) ||
        !tcd_test_util::close(val, 302.0, 1e-12))
    {
        TCD_ERROR("Wrong center value for TC 01W")
        return -1;
    }

    rec = orch.get_record("01W", "ocean_heat_content");
    if (!rec || rec->get_scalar("isotherm_depth", val) ||
        !tcd_test_util::close(val, 50.0 + 25.0/3.0, 1e-9))
    {
        TCD_ERROR("Wrong isotherm depth for TC 01W")
        return -1;
    }

    if (!orch.get_grid_record("ocean_heat_content") ||
        !orch.get_grid_record("ocean_heat_content")->has_field("tchp"))
    {
        TCD_ERROR("The heat content grid was not published")
        return -1;
    }

    if ((orch.get_tc_error("02W", "center_value") != tcd_error::numerical_error)
        || orch.get_record("02W", "center_value") ||
        orch.get_application_error("center_value"))
    {
        TCD_ERROR("The failure of TC 02W was not isolated")
        return -1;
    }

    // messages name the application and TC while it runs
    if ((cv->message_context != " (center_value 02W)") ||
        !tcd_message_context::get().empty())
    {
        TCD_ERROR("Wrong message context \"" << cv->message_context << "\"")
        return -1;
    }
    }

    // the ocean inputs are missing or failed to resolve
    {
    tcd_field_collection partial;
    partial.set("sst", sst);
    partial.set("depth", depth);

    tcd_diagnostics_orchestrator orch(units, schemas);
    orch.add_diagnostic(tcd_ohc_diagnostic::New());
    orch.add_diagnostic(center_value::New());

    if ((orch.execute(partial, fixes) != tcd_error::missing_variable_error) ||
        (orch.get_application_error("ocean_heat_content") !=
            tcd_error::missing_variable_error) ||
        !orch.get_record("01W", "center_value"))
    {
        TCD_ERROR("A missing input stopped the other application")
        return -1;
    }

    partial.set_error("pottemp", tcd_error::unit_error);
    if ((orch.execute(partial, fixes) != tcd_error::unit_error) ||
        (orch.get_application_error("ocean_heat_content") != tcd_error::unit_error))
    {
        TCD_ERROR("The input's own error was not reported")
        return -1;
    }
    }

    // an application that fails to configure is skipped
    {
    tcd_diagnostics_orchestrator orch(units, schemas);
    orch.add_diagnostic(tcd_ohc_diagnostic::New());
    orch.add_diagnostic(center_value::New());

    tcd_config_block block;
    block.set("isotherm", "warm");
    if (orch.configure("ocean_heat_content", block) != tcd_error::config_error)
    {
        TCD_ERROR("A non-numeric isotherm was accepted")
        return -1;
    }

    if (orch.configure("wind_radii", block) != tcd_error::config_error)
    {
        TCD_ERROR("An unknown application was configured")
        return -1;
    }

    if ((orch.execute(fields, {fixes[0]}) != tcd_error::config_error) ||
        (orch.get_application_error("ocean_heat_content") !=
        tcd_error::config_error) || orch.get_record("01W", "ocean_heat_content") ||
        !orch.get_record("01W", "center_value"))
    {
        TCD_ERROR("The unconfigured application was not skipped")
        return -1;
    }
    }

    return 0;
}
