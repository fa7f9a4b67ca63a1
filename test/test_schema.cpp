#include "tcd_schema.h"
#include "tcd_msi_diagnostic.h"
#include "tcd_config_block.h"
#include "tcd_table.h"
#include "tcd_error.h"
#include "tcd_common.h"

#include <iostream>
#include <string>
#include <vector>

int main(int, char **)
{
    tcd_schema_registry schemas;

    // every declared key is present, given or defaulted
    tcd_config_block block;
    block.set("drho", "50000");
    block.set("max_wn", "2");
    block.set("app_module", "ignored");

    tcd_warning_log log;
    tcd_config_record rec;
    tcd_table table;
    if (schemas.validate("multiscale_intensity", block, rec, log, &table))
    {
        TCD_ERROR("A valid multiscale_intensity block was rejected")
        return -1;
    }

    std::cerr << table << std::endl;

    const tcd_schema *msi = schemas.get("multiscale_intensity");
    for (const std::string &key : msi->get_keys())
    {
        if (!rec.has(key))
        {
            TCD_ERROR("Validated record is missing \"" << key << "\"")
            return -1;
        }
    }

    double drho = 0.0;
    long max_wn = 0;
    double dphi = 0.0;
    if (rec.get("drho", drho) || rec.get("max_wn", max_wn) ||
        rec.get("dphi", dphi))
    {
        TCD_ERROR("Failed to get the validated values")
        return -1;
    }

    if ((drho != 50000.0) || (max_wn != 2) || (dphi != 45.0))
    {
        TCD_ERROR("Wrong values drho=" << drho << " max_wn=" << max_wn
            << " dphi=" << dphi)
        return -1;
    }

    if ((rec.get_origin("drho") != tcd_config_record::from_input) ||
        (rec.get_origin("dphi") != tcd_config_record::from_default))
    {
        TCD_ERROR("Wrong value origins")
        return -1;
    }

    // the record holds exactly the declared keys, extras are only reported
    if ((rec.get_keys() != msi->get_keys()) || rec.has("app_module") ||
        (rec.get_origin("app_module") != -1))
    {
        TCD_ERROR("The record keys " << rec.get_keys()
            << " are not the declared keys " << msi->get_keys())
        return -1;
    }

    if (log.count(tcd_warning_log::unrecognized_key_warning) != 1)
    {
        TCD_ERROR("Expected one unrecognized key warning but found "
            << log.count(tcd_warning_log::unrecognized_key_warning))
        return -1;
    }

    bool listed = false;
    for (unsigned long i = 0; i < table.get_number_of_rows(); ++i)
        listed |= (table.get(i, 0) == "app_module") &&
            (table.get(i, 3) == "unrecognized");

    if (!listed)
    {
        TCD_ERROR("app_module is not listed as unrecognized in the table")
        return -1;
    }

    // the validated record configures the application
    p_tcd_msi_diagnostic msi_app = tcd_msi_diagnostic::New();
    if (msi_app->configure(rec) || (msi_app->get_dphi() != 45.0))
    {
        TCD_ERROR("Configuring multiscale_intensity from the record failed")
        return -1;
    }

    // a dphi that does not divide 360 degrees is rejected
    tcd_config_block uneven;
    uneven.set("dphi", "50");
    if (schemas.validate("multiscale_intensity", uneven, rec, log) ||
        (msi_app->configure(rec) != tcd_error::config_error))
    {
        TCD_ERROR("A dphi of 50 degrees was accepted")
        return -1;
    }

    // a wrongly typed value is rejected
    tcd_config_block bad_type;
    bad_type.set("max_wn", "three");
    if (schemas.validate("multiscale_intensity", bad_type, rec, log)
        != tcd_error::config_error)
    {
        TCD_ERROR("A non-integer max_wn was accepted")
        return -1;
    }

    // a missing required key is rejected
    tcd_config_block no_inputs;
    no_inputs.set("tcinfo", "tcinfo.yaml");
    if (schemas.validate("experiment", no_inputs, rec, log)
        != tcd_error::config_error)
    {
        TCD_ERROR("An experiment without inputs was accepted")
        return -1;
    }

    // lists
    tcd_config_block steer;
    steer.set("isolevels", std::vector<std::string>({"85000", "50000", "20000"}));
    if (schemas.validate("steering_flow", steer, rec, log))
    {
        TCD_ERROR("A valid steering_flow block was rejected")
        return -1;
    }

    std::vector<double> isolevels;
    if (rec.get("isolevels", isolevels) || (isolevels.size() != 3) ||
        (isolevels[1] != 50000.0))
    {
        TCD_ERROR("Wrong isolevels " << isolevels)
        return -1;
    }

    // unknown schema
    if (!schemas.validate("no_such_schema", steer, rec, log))
    {
        TCD_ERROR("Validation with an unknown schema succeeded")
        return -1;
    }

    return 0;
}
