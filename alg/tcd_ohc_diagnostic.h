#ifndef tcd_ohc_diagnostic_h
#define tcd_ohc_diagnostic_h

/// @file

#include "tcd_config.h"
#include "tcd_diagnostic.h"
#include "tcd_isotherm_profile.h"

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_ohc_diagnostic)

/** @brief
 * The ocean_heat_content application.
 *
 * @details
 * prepare locates the isotherm in the pottemp field and integrates the
 * heat content above it using the depth field, producing the
 * isotherm_depth and tchp grid fields. execute reports the heat content at
 * the TC center in kJ cm-2 along with the isotherm depth.
 *
 * @see tcd_isotherm_locator
 */
class TCD_EXPORT tcd_ohc_diagnostic : public tcd_diagnostic
{
public:
    TCD_STATIC_NEW(tcd_ohc_diagnostic)
    TCD_DIAGNOSTIC_DELETE_COPY_ASSIGN(tcd_ohc_diagnostic)

    ~tcd_ohc_diagnostic() override = default;

    const char *get_class_name() const override
    { return "tcd_ohc_diagnostic"; }

    const char *get_application_name() const override
    { return "ocean_heat_content"; }

    TCD_GET_PROPERTIES_DESCRIPTION()
    TCD_SET_PROPERTIES()

    /** @name parameters
     * @see tcd_isotherm_locator
     */
    ///@{
    TCD_PROPERTY(double, isotherm)
    TCD_PROPERTY(double, deltaz)
    TCD_PROPERTY(double, fill_value)
    TCD_PROPERTY(std::string, interp_type)
    TCD_PROPERTY(double, rho)
    TCD_PROPERTY(double, cp)
    ///@}

    int configure(const tcd_config_record &rec) override;

    std::vector<std::string> get_required_inputs() const override;

    int prepare(const tcd_field_collection &fields,
        const tcd_unit_system &units, tcd_warning_log &log,
        p_tcd_diagnostic_record &record) override;

    int execute(const tcd_tc_fix &fix, const tcd_unit_system &units,
        tcd_warning_log &log, p_tcd_diagnostic_record &record) override;

protected:
    tcd_ohc_diagnostic();

private:
    double isotherm;
    double deltaz;
    double fill_value;
    std::string interp_type;
    double rho;
    double cp;

    tcd_isotherm_profile profile;
};

#endif
