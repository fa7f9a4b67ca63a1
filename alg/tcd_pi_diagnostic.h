#ifndef tcd_pi_diagnostic_h
#define tcd_pi_diagnostic_h

/// @file

#include "tcd_config.h"
#include "tcd_diagnostic.h"
#include "tcd_potential_intensity.h"

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_pi_diagnostic)

/** @brief
 * The potential_intensity application.
 *
 * @details
 * prepare computes the maximum potential intensity of every column from the
 * pressure, temperature, mixing_ratio, sea_level_pressure and
 * surface_height fields, and sea_surface_temperature when it was resolved.
 * The grid record holds the vmax, pmin, tout, pout and pi_status fields.
 * execute interpolates them to the TC center.
 *
 * @see tcd_potential_intensity
 */
class TCD_EXPORT tcd_pi_diagnostic : public tcd_diagnostic
{
public:
    TCD_STATIC_NEW(tcd_pi_diagnostic)
    TCD_DIAGNOSTIC_DELETE_COPY_ASSIGN(tcd_pi_diagnostic)

    ~tcd_pi_diagnostic() override = default;

    const char *get_class_name() const override
    { return "tcd_pi_diagnostic"; }

    const char *get_application_name() const override
    { return "potential_intensity"; }

    TCD_GET_PROPERTIES_DESCRIPTION()
    TCD_SET_PROPERTIES()

    /** @name parameters
     * @see tcd_potential_intensity
     */
    ///@{
    TCD_PROPERTY(double, zmax)
    TCD_PROPERTY(double, mslp_max)
    TCD_PROPERTY(double, ckcd)
    TCD_PROPERTY(double, ascent_flag)
    TCD_PROPERTY(int, diss_flag)
    TCD_PROPERTY(double, v_reduc)
    TCD_PROPERTY(double, ptop)
    ///@}

    int configure(const tcd_config_record &rec) override;

    std::vector<std::string> get_required_inputs() const override;
    std::vector<std::string> get_optional_inputs() const override;

    int prepare(const tcd_field_collection &fields,
        const tcd_unit_system &units, tcd_warning_log &log,
        p_tcd_diagnostic_record &record) override;

    int execute(const tcd_tc_fix &fix, const tcd_unit_system &units,
        tcd_warning_log &log, p_tcd_diagnostic_record &record) override;

protected:
    tcd_pi_diagnostic();

    /// a kernel initialized from the parameters
    void get_kernel(tcd_potential_intensity &pi) const;

private:
    double zmax;
    double mslp_max;
    double ckcd;
    double ascent_flag;
    int diss_flag;
    double v_reduc;
    double ptop;

    tcd_pi_fields products;
};

#endif
