#ifndef tcd_msi_diagnostic_h
#define tcd_msi_diagnostic_h

/// @file

#include "tcd_config.h"
#include "tcd_diagnostic.h"

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_msi_diagnostic)

/** @brief
 * The multiscale_intensity application (after Vukicevic et al. 2014).
 *
 * @details
 * prepare computes the wind speed from the uwind and vwind fields. When the
 * winds are 3-D the speed is interpolated in height to wind_height, which
 * requires the height field. Columns whose lowest level is above
 * wind_height take the lowest level's speed. The grid record holds the
 * resulting wspd field.
 *
 * execute projects the wind speed onto a polar grid centered on the TC with
 * drho meter rings out to max_radius and dphi degree spokes, and decomposes
 * it into azimuthal wavenumbers 0 through max_wn. The TC record holds the
 * projected wind, its components, the truncated and residual fields, the
 * summary scalars and the per wavenumber maxima as a table.
 */
class TCD_EXPORT tcd_msi_diagnostic : public tcd_diagnostic
{
public:
    TCD_STATIC_NEW(tcd_msi_diagnostic)
    TCD_DIAGNOSTIC_DELETE_COPY_ASSIGN(tcd_msi_diagnostic)

    ~tcd_msi_diagnostic() override = default;

    const char *get_class_name() const override
    { return "tcd_msi_diagnostic"; }

    const char *get_application_name() const override
    { return "multiscale_intensity"; }

    TCD_GET_PROPERTIES_DESCRIPTION()
    TCD_SET_PROPERTIES()

    /// radial resolution (m)
    TCD_PROPERTY(double, drho)

    /// azimuthal resolution (degrees)
    TCD_PROPERTY(double, dphi)

    /// radial extent (m)
    TCD_PROPERTY(double, max_radius)

    /// the largest wavenumber retained
    TCD_PROPERTY(unsigned int, max_wn)

    /// height (m) at which the wind is analyzed
    TCD_PROPERTY(double, wind_height)

    int configure(const tcd_config_record &rec) override;

    std::vector<std::string> get_required_inputs() const override;
    std::vector<std::string> get_optional_inputs() const override;

    int prepare(const tcd_field_collection &fields,
        const tcd_unit_system &units, tcd_warning_log &log,
        p_tcd_diagnostic_record &record) override;

    int execute(const tcd_tc_fix &fix, const tcd_unit_system &units,
        tcd_warning_log &log, p_tcd_diagnostic_record &record) override;

    /// the wind speed prepared for projection
    const_p_tcd_geo_field get_wind_speed() const { return this->wspd; }

protected:
    tcd_msi_diagnostic();

    int validate() const;

private:
    double drho;
    double dphi;
    double max_radius;
    unsigned int max_wn;
    double wind_height;

    const_p_tcd_geo_field wspd;
};

#endif
