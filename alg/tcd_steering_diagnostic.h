#ifndef tcd_steering_diagnostic_h
#define tcd_steering_diagnostic_h

/// @file

#include "tcd_config.h"
#include "tcd_diagnostic.h"
#include "tcd_steering_flow.h"

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_steering_diagnostic)

/** @brief
 * The steering_flow application.
 *
 * @details
 * prepare interpolates the uwind and vwind fields to the isobaric levels
 * using the pressure field, partitions them and computes the layer means.
 * The grid record holds the winds on the isobaric levels, their
 * vorticity, divergence, streamfunction, velocity potential, rotational,
 * divergent and harmonic parts, and the layer means.
 *
 * execute filters each layer mean about the TC and reports, per layer
 * named by its bounds in hPa, e.g. 850_200, the filtered winds and the
 * scalars u_steer, v_steer, speed_steer, heading_steer, ncoeffs_used and
 * the area means of the parts, each suffixed with the layer name.
 *
 * @see tcd_steering_flow
 */
class TCD_EXPORT tcd_steering_diagnostic : public tcd_diagnostic
{
public:
    TCD_STATIC_NEW(tcd_steering_diagnostic)
    TCD_DIAGNOSTIC_DELETE_COPY_ASSIGN(tcd_steering_diagnostic)

    ~tcd_steering_diagnostic() override = default;

    const char *get_class_name() const override
    { return "tcd_steering_diagnostic"; }

    const char *get_application_name() const override
    { return "steering_flow"; }

    TCD_GET_PROPERTIES_DESCRIPTION()
    TCD_SET_PROPERTIES()

    /** @name parameters
     * @see tcd_steering_flow
     */
    ///@{
    TCD_VECTOR_PROPERTY(double, isolevel)
    TCD_VECTOR_PROPERTY(double, layer)
    TCD_PROPERTY(double, distance)
    TCD_PROPERTY(double, ddist)
    TCD_PROPERTY(unsigned int, ncoeffs)
    TCD_PROPERTY(double, tolerance)
    TCD_PROPERTY(unsigned long, max_iterations)
    ///@}

    int configure(const tcd_config_record &rec) override;

    std::vector<std::string> get_required_inputs() const override;

    int prepare(const tcd_field_collection &fields,
        const tcd_unit_system &units, tcd_warning_log &log,
        p_tcd_diagnostic_record &record) override;

    int execute(const tcd_tc_fix &fix, const tcd_unit_system &units,
        tcd_warning_log &log, p_tcd_diagnostic_record &record) override;

    /// the layer means computed by prepare
    const tcd_steering_layer_list &get_layer_means() const
    { return this->layer_means; }

protected:
    tcd_steering_diagnostic();

    /// a kernel initialized from the parameters
    void get_kernel(tcd_steering_flow &steer) const;

private:
    std::vector<double> isolevels;
    std::vector<double> layers;
    double distance;
    double ddist;
    unsigned int ncoeffs;
    double tolerance;
    unsigned long max_iterations;

    tcd_steering_layer_list layer_means;
};

#endif
