#ifndef tcd_steering_layer_h
#define tcd_steering_layer_h

/// @file

#include "tcd_config.h"
#include "tcd_geo_field.h"

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

/** @brief
 * The pressure weighted mean wind of one isobaric layer and its partition
 * into rotational, divergent and harmonic parts.
 *
 * @details
 * bottom and top are in Pa with bottom > top. The mean fields are 2-D and
 * cover the whole grid.
 */
struct TCD_EXPORT tcd_steering_layer
{
    tcd_steering_layer() : bottom(0.0), top(0.0), number_of_levels(0)
    {}

    /// a name for the layer built from its bounds in hPa, e.g. 850_200
    std::string get_name() const
    {
        std::ostringstream oss;
        oss << std::lround(this->bottom/100.0) << "_"
            << std::lround(this->top/100.0);
        return oss.str();
    }

    double bottom;
    double top;
    unsigned long number_of_levels;

    const_p_tcd_geo_field u;
    const_p_tcd_geo_field v;
    const_p_tcd_geo_field urot;
    const_p_tcd_geo_field vrot;
    const_p_tcd_geo_field udiv;
    const_p_tcd_geo_field vdiv;
    const_p_tcd_geo_field uhrm;
    const_p_tcd_geo_field vhrm;
};

/** @brief
 * The steering flow of one TC in one layer.
 *
 * @details
 * | Member      | Description                                              |
 * | ------      | -----------                                              |
 * | u_filtered  | layer mean zonal wind after filtering about the TC       |
 * | v_filtered  | layer mean meridional wind after filtering about the TC  |
 * | ncoeffs     | number of singular values retained by the filter         |
 * | u_steer     | area mean of u_filtered within the steering distance     |
 * | v_steer     | area mean of v_filtered within the steering distance     |
 * | speed       | magnitude of the steering vector (m/s)                   |
 * | heading     | direction of motion, degrees clockwise from north        |
 * | u_rot ...   | area means of the partitioned layer mean winds           |
 */
struct TCD_EXPORT tcd_steering_vector
{
    tcd_steering_vector() : ncoeffs(0), u_steer(0.0), v_steer(0.0),
        speed(0.0), heading(0.0), u_rot(0.0), v_rot(0.0), u_div(0.0),
        v_div(0.0), u_hrm(0.0), v_hrm(0.0)
    {}

    p_tcd_geo_field u_filtered;
    p_tcd_geo_field v_filtered;
    unsigned int ncoeffs;
    double u_steer;
    double v_steer;
    double speed;
    double heading;
    double u_rot;
    double v_rot;
    double u_div;
    double v_div;
    double u_hrm;
    double v_hrm;
};

using tcd_steering_layer_list = std::vector<tcd_steering_layer>;

#endif
