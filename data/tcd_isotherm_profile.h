#ifndef tcd_isotherm_profile_h
#define tcd_isotherm_profile_h

/// @file

#include "tcd_config.h"
#include "tcd_geo_field.h"

/** @brief
 * The depth of an isotherm and the heat content above it, per grid column.
 *
 * @details
 * depth holds the isotherm depth (m) or the fill value where the isotherm
 * was not found. tchp holds the heat content (J m-2) of the water warmer
 * than the isotherm. number_not_found counts the columns with valid data in
 * which the isotherm was not found.
 */
struct TCD_EXPORT tcd_isotherm_profile
{
    tcd_isotherm_profile() : isotherm(0.0), number_not_found(0)
    {}

    double isotherm;
    p_tcd_geo_field depth;
    p_tcd_geo_field tchp;
    unsigned long number_not_found;
};

#endif
