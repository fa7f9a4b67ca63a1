#ifndef tcd_array_attributes_h
#define tcd_array_attributes_h

#include "tcd_config.h"

#include <ostream>
#include <string>
#include <cmath>

/** @brief
 * A convenience container for conventional array attributes necessary and/or
 * useful when producing NetCDF CF format files using the tcd_cf_writer.
 *
 * @details
 *
 * | Member          | Description                                                |
 * | ------          | -----------                                                |
 * | units           | string describing the units that the variable is in.       |
 * | long name       | a more descriptive name                                    |
 * | description     | text describing the data                                   |
 * | have_fill_value | set non-zero to indicate that a fill_value has been        |
 * |                 | provided.                                                  |
 * | fill_value      | value used to identify missing or invalid data             |
 */
struct TCD_EXPORT tcd_array_attributes
{
    tcd_array_attributes() : units(), long_name(), description(),
        have_fill_value(0), fill_value(default_fill_value())
    {}

    tcd_array_attributes(const std::string &un, const std::string &ln,
        const std::string &descr, int have_fv = 0,
        double fv = default_fill_value()) :
        units(un), long_name(ln), description(descr),
        have_fill_value(have_fv), fill_value(fv)
    {}

    tcd_array_attributes(const tcd_array_attributes &) = default;
    tcd_array_attributes &operator=(const tcd_array_attributes &) = default;

    /// Send to the stream in human readable form.
    void to_stream(std::ostream &os) const;

    /// the fill value used when none is provided
    static constexpr double default_fill_value() { return 1.0e20; }

    /** Return true if v should be treated as missing. In addition to the
     * fill value, NaN and values at or beyond the default fill magnitude are
     * missing.
     */
    bool is_missing(double v) const
    {
        return std::isnan(v) || (have_fill_value && (v == fill_value))
            || (std::fabs(v) >= 0.99*default_fill_value());
    }

    std::string units;
    std::string long_name;
    std::string description;
    int have_fill_value;
    double fill_value;
};

#endif
