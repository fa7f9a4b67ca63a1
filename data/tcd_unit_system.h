#ifndef tcd_unit_system_h
#define tcd_unit_system_h

/// @file

#include "tcd_config.h"
#include "tcd_geo_field.h"

#include <map>
#include <string>
#include <vector>

/** @brief
 * A registry of physical units and the conversions among them.
 *
 * @details
 * Each unit belongs to a dimension (pressure, temperature, ...) and converts
 * to the SI unit of that dimension by the affine map si = value*scale +
 * offset. Unit strings are matched case-insensitively after trimming, and
 * aliases map alternate spellings ("hPa", "mb", "millibar") onto a canonical
 * name. A unit system is created per orchestrator run and passed by reference
 * to the stages that need it. Construction registers the built in units used
 * by atmosphere and ocean analyses.
 *
 * All methods return 0 on success or tcd_error::unit_error when a unit is
 * not recognized or the units are of different dimensions.
 */
class TCD_EXPORT tcd_unit_system
{
public:
    tcd_unit_system();
    ~tcd_unit_system() = default;

    /// register a canonical unit
    int register_unit(const std::string &name, const std::string &dimension,
        double scale, double offset = 0.0);

    /// register an alternate spelling for a canonical unit
    int register_alias(const std::string &alias, const std::string &name);

    /// return true if the unit string is recognized
    bool is_known(const std::string &units) const;

    /// get the canonical name of the unit
    int get_canonical_name(const std::string &units, std::string &name) const;

    /// get the dimension of the unit
    int get_dimension(const std::string &units, std::string &dimension) const;

    /// return true if both units are known and have the same dimension
    bool compatible(const std::string &from, const std::string &to) const;

    /// convert a single value
    int convert(double &value, const std::string &from,
        const std::string &to) const;

    /** convert an array of values in place. values for which is_missing
     * returns true are left unchanged.
     */
    template <typename missing_t>
    int convert(double *values, unsigned long n, const std::string &from,
        const std::string &to, const missing_t &is_missing) const;

    /** convert a field in place to the given units, and update its unit
     * string. missing values are left unchanged.
     */
    int convert(tcd_geo_field &field, const std::string &to) const;

private:
    struct unit_t
    {
        std::string dimension;
        double scale;
        double offset;
    };

    const unit_t *find(const std::string &units) const;

    int get_transform(const std::string &from, const std::string &to,
        double &mult, double &add) const;

private:
    std::map<std::string, unit_t> units;
    std::map<std::string, std::string> aliases;
};

// --------------------------------------------------------------------------
template <typename missing_t>
int tcd_unit_system::convert(double *values, unsigned long n,
    const std::string &from, const std::string &to,
    const missing_t &is_missing) const
{
    double mult = 1.0;
    double add = 0.0;
    int ierr = 0;
    if ((ierr = this->get_transform(from, to, mult, add)))
        return ierr;

    if ((mult == 1.0) && (add == 0.0))
        return 0;

    for (unsigned long i = 0; i < n; ++i)
    {
        if (!is_missing(values[i]))
            values[i] = values[i]*mult + add;
    }

    return 0;
}

#endif
