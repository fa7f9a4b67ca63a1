#ifndef tcd_field_collection_h
#define tcd_field_collection_h

/// @file

#include "tcd_config.h"
#include "tcd_geo_field.h"

#include <map>
#include <string>
#include <vector>

/** @brief
 * The fields resolved in one run, keyed by variable name, along with the
 * error codes of the variables that could not be resolved.
 *
 * @details
 * Fields are held read-only. A name is either resolved or failed, never
 * both.
 */
class TCD_EXPORT tcd_field_collection
{
public:
    /// add a resolved field. replaces an earlier field or failure.
    void set(const std::string &name, const const_p_tcd_geo_field &field);

    /// record the failure of a variable. replaces an earlier field.
    void set_error(const std::string &name, int code);

    /// return true if the named field was resolved
    bool has(const std::string &name) const
    { return this->fields.count(name); }

    /// return true if the named variable failed
    bool has_error(const std::string &name) const
    { return this->errors.count(name); }

    /// get the named field, nullptr if it was not resolved
    const_p_tcd_geo_field get(const std::string &name) const;

    /// get the error code of a failed variable, 0 if it did not fail
    int get_error(const std::string &name) const;

    /// names of the resolved fields
    std::vector<std::string> get_names() const;

    /// names of the failed variables
    std::vector<std::string> get_error_names() const;

    unsigned long size() const { return this->fields.size(); }
    bool empty() const { return this->fields.empty(); }

    void clear();

private:
    std::map<std::string, const_p_tcd_geo_field> fields;
    std::map<std::string, int> errors;
};

#endif
