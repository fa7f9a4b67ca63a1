#ifndef tcd_diagnostic_record_h
#define tcd_diagnostic_record_h

/// @file

#include "tcd_config.h"
#include "tcd_shared_object.h"
#include "tcd_array_attributes.h"
#include "tcd_geo_field.h"
#include "tcd_polar_field.h"
#include "tcd_table.h"

#include <map>
#include <string>
#include <vector>
#include <ostream>

class tcd_unit_system;

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_diagnostic_record)

/// A named scalar result with units and a description
struct TCD_EXPORT tcd_scalar_summary
{
    std::string name;
    double value;
    tcd_array_attributes attributes;
};

/** @brief
 * The results of one application for one TC, or for the whole grid when the
 * TC identifier is empty.
 *
 * @details
 * A record holds gridded fields, polar fields, scalar summaries and text
 * tables, each keyed by a well known name. Names must be non-empty and unique
 * across the record; adding a duplicate is an error. Once populated a record
 * is checked with validate and then published read-only.
 */
class TCD_EXPORT tcd_diagnostic_record
{
public:
    static p_tcd_diagnostic_record New(const std::string &application,
        const std::string &tc_id);

    const std::string &get_application() const { return this->application; }
    const std::string &get_tc_id() const { return this->tc_id; }

    /** add a gridded field. the field's name, units, long_name and
     * description are used. returns 0 if successful.
     */
    int add_field(const const_p_tcd_geo_field &field);

    /// add a polar field. returns 0 if successful.
    int add_polar_field(const const_p_tcd_polar_field &field);

    /// add a scalar summary. returns 0 if successful.
    int add_scalar(const std::string &name, double value,
        const std::string &units, const std::string &description);

    /// add a text table. returns 0 if successful.
    int add_table(const std::string &name, const tcd_table &table);

    bool has_field(const std::string &name) const
    { return this->fields.count(name); }

    bool has_polar_field(const std::string &name) const
    { return this->polar_fields.count(name); }

    bool has_scalar(const std::string &name) const
    { return this->scalars.count(name); }

    /// get a field by name. returns nullptr if there is no such field.
    const_p_tcd_geo_field get_field(const std::string &name) const;

    /// get a polar field by name. returns nullptr if there is no such field.
    const_p_tcd_polar_field get_polar_field(const std::string &name) const;

    /// get a scalar value. returns 0 if the scalar exists.
    int get_scalar(const std::string &name, double &value) const;

    /// get a scalar summary. returns nullptr if there is no such scalar.
    const tcd_scalar_summary *get_scalar_summary(const std::string &name) const;

    /// get a table. returns nullptr if there is no such table.
    const tcd_table *get_table(const std::string &name) const;

    /// names in the order they were added
    const std::vector<std::string> &get_field_names() const { return this->field_names; }
    const std::vector<std::string> &get_polar_field_names() const { return this->polar_field_names; }
    const std::vector<std::string> &get_scalar_names() const { return this->scalar_names; }
    const std::vector<std::string> &get_table_names() const { return this->table_names; }

    /** check that every entry has units that the unit system recognizes.
     * returns 0 if the record is valid, tcd_error::unit_error otherwise.
     */
    int validate(const tcd_unit_system &units) const;

    /// send the scalar summaries and tables in human readable form
    void to_stream(std::ostream &os) const;

protected:
    tcd_diagnostic_record() = default;

    int check_name(const std::string &name) const;

private:
    std::string application;
    std::string tc_id;
    std::map<std::string, const_p_tcd_geo_field> fields;
    std::map<std::string, const_p_tcd_polar_field> polar_fields;
    std::map<std::string, tcd_scalar_summary> scalars;
    std::map<std::string, tcd_table> tables;
    std::vector<std::string> field_names;
    std::vector<std::string> polar_field_names;
    std::vector<std::string> scalar_names;
    std::vector<std::string> table_names;
};

#endif
