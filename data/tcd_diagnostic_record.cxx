#include "tcd_diagnostic_record.h"
#include "tcd_unit_system.h"
#include "tcd_common.h"
#include "tcd_error.h"

// --------------------------------------------------------------------------
p_tcd_diagnostic_record tcd_diagnostic_record::New(
    const std::string &application, const std::string &tc_id)
{
    p_tcd_diagnostic_record rec(new tcd_diagnostic_record);
    rec->application = application;
    rec->tc_id = tc_id;
    return rec;
}

// --------------------------------------------------------------------------
int tcd_diagnostic_record::check_name(const std::string &name) const
{
    if (name.empty())
    {
        TCD_ERROR("Result of " << this->application << " has no name")
        return -1;
    }

    if (this->fields.count(name) || this->polar_fields.count(name) ||
        this->scalars.count(name) || this->tables.count(name))
    {
        TCD_ERROR("Duplicate result \"" << name << "\" in "
            << this->application << " " << this->tc_id)
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_diagnostic_record::add_field(const const_p_tcd_geo_field &field)
{
    if (!field || this->check_name(field->get_name()))
        return -1;

    this->fields[field->get_name()] = field;
    this->field_names.push_back(field->get_name());
    return 0;
}

// --------------------------------------------------------------------------
int tcd_diagnostic_record::add_polar_field(const const_p_tcd_polar_field &field)
{
    if (!field || this->check_name(field->get_name()))
        return -1;

    this->polar_fields[field->get_name()] = field;
    this->polar_field_names.push_back(field->get_name());
    return 0;
}

// --------------------------------------------------------------------------
int tcd_diagnostic_record::add_scalar(const std::string &name, double value,
    const std::string &units, const std::string &description)
{
    if (this->check_name(name))
        return -1;

    tcd_scalar_summary s;
    s.name = name;
    s.value = value;
    s.attributes = tcd_array_attributes(units, name, description, 1);

    this->scalars[name] = s;
    this->scalar_names.push_back(name);
    return 0;
}

// --------------------------------------------------------------------------
int tcd_diagnostic_record::add_table(const std::string &name,
    const tcd_table &table)
{
    if (this->check_name(name))
        return -1;

    this->tables[name] = table;
    this->table_names.push_back(name);
    return 0;
}

// --------------------------------------------------------------------------
const_p_tcd_geo_field tcd_diagnostic_record::get_field(
    const std::string &name) const
{
    auto it = this->fields.find(name);
    return it == this->fields.end() ? nullptr : it->second;
}

// --------------------------------------------------------------------------
const_p_tcd_polar_field tcd_diagnostic_record::get_polar_field(
    const std::string &name) const
{
    auto it = this->polar_fields.find(name);
    return it == this->polar_fields.end() ? nullptr : it->second;
}

// --------------------------------------------------------------------------
int tcd_diagnostic_record::get_scalar(const std::string &name,
    double &value) const
{
    auto it = this->scalars.find(name);
    if (it == this->scalars.end())
        return -1;

    value = it->second.value;
    return 0;
}

// --------------------------------------------------------------------------
const tcd_scalar_summary *tcd_diagnostic_record::get_scalar_summary(
    const std::string &name) const
{
    auto it = this->scalars.find(name);
    return it == this->scalars.end() ? nullptr : &it->second;
}

// --------------------------------------------------------------------------
const tcd_table *tcd_diagnostic_record::get_table(const std::string &name) const
{
    auto it = this->tables.find(name);
    return it == this->tables.end() ? nullptr : &it->second;
}

// --------------------------------------------------------------------------
int tcd_diagnostic_record::validate(const tcd_unit_system &units) const
{
    int ierr = 0;

    for (const auto &[name, field] : this->fields)
    {
        if (!units.is_known(field->get_units()))
        {
            TCD_ERROR(<< this->application << " field \"" << name
                << "\" has unrecognized units \"" << field->get_units() << "\"")
            ierr = tcd_error::unit_error;
        }
    }

    for (const auto &[name, field] : this->polar_fields)
    {
        if (!units.is_known(field->get_units()))
        {
            TCD_ERROR(<< this->application << " polar field \"" << name
                << "\" has unrecognized units \"" << field->get_units() << "\"")
            ierr = tcd_error::unit_error;
        }
    }

    for (const auto &[name, scalar] : this->scalars)
    {
        if (!units.is_known(scalar.attributes.units))
        {
            TCD_ERROR(<< this->application << " scalar \"" << name
                << "\" has unrecognized units \"" << scalar.attributes.units << "\"")
            ierr = tcd_error::unit_error;
        }
    }

    return ierr;
}

// --------------------------------------------------------------------------
void tcd_diagnostic_record::to_stream(std::ostream &os) const
{
    os << this->application;
    if (!this->tc_id.empty())
        os << " " << this->tc_id;
    os << std::endl;

    if (!this->field_names.empty())
        os << "  fields: " << this->field_names << std::endl;

    if (!this->polar_field_names.empty())
        os << "  polar fields: " << this->polar_field_names << std::endl;

    for (const std::string &name : this->scalar_names)
    {
        const tcd_scalar_summary &s = this->scalars.at(name);
        os << "  " << name << " = " << s.value << " " << s.attributes.units
            << std::endl;
    }

    for (const std::string &name : this->table_names)
        os << this->tables.at(name) << std::endl;
}
