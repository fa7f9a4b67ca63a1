#include "tcd_field_collection.h"

// --------------------------------------------------------------------------
void tcd_field_collection::set(const std::string &name,
    const const_p_tcd_geo_field &field)
{
    this->errors.erase(name);
    this->fields[name] = field;
}

// --------------------------------------------------------------------------
void tcd_field_collection::set_error(const std::string &name, int code)
{
    this->fields.erase(name);
    this->errors[name] = code;
}

// --------------------------------------------------------------------------
const_p_tcd_geo_field tcd_field_collection::get(const std::string &name) const
{
    auto it = this->fields.find(name);
    return it == this->fields.end() ? nullptr : it->second;
}

// --------------------------------------------------------------------------
int tcd_field_collection::get_error(const std::string &name) const
{
    auto it = this->errors.find(name);
    return it == this->errors.end() ? 0 : it->second;
}

// --------------------------------------------------------------------------
std::vector<std::string> tcd_field_collection::get_names() const
{
    std::vector<std::string> names;
    for (const auto &f : this->fields)
        names.push_back(f.first);
    return names;
}

// --------------------------------------------------------------------------
std::vector<std::string> tcd_field_collection::get_error_names() const
{
    std::vector<std::string> names;
    for (const auto &e : this->errors)
        names.push_back(e.first);
    return names;
}

// --------------------------------------------------------------------------
void tcd_field_collection::clear()
{
    this->fields.clear();
    this->errors.clear();
}
