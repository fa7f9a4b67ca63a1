#include "tcd_array_source.h"
#include "tcd_common.h"
#include "tcd_error.h"

#if defined(TCD_HAS_NETCDF)
#include "tcd_netcdf_array_source.h"
#endif

// --------------------------------------------------------------------------
p_tcd_memory_array_source tcd_memory_array_source::New(const std::string &name)
{
    p_tcd_memory_array_source src(new tcd_memory_array_source);
    src->name = name;
    return src;
}

// --------------------------------------------------------------------------
void tcd_memory_array_source::add_variable(const const_p_tcd_geo_field &field)
{
    this->variables[field->get_name()] = field;
}

// --------------------------------------------------------------------------
void tcd_memory_array_source::add_variable(const std::string &var_name,
    const const_p_tcd_geo_field &field)
{
    this->variables[var_name] = field;
}

// --------------------------------------------------------------------------
int tcd_memory_array_source::read(const std::string &var_name,
    p_tcd_geo_field &field)
{
    auto it = this->variables.find(var_name);
    if (it == this->variables.end())
    {
        TCD_ERROR("No variable named \"" << var_name << "\" in "
            << this->get_description())
        return tcd_error::missing_variable_error;
    }

    field = it->second->new_copy();
    field->set_name(var_name);

    return 0;
}

// --------------------------------------------------------------------------
bool tcd_memory_array_source::has_variable(const std::string &var_name)
{
    return this->variables.count(var_name);
}

// --------------------------------------------------------------------------
int tcd_memory_array_source::get_variable_names(
    std::vector<std::string> &names)
{
    names.clear();
    for (const auto &var : this->variables)
        names.push_back(var.first);
    return 0;
}

// --------------------------------------------------------------------------
std::string tcd_memory_array_source::get_description() const
{
    return "memory source \"" + this->name + "\"";
}



// --------------------------------------------------------------------------
void tcd_source_provider::add_source(const std::string &path,
    const p_tcd_array_source &source)
{
    this->sources[path] = source;
}

// --------------------------------------------------------------------------
int tcd_source_provider::get_source(const std::string &path,
    p_tcd_array_source &source)
{
    auto it = this->sources.find(path);
    if (it != this->sources.end())
    {
        source = it->second;
        return 0;
    }

#if defined(TCD_HAS_NETCDF)
    source = tcd_netcdf_array_source::New(path);
    this->sources[path] = source;
    return 0;
#else
    TCD_ERROR("Can't read \"" << path << "\". TCD was built without NetCDF")
    return tcd_error::io_error;
#endif
}
