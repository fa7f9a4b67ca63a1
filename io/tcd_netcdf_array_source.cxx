#include "tcd_netcdf_array_source.h"
#include "tcd_netcdf_util.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <algorithm>

// --------------------------------------------------------------------------
p_tcd_netcdf_array_source tcd_netcdf_array_source::New(
    const std::string &file_name)
{
    p_tcd_netcdf_array_source src(new tcd_netcdf_array_source);
    src->file_name = file_name;
    return src;
}

// --------------------------------------------------------------------------
int tcd_netcdf_array_source::read(const std::string &var_name,
    p_tcd_geo_field &field)
{
    tcd_netcdf_util::netcdf_handle fh;
    if (fh.open(this->file_name, NC_NOWRITE))
    {
        TCD_ERROR("Failed to open \"" << this->file_name << "\"")
        return tcd_error::io_error;
    }

    int ierr = 0;
    if ((ierr = tcd_netcdf_util::read_variable(fh, var_name, field)))
    {
        TCD_ERROR("Failed to read \"" << var_name << "\" from \""
            << this->file_name << "\"")
        return ierr;
    }

    return 0;
}

// --------------------------------------------------------------------------
bool tcd_netcdf_array_source::has_variable(const std::string &var_name)
{
    std::vector<std::string> names;
    if (this->get_variable_names(names))
        return false;

    return std::find(names.begin(), names.end(), var_name) != names.end();
}

// --------------------------------------------------------------------------
int tcd_netcdf_array_source::get_variable_names(std::vector<std::string> &names)
{
    tcd_netcdf_util::netcdf_handle fh;
    if (fh.open(this->file_name, NC_NOWRITE))
    {
        TCD_ERROR("Failed to open \"" << this->file_name << "\"")
        return tcd_error::io_error;
    }

    return tcd_netcdf_util::get_variable_names(fh, names);
}

// --------------------------------------------------------------------------
std::string tcd_netcdf_array_source::get_description() const
{
    return "NetCDF file \"" + this->file_name + "\"";
}
