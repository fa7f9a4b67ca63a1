#include "tcd_netcdf_util.h"
#include "tcd_common.h"
#include "tcd_error.h"
#include "tcd_array_attributes.h"

#include <cstring>

static std::mutex g_netcdf_mutex;

namespace
{
// these assume the caller holds the netcdf mutex

int get_att_text(int fh, int var_id, const std::string &att_name,
    std::string &value)
{
    nc_type att_type = 0;
    size_t att_len = 0;
    if ((nc_inq_att(fh, var_id, att_name.c_str(), &att_type, &att_len) != NC_NOERR)
        || (att_type != NC_CHAR))
        return -1;

    std::vector<char> buf(att_len + 1, '\0');
    if (nc_get_att_text(fh, var_id, att_name.c_str(), buf.data()) != NC_NOERR)
        return -1;

    value = buf.data();

    // fortran strings are padded with spaces rather than null terminated
    size_t n = value.find_last_not_of(' ');
    value.erase(n == std::string::npos ? 0 : n + 1);

    return 0;
}

int get_att_double(int fh, int var_id, const std::string &att_name,
    double &value)
{
    nc_type att_type = 0;
    size_t att_len = 0;
    if ((nc_inq_att(fh, var_id, att_name.c_str(), &att_type, &att_len) != NC_NOERR)
        || (att_type == NC_CHAR) || (att_type == NC_STRING) || (att_len < 1))
        return -1;

    std::vector<double> buf(att_len);
    if (nc_get_att_double(fh, var_id, att_name.c_str(), buf.data()) != NC_NOERR)
        return -1;

    value = buf[0];
    return 0;
}
}

namespace tcd_netcdf_util
{
// **************************************************************************
std::mutex &get_netcdf_mutex()
{
    return g_netcdf_mutex;
}

// --------------------------------------------------------------------------
int netcdf_handle::open(const std::string &file_path, int mode)
{
    if (m_handle)
    {
        TCD_ERROR("Handle in use, close before re-opening")
        return -1;
    }

    int ierr = 0;
    std::lock_guard<std::mutex> lock(tcd_netcdf_util::get_netcdf_mutex());
    if ((ierr = nc_open(file_path.c_str(), mode, &m_handle)) != NC_NOERR)
    {
        TCD_ERROR("Failed to open \"" << file_path << "\". " << nc_strerror(ierr))
        m_handle = 0;
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int netcdf_handle::create(const std::string &file_path, int mode)
{
    if (m_handle)
    {
        TCD_ERROR("Handle in use, close before re-opening")
        return -1;
    }

    int ierr = 0;
    std::lock_guard<std::mutex> lock(tcd_netcdf_util::get_netcdf_mutex());
    if ((ierr = nc_create(file_path.c_str(), mode, &m_handle)) != NC_NOERR)
    {
        TCD_ERROR("Failed to create \"" << file_path << "\". " << nc_strerror(ierr))
        m_handle = 0;
        return -1;
    }

    // add some global metadata for provenance
    if ((ierr = nc_put_att_text(m_handle, NC_GLOBAL, "TCD_VERSION_DESCR",
        strlen(TCD_VERSION_DESCR), TCD_VERSION_DESCR)))
    {
        TCD_ERROR("Failed to set version attribute." << nc_strerror(ierr))
        return -1;
    }

    return 0;
}

// --------------------------------------------------------------------------
int netcdf_handle::flush()
{
    int ierr = 0;
    std::lock_guard<std::mutex> lock(tcd_netcdf_util::get_netcdf_mutex());
    if ((ierr = nc_sync(m_handle)) != NC_NOERR)
    {
        TCD_ERROR("Failed to sync file. " << nc_strerror(ierr))
        return -1;
    }
    return 0;
}

// --------------------------------------------------------------------------
int netcdf_handle::close()
{
    if (m_handle)
    {
        std::lock_guard<std::mutex> lock(tcd_netcdf_util::get_netcdf_mutex());
        nc_close(m_handle);
        m_handle = 0;
    }
    return 0;
}

// **************************************************************************
int read_variable(netcdf_handle &fh, const std::string &var_name,
    p_tcd_geo_field &field)
{
    std::lock_guard<std::mutex> lock(tcd_netcdf_util::get_netcdf_mutex());

    int ierr = 0;
    int var_id = 0;
    if ((ierr = nc_inq_varid(fh.get(), var_name.c_str(), &var_id)) != NC_NOERR)
    {
        if (ierr == NC_ENOTVAR)
        {
            TCD_ERROR("No variable named \"" << var_name << "\"")
            return tcd_error::missing_variable_error;
        }

        TCD_ERROR("Failed to query \"" << var_name << "\". " << nc_strerror(ierr))
        return tcd_error::io_error;
    }

    int n_dims = 0;
    int dim_id[NC_MAX_VAR_DIMS] = {0};
    if ((ierr = nc_inq_var(fh.get(), var_id, nullptr, nullptr, &n_dims,
        dim_id, nullptr)) != NC_NOERR)
    {
        TCD_ERROR("Failed to query the dimensions of \"" << var_name << "\". "
            << nc_strerror(ierr))
        return tcd_error::io_error;
    }

    std::vector<unsigned long> shape(n_dims);
    std::vector<std::string> dim_names(n_dims);
    for (int i = 0; i < n_dims; ++i)
    {
        char dim_name[NC_MAX_NAME + 1] = {'\0'};
        size_t dim_len = 0;
        if ((ierr = nc_inq_dim(fh.get(), dim_id[i], dim_name, &dim_len)) != NC_NOERR)
        {
            TCD_ERROR("Failed to query dimension " << i << " of \""
                << var_name << "\". " << nc_strerror(ierr))
            return tcd_error::io_error;
        }
        shape[i] = dim_len;
        dim_names[i] = dim_name;
    }

    field = tcd_geo_field::New(var_name, shape);
    field->set_dim_names(dim_names);

    if ((ierr = nc_get_var_double(fh.get(), var_id, field->data())) != NC_NOERR)
    {
        TCD_ERROR("Failed to read \"" << var_name << "\". " << nc_strerror(ierr))
        return tcd_error::io_error;
    }

    tcd_array_attributes atts;
    get_att_text(fh.get(), var_id, "units", atts.units);
    get_att_text(fh.get(), var_id, "long_name", atts.long_name);
    get_att_text(fh.get(), var_id, "description", atts.description);

    double fill_value = 0.0;
    if (!get_att_double(fh.get(), var_id, "_FillValue", fill_value) ||
        !get_att_double(fh.get(), var_id, "missing_value", fill_value))
    {
        atts.have_fill_value = 1;
        atts.fill_value = fill_value;
    }

    // unpack packed data, leaving fill values in place
    double scale_factor = 1.0;
    double add_offset = 0.0;
    int have_scale = !get_att_double(fh.get(), var_id, "scale_factor", scale_factor);
    int have_offset = !get_att_double(fh.get(), var_id, "add_offset", add_offset);
    if (have_scale || have_offset)
    {
        unsigned long n = field->size();
        double *p_field = field->data();
        for (unsigned long i = 0; i < n; ++i)
        {
            if (!atts.is_missing(p_field[i]))
                p_field[i] = p_field[i]*scale_factor + add_offset;
        }
    }

    field->set_attributes(atts);

    return 0;
}

// **************************************************************************
int get_variable_names(netcdf_handle &fh, std::vector<std::string> &names)
{
    std::lock_guard<std::mutex> lock(tcd_netcdf_util::get_netcdf_mutex());

    int ierr = 0;
    int n_vars = 0;
    if ((ierr = nc_inq_nvars(fh.get(), &n_vars)) != NC_NOERR)
    {
        TCD_ERROR("Failed to get the number of variables. " << nc_strerror(ierr))
        return tcd_error::io_error;
    }

    names.clear();
    for (int i = 0; i < n_vars; ++i)
    {
        char var_name[NC_MAX_NAME + 1] = {'\0'};
        if ((ierr = nc_inq_varname(fh.get(), i, var_name)) != NC_NOERR)
        {
            TCD_ERROR("Failed to get the name of variable " << i << ". "
                << nc_strerror(ierr))
            return tcd_error::io_error;
        }
        names.push_back(var_name);
    }

    return 0;
}

// **************************************************************************
int write_attribute(netcdf_handle &fh, int var_id, const std::string &att_name,
    const std::string &value)
{
    std::lock_guard<std::mutex> lock(tcd_netcdf_util::get_netcdf_mutex());

    int ierr = 0;
    if ((ierr = nc_put_att_text(fh.get(), var_id, att_name.c_str(),
        value.size(), value.c_str())) != NC_NOERR)
    {
        TCD_ERROR("Failed to write the attribute \"" << att_name << "\". "
            << nc_strerror(ierr))
        return tcd_error::io_error;
    }

    return 0;
}

// **************************************************************************
int write_attribute(netcdf_handle &fh, int var_id, const std::string &att_name,
    double value)
{
    std::lock_guard<std::mutex> lock(tcd_netcdf_util::get_netcdf_mutex());

    int ierr = 0;
    if ((ierr = nc_put_att_double(fh.get(), var_id, att_name.c_str(),
        NC_DOUBLE, 1, &value)) != NC_NOERR)
    {
        TCD_ERROR("Failed to write the attribute \"" << att_name << "\". "
            << nc_strerror(ierr))
        return tcd_error::io_error;
    }

    return 0;
}
}
