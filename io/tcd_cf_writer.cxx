#include "tcd_cf_writer.h"
#include "tcd_coordinate_util.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <deque>
#include <map>
#include <sstream>
#include <vector>

#if defined(TCD_HAS_NETCDF)
#include "tcd_netcdf_util.h"

using tcd_netcdf_util::netcdf_handle;

namespace
{
// a variable defined in the file, and the values to write once the
// definitions are complete
struct var_def_t
{
    int var_id;
    const double *values;
};

// --------------------------------------------------------------------------
int define_dim(netcdf_handle &fh, const std::string &name, size_t size,
    int &dim_id)
{
    std::lock_guard<std::mutex> lock(tcd_netcdf_util::get_netcdf_mutex());

    int ierr = 0;
    if ((ierr = nc_def_dim(fh.get(), name.c_str(), size, &dim_id)) != NC_NOERR)
    {
        TCD_ERROR("Failed to define dimension \"" << name << "\" of length "
            << size << ". " << nc_strerror(ierr))
        return tcd_error::io_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
int define_var(netcdf_handle &fh, const std::string &name,
    const std::vector<int> &dim_ids, int &var_id)
{
    std::lock_guard<std::mutex> lock(tcd_netcdf_util::get_netcdf_mutex());

    int ierr = 0;
    if ((ierr = nc_def_var(fh.get(), name.c_str(), NC_DOUBLE, dim_ids.size(),
        dim_ids.data(), &var_id)) != NC_NOERR)
    {
        TCD_ERROR("Failed to define variable \"" << name << "\". "
            << nc_strerror(ierr))
        return tcd_error::io_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
int write_attributes(netcdf_handle &fh, int var_id, const std::string &name,
    const tcd_array_attributes &atts)
{
    int ierr = 0;
    if ((ierr = tcd_netcdf_util::write_attribute(fh, var_id, "long_name",
            atts.long_name.empty() ? name : atts.long_name)) ||
        (ierr = tcd_netcdf_util::write_attribute(fh, var_id, "units",
            atts.units)))
        return ierr;

    if (!atts.description.empty() &&
        (ierr = tcd_netcdf_util::write_attribute(fh, var_id, "description",
            atts.description)))
        return ierr;

    if (atts.have_fill_value &&
        (ierr = tcd_netcdf_util::write_attribute(fh, var_id, "_FillValue",
            atts.fill_value)))
        return ierr;

    return 0;
}

// --------------------------------------------------------------------------
int define_coordinate(netcdf_handle &fh, const std::string &name,
    const std::vector<double> &values, const std::string &units,
    int &dim_id, std::vector<var_def_t> &defs)
{
    int ierr = 0;
    int var_id = 0;
    if ((ierr = define_dim(fh, name, values.size(), dim_id)) ||
        (ierr = define_var(fh, name, {dim_id}, var_id)) ||
        (ierr = tcd_netcdf_util::write_attribute(fh, var_id, "units", units)))
        return ierr;

    defs.push_back({var_id, values.data()});
    return 0;
}

// the dimensions shared by the variables of the file
struct dim_set_t
{
    // dimension ids keyed by name, and their lengths
    std::map<std::string, int> ids;
    std::map<std::string, size_t> sizes;

    // coordinate values kept alive until written
    std::deque<std::vector<double>> coords;

    // get the id of the named dimension, defining it with the coordinate
    // values when needed. a dimension of the same name with a different
    // length is defined with a numbered suffix.
    int get(netcdf_handle &fh, const std::string &name,
        const std::vector<double> &values, const std::string &units,
        int &dim_id, std::vector<var_def_t> &defs)
    {
        std::string dim_name = name;
        for (int i = 1; this->ids.count(dim_name); ++i)
        {
            if (this->sizes[dim_name] == values.size())
            {
                dim_id = this->ids[dim_name];
                return 0;
            }
            dim_name = name + "_" + std::to_string(i);
        }

        this->coords.push_back(values);

        int ierr = 0;
        if ((ierr = define_coordinate(fh, dim_name, this->coords.back(),
            units, dim_id, defs)))
            return ierr;

        this->ids[dim_name] = dim_id;
        this->sizes[dim_name] = values.size();
        return 0;
    }
};
}
#endif

// --------------------------------------------------------------------------
int tcd_cf_writer::write(const std::string &file_name,
    const tcd_diagnostic_record &record) const
{
#if !defined(TCD_HAS_NETCDF)
    TCD_ERROR("Can't write \"" << file_name << "\". NetCDF is required"
        " but this build does not include it")
    (void)record;
    return tcd_error::io_error;
#else
    netcdf_handle fh;
    if (fh.create(file_name, NC_CLOBBER | NC_NETCDF4))
    {
        TCD_ERROR("Failed to create \"" << file_name << "\"")
        return tcd_error::io_error;
    }

    int ierr = 0;

    // global attributes
    if ((ierr = tcd_netcdf_util::write_attribute(fh, NC_GLOBAL, "application",
        record.get_application())))
        return ierr;

    if (!record.get_tc_id().empty() &&
        (ierr = tcd_netcdf_util::write_attribute(fh, NC_GLOBAL, "tc_id",
        record.get_tc_id())))
        return ierr;

    for (const std::string &name : record.get_table_names())
    {
        std::ostringstream oss;
        oss << *record.get_table(name);
        if ((ierr = tcd_netcdf_util::write_attribute(fh, NC_GLOBAL,
            "table_" + name, oss.str())))
            return ierr;
    }

    // the coordinate arrays are kept alive in coords until they are written
    std::vector<var_def_t> defs;
    dim_set_t dims;

    // gridded fields
    for (const std::string &name : record.get_field_names())
    {
        const_p_tcd_geo_field field = record.get_field(name);

        std::vector<int> dim_ids;
        unsigned long n_dims = field->get_number_of_dimensions();

        if ((n_dims < 2) || (n_dims > 3) || !field->get_latitude() ||
            !field->get_longitude())
        {
            TCD_ERROR("Can't write \"" << name << "\" [" << field->get_shape()
                << "]. 2-D and 3-D fields with coordinates are supported")
            return tcd_error::io_error;
        }

        if (n_dims == 3)
        {
            std::string lev_name = field->get_dim_names()[0];
            if (lev_name.empty())
                lev_name = "level";

            std::vector<double> levels = field->get_levels();
            if (levels.size() != field->get_number_of_levels())
            {
                levels.resize(field->get_number_of_levels());
                for (unsigned long k = 0; k < levels.size(); ++k)
                    levels[k] = k;
            }

            int dim_id = 0;
            if ((ierr = dims.get(fh, lev_name, levels, "", dim_id, defs)))
                return ierr;

            dim_ids.push_back(dim_id);
        }

        std::vector<double> lat_axis;
        std::vector<double> lon_axis;
        if (tcd_coordinate_util::get_rectilinear_axes(*field->get_latitude(),
            *field->get_longitude(), lat_axis, lon_axis))
        {
            TCD_ERROR("Can't write \"" << name << "\". The grid is not rectilinear")
            return tcd_error::io_error;
        }

        int lat_id = 0;
        int lon_id = 0;
        if ((ierr = dims.get(fh, "lat", lat_axis, "degrees_north", lat_id, defs)) ||
            (ierr = dims.get(fh, "lon", lon_axis, "degrees_east", lon_id, defs)))
            return ierr;

        dim_ids.push_back(lat_id);
        dim_ids.push_back(lon_id);

        int var_id = 0;
        if ((ierr = define_var(fh, name, dim_ids, var_id)) ||
            (ierr = write_attributes(fh, var_id, name, field->get_attributes())))
            return ierr;

        defs.push_back({var_id, field->data()});
    }

    // polar fields
    for (const std::string &name : record.get_polar_field_names())
    {
        const_p_tcd_polar_field field = record.get_polar_field(name);

        int rad_id = 0;
        int az_id = 0;
        if ((ierr = dims.get(fh, "radius", field->get_radial(), "m",
                rad_id, defs)) ||
            (ierr = dims.get(fh, "azimuth", field->get_azimuth(), "radians",
                az_id, defs)))
            return ierr;

        int var_id = 0;
        if ((ierr = define_var(fh, name, {rad_id, az_id}, var_id)) ||
            (ierr = write_attributes(fh, var_id, name, field->get_attributes())))
            return ierr;

        defs.push_back({var_id, field->data()});
    }

    // the TC center
    if (!record.get_polar_field_names().empty())
    {
        const tcd_tc_fix &fix =
            record.get_polar_field(record.get_polar_field_names()[0])->get_tc_fix();

        if ((ierr = tcd_netcdf_util::write_attribute(fh, NC_GLOBAL,
                "tc_lat", fix.lat_deg)) ||
            (ierr = tcd_netcdf_util::write_attribute(fh, NC_GLOBAL,
                "tc_lon", fix.lon_deg)))
            return ierr;
    }

    // scalar summaries
    for (const std::string &name : record.get_scalar_names())
    {
        const tcd_scalar_summary *scalar = record.get_scalar_summary(name);

        int var_id = 0;
        if ((ierr = define_var(fh, name, {}, var_id)) ||
            (ierr = write_attributes(fh, var_id, name, scalar->attributes)))
            return ierr;

        defs.push_back({var_id, &scalar->value});
    }

    // values
    {
    std::lock_guard<std::mutex> lock(tcd_netcdf_util::get_netcdf_mutex());

    if ((ierr = nc_enddef(fh.get())) != NC_NOERR)
    {
        TCD_ERROR("Failed to define the variables of \"" << file_name << "\". "
            << nc_strerror(ierr))
        return tcd_error::io_error;
    }

    for (const var_def_t &def : defs)
    {
        if ((ierr = nc_put_var_double(fh.get(), def.var_id, def.values)) != NC_NOERR)
        {
            TCD_ERROR("Failed to write variable " << def.var_id << " of \""
                << file_name << "\". " << nc_strerror(ierr))
            return tcd_error::io_error;
        }
    }
    }

    if (fh.close())
    {
        TCD_ERROR("Failed to close \"" << file_name << "\"")
        return tcd_error::io_error;
    }

    if (this->verbose)
    {
        TCD_STATUS("Wrote " << record.get_application()
            << (record.get_tc_id().empty() ? "" : " ") << record.get_tc_id()
            << " to \"" << file_name << "\"")
    }

    return 0;
#endif
}
