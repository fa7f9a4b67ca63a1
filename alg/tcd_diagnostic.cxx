#include "tcd_diagnostic.h"
#include "tcd_schema.h"
#include "tcd_unit_system.h"
#include "tcd_coordinate_util.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <limits>

#if defined(TCD_HAS_BOOST)
#include <boost/program_options.hpp>
#endif

// --------------------------------------------------------------------------
tcd_diagnostic::tcd_diagnostic() : verbose(0), write_output(0),
    output_file(), overridden()
{
}

#if defined(TCD_HAS_BOOST)
// --------------------------------------------------------------------------
void tcd_diagnostic::get_properties_description(const std::string &prefix,
    options_description &global_opts)
{
    options_description opts("Options for "
        + (prefix.empty()?"tcd_diagnostic":prefix));

    opts.add_options()
        TCD_POPTS_GET(int, prefix, verbose,
            "set to non-zero to report progress")
        TCD_POPTS_GET(int, prefix, write_output,
            "set to non-zero to write the results to disk")
        TCD_POPTS_GET(std::string, prefix, output_file,
            "the path of the file the results are written to")
        ;

    global_opts.add(opts);
}

// --------------------------------------------------------------------------
void tcd_diagnostic::set_properties(const std::string &prefix,
    variables_map &opts)
{
    TCD_POPTS_SET(opts, int, prefix, verbose)
    TCD_POPTS_SET(opts, int, prefix, write_output)
    TCD_POPTS_SET(opts, std::string, prefix, output_file)
}
#endif

// --------------------------------------------------------------------------
template <typename val_t>
int tcd_diagnostic::get_parameter(const tcd_config_record &rec,
    const std::string &key, val_t &val) const
{
    if (this->is_overridden(key) || !rec.has(key))
        return 0;

    if (rec.get(key, val))
    {
        TCD_ERROR("The " << this->get_application_name() << " parameter \""
            << key << "\" has the wrong type")
        return tcd_error::config_error;
    }

    return 0;
}

// --------------------------------------------------------------------------
int tcd_diagnostic::get_parameter(const tcd_config_record &rec,
    const std::string &key, unsigned long &val) const
{
    long tmp = static_cast<long>(val);
    int ierr = 0;
    if ((ierr = this->get_parameter<long>(rec, key, tmp)))
        return ierr;

    if (tmp < 0)
    {
        TCD_ERROR("The " << this->get_application_name() << " parameter \""
            << key << "\" must not be negative. " << tmp << " was given")
        return tcd_error::config_error;
    }

    val = tmp;
    return 0;
}

// --------------------------------------------------------------------------
int tcd_diagnostic::get_parameter(const tcd_config_record &rec,
    const std::string &key, unsigned int &val) const
{
    unsigned long tmp = val;
    int ierr = 0;
    if ((ierr = this->get_parameter(rec, key, tmp)))
        return ierr;

    if (tmp > std::numeric_limits<unsigned int>::max())
    {
        TCD_ERROR("The " << this->get_application_name() << " parameter \""
            << key << "\" is too large. " << tmp << " was given")
        return tcd_error::config_error;
    }

    val = tmp;
    return 0;
}

template int tcd_diagnostic::get_parameter<bool>(const tcd_config_record &,
    const std::string &, bool &) const;
template int tcd_diagnostic::get_parameter<int>(const tcd_config_record &,
    const std::string &, int &) const;
template int tcd_diagnostic::get_parameter<long>(const tcd_config_record &,
    const std::string &, long &) const;
template int tcd_diagnostic::get_parameter<double>(const tcd_config_record &,
    const std::string &, double &) const;
template int tcd_diagnostic::get_parameter<std::string>(const tcd_config_record &,
    const std::string &, std::string &) const;
template int tcd_diagnostic::get_parameter<std::vector<double>>(
    const tcd_config_record &, const std::string &, std::vector<double> &) const;
template int tcd_diagnostic::get_parameter<std::vector<std::string>>(
    const tcd_config_record &, const std::string &,
    std::vector<std::string> &) const;

// --------------------------------------------------------------------------
int tcd_diagnostic::configure(const tcd_config_record &rec)
{
    bool write = this->write_output;

    int ierr = 0;
    if ((ierr = this->get_parameter(rec, "verbose", this->verbose)) ||
        (ierr = this->get_parameter(rec, "write_output", write)) ||
        (ierr = this->get_parameter(rec, "output_file", this->output_file)))
        return ierr;

    this->write_output = write;
    return 0;
}

// --------------------------------------------------------------------------
int tcd_diagnostic::get_field(const tcd_field_collection &fields,
    const std::string &name, const std::string &to_units,
    const tcd_unit_system &units, const_p_tcd_geo_field &field) const
{
    field = nullptr;

    if (fields.has_error(name))
    {
        int code = fields.get_error(name);
        TCD_ERROR("Application " << this->get_application_name() << " requires \"" << name
            << "\" which failed with a " << tcd_error::get_name(code))
        return code;
    }

    const_p_tcd_geo_field in = fields.get(name);
    if (!in)
    {
        TCD_ERROR("Application " << this->get_application_name() << " requires \"" << name
            << "\" which was not provided")
        return tcd_error::missing_variable_error;
    }

    if (to_units.empty() || (in->get_units() == to_units))
    {
        field = in;
        return 0;
    }

    if (!units.compatible(in->get_units(), to_units))
    {
        TCD_ERROR("Application " << this->get_application_name() << " requires \"" << name
            << "\" in units compatible with \"" << to_units << "\" but it has \""
            << in->get_units() << "\"")
        return tcd_error::unit_error;
    }

    p_tcd_geo_field tmp = in->new_copy();
    if (units.convert(*tmp, to_units))
        return tcd_error::unit_error;

    field = tmp;
    return 0;
}

// --------------------------------------------------------------------------
int tcd_diagnostic::sample(const tcd_geo_field &field, const tcd_tc_fix &fix,
    double &val)
{
    val = field.get_fill_value();

    const_p_tcd_geo_field lat = field.get_latitude();
    const_p_tcd_geo_field lon = field.get_longitude();
    if (!lat || !lon || (field.get_number_of_dimensions() != 2))
        return -1;

    std::vector<double> lat_axis;
    std::vector<double> lon_axis;
    if (tcd_coordinate_util::get_rectilinear_axes(*lat, *lon, lat_axis, lon_axis))
        return -1;

    unsigned long n_lat = lat_axis.size();
    unsigned long n_lon = lon_axis.size();
    const double *p_data = field.data();

    auto missing = [&field](double v) -> bool { return field.is_missing(v); };

    double cx = tcd_coordinate_util::wrap_longitude(fix.lon_deg, lon_axis[0]);
    double cy = fix.lat_deg;

    if (!tcd_coordinate_util::is_periodic_longitude(lon_axis) ||
        (cx <= lon_axis[n_lon - 1]))
    {
        return tcd_coordinate_util::interpolate_linear(cx, cy, lon_axis.data(),
            lat_axis.data(), p_data, n_lon, n_lat, missing, val);
    }

    // the center falls between the last and first longitude of a global
    // grid. interpolate on the two columns that bracket it.
    double x2[2] = {lon_axis[n_lon - 1], lon_axis[0] + 360.0};
    std::vector<double> seam(2*n_lat);
    for (unsigned long j = 0; j < n_lat; ++j)
    {
        seam[2*j] = p_data[j*n_lon + n_lon - 1];
        seam[2*j + 1] = p_data[j*n_lon];
    }

    return tcd_coordinate_util::interpolate_linear(cx, cy, x2,
        lat_axis.data(), seam.data(), 2ul, n_lat, missing, val);
}
