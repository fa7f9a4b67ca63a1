#ifndef tcd_netcdf_util_h
#define tcd_netcdf_util_h

/// @file

#include "tcd_config.h"
#include "tcd_geo_field.h"

#include <mutex>
#include <string>
#include <vector>

#include <netcdf.h>

/// Codes dealing with NetCDF I/O calls
namespace tcd_netcdf_util
{
/** NetCDF 3 is not threadsafe, and HDF5 is usually not built threadsafe.
 * All NetCDF calls are serialized with this mutex.
 */
TCD_EXPORT
std::mutex &get_netcdf_mutex();

/// A RAII class for managing NetCDF files. The file is kept open while the object exists.
class TCD_EXPORT netcdf_handle
{
public:
    netcdf_handle() : m_handle(0)
    {}

    /** Close the file during destruction. */
    ~netcdf_handle()
    { this->close(); }

    /// This is a move only class.
    netcdf_handle(const netcdf_handle &) = delete;
    void operator=(const netcdf_handle &) = delete;

    /** Move construction takes ownership from the other object. */
    netcdf_handle(netcdf_handle &&other)
    {
        m_handle = other.m_handle;
        other.m_handle = 0;
    }

    /** Move assignment takes ownership from the other object. */
    void operator=(netcdf_handle &&other)
    {
        this->close();
        m_handle = other.m_handle;
        other.m_handle = 0;
    }

    /** Open the file. Returns 0 on success. */
    int open(const std::string &file_path, int mode);

    /** Create the file and tag it with the version. Returns 0 on success. */
    int create(const std::string &file_path, int mode);

    /** Close the file. */
    int close();

    /** Flush all data to disk. */
    int flush();

    /** Returns a reference to the handle. */
    int &get()
    { return m_handle; }

    /** Test if the handle is valid. */
    operator bool() const
    { return m_handle > 0; }

private:
    int m_handle;
};

/** Read the named variable, converting to double. The field receives the
 * values, shape, dimension names, units, long_name, description and fill
 * value. Returns 0 if successful, tcd_error::missing_variable_error if there
 * is no such variable and tcd_error::io_error on other failures.
 */
TCD_EXPORT
int read_variable(netcdf_handle &fh, const std::string &var_name,
    p_tcd_geo_field &field);

/** Get the names of the variables in the file. Returns 0 if successful. */
TCD_EXPORT
int get_variable_names(netcdf_handle &fh, std::vector<std::string> &names);

/** Write a text attribute. Returns 0 if successful. */
TCD_EXPORT
int write_attribute(netcdf_handle &fh, int var_id, const std::string &att_name,
    const std::string &value);

/** Write a scalar double attribute. Returns 0 if successful. */
TCD_EXPORT
int write_attribute(netcdf_handle &fh, int var_id, const std::string &att_name,
    double value);
}

#endif
