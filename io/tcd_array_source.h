#ifndef tcd_array_source_h
#define tcd_array_source_h

/// @file

#include "tcd_config.h"
#include "tcd_shared_object.h"
#include "tcd_geo_field.h"

#include <map>
#include <string>
#include <vector>

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_array_source)
TCD_SHARED_OBJECT_FORWARD_DECL(tcd_memory_array_source)

/** @brief
 * The interface to a collection of named gridded arrays, typically one
 * file.
 *
 * @details
 * A read returns a newly allocated field holding the values as stored in the
 * source along with its shape, dimension names, units and fill value.
 * Sources do not interpret axes; that is left to the tcd_variable_resolver.
 */
class TCD_EXPORT tcd_array_source
{
public:
    virtual ~tcd_array_source() = default;

    /** read the named array. returns 0 if successful,
     * tcd_error::missing_variable_error when there is no such array, and
     * tcd_error::io_error when the source can't be read.
     */
    virtual int read(const std::string &var_name, p_tcd_geo_field &field) = 0;

    /// return true if the named array exists
    virtual bool has_variable(const std::string &var_name) = 0;

    /// get the names of the arrays. returns 0 if successful.
    virtual int get_variable_names(std::vector<std::string> &names) = 0;

    /// a description of the source used in messages
    virtual std::string get_description() const = 0;

protected:
    tcd_array_source() = default;
    tcd_array_source(const tcd_array_source &) = delete;
    void operator=(const tcd_array_source &) = delete;
};

/// An array source that serves fields held in memory
class TCD_EXPORT tcd_memory_array_source : public tcd_array_source
{
public:
    static p_tcd_memory_array_source New(const std::string &name = "memory");

    /// add a field. the field is copied on each read.
    void add_variable(const const_p_tcd_geo_field &field);

    /// add a field under an explicit name
    void add_variable(const std::string &var_name,
        const const_p_tcd_geo_field &field);

    int read(const std::string &var_name, p_tcd_geo_field &field) override;

    bool has_variable(const std::string &var_name) override;

    int get_variable_names(std::vector<std::string> &names) override;

    std::string get_description() const override;

protected:
    tcd_memory_array_source() = default;

private:
    std::string name;
    std::map<std::string, const_p_tcd_geo_field> variables;
};

/** @brief
 * Maps the file paths named in the configuration to array sources.
 *
 * @details
 * Paths that have been registered with add_source are served by the
 * registered source. Other paths are opened as NetCDF files when NetCDF is
 * available. Files are opened for the duration of each read only.
 */
class TCD_EXPORT tcd_source_provider
{
public:
    /// serve the path from the given source
    void add_source(const std::string &path, const p_tcd_array_source &source);

    /** get the source for the path. returns 0 if successful and
     * tcd_error::io_error if no source can be made.
     */
    int get_source(const std::string &path, p_tcd_array_source &source);

private:
    std::map<std::string, p_tcd_array_source> sources;
};

#endif
