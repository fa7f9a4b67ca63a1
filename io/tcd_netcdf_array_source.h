#ifndef tcd_netcdf_array_source_h
#define tcd_netcdf_array_source_h

/// @file

#include "tcd_config.h"
#include "tcd_shared_object.h"
#include "tcd_array_source.h"

#include <string>
#include <vector>

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_netcdf_array_source)

/** @brief
 * An array source reading variables from a NetCDF file.
 *
 * @details
 * The file is opened at the start of each call and closed when the call
 * returns. Values of any numeric type are converted to double, and packed
 * values (scale_factor/add_offset) are unpacked.
 */
class TCD_EXPORT tcd_netcdf_array_source : public tcd_array_source
{
public:
    static p_tcd_netcdf_array_source New(const std::string &file_name);

    const std::string &get_file_name() const { return this->file_name; }

    int read(const std::string &var_name, p_tcd_geo_field &field) override;

    bool has_variable(const std::string &var_name) override;

    int get_variable_names(std::vector<std::string> &names) override;

    std::string get_description() const override;

protected:
    tcd_netcdf_array_source() = default;

private:
    std::string file_name;
};

#endif
