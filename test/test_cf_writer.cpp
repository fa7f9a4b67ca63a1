#include "tcd_config.h"
#include "tcd_cf_writer.h"
#include "tcd_diagnostic_record.h"
#include "tcd_geo_field.h"
#include "tcd_table.h"
#include "tcd_error.h"
#include "tcd_common.h"
#include "tcd_test_util.h"
#if defined(TCD_HAS_NETCDF)
#include "tcd_netcdf_array_source.h"
#endif

#include <algorithm>
#include <string>
#include <vector>

int main(int, char **)
{
    p_tcd_geo_field lat;
    p_tcd_geo_field lon;
    tcd_test_util::make_coordinates(-10.0, 10.0, 11, 100.0, 120.0, 21, lat, lon);

    p_tcd_geo_field vmax = tcd_test_util::make_field("vmax", "m/s", 0, lat, lon,
        [](unsigned long, double y, double x) -> double
        { return 60.0 + 0.5*y - 0.1*(x - 110.0); });

    (*vmax)[17] = vmax->get_fill_value();

    p_tcd_diagnostic_record rec = tcd_diagnostic_record::New(
        "potential_intensity", "09L");

    tcd_table table;
    table.set_title("summary");
    table.declare_columns({"name", "value"});

    if (table.append("vmax", 61.5) || rec->add_field(vmax) ||
        rec->add_scalar("vmax_center", 61.5, "m/s", "vmax at the TC center") ||
        rec->add_table("summary", table))
    {
        TCD_ERROR("Failed to populate the record")
        return -1;
    }

    std::string file_name = "test_cf_writer_09L.nc";

    tcd_cf_writer writer;
    int ierr = writer.write(file_name, *rec);

#if !defined(TCD_HAS_NETCDF)
    if (ierr != tcd_error::io_error)
    {
        TCD_ERROR("Writing without NetCDF did not fail with an I/O error")
        return -1;
    }
#else
    if (ierr)
    {
        TCD_ERROR("Failed to write \"" << file_name << "\"")
        return -1;
    }

    p_tcd_netcdf_array_source src = tcd_netcdf_array_source::New(file_name);

    std::vector<std::string> names;
    if (src->get_variable_names(names))
    {
        TCD_ERROR("Failed to list the variables of \"" << file_name << "\"")
        return -1;
    }

    for (const char *name : {"lat", "lon", "vmax", "vmax_center"})
    {
        if (std::find(names.begin(), names.end(), name) == names.end())
        {
            TCD_ERROR("\"" << name << "\" was not written. found " << names)
            return -1;
        }
    }

    p_tcd_geo_field vmax_in;
    if (src->read("vmax", vmax_in) || (vmax_in->size() != vmax->size()))
    {
        TCD_ERROR("Failed to read back vmax")
        return -1;
    }

    for (unsigned long q = 0; q < vmax->size(); ++q)
    {
        if (q == 17)
        {
            if (!vmax_in->is_missing((*vmax_in)[q]))
            {
                TCD_ERROR("The missing value was not preserved")
                return -1;
            }
            continue;
        }

        if (!tcd_test_util::close((*vmax_in)[q], (*vmax)[q], 1e-12))
        {
            TCD_ERROR("vmax differs at " << q << " " << (*vmax_in)[q]
                << " != " << (*vmax)[q])
            return -1;
        }
    }

    if (vmax_in->get_units() != "m/s")
    {
        TCD_ERROR("The units were not written")
        return -1;
    }
#endif

    return 0;
}
