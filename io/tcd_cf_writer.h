#ifndef tcd_cf_writer_h
#define tcd_cf_writer_h

/// @file

#include "tcd_config.h"
#include "tcd_property.h"
#include "tcd_diagnostic_record.h"

#include <string>

/** @brief
 * Writes a diagnostic record to a CF style NetCDF file.
 *
 * @details
 * Gridded fields are written on lat and lon dimensions, with a level
 * dimension named after the field's vertical axis when the field is 3-D.
 * The 1-D lat and lon coordinate variables are written once, from the first
 * field. Polar fields are written on radius and azimuth dimensions, named
 * with a suffix when their grids differ. Scalar summaries become 0-D
 * variables. Every variable carries long_name, units, description and,
 * where values may be missing, _FillValue attributes. The application and
 * the TC id are written as global attributes, as are the TC center and the
 * tables in text form.
 *
 * The file is created, replacing an existing one. When NetCDF is not
 * available write fails with tcd_error::io_error.
 */
class TCD_EXPORT tcd_cf_writer
{
public:
    tcd_cf_writer() : verbose(0) {}
    ~tcd_cf_writer() = default;

    TCD_PROPERTY(int, verbose)

    /** write the record. returns 0 if successful and tcd_error::io_error
     * if the file could not be written.
     */
    int write(const std::string &file_name,
        const tcd_diagnostic_record &record) const;

private:
    int verbose;
};

#endif
