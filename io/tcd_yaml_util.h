#ifndef tcd_yaml_util_h
#define tcd_yaml_util_h

/// @file

#include "tcd_config.h"
#include "tcd_config_block.h"
#include "tcd_tc_fix.h"

#include <string>
#include <vector>

/// Codes for loading YAML configuration documents
namespace tcd_yaml_util
{
/** parse YAML text into a configuration block. the document must be a
 * mapping. nested mappings become nested blocks, sequences of scalars
 * become sequence values, and keys with no value are skipped. a scalar
 * tagged !ENV has its ${NAME} references replaced by the value of the
 * environment variable. returns 0 if successful and tcd_error::config_error
 * if the text is not valid YAML or does not have the expected layout.
 */
TCD_EXPORT
int parse(const std::string &text, tcd_config_block &doc);

/** load a YAML file into a configuration block. returns 0 if successful,
 * tcd_error::io_error if the file can't be read, and
 * tcd_error::config_error if its contents are not valid.
 */
TCD_EXPORT
int load(const std::string &file_name, tcd_config_block &doc);

/** get the TC fixes from a document mapping each TC id to a block holding
 * lat_deg, lon_deg and optionally valid_time. lat and lon are accepted in
 * place of lat_deg and lon_deg. fixes are returned in document order.
 * returns 0 if successful and tcd_error::config_error if an entry is
 * malformed or the position is out of range.
 */
TCD_EXPORT
int get_tc_fixes(const tcd_config_block &doc, tcd_tc_fix_list &fixes);

/// load the TC fixes from a YAML file. returns 0 if successful.
TCD_EXPORT
int load_tc_fixes(const std::string &file_name, tcd_tc_fix_list &fixes);
};

#endif
