#ifndef tcd_file_util_h
#define tcd_file_util_h

/// @file

#include "tcd_config.h"

#include <string>

#ifndef WIN32
  #define TCD_PATH_SEP "/"
#else
  #define TCD_PATH_SEP "\\"
#endif

/// Codes dealing with the paths of configuration and output files
namespace tcd_file_util
{
/// returns 1 if the path names a regular file
TCD_EXPORT
int file_exists(const std::string &path);

/// returns 1 if the path names a directory
TCD_EXPORT
int directory_exists(const std::string &path);

/// returns 1 if the file or directory can be written
TCD_EXPORT
int writable(const std::string &path);

/** Returns the directory part of a path, not including the final
 * TCD_PATH_SEP. If there is no TCD_PATH_SEP then "." is returned.
 */
TCD_EXPORT
std::string path(const std::string &file_name);

/// Returns the file name part of a path.
TCD_EXPORT
std::string filename(const std::string &file_name);

/// returns true if the path starts at the root of the file system
TCD_EXPORT
bool is_absolute(const std::string &path);

/** Joins a directory and a file name. The file name is returned unchanged
 * when it is absolute or the directory is empty.
 */
TCD_EXPORT
std::string join(const std::string &dir, const std::string &file_name);

/** Locates a file named in a configuration file. Relative names are taken
 * relative to the directory holding the configuration file. Empty names
 * are returned unchanged.
 */
TCD_EXPORT
std::string resolve(const std::string &config_file, const std::string &file_name);

/** Checks that output can be written to a directory. An empty directory is
 * the current directory. returns 0 if successful and tcd_error::io_error
 * if the directory does not exist or is not writable.
 */
TCD_EXPORT
int check_output_dir(const std::string &dir);
};

#endif
