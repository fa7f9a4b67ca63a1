#include "tcd_file_util.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <sys/stat.h>
#ifndef WIN32
#include <unistd.h>
#else
#include <io.h>
#define access _access
#define W_OK 2
#endif

namespace
{
// get the file type bits, 0 when the path does not exist
unsigned int get_mode(const std::string &path)
{
    struct stat s;
    if (stat(path.c_str(), &s))
        return 0;
    return s.st_mode;
}
}

namespace tcd_file_util
{
// **************************************************************************
int file_exists(const std::string &path)
{
    return (get_mode(path) & S_IFMT) == S_IFREG;
}

// **************************************************************************
int directory_exists(const std::string &path)
{
    return (get_mode(path) & S_IFMT) == S_IFDIR;
}

// **************************************************************************
int writable(const std::string &path)
{
    return !access(path.c_str(), W_OK);
}

// **************************************************************************
std::string path(const std::string &file_name)
{
    size_t p = file_name.find_last_of(TCD_PATH_SEP);
    if (p == std::string::npos)
        return ".";

    return file_name.substr(0, p);
}

// **************************************************************************
std::string filename(const std::string &file_name)
{
    size_t p = file_name.find_last_of(TCD_PATH_SEP);
    if (p == std::string::npos)
        return file_name;

    return file_name.substr(p + 1, std::string::npos);
}

// **************************************************************************
bool is_absolute(const std::string &path)
{
#ifndef WIN32
    return !path.empty() && (path[0] == '/');
#else
    return (path.size() > 1) && (path[1] == ':');
#endif
}

// **************************************************************************
std::string join(const std::string &dir, const std::string &file_name)
{
    if (dir.empty() || is_absolute(file_name))
        return file_name;

    if (dir.back() == TCD_PATH_SEP[0])
        return dir + file_name;

    return dir + TCD_PATH_SEP + file_name;
}

// **************************************************************************
std::string resolve(const std::string &config_file, const std::string &file_name)
{
    if (file_name.empty() || is_absolute(file_name))
        return file_name;

    std::string dir = path(config_file);
    if (dir == ".")
        return file_name;

    return join(dir, file_name);
}

// **************************************************************************
int check_output_dir(const std::string &dir)
{
    std::string out_dir = dir.empty() ? std::string(".") : dir;

    if (!directory_exists(out_dir))
    {
        TCD_ERROR("The output directory \"" << out_dir << "\" does not exist")
        return tcd_error::io_error;
    }

    if (!writable(out_dir))
    {
        TCD_ERROR("The output directory \"" << out_dir << "\" is not writable")
        return tcd_error::io_error;
    }

    return 0;
}
};
