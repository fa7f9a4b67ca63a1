#ifndef tcd_string_util_h
#define tcd_string_util_h

/// @file

#include "tcd_config.h"
#include "tcd_common.h"

#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <string>
#include <vector>

/// Codes for dealing with string processing
namespace tcd_string_util
{
/// A traits class for conversion from text to numbers
template <typename T>
struct TCD_EXPORT string_tt {};

#define DECLARE_STR_CONVERSION_I(_CPP_T, _FUNC)                                     \
/** A traits class for conversion from text to numbers, specialized for _CPP_T */   \
template <>                                                                         \
struct string_tt<_CPP_T>                                                            \
{                                                                                   \
    static const char *type_name() { return # _CPP_T; }                             \
                                                                                    \
    static int convert(const char *str, _CPP_T &val)                                \
    {                                                                               \
        errno = 0;                                                                  \
        char *endp = nullptr;                                                       \
        _CPP_T tmp = _FUNC(str, &endp, 10);                                         \
        if ((errno != 0) || (endp == str))                                          \
            return -1;                                                              \
        while ((*endp == ' ') || (*endp == '\t'))                                   \
            ++endp;                                                                 \
        if (*endp != '\0')                                                          \
            return -1;                                                              \
        val = tmp;                                                                  \
        return 0;                                                                   \
    }                                                                               \
};

#define DECLARE_STR_CONVERSION_F(_CPP_T, _FUNC)                                     \
/** A traits class for conversion from text to numbers, specialized for _CPP_T */   \
template <>                                                                         \
struct string_tt<_CPP_T>                                                            \
{                                                                                   \
    static const char *type_name() { return # _CPP_T; }                             \
                                                                                    \
    static int convert(const char *str, _CPP_T &val)                                \
    {                                                                               \
        errno = 0;                                                                  \
        char *endp = nullptr;                                                       \
        _CPP_T tmp = _FUNC(str, &endp);                                             \
        if ((errno != 0) || (endp == str))                                          \
            return -1;                                                              \
        while ((*endp == ' ') || (*endp == '\t'))                                   \
            ++endp;                                                                 \
        if (*endp != '\0')                                                          \
            return -1;                                                              \
        val = tmp;                                                                  \
        return 0;                                                                   \
    }                                                                               \
};

DECLARE_STR_CONVERSION_F(double, strtod)
DECLARE_STR_CONVERSION_I(long, strtol)

/** A traits class for conversion from text to bool. Accepts 0/1, true/false,
 * on/off and yes/no in any case.
 */
template <>
struct string_tt<bool>
{
    static const char *type_name() { return "bool"; }

    static int convert(const char *str, bool &val);
};

/// A traits class for conversion from text, specialized for std::string
template <>
struct string_tt<std::string>
{
    static const char *type_name() { return "string"; }

    static int convert(const char *str, std::string &val)
    {
        val = str;
        return 0;
    }
};

/// return a copy with leading and trailing white space removed
TCD_EXPORT
std::string trim(const std::string &str);

/// return a lower case copy
TCD_EXPORT
std::string to_lower(const std::string &str);

/// split on the delimiter, trimming each token. empty tokens are skipped.
TCD_EXPORT
std::vector<std::string> split(const std::string &str, char delim);

/// return true if str contains the substring sub
inline
bool contains(const std::string &str, const std::string &sub)
{
    return str.find(sub) != std::string::npos;
}

/** Insert a tag before the extension of a file name. For example
 * insert_before_extension("out.nc", "AL092022") returns "out.AL092022.nc".
 */
TCD_EXPORT
std::string insert_before_extension(const std::string &file_name,
    const std::string &tag);
}

#endif
