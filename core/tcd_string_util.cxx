#include "tcd_string_util.h"

#include <algorithm>
#include <cctype>

namespace tcd_string_util
{
// --------------------------------------------------------------------------
int string_tt<bool>::convert(const char *str, bool &val)
{
    std::string tmp = to_lower(trim(str));

    if ((tmp == "0") || (tmp == "false") || (tmp == "off") || (tmp == "no"))
    {
        val = false;
        return 0;
    }
    else if ((tmp == "1") || (tmp == "true") || (tmp == "on") || (tmp == "yes"))
    {
        val = true;
        return 0;
    }

    return -1;
}

// --------------------------------------------------------------------------
std::string trim(const std::string &str)
{
    const char *pad = " \t\r\n";
    size_t first = str.find_first_not_of(pad);
    if (first == std::string::npos)
        return std::string();
    size_t last = str.find_last_not_of(pad);
    return str.substr(first, last - first + 1);
}

// --------------------------------------------------------------------------
std::string to_lower(const std::string &str)
{
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return out;
}

// --------------------------------------------------------------------------
std::vector<std::string> split(const std::string &str, char delim)
{
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start <= str.size())
    {
        size_t end = str.find(delim, start);
        if (end == std::string::npos)
            end = str.size();

        std::string tok = trim(str.substr(start, end - start));
        if (!tok.empty())
            tokens.push_back(tok);

        start = end + 1;
    }
    return tokens;
}

// --------------------------------------------------------------------------
std::string insert_before_extension(const std::string &file_name,
    const std::string &tag)
{
    size_t slash = file_name.rfind('/');
    size_t dot = file_name.rfind('.');

    if ((dot == std::string::npos) ||
        ((slash != std::string::npos) && (dot < slash)))
        return file_name + "." + tag;

    return file_name.substr(0, dot) + "." + tag + file_name.substr(dot);
}
}
