#include "tcd_yaml_util.h"
#include "tcd_string_util.h"
#include "tcd_common.h"
#include "tcd_error.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>

namespace
{
// replace ${NAME} with the value of the environment variable NAME. an
// unset variable is an error.
int expand_environment(const std::string &text, std::string &result)
{
    result.clear();

    size_t pos = 0;
    while (pos < text.size())
    {
        size_t start = text.find("${", pos);
        if (start == std::string::npos)
        {
            result += text.substr(pos);
            break;
        }

        size_t end = text.find('}', start + 2);
        if (end == std::string::npos)
        {
            TCD_ERROR("Unterminated environment reference in \"" << text << "\"")
            return tcd_error::config_error;
        }

        std::string name = text.substr(start + 2, end - start - 2);
        const char *value = getenv(name.c_str());
        if (!value)
        {
            TCD_ERROR("\"" << text << "\" references the environment variable "
                << name << " which is not set")
            return tcd_error::config_error;
        }

        result += text.substr(pos, start - pos);
        result += value;
        pos = end + 1;
    }

    return 0;
}

// get the text of a scalar node
int get_scalar(const YAML::Node &node, std::string &text)
{
    if (node.Tag() == "!ENV")
        return expand_environment(node.Scalar(), text);

    text = node.Scalar();
    return 0;
}

// copy a mapping node into a block
int to_block(const YAML::Node &node, const std::string &path,
    tcd_config_block &block)
{
    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it)
    {
        if (!it->first.IsScalar())
        {
            TCD_ERROR("A key in \"" << path << "\" is not a scalar")
            return tcd_error::config_error;
        }

        std::string key = it->first.Scalar();
        std::string key_path = path.empty() ? key : path + "." + key;

        const YAML::Node &val = it->second;
        switch (val.Type())
        {
            case YAML::NodeType::Null:
            case YAML::NodeType::Undefined:
                break;

            case YAML::NodeType::Scalar:
            {
                std::string text;
                if (get_scalar(val, text))
                {
                    TCD_ERROR("Failed to get the value of \"" << key_path << "\"")
                    return tcd_error::config_error;
                }
                block.set(key, text);
                break;
            }

            case YAML::NodeType::Sequence:
            {
                std::vector<std::string> values;
                for (const YAML::Node &elem : val)
                {
                    if (!elem.IsScalar())
                    {
                        TCD_ERROR("\"" << key_path << "\" is a sequence of"
                            " non-scalar values, only sequences of scalars"
                            " are supported")
                        return tcd_error::config_error;
                    }

                    std::string text;
                    if (get_scalar(elem, text))
                        return tcd_error::config_error;

                    values.push_back(text);
                }
                block.set(key, values);
                break;
            }

            case YAML::NodeType::Map:
            {
                tcd_config_block sub;
                int ierr = 0;
                if ((ierr = to_block(val, key_path, sub)))
                    return ierr;
                block.set_block(key, sub);
                break;
            }
        }
    }

    return 0;
}

// copy a document node into a block
int to_document(const YAML::Node &root, tcd_config_block &doc)
{
    doc.clear();

    if (root.IsNull())
        return 0;

    if (!root.IsMap())
    {
        TCD_ERROR("The document is not a mapping")
        return tcd_error::config_error;
    }

    return to_block(root, "", doc);
}

// get a coordinate of a TC fix, under its primary or alternate key
int get_position(const tcd_config_block &block, const std::string &id,
    const std::string &key, const std::string &alt_key, double &val)
{
    std::string text;
    if (block.get(key, text) && block.get(alt_key, text))
    {
        TCD_ERROR("TC " << id << " has no " << key)
        return tcd_error::config_error;
    }

    if (tcd_string_util::string_tt<double>::convert(text.c_str(), val))
    {
        TCD_ERROR("TC " << id << " " << key << " \"" << text
            << "\" is not a number")
        return tcd_error::config_error;
    }

    return 0;
}
}

namespace tcd_yaml_util
{
// --------------------------------------------------------------------------
int parse(const std::string &text, tcd_config_block &doc)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(text);
    }
    catch (const YAML::Exception &e)
    {
        TCD_ERROR("Failed to parse the YAML document. " << e.what())
        return tcd_error::config_error;
    }

    return to_document(root, doc);
}

// --------------------------------------------------------------------------
int load(const std::string &file_name, tcd_config_block &doc)
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(file_name);
    }
    catch (const YAML::BadFile &e)
    {
        TCD_ERROR("Failed to open \"" << file_name << "\". " << e.what())
        return tcd_error::io_error;
    }
    catch (const YAML::Exception &e)
    {
        TCD_ERROR("Failed to parse \"" << file_name << "\". " << e.what())
        return tcd_error::config_error;
    }

    int ierr = 0;
    if ((ierr = to_document(root, doc)))
    {
        TCD_ERROR("\"" << file_name << "\" is not a valid configuration")
        return ierr;
    }

    return 0;
}

// --------------------------------------------------------------------------
int get_tc_fixes(const tcd_config_block &doc, tcd_tc_fix_list &fixes)
{
    fixes.clear();

    std::vector<std::string> ids = doc.get_keys();
    for (const std::string &id : ids)
    {
        const tcd_config_block *block = doc.get_block(id);
        if (!block)
        {
            TCD_ERROR("TC " << id << " is not a mapping of its attributes")
            return tcd_error::config_error;
        }

        tcd_tc_fix fix;
        fix.id = id;

        int ierr = 0;
        if ((ierr = get_position(*block, id, "lat_deg", "lat", fix.lat_deg)) ||
            (ierr = get_position(*block, id, "lon_deg", "lon", fix.lon_deg)))
            return ierr;

        if ((fix.lat_deg < -90.0) || (fix.lat_deg > 90.0) ||
            (fix.lon_deg < -360.0) || (fix.lon_deg > 360.0))
        {
            TCD_ERROR("TC " << id << " position " << fix.lat_deg << ", "
                << fix.lon_deg << " is out of range")
            return tcd_error::config_error;
        }

        block->get("valid_time", fix.valid_time);

        fixes.push_back(fix);
    }

    return 0;
}

// --------------------------------------------------------------------------
int load_tc_fixes(const std::string &file_name, tcd_tc_fix_list &fixes)
{
    int ierr = 0;
    tcd_config_block doc;
    if ((ierr = load(file_name, doc)))
        return ierr;

    if ((ierr = get_tc_fixes(doc, fixes)))
    {
        TCD_ERROR("Failed to get the TC fixes from \"" << file_name << "\"")
        return ierr;
    }

    return 0;
}
};
