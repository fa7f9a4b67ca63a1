#ifndef tcd_program_options_h
#define tcd_program_options_h

/// @file

#include "tcd_config.h"
#include "tcd_common.h"

#if defined(TCD_HAS_BOOST)
namespace boost
{
    namespace program_options
    {
        class options_description;
        class variables_map;
    }
};

using options_description = boost::program_options::options_description;
using variables_map = boost::program_options::variables_map;

/// declares get_properties_description for a class with properties
#define TCD_GET_PROPERTIES_DESCRIPTION()                                    \
                                                                            \
    /** Adds the class properties to the description object */              \
    void get_properties_description(const std::string &prefix,              \
        boost::program_options::options_description &opts) override;        \

/// declares set_properties for a class with properties
#define TCD_SET_PROPERTIES()                                                \
    /** Sets the class properties from the map object */                    \
    void set_properties(const std::string &prefix,                          \
        boost::program_options::variables_map &opts) override;              \

// helpers for implementation dealing with Boost program options. the above
// declarations are intended for class headers, hence <string> and
// <boost/program_options.hpp> need to be included in the cxx files.
#define TCD_POPTS_GET(_type, _prefix, _name, _desc)            \
     (((_prefix.empty()?"":_prefix+"::") + #_name).c_str(),    \
         boost::program_options::value<_type>()->default_value \
            (this->get_ ## _name()), "\n" _desc "\n")

#define TCD_POPTS_MULTI_GET(_type, _prefix, _name, _desc)   \
     (((_prefix.empty()?"":_prefix+"::") + #_name).c_str(), \
         boost::program_options::value<_type>()->multitoken \
            ()->default_value(this->get_ ## _name()),       \
         "\n" _desc "\n")

#define TCD_POPTS_SET(_opts, _type, _prefix, _name)              \
    {std::string opt_name =                                      \
        (_prefix.empty()?"":_prefix+"::") + #_name;              \
    if (_opts.count(opt_name) && !_opts[opt_name].defaulted())   \
    {                                                            \
        _type val = _opts[opt_name].as<_type>();                 \
        if (this->verbose)                                       \
        {                                                        \
            TCD_STATUS("Setting " << opt_name << " = " << val)   \
        }                                                        \
        this->set_##_name(val);                                  \
        this->mark_overridden(#_name);                           \
    }}

#else
#define TCD_GET_PROPERTIES_DESCRIPTION()
#define TCD_SET_PROPERTIES()
#endif
#endif
