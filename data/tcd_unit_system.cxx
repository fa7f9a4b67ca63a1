#include "tcd_unit_system.h"
#include "tcd_common.h"
#include "tcd_error.h"
#include "tcd_string_util.h"
#include "tcd_physical_constants.h"

#include <sstream>

namespace
{
// lower case, trim, and collapse runs of white space
std::string normalize(const std::string &units)
{
    std::string tmp = tcd_string_util::to_lower(tcd_string_util::trim(units));
    std::string out;
    out.reserve(tmp.size());
    bool space = false;
    for (char c : tmp)
    {
        if ((c == ' ') || (c == '\t'))
        {
            space = true;
            continue;
        }
        if (space && !out.empty())
            out += ' ';
        space = false;
        out += c;
    }
    return out;
}
}

// --------------------------------------------------------------------------
tcd_unit_system::tcd_unit_system()
{
    // pressure
    this->register_unit("pascal", "pressure", 1.0);
    this->register_unit("hectopascal", "pressure", 100.0);
    this->register_unit("kilopascal", "pressure", 1000.0);
    this->register_unit("decibar", "pressure", 1.0e4);
    for (const char *a : {"pa", "pascals", "n m-2", "n/m2"})
        this->register_alias(a, "pascal");
    for (const char *a : {"hpa", "mb", "mbar", "millibar", "millibars", "hectopascals"})
        this->register_alias(a, "hectopascal");
    this->register_alias("kpa", "kilopascal");
    this->register_alias("dbar", "decibar");

    // temperature
    this->register_unit("kelvin", "temperature", 1.0);
    this->register_unit("degree_celsius", "temperature", 1.0,
        tcd_physical_constants::freezing_point());
    this->register_unit("degree_fahrenheit", "temperature", 5.0/9.0,
        tcd_physical_constants::freezing_point() - 32.0*5.0/9.0);
    for (const char *a : {"k", "degk", "deg_k", "degrees_kelvin"})
        this->register_alias(a, "kelvin");
    for (const char *a : {"degc", "deg_c", "celsius", "c", "degrees_celsius",
        "degree_c", "degrees_c"})
        this->register_alias(a, "degree_celsius");
    for (const char *a : {"degf", "deg_f", "fahrenheit", "f", "degrees_fahrenheit"})
        this->register_alias(a, "degree_fahrenheit");

    // speed
    this->register_unit("meter_per_second", "speed", 1.0);
    this->register_unit("knot", "speed", 1852.0/3600.0);
    this->register_unit("kilometer_per_hour", "speed", 1000.0/3600.0);
    for (const char *a : {"m/s", "mps", "m s-1", "m s**-1", "m s^-1",
        "meters/second", "meter/second", "meters_per_second"})
        this->register_alias(a, "meter_per_second");
    for (const char *a : {"knots", "kt", "kts"})
        this->register_alias(a, "knot");
    for (const char *a : {"km/h", "kph", "km h-1"})
        this->register_alias(a, "kilometer_per_hour");

    // length
    this->register_unit("meter", "length", 1.0);
    this->register_unit("kilometer", "length", 1000.0);
    this->register_unit("centimeter", "length", 0.01);
    for (const char *a : {"m", "meters", "metre", "metres", "gpm",
        "geopotential_meter", "geopotential_meters"})
        this->register_alias(a, "meter");
    for (const char *a : {"km", "kilometers", "kilometres"})
        this->register_alias(a, "kilometer");
    for (const char *a : {"cm", "centimeters"})
        this->register_alias(a, "centimeter");

    // mass ratio
    this->register_unit("kilogram_per_kilogram", "mass_ratio", 1.0);
    this->register_unit("gram_per_kilogram", "mass_ratio", 1.0e-3);
    for (const char *a : {"kg/kg", "kg kg-1", "kg kg**-1", "kilogram/kilogram",
        "g/g", "gram/gram"})
        this->register_alias(a, "kilogram_per_kilogram");
    for (const char *a : {"g/kg", "g kg-1", "gram/kilogram"})
        this->register_alias(a, "gram_per_kilogram");

    // angle
    this->register_unit("radian", "angle", 1.0);
    this->register_unit("degree", "angle", tcd_physical_constants::deg_to_rad());
    for (const char *a : {"rad", "radians"})
        this->register_alias(a, "radian");
    for (const char *a : {"deg", "degrees", "degrees_north", "degrees_east",
        "degree_north", "degree_east", "degrees_n", "degrees_e"})
        this->register_alias(a, "degree");

    // derivatives of the wind
    this->register_unit("per_second", "frequency", 1.0);
    for (const char *a : {"1/s", "s-1", "s**-1", "1/second", "/s"})
        this->register_alias(a, "per_second");

    this->register_unit("meter2_per_second", "diffusivity", 1.0);
    for (const char *a : {"m2/s", "m^2/s", "m2 s-1", "m**2 s**-1",
        "meters^2/second", "meters2/second"})
        this->register_alias(a, "meter2_per_second");

    // ocean heat content
    this->register_unit("joule_per_meter2", "energy_per_area", 1.0);
    this->register_unit("kilojoule_per_centimeter2", "energy_per_area", 1.0e7);
    for (const char *a : {"j/m2", "j/m^2", "j m-2", "j m**-2"})
        this->register_alias(a, "joule_per_meter2");
    for (const char *a : {"kj/cm2", "kj/cm^2", "kj cm-2"})
        this->register_alias(a, "kilojoule_per_centimeter2");

    this->register_unit("kilogram_per_meter3", "density", 1.0);
    this->register_alias("kg/m3", "kilogram_per_meter3");
    this->register_alias("kg m-3", "kilogram_per_meter3");

    this->register_unit("joule_per_kilogram_kelvin", "specific_heat", 1.0);
    this->register_alias("j/kg/k", "joule_per_kilogram_kelvin");
    this->register_alias("j kg-1 k-1", "joule_per_kilogram_kelvin");

    this->register_unit("second", "time", 1.0);
    this->register_alias("s", "second");
    this->register_alias("seconds", "second");

    // dimensionless and salinity
    this->register_unit("dimensionless", "dimensionless", 1.0);
    for (const char *a : {"1", "unitless", "none", "fraction"})
        this->register_alias(a, "dimensionless");
    this->register_unit("percent", "dimensionless", 0.01);
    this->register_alias("%", "percent");

    this->register_unit("practical_salinity_unit", "salinity", 1.0);
    for (const char *a : {"psu", "pss-78", "g/kg_salt"})
        this->register_alias(a, "practical_salinity_unit");
}

// --------------------------------------------------------------------------
int tcd_unit_system::register_unit(const std::string &name,
    const std::string &dimension, double scale, double offset)
{
    std::string key = normalize(name);
    if (key.empty() || (scale == 0.0))
    {
        TCD_ERROR("Invalid unit \"" << name << "\" scale " << scale)
        return tcd_error::unit_error;
    }

    this->units[key] = unit_t{dimension, scale, offset};
    return 0;
}

// --------------------------------------------------------------------------
int tcd_unit_system::register_alias(const std::string &alias,
    const std::string &name)
{
    std::string key = normalize(name);
    if (!this->units.count(key))
    {
        TCD_ERROR("Can't alias \"" << alias << "\" to the unknown unit \""
            << name << "\"")
        return tcd_error::unit_error;
    }

    this->aliases[normalize(alias)] = key;
    return 0;
}

// --------------------------------------------------------------------------
const tcd_unit_system::unit_t *tcd_unit_system::find(const std::string &units) const
{
    std::string key = normalize(units);

    auto ait = this->aliases.find(key);
    if (ait != this->aliases.end())
        key = ait->second;

    auto it = this->units.find(key);
    if (it == this->units.end())
        return nullptr;

    return &it->second;
}

// --------------------------------------------------------------------------
bool tcd_unit_system::is_known(const std::string &units) const
{
    return this->find(units) != nullptr;
}

// --------------------------------------------------------------------------
int tcd_unit_system::get_canonical_name(const std::string &units,
    std::string &name) const
{
    std::string key = normalize(units);

    auto ait = this->aliases.find(key);
    if (ait != this->aliases.end())
        key = ait->second;

    if (!this->units.count(key))
    {
        TCD_ERROR("Unknown units \"" << units << "\"")
        return tcd_error::unit_error;
    }

    name = key;
    return 0;
}

// --------------------------------------------------------------------------
int tcd_unit_system::get_dimension(const std::string &units,
    std::string &dimension) const
{
    const unit_t *u = this->find(units);
    if (!u)
    {
        TCD_ERROR("Unknown units \"" << units << "\"")
        return tcd_error::unit_error;
    }

    dimension = u->dimension;
    return 0;
}

// --------------------------------------------------------------------------
bool tcd_unit_system::compatible(const std::string &from,
    const std::string &to) const
{
    const unit_t *u_from = this->find(from);
    const unit_t *u_to = this->find(to);
    return u_from && u_to && (u_from->dimension == u_to->dimension);
}

// --------------------------------------------------------------------------
int tcd_unit_system::get_transform(const std::string &from,
    const std::string &to, double &mult, double &add) const
{
    const unit_t *u_from = this->find(from);
    if (!u_from)
    {
        TCD_ERROR("Unknown units \"" << from << "\"")
        return tcd_error::unit_error;
    }

    const unit_t *u_to = this->find(to);
    if (!u_to)
    {
        TCD_ERROR("Unknown units \"" << to << "\"")
        return tcd_error::unit_error;
    }

    if (u_from->dimension != u_to->dimension)
    {
        TCD_ERROR("Can't convert from \"" << from << "\" (" << u_from->dimension
            << ") to \"" << to << "\" (" << u_to->dimension << ")")
        return tcd_error::unit_error;
    }

    // si = v*s_from + o_from, out = (si - o_to)/s_to
    mult = u_from->scale/u_to->scale;
    add = (u_from->offset - u_to->offset)/u_to->scale;

    return 0;
}

// --------------------------------------------------------------------------
int tcd_unit_system::convert(double &value, const std::string &from,
    const std::string &to) const
{
    double mult = 1.0;
    double add = 0.0;
    int ierr = 0;
    if ((ierr = this->get_transform(from, to, mult, add)))
        return ierr;

    value = value*mult + add;
    return 0;
}

// --------------------------------------------------------------------------
int tcd_unit_system::convert(tcd_geo_field &field, const std::string &to) const
{
    int ierr = 0;
    if ((ierr = this->convert(field.data(), field.size(), field.get_units(), to,
        [&field](double v) -> bool { return field.is_missing(v); })))
    {
        TCD_ERROR("Failed to convert \"" << field.get_name() << "\" from \""
            << field.get_units() << "\" to \"" << to << "\"")
        return ierr;
    }

    field.set_units(to);
    return 0;
}
