#include "tcd_schema.h"
#include "tcd_common.h"
#include "tcd_error.h"
#include "tcd_string_util.h"

#include <sstream>

using tcd_string_util::string_tt;

namespace
{
// convert one text value to a scalar of the requested type
template <typename val_t>
int convert_scalar(const std::string &text, tcd_config_value &val)
{
    val_t tmp;
    if (string_tt<val_t>::convert(tcd_string_util::trim(text).c_str(), tmp))
        return -1;
    val = tmp;
    return 0;
}

// convert a sequence of text values to a list of the requested type
template <typename val_t>
int convert_list(const std::vector<std::string> &text, tcd_config_value &val)
{
    std::vector<val_t> tmp;
    tmp.reserve(text.size());
    for (const std::string &t : text)
    {
        val_t v;
        if (string_tt<val_t>::convert(tcd_string_util::trim(t).c_str(), v))
            return -1;
        tmp.push_back(v);
    }
    val = tmp;
    return 0;
}
}

// --------------------------------------------------------------------------
void tcd_config_record::set(const std::string &key,
    const tcd_config_value &val, int origin)
{
    if (!this->values.count(key))
        this->keys.push_back(key);

    this->values[key] = val;
    this->origins[key] = origin;
}

// --------------------------------------------------------------------------
void tcd_config_record::clear()
{
    this->keys.clear();
    this->values.clear();
    this->origins.clear();
}

// --------------------------------------------------------------------------
int tcd_config_record::get_origin(const std::string &key) const
{
    auto it = this->origins.find(key);
    return it == this->origins.end() ? -1 : it->second;
}

// --------------------------------------------------------------------------
template <typename val_t>
int tcd_config_record::get_value(const std::string &key, val_t &val) const
{
    auto it = this->values.find(key);
    if (it == this->values.end())
        return -1;

    const val_t *pval = std::get_if<val_t>(&it->second);
    if (!pval)
        return -1;

    val = *pval;
    return 0;
}

// --------------------------------------------------------------------------
int tcd_config_record::get(const std::string &key, bool &val) const
{
    return this->get_value(key, val);
}

// --------------------------------------------------------------------------
int tcd_config_record::get(const std::string &key, long &val) const
{
    return this->get_value(key, val);
}

// --------------------------------------------------------------------------
int tcd_config_record::get(const std::string &key, int &val) const
{
    long tmp = 0;
    if (this->get_value(key, tmp))
        return -1;
    val = tmp;
    return 0;
}

// --------------------------------------------------------------------------
int tcd_config_record::get(const std::string &key, double &val) const
{
    if (!this->get_value(key, val))
        return 0;

    long tmp = 0;
    if (this->get_value(key, tmp))
        return -1;

    val = tmp;
    return 0;
}

// --------------------------------------------------------------------------
int tcd_config_record::get(const std::string &key, std::string &val) const
{
    return this->get_value(key, val);
}

// --------------------------------------------------------------------------
int tcd_config_record::get(const std::string &key,
    std::vector<double> &val) const
{
    return this->get_value(key, val);
}

// --------------------------------------------------------------------------
int tcd_config_record::get(const std::string &key,
    std::vector<std::string> &val) const
{
    return this->get_value(key, val);
}



// --------------------------------------------------------------------------
void tcd_schema::add_required(const std::string &key, int type,
    const std::string &description)
{
    key_t k;
    k.key = key;
    k.type = type;
    k.required = true;
    k.description = description;
    this->schema_keys.push_back(k);
}

// --------------------------------------------------------------------------
void tcd_schema::add_optional(const std::string &key, int type,
    const tcd_config_value &def, const std::string &description)
{
    key_t k;
    k.key = key;
    k.type = type;
    k.required = false;
    k.def = def;
    k.description = description;
    this->schema_keys.push_back(k);
}

// --------------------------------------------------------------------------
void tcd_schema::add_bool(const std::string &key, bool def,
    const std::string &description)
{
    this->add_optional(key, bool_type, tcd_config_value(def), description);
}

// --------------------------------------------------------------------------
void tcd_schema::add_int(const std::string &key, long def,
    const std::string &description)
{
    this->add_optional(key, int_type, tcd_config_value(def), description);
}

// --------------------------------------------------------------------------
void tcd_schema::add_float(const std::string &key, double def,
    const std::string &description)
{
    this->add_optional(key, float_type, tcd_config_value(def), description);
}

// --------------------------------------------------------------------------
void tcd_schema::add_string(const std::string &key, const std::string &def,
    const std::string &description)
{
    this->add_optional(key, string_type, tcd_config_value(def), description);
}

// --------------------------------------------------------------------------
void tcd_schema::add_float_list(const std::string &key,
    const std::vector<double> &def, const std::string &description)
{
    this->add_optional(key, float_list_type, tcd_config_value(def), description);
}

// --------------------------------------------------------------------------
void tcd_schema::add_string_list(const std::string &key,
    const std::vector<std::string> &def, const std::string &description)
{
    this->add_optional(key, string_list_type, tcd_config_value(def), description);
}

// --------------------------------------------------------------------------
bool tcd_schema::has_key(const std::string &key) const
{
    for (const key_t &k : this->schema_keys)
    {
        if (k.key == key)
            return true;
    }
    return false;
}

// --------------------------------------------------------------------------
std::vector<std::string> tcd_schema::get_keys() const
{
    std::vector<std::string> keys;
    for (const key_t &k : this->schema_keys)
        keys.push_back(k.key);
    return keys;
}

// --------------------------------------------------------------------------
const char *tcd_schema::get_type_name(int type)
{
    switch (type)
    {
        case bool_type: return "bool";
        case int_type: return "int";
        case float_type: return "float";
        case string_type: return "string";
        case float_list_type: return "float_list";
        case string_list_type: return "string_list";
    }
    return "unknown";
}

// --------------------------------------------------------------------------
std::string tcd_schema::to_string(const tcd_config_value &val)
{
    std::ostringstream oss;
    oss.precision(10);

    if (const bool *b = std::get_if<bool>(&val))
        oss << (*b ? "true" : "false");
    else if (const long *l = std::get_if<long>(&val))
        oss << *l;
    else if (const double *d = std::get_if<double>(&val))
        oss << *d;
    else if (const std::string *s = std::get_if<std::string>(&val))
        oss << *s;
    else if (const std::vector<double> *vd = std::get_if<std::vector<double>>(&val))
        oss << "[" << *vd << "]";
    else if (const std::vector<std::string> *vs =
        std::get_if<std::vector<std::string>>(&val))
        oss << "[" << *vs << "]";

    return oss.str();
}

// --------------------------------------------------------------------------
int tcd_schema::coerce(const tcd_config_block &block, const std::string &key,
    int type, tcd_config_value &val)
{
    int kind = block.get_kind(key);

    if (kind == tcd_config_block::block_value)
        return -1;

    bool is_list = (type == float_list_type) || (type == string_list_type);

    if (kind == tcd_config_block::sequence_value)
    {
        if (!is_list)
            return -1;

        std::vector<std::string> text;
        block.get(key, text);

        if (type == float_list_type)
            return convert_list<double>(text, val);

        return convert_list<std::string>(text, val);
    }

    std::string text;
    if (block.get(key, text))
        return -1;

    switch (type)
    {
        case bool_type:
            return convert_scalar<bool>(text, val);
        case int_type:
            return convert_scalar<long>(text, val);
        case float_type:
            return convert_scalar<double>(text, val);
        case string_type:
            val = text;
            return 0;
        case float_list_type:
            return convert_list<double>({text}, val);
        case string_list_type:
            val = std::vector<std::string>({text});
            return 0;
    }

    return -1;
}

// --------------------------------------------------------------------------
int tcd_schema::validate(const tcd_config_block &block, tcd_config_record &rec,
    tcd_warning_log &log, tcd_table *table) const
{
    rec.clear();

    if (table)
    {
        table->set_title("Validation of " + this->name);
        table->declare_columns({"key", "type", "value", "origin"});
    }

    int ierr = 0;
    for (const key_t &k : this->schema_keys)
    {
        if (!block.has(k.key))
        {
            if (k.required)
            {
                TCD_ERROR("The " << this->name << " key \"" << k.key
                    << "\" is required but was not provided")
                ierr = tcd_error::config_error;
                continue;
            }

            rec.set(k.key, k.def, tcd_config_record::from_default);

            std::ostringstream oss;
            oss << "\"" << k.key << "\" was not provided, using the default "
                << to_string(k.def);
            log.record(tcd_warning_log::default_value_warning, this->name,
                oss.str());

            if (table)
                table->append(k.key, get_type_name(k.type), to_string(k.def),
                    "default");

            continue;
        }

        tcd_config_value val;
        if (coerce(block, k.key, k.type, val))
        {
            std::string text;
            std::vector<std::string> seq;
            if (block.get(k.key, seq) == 0)
            {
                std::ostringstream oss;
                oss << seq;
                text = oss.str();
            }
            else
            {
                text = "mapping";
            }

            TCD_ERROR("The " << this->name << " key \"" << k.key
                << "\" has the value \"" << text << "\" which is not a "
                << get_type_name(k.type))
            ierr = tcd_error::config_error;
            continue;
        }

        rec.set(k.key, val, tcd_config_record::from_input);

        if (table)
            table->append(k.key, get_type_name(k.type), to_string(val), "input");
    }

    // report what we don't know about, the record holds declared keys only
    std::vector<std::string> keys = block.get_keys();
    for (const std::string &key : keys)
    {
        if (this->has_key(key))
            continue;

        log.record(tcd_warning_log::unrecognized_key_warning, this->name,
            "\"" + key + "\" is not a " + this->name + " key and was ignored");

        if (!table)
            continue;

        int kind = block.get_kind(key);
        if (kind == tcd_config_block::block_value)
        {
            table->append(key, "mapping", "{...}", "unrecognized");
            continue;
        }

        tcd_config_value val;
        int type = kind == tcd_config_block::sequence_value ?
            string_list_type : string_type;

        if (coerce(block, key, type, val))
        {
            table->append(key, get_type_name(type), "?", "unrecognized");
            continue;
        }

        table->append(key, get_type_name(type), to_string(val), "unrecognized");
    }

    if (ierr)
    {
        TCD_ERROR("Validation of the " << this->name << " block failed with "
            << tcd_error::get_name(ierr))
    }

    return ierr;
}



// --------------------------------------------------------------------------
tcd_schema_registry::tcd_schema_registry()
{
    tcd_schema var("variable");
    var.add_required("units", tcd_schema::string_type,
        "units of the values, after scaling");
    var.add_string("name", "", "short name used in outputs");
    var.add_string("description", "", "text describing the variable");
    var.add_string("ncfile", "", "path to the file holding the variable");
    var.add_string("ncvarname", "", "name of the variable in the file");
    var.add_bool("flip_lat", false, "reverse the latitude axis");
    var.add_bool("flip_z", false, "reverse the vertical axis");
    var.add_bool("squeeze", false, "drop a length one axis");
    var.add_int("squeeze_axis", 0, "the axis to drop when squeeze is set");
    var.add_float("scale_mult", 1.0, "values are multiplied by this");
    var.add_float("scale_add", 0.0, "added to the values after scale_mult");
    var.add_string_list("coords", {}, "names of the axes, slowest first");
    var.add_bool("derived", false, "set when the variable is computed");
    var.add_string("method", "", "the method computing a derived variable");
    var.add_string_list("inputs", {}, "inputs to the method");
    this->add(var);

    tcd_schema exp("experiment");
    exp.add_required("inputs", tcd_schema::string_type,
        "YAML file declaring the atmosphere variables");
    exp.add_string("ocean_inputs", "", "YAML file declaring the ocean variables");
    exp.add_string("tcinfo", "", "YAML file holding the TC fixes");
    exp.add_string("tcpi", "", "YAML file configuring potential intensity");
    exp.add_string("tcmsi", "", "YAML file configuring multi-scale intensity");
    exp.add_string("tcsteering", "", "YAML file configuring the steering flow");
    exp.add_string("tcohc", "", "YAML file configuring ocean heat content");
    exp.add_string("output_dir", "", "directory where output files are written");
    this->add(exp);

    tcd_schema pi("potential_intensity");
    pi.add_float("zmax", 0.0, "columns with surface height above this (m) are skipped");
    pi.add_float("mslp_max", 2000.0, "columns with sea-level pressure above this "
        "(hPa when less than 1e4, otherwise Pa) are skipped");
    pi.add_float("ckcd", 0.9, "ratio of the enthalpy and momentum exchange coefficients");
    pi.add_float("ascent_flag", 0.0, "fraction of condensate removed during ascent, "
        "0 reversible, 1 pseudo-adiabatic");
    pi.add_int("diss_flag", 1, "1 to include dissipative heating");
    pi.add_float("v_reduc", 0.8, "reduction from gradient to 10 m wind");
    pi.add_float("ptop", 5000.0, "pressure (Pa) above which the profile is ignored");
    pi.add_int("verbose", 0, "set to non-zero to report progress");
    pi.add_bool("write_output", false, "write the results to output_file");
    pi.add_string("output_file", "tcd_potential_intensity.nc", "output file name");
    this->add(pi);

    tcd_schema msi("multiscale_intensity");
    msi.add_float("drho", 100000.0, "radial resolution (m)");
    msi.add_float("dphi", 45.0, "azimuthal resolution (degrees)");
    msi.add_float("max_radius", 1000000.0, "radial extent (m)");
    msi.add_int("max_wn", 3, "the largest wavenumber retained");
    msi.add_float("wind_height", 10.0, "height (m) at which the wind is analyzed");
    msi.add_int("verbose", 0, "set to non-zero to report progress");
    msi.add_bool("write_output", false, "write the results to output_file");
    msi.add_string("output_file", "tcd_multiscale_intensity.nc", "output file name");
    this->add(msi);

    tcd_schema steer("steering_flow");
    steer.add_float_list("isolevels", {100000.0, 90000.0, 80000.0, 70000.0,
        60000.0, 50000.0, 40000.0, 30000.0, 20000.0, 10000.0},
        "isobaric levels (Pa) the winds are interpolated to");
    steer.add_float_list("layers", {}, "(bottom, top) pressure pairs (Pa)");
    steer.add_float("distance", 1600000.0, "radius (m) of the filtered region");
    steer.add_float("ddist", 100000.0, "width (m) of the blending annulus");
    steer.add_int("ncoeffs", 5, "number of singular values retained");
    steer.add_float("tolerance", 1.0e-6, "relative tolerance of the Poisson solver");
    steer.add_int("max_iterations", 20000, "iteration limit of the Poisson solver");
    steer.add_int("verbose", 0, "set to non-zero to report progress");
    steer.add_bool("write_output", false, "write the results to output_file");
    steer.add_string("output_file", "tcd_steering_flow.nc", "output file name");
    this->add(steer);

    tcd_schema ohc("ocean_heat_content");
    ohc.add_float("isotherm", 26.0, "the isotherm (degrees C)");
    ohc.add_float("deltaz", 1.0, "integration step (m)");
    ohc.add_float("fill_value", 1.0e20, "value where the isotherm is not found");
    ohc.add_string("interp_type", "linear", "linear or nearest");
    ohc.add_float("rho", 1025.0, "sea water density (kg m-3)");
    ohc.add_float("cp", 3985.0, "sea water specific heat (J kg-1 K-1)");
    ohc.add_int("verbose", 0, "set to non-zero to report progress");
    ohc.add_bool("write_output", false, "write the results to output_file");
    ohc.add_string("output_file", "tcd_ocean_heat_content.nc", "output file name");
    this->add(ohc);
}

// --------------------------------------------------------------------------
void tcd_schema_registry::add(const tcd_schema &schema)
{
    this->schemas[schema.get_name()] = schema;
}

// --------------------------------------------------------------------------
const tcd_schema *tcd_schema_registry::get(const std::string &name) const
{
    auto it = this->schemas.find(name);
    return it == this->schemas.end() ? nullptr : &it->second;
}

// --------------------------------------------------------------------------
int tcd_schema_registry::validate(const std::string &name,
    const tcd_config_block &block, tcd_config_record &rec,
    tcd_warning_log &log, tcd_table *table) const
{
    const tcd_schema *schema = this->get(name);
    if (!schema)
    {
        TCD_ERROR("No schema named \"" << name << "\"")
        return tcd_error::config_error;
    }

    return schema->validate(block, rec, log, table);
}
