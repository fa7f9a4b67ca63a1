#ifndef tcd_schema_h
#define tcd_schema_h

/// @file

#include "tcd_config.h"
#include "tcd_config_block.h"
#include "tcd_table.h"

#include <map>
#include <string>
#include <vector>
#include <variant>

class tcd_warning_log;

/// a validated configuration value
using tcd_config_value = std::variant<bool, long, double, std::string,
    std::vector<double>, std::vector<std::string>>;

/** @brief
 * A fully populated, type checked configuration record produced by
 * tcd_schema::validate.
 *
 * @details
 * The record holds one value for every key declared in the schema, either
 * the value from the input or the declared default, and nothing else. The
 * get methods return 0 when the key
 * exists and holds the requested type, and -1 otherwise. Integer values may
 * be fetched as double.
 */
class TCD_EXPORT tcd_config_record
{
public:
    /// where a value came from
    enum { from_input = 0, from_default = 1 };

    bool has(const std::string &key) const
    { return this->values.count(key); }

    int get(const std::string &key, bool &val) const;
    int get(const std::string &key, long &val) const;
    int get(const std::string &key, int &val) const;
    int get(const std::string &key, double &val) const;
    int get(const std::string &key, std::string &val) const;
    int get(const std::string &key, std::vector<double> &val) const;
    int get(const std::string &key, std::vector<std::string> &val) const;

    /// get the value's origin, or -1 if the key is not present
    int get_origin(const std::string &key) const;

    /// keys in schema order
    const std::vector<std::string> &get_keys() const { return this->keys; }

    unsigned long size() const { return this->keys.size(); }

    void set(const std::string &key, const tcd_config_value &val, int origin);

    void clear();

private:
    template <typename val_t>
    int get_value(const std::string &key, val_t &val) const;

private:
    std::vector<std::string> keys;
    std::map<std::string, tcd_config_value> values;
    std::map<std::string, int> origins;
};

/** @brief
 * Declares the keys, types, required flags and defaults of one kind of
 * configuration block, and validates raw blocks against them.
 *
 * @details
 * For each declared key that is missing from the input a required key is a
 * tcd_error::config_error, while an optional key is filled with its default
 * and a default_value_warning is recorded. Present keys are coerced to the
 * declared type; text that can't be converted is a config_error. A scalar
 * given where a list is declared is promoted to a one element list, a
 * sequence given where a scalar is declared is a config_error. Keys not
 * declared in the schema are left out of the record. They are listed as
 * unrecognized in the table and an unrecognized_key_warning is recorded.
 */
class TCD_EXPORT tcd_schema
{
public:
    /// value types
    enum
    {
        bool_type = 0,
        int_type,
        float_type,
        string_type,
        float_list_type,
        string_list_type
    };

    tcd_schema() = default;
    explicit tcd_schema(const std::string &name) : name(name) {}

    const std::string &get_name() const { return this->name; }

    /// declare a required key
    void add_required(const std::string &key, int type,
        const std::string &description);

    /// declare optional keys with their defaults
    void add_bool(const std::string &key, bool def, const std::string &description);
    void add_int(const std::string &key, long def, const std::string &description);
    void add_float(const std::string &key, double def, const std::string &description);
    void add_string(const std::string &key, const std::string &def,
        const std::string &description);
    void add_float_list(const std::string &key, const std::vector<double> &def,
        const std::string &description);
    void add_string_list(const std::string &key,
        const std::vector<std::string> &def, const std::string &description);

    /// return true if the key is declared
    bool has_key(const std::string &key) const;

    /// get the declared keys in declaration order
    std::vector<std::string> get_keys() const;

    /** validate the block. on success rec holds exactly one entry per
     * declared key, and table, when not null, lists each key
     * with its type, value and origin. defaults that are filled in are
     * recorded in the warning log. returns 0 if successful and
     * tcd_error::config_error otherwise.
     */
    int validate(const tcd_config_block &block, tcd_config_record &rec,
        tcd_warning_log &log, tcd_table *table = nullptr) const;

    /// get the name of a value type
    static const char *get_type_name(int type);

    /// format a value as text
    static std::string to_string(const tcd_config_value &val);

    /// coerce the raw block value at key to the given type
    static int coerce(const tcd_config_block &block, const std::string &key,
        int type, tcd_config_value &val);

private:
    struct key_t
    {
        std::string key;
        int type;
        bool required;
        tcd_config_value def;
        std::string description;
    };

    void add_optional(const std::string &key, int type,
        const tcd_config_value &def, const std::string &description);

private:
    std::string name;
    std::vector<key_t> schema_keys;
};

/** @brief
 * The named schemas used in one run. Constructing the registry declares the
 * built in schemas: variable, experiment, potential_intensity,
 * multiscale_intensity, steering_flow and ocean_heat_content.
 */
class TCD_EXPORT tcd_schema_registry
{
public:
    tcd_schema_registry();

    /// add or replace a schema
    void add(const tcd_schema &schema);

    /// get a schema by name, nullptr if it was not registered
    const tcd_schema *get(const std::string &name) const;

    /** look up the named schema and validate the block with it. returns 0
     * if successful.
     */
    int validate(const std::string &name, const tcd_config_block &block,
        tcd_config_record &rec, tcd_warning_log &log,
        tcd_table *table = nullptr) const;

private:
    std::map<std::string, tcd_schema> schemas;
};

#endif
