#ifndef tcd_diagnostic_h
#define tcd_diagnostic_h

/// @file

#include "tcd_config.h"
#include "tcd_shared_object.h"
#include "tcd_property.h"
#include "tcd_program_options.h"
#include "tcd_geo_field.h"
#include "tcd_field_collection.h"
#include "tcd_diagnostic_record.h"
#include "tcd_tc_fix.h"

#include <set>
#include <string>
#include <vector>

class tcd_config_record;
class tcd_unit_system;
class tcd_warning_log;

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_diagnostic)

/// removes copy and assignment from reference counted diagnostics
#define TCD_DIAGNOSTIC_DELETE_COPY_ASSIGN(T)    \
                                                \
    T(const T &src) = delete;                   \
    T(T &&src) = delete;                        \
                                                \
    T &operator=(const T &src) = delete;        \
    T &operator=(T &&src) = delete;

/** @brief
 * The interface to one TC diagnostic application.
 *
 * @details
 * An application is configured from a validated parameter record, or from
 * the command line, names the input fields it requires, and runs in two
 * stages. prepare computes the grid wide products once per run, execute
 * computes the diagnostics of one TC from them. Both stages return 0 when
 * successful or one of the tcd_error codes.
 *
 * Parameters set from the command line take precedence over the parameter
 * record: set_properties marks them as overridden and configure leaves
 * them alone.
 */
class TCD_EXPORT tcd_diagnostic
{
public:
    virtual ~tcd_diagnostic() = default;

    TCD_DIAGNOSTIC_DELETE_COPY_ASSIGN(tcd_diagnostic)

    /// the name of the class
    virtual const char *get_class_name() const = 0;

    /** the application name, which is also the name of its schema, e.g.
     * potential_intensity
     */
    virtual const char *get_application_name() const = 0;

#if defined(TCD_HAS_BOOST)
    /// add the diagnostic's parameters to the description object
    virtual void get_properties_description(const std::string &prefix,
        options_description &opts);

    /// set the diagnostic's parameters from the variables map
    virtual void set_properties(const std::string &prefix,
        variables_map &opts);
#endif

    /// set to a non-zero value to report progress
    TCD_PROPERTY(int, verbose)

    /// set to a non-zero value to write the results
    TCD_PROPERTY(int, write_output)

    /// path of the file written when write_output is set
    TCD_PROPERTY(std::string, output_file)

    /** initialize the parameters from a validated record. returns 0 if
     * successful and tcd_error::config_error if a value has the wrong type
     * or the parameters are invalid.
     */
    virtual int configure(const tcd_config_record &rec);

    /// the names of the fields the application reads
    virtual std::vector<std::string> get_required_inputs() const = 0;

    /// the names of fields that are used when present
    virtual std::vector<std::string> get_optional_inputs() const
    { return std::vector<std::string>(); }

    /** compute the grid wide products. record receives the fields to be
     * published for the whole grid.
     */
    virtual int prepare(const tcd_field_collection &fields,
        const tcd_unit_system &units, tcd_warning_log &log,
        p_tcd_diagnostic_record &record) = 0;

    /// compute the diagnostics of one TC
    virtual int execute(const tcd_tc_fix &fix, const tcd_unit_system &units,
        tcd_warning_log &log, p_tcd_diagnostic_record &record) = 0;

    /// note that a parameter was set from the command line
    void mark_overridden(const std::string &name)
    { this->overridden.insert(name); }

    /// return true if the parameter was set from the command line
    bool is_overridden(const std::string &name) const
    { return this->overridden.count(name); }

protected:
    tcd_diagnostic();

    /** get the named field converted to the given units. returns 0 if
     * successful, the field's error code if it failed to resolve,
     * tcd_error::missing_variable_error if it is not in the collection, and
     * tcd_error::unit_error if it can't be converted.
     */
    int get_field(const tcd_field_collection &fields, const std::string &name,
        const std::string &to_units, const tcd_unit_system &units,
        const_p_tcd_geo_field &field) const;

    /** set val from the record unless the parameter was overridden on the
     * command line. returns 0 if successful.
     */
    template <typename val_t>
    int get_parameter(const tcd_config_record &rec, const std::string &key,
        val_t &val) const;

    int get_parameter(const tcd_config_record &rec, const std::string &key,
        unsigned int &val) const;

    int get_parameter(const tcd_config_record &rec, const std::string &key,
        unsigned long &val) const;

    /** interpolate the 2-D field to the TC center. returns 0 if successful
     * and -1 if the center is outside the grid or next to a missing value.
     */
    static int sample(const tcd_geo_field &field, const tcd_tc_fix &fix,
        double &val);

protected:
    int verbose;
    int write_output;
    std::string output_file;

private:
    std::set<std::string> overridden;
};

#endif
