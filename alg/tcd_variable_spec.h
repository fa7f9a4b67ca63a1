#ifndef tcd_variable_spec_h
#define tcd_variable_spec_h

/// @file

#include "tcd_config.h"
#include "tcd_config_block.h"

#include <string>
#include <vector>
#include <ostream>

class tcd_config_record;
class tcd_schema_registry;
class tcd_warning_log;

/** @brief
 * Declares how to obtain one named field, either by reading it from a file
 * or by deriving it from other variables.
 *
 * @details
 * | Member       | Description                                               |
 * | ------       | -----------                                               |
 * | key          | the variable's name in the inputs document, used by       |
 * |              | derived variables to name their inputs                    |
 * | name         | short name used in outputs, defaults to key               |
 * | ncfile       | path of the file holding a file sourced variable          |
 * | ncvarname    | name of the array in that file                            |
 * | units        | units of the values after scaling                         |
 * | flip_lat     | reverse the latitude axis                                 |
 * | flip_z       | reverse the vertical axis                                 |
 * | squeeze      | drop the length one axis squeeze_axis                     |
 * | scale_mult   | values are transformed by v*scale_mult + scale_add        |
 * | coords       | optional axis names, slowest varying first                |
 * | method       | the derived field method of a derived variable            |
 * | inputs       | keys of the variables the method consumes                 |
 */
struct TCD_EXPORT tcd_variable_spec
{
    tcd_variable_spec() : key(), name(), description(), source(file_source),
        ncfile(), ncvarname(), units(), flip_lat(0), flip_z(0), squeeze(0),
        squeeze_axis(0), scale_mult(1.0), scale_add(0.0), coords(), method(),
        inputs()
    {}

    enum { file_source = 0, derived_source = 1 };

    bool is_derived() const { return this->source == derived_source; }

    /** initialize from a validated variable record. a file sourced
     * variable without ncfile or ncvarname is a tcd_error::config_error.
     * returns 0 if successful.
     */
    static int from_record(const std::string &key,
        const tcd_config_record &rec, tcd_variable_spec &spec);

    /** validate each mapping in the document against the variable schema
     * and initialize a spec from it. top level keys holding scalars are not
     * variables and are skipped. returns 0 if all variables were valid, and
     * the last error code otherwise. valid variables are returned even when
     * others fail.
     */
    static int from_document(const tcd_config_block &doc,
        const tcd_schema_registry &schemas, tcd_warning_log &log,
        std::vector<tcd_variable_spec> &specs, int verbose = 0);

    /** load a variables document from a YAML file and validate each of its
     * variables. returns 0 if successful, tcd_error::io_error if the file
     * can't be read. see from_document.
     */
    static int from_file(const std::string &file_name,
        const tcd_schema_registry &schemas, tcd_warning_log &log,
        std::vector<tcd_variable_spec> &specs, int verbose = 0);

    /// send to the stream in human readable form
    void to_stream(std::ostream &os) const;

    std::string key;
    std::string name;
    std::string description;
    int source;
    std::string ncfile;
    std::string ncvarname;
    std::string units;
    int flip_lat;
    int flip_z;
    int squeeze;
    int squeeze_axis;
    double scale_mult;
    double scale_add;
    std::vector<std::string> coords;
    std::string method;
    std::vector<std::string> inputs;
};

inline
std::ostream &operator<<(std::ostream &os, const tcd_variable_spec &spec)
{
    spec.to_stream(os);
    return os;
}

#endif
