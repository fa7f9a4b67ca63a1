#ifndef tcd_error_h
#define tcd_error_h

/// @file

#include "tcd_config.h"
#include "tcd_common.h"

#include <string>
#include <vector>
#include <sstream>

/// status codes returned by the diagnostics pipeline
namespace tcd_error
{
/** Non-zero codes identify the kind of failure. The code is returned up the
 * call stack; the message is reported where the failure is detected.
 */
enum
{
    no_error = 0,
    config_error = 1,
    missing_variable_error = 2,
    dependency_error = 3,
    unit_error = 4,
    io_error = 5,
    numerical_error = 6
};

/// get a human readable name for one of the above codes
TCD_EXPORT
const char *get_name(int code);
}

/** @brief
 * Collects the non-fatal conditions encountered during a run so they can be
 * surfaced to the caller after execution completes.
 */
class TCD_EXPORT tcd_warning_log
{
public:
    enum
    {
        rank_deficiency_warning = 1,
        isotherm_not_found_warning = 2,
        default_value_warning = 3,
        parameter_adjusted_warning = 4,
        unrecognized_key_warning = 5
    };

    /// a recorded warning
    struct entry
    {
        int kind;
        std::string source;
        std::string message;
    };

    /// add a warning. source names the component, field or application.
    void record(int kind, const std::string &source, const std::string &message);

    /// append all of the other log's entries to this one
    void append(const tcd_warning_log &other);

    /// get the number of warnings of the given kind
    unsigned long count(int kind) const;

    /// get the total number of warnings
    unsigned long size() const { return this->entries.size(); }

    bool empty() const { return this->entries.empty(); }

    const std::vector<entry> &get_entries() const { return this->entries; }

    void clear() { this->entries.clear(); }

    /// send a summary in human readable form
    void to_stream(std::ostream &os) const;

    /// get the name of a warning kind
    static const char *get_kind_name(int kind);

private:
    std::vector<entry> entries;
};

/** Report a warning with TCD_WARNING and record it in the log. _log is a
 * tcd_warning_log, _kind one of its warning kinds.
 */
#define TCD_RECORD_WARNING(_log, _kind, _source, _msg)                  \
{                                                                       \
    std::ostringstream wss;                                             \
    wss << "" _msg;                                                     \
    TCD_WARNING(<< _source << ": " << wss.str())                        \
    (_log).record(_kind, _source, wss.str());                           \
}

#endif
