#include "tcd_error.h"

#include <map>

namespace tcd_error
{
// --------------------------------------------------------------------------
const char *get_name(int code)
{
    switch (code)
    {
        case no_error: return "no error";
        case config_error: return "ConfigError";
        case missing_variable_error: return "MissingVariableError";
        case dependency_error: return "DependencyError";
        case unit_error: return "UnitError";
        case io_error: return "IOError";
        case numerical_error: return "NumericalError";
    }
    return "UnknownError";
}
}

// --------------------------------------------------------------------------
void tcd_warning_log::record(int kind, const std::string &source,
    const std::string &message)
{
    this->entries.push_back({kind, source, message});
}

// --------------------------------------------------------------------------
void tcd_warning_log::append(const tcd_warning_log &other)
{
    this->entries.insert(this->entries.end(),
        other.entries.begin(), other.entries.end());
}

// --------------------------------------------------------------------------
unsigned long tcd_warning_log::count(int kind) const
{
    unsigned long n = 0;
    for (const entry &e : this->entries)
        n += (e.kind == kind ? 1 : 0);
    return n;
}

// --------------------------------------------------------------------------
const char *tcd_warning_log::get_kind_name(int kind)
{
    switch (kind)
    {
        case rank_deficiency_warning: return "RankDeficiencyWarning";
        case isotherm_not_found_warning: return "IsothermNotFoundWarning";
        case default_value_warning: return "DefaultValueWarning";
        case parameter_adjusted_warning: return "ParameterAdjustedWarning";
        case unrecognized_key_warning: return "UnrecognizedKeyWarning";
    }
    return "Warning";
}

// --------------------------------------------------------------------------
void tcd_warning_log::to_stream(std::ostream &os) const
{
    std::map<int, unsigned long> totals;
    for (const entry &e : this->entries)
        totals[e.kind] += 1;

    os << this->entries.size() << " warnings";
    for (const auto &[kind, n] : totals)
        os << ", " << n << " " << get_kind_name(kind);
    os << std::endl;

    for (const entry &e : this->entries)
    {
        os << "  " << get_kind_name(e.kind) << " " << e.source
            << ": " << e.message << std::endl;
    }
}
