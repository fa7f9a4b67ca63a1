#ifndef tcd_polar_cache_h
#define tcd_polar_cache_h

/// @file

#include "tcd_config.h"
#include "tcd_shared_object.h"
#include "tcd_polar_field.h"

#include <map>
#include <string>
#include <tuple>

TCD_SHARED_OBJECT_FORWARD_DECL(tcd_polar_cache)

/// Projected fields of one run keyed by TC id, field name and level
class TCD_EXPORT tcd_polar_cache
{
public:
    TCD_STATIC_NEW(tcd_polar_cache)

    /// get a cached field, nullptr if there is none
    const_p_tcd_polar_field get(const std::string &tc_id,
        const std::string &field_name, unsigned long level) const;

    /// add a field, replacing any earlier one with the same key
    void set(const std::string &tc_id, const std::string &field_name,
        unsigned long level, const const_p_tcd_polar_field &field);

    /// drop the fields of one TC
    void erase(const std::string &tc_id);

    unsigned long size() const { return this->fields.size(); }

    void clear() { this->fields.clear(); }

protected:
    tcd_polar_cache() = default;

private:
    using key_t = std::tuple<std::string, std::string, unsigned long>;
    std::map<key_t, const_p_tcd_polar_field> fields;
};

#endif
