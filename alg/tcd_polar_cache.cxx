#include "tcd_polar_cache.h"

// --------------------------------------------------------------------------
const_p_tcd_polar_field tcd_polar_cache::get(const std::string &tc_id,
    const std::string &field_name, unsigned long level) const
{
    auto it = this->fields.find(key_t(tc_id, field_name, level));
    if (it == this->fields.end())
        return nullptr;
    return it->second;
}

// --------------------------------------------------------------------------
void tcd_polar_cache::set(const std::string &tc_id,
    const std::string &field_name, unsigned long level,
    const const_p_tcd_polar_field &field)
{
    this->fields[key_t(tc_id, field_name, level)] = field;
}

// --------------------------------------------------------------------------
void tcd_polar_cache::erase(const std::string &tc_id)
{
    auto it = this->fields.begin();
    while (it != this->fields.end())
    {
        if (std::get<0>(it->first) == tc_id)
            it = this->fields.erase(it);
        else
            ++it;
    }
}
