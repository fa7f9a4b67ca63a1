#include "tcd_config_block.h"

// --------------------------------------------------------------------------
tcd_config_block::tcd_config_block(const tcd_config_block &other)
{
    *this = other;
}

// --------------------------------------------------------------------------
tcd_config_block &tcd_config_block::operator=(const tcd_config_block &other)
{
    if (this == &other)
        return *this;

    this->entries.clear();
    this->entries.reserve(other.entries.size());

    for (const entry_t &ent : other.entries)
    {
        entry_t cpy;
        cpy.key = ent.key;
        cpy.kind = ent.kind;
        cpy.values = ent.values;
        if (ent.block)
            cpy.block.reset(new tcd_config_block(*ent.block));
        this->entries.push_back(std::move(cpy));
    }

    return *this;
}

// --------------------------------------------------------------------------
tcd_config_block::entry_t *tcd_config_block::find(const std::string &key)
{
    for (entry_t &ent : this->entries)
    {
        if (ent.key == key)
            return &ent;
    }
    return nullptr;
}

// --------------------------------------------------------------------------
const tcd_config_block::entry_t *tcd_config_block::find(
    const std::string &key) const
{
    for (const entry_t &ent : this->entries)
    {
        if (ent.key == key)
            return &ent;
    }
    return nullptr;
}

// --------------------------------------------------------------------------
tcd_config_block::entry_t &tcd_config_block::find_or_insert(
    const std::string &key)
{
    entry_t *ent = this->find(key);
    if (ent)
        return *ent;

    this->entries.emplace_back();
    this->entries.back().key = key;
    return this->entries.back();
}

// --------------------------------------------------------------------------
void tcd_config_block::set(const std::string &key, const std::string &value)
{
    entry_t &ent = this->find_or_insert(key);
    ent.kind = scalar_value;
    ent.values.assign(1, value);
    ent.block.reset();
}

// --------------------------------------------------------------------------
void tcd_config_block::set(const std::string &key,
    const std::vector<std::string> &values)
{
    entry_t &ent = this->find_or_insert(key);
    ent.kind = sequence_value;
    ent.values = values;
    ent.block.reset();
}

// --------------------------------------------------------------------------
void tcd_config_block::set_block(const std::string &key,
    const tcd_config_block &block)
{
    entry_t &ent = this->find_or_insert(key);
    ent.kind = block_value;
    ent.values.clear();
    ent.block.reset(new tcd_config_block(block));
}

// --------------------------------------------------------------------------
bool tcd_config_block::has(const std::string &key) const
{
    return this->find(key) != nullptr;
}

// --------------------------------------------------------------------------
int tcd_config_block::get_kind(const std::string &key) const
{
    const entry_t *ent = this->find(key);
    return ent ? ent->kind : -1;
}

// --------------------------------------------------------------------------
int tcd_config_block::get(const std::string &key, std::string &value) const
{
    const entry_t *ent = this->find(key);
    if (!ent || (ent->kind != scalar_value))
        return -1;

    value = ent->values[0];
    return 0;
}

// --------------------------------------------------------------------------
int tcd_config_block::get(const std::string &key,
    std::vector<std::string> &values) const
{
    const entry_t *ent = this->find(key);
    if (!ent || (ent->kind == block_value))
        return -1;

    values = ent->values;
    return 0;
}

// --------------------------------------------------------------------------
const tcd_config_block *tcd_config_block::get_block(const std::string &key) const
{
    const entry_t *ent = this->find(key);
    if (!ent || (ent->kind != block_value))
        return nullptr;

    return ent->block.get();
}

// --------------------------------------------------------------------------
int tcd_config_block::remove(const std::string &key)
{
    auto it = this->entries.begin();
    auto end = this->entries.end();
    for (; it != end; ++it)
    {
        if (it->key == key)
        {
            this->entries.erase(it);
            return 0;
        }
    }
    return -1;
}

// --------------------------------------------------------------------------
std::vector<std::string> tcd_config_block::get_keys() const
{
    std::vector<std::string> keys;
    keys.reserve(this->entries.size());
    for (const entry_t &ent : this->entries)
        keys.push_back(ent.key);
    return keys;
}

// --------------------------------------------------------------------------
void tcd_config_block::to_stream(std::ostream &os, int indent) const
{
    std::string pad(indent, ' ');
    for (const entry_t &ent : this->entries)
    {
        os << pad << ent.key << ":";
        if (ent.kind == scalar_value)
        {
            os << " " << ent.values[0] << std::endl;
        }
        else if (ent.kind == sequence_value)
        {
            os << " [";
            size_t n = ent.values.size();
            for (size_t i = 0; i < n; ++i)
                os << (i ? ", " : "") << ent.values[i];
            os << "]" << std::endl;
        }
        else
        {
            os << std::endl;
            ent.block->to_stream(os, indent + 2);
        }
    }
}
