#ifndef tcd_config_block_h
#define tcd_config_block_h

/// @file

#include "tcd_config.h"

#include <string>
#include <vector>
#include <memory>
#include <ostream>

/** @brief
 * An ordered key/value mapping holding one raw configuration document, or
 * one section of it, before validation.
 *
 * @details
 * Values are kept as text exactly as they were given. A value is either a
 * scalar, a sequence of scalars, or a nested block. Keys keep the order in
 * which they were set. Setting an existing key replaces its value in place.
 */
class TCD_EXPORT tcd_config_block
{
public:
    tcd_config_block() = default;
    ~tcd_config_block() = default;

    tcd_config_block(const tcd_config_block &other);
    tcd_config_block &operator=(const tcd_config_block &other);

    tcd_config_block(tcd_config_block &&) = default;
    tcd_config_block &operator=(tcd_config_block &&) = default;

    /// kinds of values
    enum { scalar_value = 0, sequence_value = 1, block_value = 2 };

    /// set a scalar value
    void set(const std::string &key, const std::string &value);

    /// set a sequence value
    void set(const std::string &key, const std::vector<std::string> &values);

    /// set a nested block
    void set_block(const std::string &key, const tcd_config_block &block);

    /// return true if the key is present
    bool has(const std::string &key) const;

    /// get the kind of value stored at key, or -1 if there is no such key
    int get_kind(const std::string &key) const;

    /** get a scalar value. returns 0 if the key holds a scalar and -1
     * otherwise.
     */
    int get(const std::string &key, std::string &value) const;

    /** get a sequence value. a scalar is returned as a one element sequence.
     * returns 0 if successful.
     */
    int get(const std::string &key, std::vector<std::string> &values) const;

    /// get a nested block, or nullptr if the key does not hold a block
    const tcd_config_block *get_block(const std::string &key) const;

    /// remove a key. returns 0 if the key was present.
    int remove(const std::string &key);

    /// get the keys in the order they were set
    std::vector<std::string> get_keys() const;

    unsigned long size() const { return this->entries.size(); }
    bool empty() const { return this->entries.empty(); }

    void clear() { this->entries.clear(); }

    /// send to the stream in a YAML like layout
    void to_stream(std::ostream &os, int indent = 0) const;

private:
    struct entry_t
    {
        std::string key;
        int kind;
        std::vector<std::string> values;
        std::unique_ptr<tcd_config_block> block;
    };

    entry_t *find(const std::string &key);
    const entry_t *find(const std::string &key) const;
    entry_t &find_or_insert(const std::string &key);

private:
    std::vector<entry_t> entries;
};

inline
std::ostream &operator<<(std::ostream &os, const tcd_config_block &block)
{
    block.to_stream(os);
    return os;
}

#endif
