#ifndef tcd_property_h
#define tcd_property_h

/// @file

#include <vector>
#include <initializer_list>

/// declares a scalar property with set_NAME and get_NAME accessors
#define TCD_PROPERTY(T, NAME)                           \
                                                        \
/** Set the value of the NAME property */               \
void set_##NAME(const T &v)                             \
{                                                       \
    this->NAME = v;                                     \
}                                                       \
                                                        \
/** Get the value of the NAME property */               \
const T &get_##NAME() const                             \
{                                                       \
    return this->NAME;                                  \
}

/** declares a vector property stored in the member NAME##s with accessors
 * for the whole vector and for individual elements
 */
#define TCD_VECTOR_PROPERTY(T, NAME)                                    \
                                                                        \
/** get the size of the NAME vector property */                         \
size_t get_number_of_##NAME##s() const                                 \
{                                                                       \
    return this->NAME##s.size();                                        \
}                                                                       \
                                                                        \
/** append to the NAME vector property */                               \
void append_##NAME(const T &v)                                          \
{                                                                       \
    this->NAME##s.push_back(v);                                         \
}                                                                       \
                                                                        \
/** set the NAME vector property */                                     \
void set_##NAME##s(const std::vector<T> &v)                             \
{                                                                       \
    this->NAME##s = v;                                                  \
}                                                                       \
                                                                        \
/** set the NAME vector property */                                     \
void set_##NAME##s(const std::initializer_list<T> &&l)                  \
{                                                                       \
    this->NAME##s = std::vector<T>(l);                                  \
}                                                                       \
                                                                        \
/** get the i-th element of the NAME vector property */                 \
const T &get_##NAME(size_t i) const                                     \
{                                                                       \
    return this->NAME##s[i];                                            \
}                                                                       \
                                                                        \
/** get the NAME vector property */                                     \
const std::vector<T> &get_##NAME##s() const                             \
{                                                                       \
    return this->NAME##s;                                               \
}                                                                       \
                                                                        \
/** clear the NAME vector property */                                   \
void clear_##NAME##s()                                                  \
{                                                                       \
    this->NAME##s.clear();                                              \
}

#endif
