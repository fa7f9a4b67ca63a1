#ifndef tcd_shared_object_h
#define tcd_shared_object_h

#include <memory>

// convenience macro. every shared tcd class should have the following
// forward declarations
#define TCD_SHARED_OBJECT_FORWARD_DECL(_cls)            \
    class _cls;                                         \
    using p_##_cls = std::shared_ptr<_cls>;             \
    using const_p_##_cls = std::shared_ptr<const _cls>;

/// declares a static New that returns a shared instance of T
#define TCD_STATIC_NEW(T)                               \
                                                        \
/** Returns an instance of T */                         \
static p_##T New()                                      \
{                                                       \
    return p_##T(new T);                                \
}

#endif
