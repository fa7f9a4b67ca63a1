#ifndef tcd_common_h
#define tcd_common_h

/// @file

#include "tcd_config.h"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

/** The call signature for the handler TCD_FATAL_ERROR invokes. It is passed
 * the formatted message.
 */
using p_tcd_error_handler = void (*) (const char*);

/// global error handling hooks
namespace tcd_error
{
/// The handler invoked by TCD_FATAL_ERROR. The default is error_message_abort.
extern p_tcd_error_handler error_handler TCD_EXPORT;

/// flush stdout and stderr, send msg to stderr and return
TCD_EXPORT
void error_message(const char *msg);

/// flush stdout and stderr, send msg to stderr and abort
TCD_EXPORT
void error_message_abort(const char *msg);

/** Install a handler for fatal errors. Returns the handler that was
 * installed before the call so that it can be restored.
 */
TCD_EXPORT
p_tcd_error_handler set_error_handler(p_tcd_error_handler handler);
};

/** @brief
 * Names the unit of work the messages of the current thread are about.
 *
 * @details
 * Each level is a short label, a TC id or an application name. When any
 * level is set, messages carry the labels in their header, so that an error
 * reported deep inside a kernel names the TC and application it occurred
 * in. Levels are pushed and popped with tcd_message_scope.
 */
namespace tcd_message_context
{
/// add a level
TCD_EXPORT
void push(const std::string &label);

/// remove the innermost level
TCD_EXPORT
void pop();

/// the levels formatted for a message header, empty when none are set
TCD_EXPORT
const std::string &get();
};

/// pushes a message context level for the lifetime of the object
class TCD_EXPORT tcd_message_scope
{
public:
    explicit tcd_message_scope(const std::string &label)
    { tcd_message_context::push(label); }

    ~tcd_message_scope() { tcd_message_context::pop(); }

    tcd_message_scope(const tcd_message_scope &) = delete;
    void operator=(const tcd_message_scope &) = delete;
};

/// @cond

// the operator<< overloads have to be namespace std in order for
// boost to find them. they are needed for multitoken program options
namespace std
{
/// send a vector to a stream
template <typename T>
std::ostream &operator<<(std::ostream &os, const std::vector<T> &vec)
{
    size_t n = vec.size();
    for (size_t i = 0; i < n; ++i)
        os << (i ? ", " : "") << vec[i];
    return os;
}

/// send a vector of strings to a stream, each quoted
TCD_EXPORT
std::ostream &operator<<(std::ostream &os, const std::vector<std::string> &vec);
}

/** Return non-zero if messages should be colored. They are when stderr is a
 * TTY and the NO_COLOR environment variable is not set.
 */
TCD_EXPORT int use_color();

#define ANSI_RED "\033[1;31;40m"
#define ANSI_GREEN "\033[1;32;40m"
#define ANSI_YELLOW "\033[1;33;40m"
#define ANSI_WHITE "\033[1;37;40m"
#define ANSI_OFF "\033[0m"

#define BEGIN_HL(_color) (use_color()?_color:"")
#define END_HL (use_color()?ANSI_OFF:"")

/// @endcond

/** Send a message into the stream with an ANSI color coded header that
 * includes the source location, the version, and the message context.
 */
#define TCD_MESSAGE(_strm, _head, _head_color, _msg)                    \
_strm                                                                   \
    << BEGIN_HL(_head_color) << _head << END_HL                         \
    << " [" << __FILE__ << ":" << __LINE__                              \
    << " " << TCD_VERSION_DESCR << "]"                                  \
    << tcd_message_context::get() << std::endl                          \
    << BEGIN_HL(_head_color) << _head << END_HL << " "                  \
    << BEGIN_HL(ANSI_WHITE) << "" _msg << END_HL << std::endl;

/** Constructs the error message using TCD_MESSAGE and invokes the
 * error handler.
 */
#define TCD_FATAL_ERROR(_msg)                                           \
{                                                                       \
    std::ostringstream ess;                                             \
    TCD_MESSAGE(ess, "ERROR:", ANSI_RED, _msg)                          \
    tcd_error::error_handler(ess.str().c_str());                        \
}

/// Constructs an error message and sends it to the stderr stream
#define TCD_ERROR(_msg) TCD_MESSAGE(std::cerr, "ERROR:", ANSI_RED, _msg)

/// Constructs a warning message and sends it to the stderr stream
#define TCD_WARNING(_msg) TCD_MESSAGE(std::cerr, "WARNING:", ANSI_YELLOW, _msg)

/// Constructs a status message and sends it to the stderr stream
#define TCD_STATUS(_msg) TCD_MESSAGE(std::cerr, "STATUS:", ANSI_GREEN, _msg)

#endif
