#include "tcd_common.h"

#include <cstdio>
#include <cstdlib>
#include <unistd.h>

namespace std
{
// **************************************************************************
std::ostream &operator<<(std::ostream &os, const std::vector<std::string> &vec)
{
    size_t n = vec.size();
    for (size_t i = 0; i < n; ++i)
        os << (i ? ", \"" : "\"") << vec[i] << "\"";
    return os;
}
}

// **************************************************************************
int use_color()
{
    static int color = -1;
    if (color < 0)
        color = isatty(fileno(stderr)) && !getenv("NO_COLOR");
    return color;
}

namespace
{
// the context levels of this thread and their formatted form
struct message_context
{
    std::vector<std::string> levels;
    std::string header;

    void update()
    {
        this->header.clear();
        size_t n = this->levels.size();
        for (size_t i = 0; i < n; ++i)
            this->header += (i ? " " : " (") + this->levels[i];
        if (n)
            this->header += ")";
    }
};

message_context &get_message_context()
{
    thread_local message_context ctx;
    return ctx;
}
}

namespace tcd_message_context
{
// **************************************************************************
void push(const std::string &label)
{
    message_context &ctx = get_message_context();
    ctx.levels.push_back(label);
    ctx.update();
}

// **************************************************************************
void pop()
{
    message_context &ctx = get_message_context();
    if (!ctx.levels.empty())
    {
        ctx.levels.pop_back();
        ctx.update();
    }
}

// **************************************************************************
const std::string &get()
{
    return get_message_context().header;
}
};

namespace tcd_error
{
// **************************************************************************
void error_message(const char *msg)
{
    std::cout.flush();
    std::cerr.flush();

    std::cerr << std::endl << msg << std::endl;
}

// **************************************************************************
void error_message_abort(const char *msg)
{
    tcd_error::error_message(msg);
    std::cerr << "aborting ... " << std::endl;
    abort();
}

// **************************************************************************
p_tcd_error_handler set_error_handler(p_tcd_error_handler handler)
{
    p_tcd_error_handler prev = tcd_error::error_handler;
    tcd_error::error_handler = handler;
    return prev;
}

// global error handler instance
p_tcd_error_handler error_handler = error_message_abort;
};
