#ifndef DEBUG_PRINT_HPP
#define DEBUG_PRINT_HPP

// Tracing of tree passes and search faults.

#include <cstdio>
#include <mutex>
#include <string>

#include "format.hpp"

namespace rx
{

struct log_t
{
    FILE* stream;
    std::mutex mutex;

    void write(std::string const& msg)
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::fputs(msg.c_str(), stream);
        std::fputc('\n', stream);
        std::fflush(stream);
    }
};

inline log_t stdout_log = { stdout };
inline log_t stderr_log = { stderr };

// Returns the log enabled by 'options_t::verbose', or nullptr.
log_t* trace_log();

} // namespace rx

#define DEBUG_PRINT

#ifdef DEBUG_PRINT
#define dprint(log, ...) ((void)((log) ? ((log)->write(::rx::ezcat(" ", __VA_ARGS__)), 0) : 0))
#else
#define dprint(...) ((void)0)
#endif

#endif
