#include "options.hpp"

#include "debug_print.hpp"

namespace rx
{

options_t _options;

log_t* trace_log()
{
    return options().verbose ? &stderr_log : nullptr;
}

} // namespace rx
