#include "finish.hpp"

#include "debug_print.hpp"
#include "node.hpp"
#include "options.hpp"

namespace rx
{

finish_result_t finish_tree(node_t& root)
{
    finish_result_t result;
    result.failures = root.finalize();
    result.next_capture_number = root.record_capture_number(options().first_capture_number);

    dprint(trace_log(), "finish:", fmt("\"%\"", root.content()),
           "failures", result.failures,
           "captures", result.next_capture_number - options().first_capture_number);

    return result;
}

} // namespace rx
