#ifndef FINISH_HPP
#define FINISH_HPP

// The lexer's last step, run after the whole tree is built.

namespace rx
{

class node_t;

struct finish_result_t
{
    unsigned failures;             // Parse failures found by 'finalize'.
    unsigned next_capture_number;  // One past the last capture number.
};

// Runs 'finalize', then numbers the captures starting at
// 'options().first_capture_number'.
finish_result_t finish_tree(node_t& root);

} // namespace rx

#endif
