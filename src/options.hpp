#ifndef OPTIONS_HPP
#define OPTIONS_HPP

// Process-wide settings.
// Written once at start-up, before any tree is built.

namespace rx
{

struct options_t
{
    bool verbose = false;

    // The counter handed to the root by 'finish_tree'.
    unsigned first_capture_number = 1;
};

extern options_t _options;
inline options_t const& options() { return _options; }

} // namespace rx

#endif
