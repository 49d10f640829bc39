#ifndef ERROR_HPP
#define ERROR_HPP

#include <stdexcept>
#include <string>

namespace rx
{

// Thrown on malformed input to the utility layer, e.g. a bad version string.
// Tree navigation and search never throw; they report through return values.
class rx_error_t : public std::runtime_error
{
public:
    explicit rx_error_t(char const* what)
    : std::runtime_error(what)
    {}

    explicit rx_error_t(std::string const& what)
    : std::runtime_error(what)
    {}
};

} // namespace rx

#endif
