#ifndef VERSION_HPP
#define VERSION_HPP

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace rx
{

// A Perl version number, like 5.006 or 5.008001.
// Stored as fixed-point with six decimal places of fraction.
struct perl_version_t
{
    using int_type = std::uint64_t;

    int_type value;

    static constexpr int_type scale = 1000000; // 6 decimal digits

    constexpr auto operator<=>(perl_version_t const& o) const = default;

    static constexpr perl_version_t make(int_type whole, int_type frac)
        { return { whole * scale + frac }; }
    constexpr int_type whole() const { return value / scale; }
    constexpr int_type frac() const { return value % scale; }

    // Accepts "5", "5.6", "5.010", "5.008001". Throws 'rx_error_t' otherwise.
    static perl_version_t parse(std::string_view str);

    // Prints at least three fractional digits: "5.006", "5.008001".
    std::string to_string() const;
};

// Used for 'perl_version_removed', which usually doesn't exist.
using maybe_version_t = std::optional<perl_version_t>;

// The oldest Perl this library supports.
// Every node is at least this new.
constexpr perl_version_t MINIMUM_PERL = perl_version_t::make(5, 6000);

std::ostream& operator<<(std::ostream& o, perl_version_t v);
std::ostream& operator<<(std::ostream& o, maybe_version_t v);

} // namespace rx

#endif
