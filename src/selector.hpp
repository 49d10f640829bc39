#ifndef SELECTOR_HPP
#define SELECTOR_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "kind.hpp"

namespace rx
{

class element_t;
class node_t;

// What a search predicate decides about one element.
enum visit_t : std::uint8_t
{
    VISIT_EXCLUDE, // Skip it, but still search inside it.
    VISIT_INCLUDE, // Collect it, and search inside it.
    VISIT_PRUNE,   // Skip it, and don't search inside it.
};

// Called with the node being searched and one of its elements.
// Throwing anything aborts the search.
using predicate_t = std::function<visit_t(node_t const& container, element_t const& elem)>;

// Either a kind, a kind name like "Token::Literal", or a predicate.
using selector_t = std::variant<kind_t, std::string, predicate_t>;

// Returns nullopt for an out-of-range kind or an empty predicate.
// A name that isn't a kind matches nothing.
std::optional<predicate_t> resolve_selector(selector_t const& want);

} // namespace rx

#endif
