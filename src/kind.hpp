#ifndef KIND_HPP
#define KIND_HPP

// The closed set of element variants, arranged as a single-inheritance
// hierarchy so that selectors can ask "is this a Token?" and match every
// token variant.

#include <cstdint>
#include <optional>
#include <string_view>

namespace rx
{

enum kind_t : std::uint8_t
{
#define KIND(name, parent, str) KIND_##name,
#include "kind.inc"
#undef KIND
    NUM_KINDS,
};

// Selector names may be written with or without this prefix.
constexpr std::string_view KIND_NAMESPACE = "rx::";

kind_t kind_parent(kind_t kind);
char const* kind_name(kind_t kind);

// True if 'kind' is 'base' or derives from it.
bool kind_isa(kind_t kind, kind_t base);

inline bool kind_is_token(kind_t kind) { return kind != KIND_TOKEN && kind_isa(kind, KIND_TOKEN); }
inline bool kind_is_node(kind_t kind) { return kind_isa(kind, KIND_NODE); }

// Resolves "Token::Literal" or "rx::Token::Literal".
std::optional<kind_t> lookup_kind(std::string_view name);

} // namespace rx

#endif
