#include "kind.hpp"

#include "assert.hpp"

namespace rx
{

namespace
{
    constexpr kind_t kind_parent_table[NUM_KINDS] =
    {
#define KIND(name, parent, str) KIND_##parent,
#include "kind.inc"
#undef KIND
    };

    constexpr char const* kind_name_table[NUM_KINDS] =
    {
#define KIND(name, parent, str) str,
#include "kind.inc"
#undef KIND
    };
} // end anon namespace

kind_t kind_parent(kind_t kind)
{
    passert(kind < NUM_KINDS, (unsigned)kind);
    return kind_parent_table[kind];
}

char const* kind_name(kind_t kind)
{
    passert(kind < NUM_KINDS, (unsigned)kind);
    return kind_name_table[kind];
}

bool kind_isa(kind_t kind, kind_t base)
{
    while(true)
    {
        if(kind == base)
            return true;
        if(kind == KIND_ELEMENT)
            return false;
        kind = kind_parent(kind);
    }
}

std::optional<kind_t> lookup_kind(std::string_view name)
{
    if(name.starts_with(KIND_NAMESPACE))
        name.remove_prefix(KIND_NAMESPACE.size());

    for(unsigned i = 0; i < NUM_KINDS; ++i)
        if(name == kind_name_table[i])
            return kind_t(i);

    return std::nullopt;
}

} // namespace rx
