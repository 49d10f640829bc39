#include "selector.hpp"

#include "element.hpp"

namespace rx
{

namespace
{
    predicate_t kind_predicate(kind_t kind)
    {
        return [kind](node_t const&, element_t const& elem) -> visit_t
        {
            return elem.isa(kind) ? VISIT_INCLUDE : VISIT_EXCLUDE;
        };
    }
} // end anon namespace

std::optional<predicate_t> resolve_selector(selector_t const& want)
{
    if(kind_t const* kind = std::get_if<kind_t>(&want))
    {
        if(*kind >= NUM_KINDS)
            return std::nullopt;
        return kind_predicate(*kind);
    }

    if(std::string const* name = std::get_if<std::string>(&want))
    {
        if(std::optional<kind_t> kind = lookup_kind(*name))
            return kind_predicate(*kind);

        // No element is of an unknown kind, so nothing matches.
        return [](node_t const&, element_t const&) { return VISIT_EXCLUDE; };
    }

    predicate_t const& pred = std::get<predicate_t>(want);
    if(!pred)
        return std::nullopt;
    return pred;
}

} // namespace rx
