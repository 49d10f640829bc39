#include "node.hpp"

#include <algorithm>
#include <exception>

#include "assert.hpp"
#include "debug_print.hpp"

namespace rx
{

std::unique_ptr<node_t> node_t::make(element_list_t children)
{
    if(!all_elements(children))
        return nullptr;
    return std::unique_ptr<node_t>(new node_t(KIND_NODE, std::move(children)));
}

node_t::node_t(kind_t kind, element_list_t children)
: element_t(kind)
{
    passert(kind_is_node(kind), rx::kind_name(kind));

    m_children.reserve(children.size());
    for(std::unique_ptr<element_t>& elem : children)
    {
        adopt(*elem);
        m_children.push_back(std::move(elem));
    }
}

bool node_t::all_elements(element_list_t const& list)
{
    return std::all_of(list.begin(), list.end(),
                       [](std::unique_ptr<element_t> const& elem) { return bool(elem); });
}

void node_t::adopt(element_t& elem)
{
    passert(!elem.m_parent, elem.kind_name());
    elem.m_parent = this;
}

element_t* node_t::child(int i) const
{
    int const size = m_children.size();
    if(i < 0)
        i += size;
    if(i < 0 || i >= size)
        return nullptr;
    return m_children[i].get();
}

element_vec_t node_t::children() const
{
    element_vec_t vec;
    vec.reserve(m_children.size());
    for(auto const& elem : m_children)
        vec.push_back(elem.get());
    return vec;
}

element_t* node_t::first_element() const
{
    element_vec_t const elems = elements();
    return elems.empty() ? nullptr : elems.front();
}

element_t* node_t::last_element() const
{
    element_vec_t const elems = elements();
    return elems.empty() ? nullptr : elems.back();
}

element_t* node_t::schild(int i) const
{
    int const size = m_children.size();

    if(i >= 0)
    {
        for(int loc = 0; loc < size; ++loc)
        {
            if(!m_children[loc]->significant())
                continue;
            if(--i >= 0)
                continue;
            return m_children[loc].get();
        }
    }
    else
    {
        for(int loc = size - 1; loc >= 0; --loc)
        {
            if(!m_children[loc]->significant())
                continue;
            if(i++ < -1)
                continue;
            return m_children[loc].get();
        }
    }

    return nullptr;
}

element_vec_t node_t::schildren() const
{
    element_vec_t vec;
    for(auto const& elem : m_children)
        if(elem->significant())
            vec.push_back(elem.get());
    return vec;
}

std::size_t node_t::num_schildren() const
{
    return std::count_if(m_children.begin(), m_children.end(),
                         [](std::unique_ptr<element_t> const& elem) { return elem->significant(); });
}

bool node_t::contains(element_t const* elem) const
{
    if(!elem)
        return false;

    for(node_t const* node = elem->parent(); node; node = node->parent())
        if(node == this)
            return true;

    return false;
}

element_vec_t node_t::tokens() const
{
    element_vec_t vec;
    for(element_t* elem : elements())
    {
        if(node_t const* node = elem->as_node())
        {
            element_vec_t const sub = node->tokens();
            vec.insert(vec.end(), sub.begin(), sub.end());
        }
        else
            vec.push_back(elem);
    }
    return vec;
}

std::optional<element_vec_t> node_t::find(selector_t const& want) const
{
    std::optional<predicate_t> const pred = resolve_selector(want);
    if(!pred)
        return std::nullopt;
    return find_impl(*pred);
}

// A fault in this node's own predicate calls fails the whole call.
// A failed recursive call only loses that subtree's matches.
std::optional<element_vec_t> node_t::find_impl(predicate_t const& pred) const
{
    element_vec_t found;

    for(element_t* elem : elements())
    {
        visit_t result;
        try
        {
            result = pred(*this, *elem);
        }
        catch(std::exception const& e)
        {
            dprint(trace_log(), "find: predicate threw on", elem->kind_name(),
                   fmt("\"%\":", elem->content()), e.what());
            return std::nullopt;
        }
        catch(...)
        {
            dprint(trace_log(), "find: predicate threw on", elem->kind_name(),
                   fmt("\"%\":", elem->content()), "unknown exception");
            return std::nullopt;
        }

        if(result == VISIT_INCLUDE)
            found.push_back(elem);

        if(result == VISIT_PRUNE)
            continue;

        if(node_t const* node = elem->as_node())
            if(std::optional<element_vec_t> sub = node->find_impl(pred))
                found.insert(found.end(), sub->begin(), sub->end());
    }

    return found;
}

std::optional<element_t*> node_t::find_first(selector_t const& want) const
{
    std::optional<predicate_t> const pred = resolve_selector(want);
    if(!pred)
        return std::nullopt;
    return find_first_impl(*pred);
}

// Unlike 'find_impl', faults anywhere in the subtree fail the call.
std::optional<element_t*> node_t::find_first_impl(predicate_t const& pred) const
{
    for(element_t* elem : elements())
    {
        visit_t result;
        try
        {
            result = pred(*this, *elem);
        }
        catch(std::exception const& e)
        {
            dprint(trace_log(), "find_first: predicate threw on", elem->kind_name(),
                   fmt("\"%\":", elem->content()), e.what());
            return std::nullopt;
        }
        catch(...)
        {
            dprint(trace_log(), "find_first: predicate threw on", elem->kind_name(),
                   fmt("\"%\":", elem->content()), "unknown exception");
            return std::nullopt;
        }

        if(result == VISIT_INCLUDE)
            return elem;

        if(result == VISIT_PRUNE)
            continue;

        if(node_t const* node = elem->as_node())
        {
            std::optional<element_t*> const sub = node->find_first_impl(pred);
            if(!sub || *sub)
                return sub;
        }
    }

    return std::optional<element_t*>(nullptr);
}

std::optional<nav_step_t> node_t::child_nav(element_t const& child) const
{
    if(child.parent() != this)
        return std::nullopt;
    return locate(child);
}

std::optional<nav_step_t> node_t::locate(element_t const& child) const
{
    for(std::size_t i = 0; i < m_children.size(); ++i)
        if(m_children[i].get() == &child)
            return nav_step_t{ NAV_CHILD, int(i) };
    return std::nullopt;
}

element_t* node_t::step(nav_step_t where) const
{
    if(where.method != NAV_CHILD)
        return nullptr;
    return child(where.index);
}

element_t* node_t::follow(nav_path_t const& path)
{
    element_t* elem = this;
    for(nav_step_t const& where : path)
    {
        node_t const* node = elem->as_node();
        if(!node)
            return nullptr;
        elem = node->step(where);
        if(!elem)
            return nullptr;
    }
    return elem;
}

std::string node_t::content() const
{
    std::string str;
    for(element_t const* elem : elements())
        str += elem->content();
    return str;
}

perl_version_t node_t::perl_version_introduced() const
{
    perl_version_t version = MINIMUM_PERL;
    for(element_t const* elem : elements())
        version = std::max(version, elem->perl_version_introduced());
    return version;
}

maybe_version_t node_t::perl_version_removed() const
{
    maybe_version_t min;
    for(element_t const* elem : elements())
        if(maybe_version_t const version = elem->perl_version_removed())
            if(!min || *version < *min)
                min = version;
    return min;
}

element_vec_t node_t::elements() const
{
    return children();
}

unsigned node_t::finalize()
{
    unsigned failures = 0;
    for(element_t* elem : elements())
        failures += elem->finalize();
    return failures;
}

unsigned node_t::record_capture_number(unsigned number)
{
    for(auto const& elem : m_children)
        number = elem->record_capture_number(number);
    return number;
}

} // namespace rx
