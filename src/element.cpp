#include "element.hpp"

#include "format.hpp"
#include "node.hpp"

namespace rx
{

char const* nav_method_name(nav_method_t method)
{
    switch(method)
    {
    case NAV_CHILD:  return "child";
    case NAV_START:  return "start";
    case NAV_TYPE:   return "type";
    case NAV_FINISH: return "finish";
    }
    return "?";
}

std::ostream& operator<<(std::ostream& o, nav_step_t step)
{
    o << nav_method_name(step.method) << '(' << step.index << ')';
    return o;
}

std::string to_string(nav_path_t const& path)
{
    std::string str;
    for(nav_step_t const& step : path)
    {
        if(!str.empty())
            str.push_back(' ');
        str += fmt("%", step);
    }
    return str;
}

node_t* element_t::as_node()
{
    return kind_is_node(m_kind) ? static_cast<node_t*>(this) : nullptr;
}

node_t const* element_t::as_node() const
{
    return kind_is_node(m_kind) ? static_cast<node_t const*>(this) : nullptr;
}

element_t* element_t::top()
{
    element_t* elem = this;
    while(elem->m_parent)
        elem = elem->m_parent;
    return elem;
}

element_t const* element_t::top() const
{
    element_t const* elem = this;
    while(elem->m_parent)
        elem = elem->m_parent;
    return elem;
}

std::optional<nav_step_t> element_t::my_index() const
{
    if(!m_parent)
        return std::nullopt;
    return m_parent->child_nav(*this);
}

nav_path_t element_t::nav() const
{
    nav_path_t path;
    for(element_t const* elem = this; elem->m_parent; elem = elem->m_parent)
        if(std::optional<nav_step_t> where = elem->my_index())
            path.insert(path.begin(), *where);
    return path;
}

element_t* element_t::sibling(int offset) const
{
    std::optional<nav_step_t> where = my_index();
    if(!where || where->index + offset < 0)
        return nullptr;
    where->index += offset;
    return m_parent->step(*where);
}

element_t* element_t::ssibling(int direction) const
{
    std::optional<nav_step_t> const where = my_index();
    if(!where || where->method != NAV_CHILD)
        return nullptr;

    int const size = m_parent->num_children();
    for(int i = where->index + direction; i >= 0 && i < size; i += direction)
    {
        element_t* elem = m_parent->child(i);
        if(elem->significant())
            return elem;
    }

    return nullptr;
}

element_t* element_t::next_sibling() const { return sibling(1); }
element_t* element_t::previous_sibling() const { return sibling(-1); }
element_t* element_t::snext_sibling() const { return ssibling(1); }
element_t* element_t::sprevious_sibling() const { return ssibling(-1); }

bool element_t::ancestor_of(element_t const* elem) const
{
    if(!elem)
        return false;
    if(elem == this)
        return true;
    node_t const* node = as_node();
    return node && node->contains(elem);
}

bool element_t::descendant_of(element_t const* elem) const
{
    return elem && elem->ancestor_of(this);
}

} // namespace rx
