#include "structure.hpp"

#include "debug_print.hpp"

namespace rx
{

std::unique_ptr<structure_t> structure_t::make(
    kind_t kind, std::unique_ptr<element_t> start, std::unique_ptr<element_t> type,
    element_list_t children, std::unique_ptr<element_t> finish)
{
    if(kind != KIND_STRUCTURE && kind != KIND_STRUCTURE_REGEXP)
        return nullptr;
    if(!all_elements(children))
        return nullptr;
    return std::unique_ptr<structure_t>(new structure_t(
        kind, std::move(start), std::move(type), std::move(children), std::move(finish)));
}

structure_t::structure_t(kind_t kind, std::unique_ptr<element_t> start, std::unique_ptr<element_t> type,
                         element_list_t children, std::unique_ptr<element_t> finish)
: node_t(kind, std::move(children))
, m_start(std::move(start))
, m_type(std::move(type))
, m_finish(std::move(finish))
{
    for(element_t* delim : { m_start.get(), m_type.get(), m_finish.get() })
        if(delim)
            adopt(*delim);
}

element_vec_t structure_t::elements() const
{
    element_vec_t vec;
    if(m_start)
        vec.push_back(m_start.get());
    if(m_type)
        vec.push_back(m_type.get());
    element_vec_t const kids = children();
    vec.insert(vec.end(), kids.begin(), kids.end());
    if(m_finish)
        vec.push_back(m_finish.get());
    return vec;
}

element_t* structure_t::step(nav_step_t where) const
{
    switch(where.method)
    {
    case NAV_START:  return start(where.index);
    case NAV_TYPE:   return type(where.index);
    case NAV_FINISH: return finish(where.index);
    default:         return node_t::step(where);
    }
}

std::optional<nav_step_t> structure_t::locate(element_t const& child) const
{
    if(&child == m_start.get())
        return nav_step_t{ NAV_START, 0 };
    if(&child == m_type.get())
        return nav_step_t{ NAV_TYPE, 0 };
    if(&child == m_finish.get())
        return nav_step_t{ NAV_FINISH, 0 };
    return node_t::locate(child);
}

std::unique_ptr<capture_t> capture_t::make(
    std::unique_ptr<element_t> start, std::unique_ptr<element_t> type,
    element_list_t children, std::unique_ptr<element_t> finish)
{
    if(!all_elements(children))
        return nullptr;
    return std::unique_ptr<capture_t>(new capture_t(
        KIND_STRUCTURE_CAPTURE, {}, std::move(start), std::move(type),
        std::move(children), std::move(finish)));
}

std::unique_ptr<capture_t> capture_t::make_named(
    std::string name, std::unique_ptr<element_t> start, std::unique_ptr<element_t> type,
    element_list_t children, std::unique_ptr<element_t> finish)
{
    if(name.empty() || !all_elements(children))
        return nullptr;
    return std::unique_ptr<capture_t>(new capture_t(
        KIND_STRUCTURE_NAMED_CAPTURE, std::move(name), std::move(start), std::move(type),
        std::move(children), std::move(finish)));
}

capture_t::capture_t(kind_t kind, std::string name, std::unique_ptr<element_t> start,
                     std::unique_ptr<element_t> type, element_list_t children,
                     std::unique_ptr<element_t> finish)
: structure_t(kind, std::move(start), std::move(type), std::move(children), std::move(finish))
, m_name(std::move(name))
{}

unsigned capture_t::record_capture_number(unsigned number)
{
    m_number = number;
    dprint(trace_log(), "capture", number, m_name);
    return structure_t::record_capture_number(number + 1);
}

} // namespace rx
