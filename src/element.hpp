#ifndef ELEMENT_HPP
#define ELEMENT_HPP

// The base of everything that can be placed in a regexp tree:
// leaf tokens (token_t) and containers (node_t).

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <boost/container/small_vector.hpp>

#include "kind.hpp"
#include "version.hpp"

namespace bc = ::boost::container;

namespace rx
{

class element_t;
class node_t;

// Borrowed pointers, in document order. The tree owns the elements.
using element_vec_t = bc::small_vector<element_t*, 8>;

// Owning pointers, used to hand children to a node factory.
using element_list_t = std::vector<std::unique_ptr<element_t>>;

template<typename... Ts>
element_list_t make_element_list(std::unique_ptr<Ts>&&... elems)
{
    element_list_t list;
    list.reserve(sizeof...(Ts));
    (list.push_back(std::move(elems)), ...);
    return list;
}

// Which accessor of the parent an element is reached through.
enum nav_method_t : std::uint8_t
{
    NAV_CHILD,
    NAV_START,
    NAV_TYPE,
    NAV_FINISH,
};

char const* nav_method_name(nav_method_t method);

struct nav_step_t
{
    nav_method_t method;
    int index;

    constexpr bool operator==(nav_step_t const& o) const = default;
};

using nav_path_t = bc::small_vector<nav_step_t, 8>;

std::ostream& operator<<(std::ostream& o, nav_step_t step);
std::string to_string(nav_path_t const& path);

class element_t
{
friend class node_t;
public:
    element_t(element_t const&) = delete;
    element_t& operator=(element_t const&) = delete;
    virtual ~element_t() = default;

    kind_t kind() const { return m_kind; }
    char const* kind_name() const { return rx::kind_name(m_kind); }
    bool isa(kind_t base) const { return kind_isa(m_kind, base); }

    // Returns nullptr if this isn't a container.
    node_t* as_node();
    node_t const* as_node() const;

    // The owning node, or nullptr for a root.
    node_t* parent() const { return m_parent; }

    element_t* top();
    element_t const* top() const;

    // The literal text this element was parsed from.
    virtual std::string content() const = 0;

    // Insignificant elements (whitespace, comments) are skipped
    // by 'schild' and friends.
    virtual bool significant() const { return true; }

    // The first Perl that accepts this element.
    virtual perl_version_t perl_version_introduced() const = 0;

    // The first Perl that no longer accepts it, if any.
    virtual maybe_version_t perl_version_removed() const = 0;

    // Leaves have no elements.
    virtual element_vec_t elements() const { return {}; }

    // How the parent reaches this element, or nullopt for a root.
    std::optional<nav_step_t> my_index() const;

    // The accessor path from 'top()' down to this element.
    nav_path_t nav() const;

    element_t* next_sibling() const;
    element_t* previous_sibling() const;
    element_t* snext_sibling() const;
    element_t* sprevious_sibling() const;

    // Both are inclusive: an element is its own ancestor and descendant.
    bool ancestor_of(element_t const* elem) const;
    bool descendant_of(element_t const* elem) const;

    // Lexer hooks. These run once the whole tree exists.

    // Returns the number of parse failures found.
    virtual unsigned finalize() { return 0; }

    // Takes the next unused capture number and returns the one after
    // everything this element consumed.
    virtual unsigned record_capture_number(unsigned number) { return number; }

protected:
    explicit element_t(kind_t kind) : m_kind(kind) {}

private:
    element_t* sibling(int offset) const;
    element_t* ssibling(int direction) const;

    node_t* m_parent = nullptr;
    kind_t const m_kind;
};

} // namespace rx

#endif
