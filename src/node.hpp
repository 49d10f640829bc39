#ifndef NODE_HPP
#define NODE_HPP

// A container of elements.
// Nodes own their children and maintain each child's parent pointer.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <boost/container/small_vector.hpp>

#include "element.hpp"
#include "selector.hpp"

namespace rx
{

class node_t : public element_t
{
public:
    // Returns nullptr if any child is null.
    static std::unique_ptr<node_t> make(element_list_t children);

    // Indexes by raw position. Negative indices count from the end.
    // Returns nullptr when out of range.
    element_t* child(int i = 0) const;
    element_vec_t children() const;
    std::size_t num_children() const { return m_children.size(); }

    element_t* first_element() const;
    element_t* last_element() const;

    // Like 'child', but counts only significant children.
    element_t* schild(int i = 0) const;
    element_vec_t schildren() const;
    std::size_t num_schildren() const;

    // True if 'elem' is a strict descendant of this node.
    bool contains(element_t const* elem) const;

    // Every leaf token below this node, in document order.
    element_vec_t tokens() const;

    // Collects every matching element below this node, in document order.
    // An empty vector means nothing matched.
    // nullopt means the selector was bad or the predicate threw.
    std::optional<element_vec_t> find(selector_t const& want) const;

    // Returns the first match, or nullptr if nothing matched.
    // nullopt means the selector was bad or the predicate threw.
    std::optional<element_t*> find_first(selector_t const& want) const;

    // How this node reaches 'child', provided 'child' is a direct child.
    std::optional<nav_step_t> child_nav(element_t const& child) const;

    // Takes one accessor step. Returns nullptr when out of range.
    virtual element_t* step(nav_step_t where) const;

    // Walks a path produced by 'element_t::nav'.
    element_t* follow(nav_path_t const& path);

    virtual std::string content() const override;
    virtual perl_version_t perl_version_introduced() const override;
    virtual maybe_version_t perl_version_removed() const override;
    virtual element_vec_t elements() const override;

    virtual unsigned finalize() override;
    virtual unsigned record_capture_number(unsigned number) override;

protected:
    // Children must already be checked by 'all_elements'.
    node_t(kind_t kind, element_list_t children);

    static bool all_elements(element_list_t const& list);

    // Points 'elem' back at this node.
    void adopt(element_t& elem);

    virtual std::optional<nav_step_t> locate(element_t const& child) const;

private:
    std::optional<element_vec_t> find_impl(predicate_t const& pred) const;
    std::optional<element_t*> find_first_impl(predicate_t const& pred) const;

    bc::small_vector<std::unique_ptr<element_t>, 4> m_children;
};

} // namespace rx

#endif
