#ifndef STRUCTURE_HPP
#define STRUCTURE_HPP

// Nodes that are bracketed by delimiters, like "(?:...)".
// The delimiters are elements of the structure but not children of it.

#include <memory>
#include <optional>
#include <string>

#include "node.hpp"

namespace rx
{

class structure_t : public node_t
{
public:
    // 'kind' must be KIND_STRUCTURE or KIND_STRUCTURE_REGEXP.
    // Any delimiter may be null, meaning absent.
    // Returns nullptr if the kind is wrong or any child is null.
    static std::unique_ptr<structure_t> make(
        kind_t kind, std::unique_ptr<element_t> start, std::unique_ptr<element_t> type,
        element_list_t children, std::unique_ptr<element_t> finish);

    // Each delimiter is a single element, so only 0 and -1 are valid.
    element_t* start(int i = 0) const { return delimiter(m_start, i); }
    element_t* type(int i = 0) const { return delimiter(m_type, i); }
    element_t* finish(int i = 0) const { return delimiter(m_finish, i); }

    // start, type, children..., finish
    virtual element_vec_t elements() const override;

    virtual element_t* step(nav_step_t where) const override;

protected:
    structure_t(kind_t kind, std::unique_ptr<element_t> start, std::unique_ptr<element_t> type,
                element_list_t children, std::unique_ptr<element_t> finish);

    virtual std::optional<nav_step_t> locate(element_t const& child) const override;

private:
    static element_t* delimiter(std::unique_ptr<element_t> const& ptr, int i)
        { return (i == 0 || i == -1) ? ptr.get() : nullptr; }

    std::unique_ptr<element_t> m_start;
    std::unique_ptr<element_t> m_type;
    std::unique_ptr<element_t> m_finish;
};

// A capturing group. Named captures are numbered too.
class capture_t : public structure_t
{
public:
    static std::unique_ptr<capture_t> make(
        std::unique_ptr<element_t> start, std::unique_ptr<element_t> type,
        element_list_t children, std::unique_ptr<element_t> finish);

    static std::unique_ptr<capture_t> make_named(
        std::string name, std::unique_ptr<element_t> start, std::unique_ptr<element_t> type,
        element_list_t children, std::unique_ptr<element_t> finish);

    // Unset until the lexer numbers the tree.
    std::optional<unsigned> number() const { return m_number; }

    // Empty for unnamed captures.
    std::string const& name() const { return m_name; }

    virtual unsigned record_capture_number(unsigned number) override;

private:
    capture_t(kind_t kind, std::string name, std::unique_ptr<element_t> start,
              std::unique_ptr<element_t> type, element_list_t children,
              std::unique_ptr<element_t> finish);

    std::string m_name;
    std::optional<unsigned> m_number;
};

} // namespace rx

#endif
