#ifndef TOKEN_HPP
#define TOKEN_HPP

#include <memory>
#include <string>

#include "element.hpp"

namespace rx
{

// A leaf of the tree: one lexeme of the regexp.
// The lexer decides the kind and the version facts.
class token_t : public element_t
{
public:
    // Returns nullptr unless 'kind' is a concrete token kind.
    static std::unique_ptr<token_t> make(kind_t kind, std::string content,
                                         perl_version_t introduced = MINIMUM_PERL,
                                         maybe_version_t removed = std::nullopt);

    virtual std::string content() const override { return m_content; }
    virtual bool significant() const override;
    virtual perl_version_t perl_version_introduced() const override { return m_introduced; }
    virtual maybe_version_t perl_version_removed() const override { return m_removed; }

    // Unknown tokens are what the lexer leaves behind on a parse failure.
    virtual unsigned finalize() override { return kind() == KIND_TOKEN_UNKNOWN; }

    // Used for debugging and logging.
    std::string to_string() const;

private:
    token_t(kind_t kind, std::string content, perl_version_t introduced, maybe_version_t removed)
    : element_t(kind)
    , m_content(std::move(content))
    , m_introduced(introduced)
    , m_removed(removed)
    {}

    std::string m_content;
    perl_version_t m_introduced;
    maybe_version_t m_removed;
};

// Shorthand constructors for the common kinds.
inline std::unique_ptr<token_t> make_literal(std::string content)
    { return token_t::make(KIND_TOKEN_LITERAL, std::move(content)); }
inline std::unique_ptr<token_t> make_whitespace(std::string content)
    { return token_t::make(KIND_TOKEN_WHITESPACE, std::move(content)); }
inline std::unique_ptr<token_t> make_comment(std::string content)
    { return token_t::make(KIND_TOKEN_COMMENT, std::move(content)); }
inline std::unique_ptr<token_t> make_unknown(std::string content)
    { return token_t::make(KIND_TOKEN_UNKNOWN, std::move(content)); }

} // namespace rx

#endif
