#include "token.hpp"

#include "format.hpp"

namespace rx
{

std::unique_ptr<token_t> token_t::make(kind_t kind, std::string content,
                                       perl_version_t introduced, maybe_version_t removed)
{
    if(!kind_is_token(kind))
        return nullptr;
    return std::unique_ptr<token_t>(new token_t(kind, std::move(content), introduced, removed));
}

bool token_t::significant() const
{
    switch(kind())
    {
    case KIND_TOKEN_WHITESPACE:
    case KIND_TOKEN_COMMENT:
        return false;
    default:
        return true;
    }
}

std::string token_t::to_string() const
{
    return fmt("{ %, \"%\", %, % }", kind_name(), m_content,
               m_introduced, perl_version_removed());
}

} // namespace rx
