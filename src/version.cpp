#include "version.hpp"

#include <cctype>

#include "error.hpp"
#include "format.hpp"

namespace rx
{

perl_version_t perl_version_t::parse(std::string_view str)
{
    auto const bad = [&]() -> rx_error_t
        { return rx_error_t(fmt("Invalid Perl version: \"%\"", str)); };

    std::size_t i = 0;
    int_type whole = 0;
    int_type frac = 0;

    if(str.empty() || !std::isdigit((unsigned char)str[0]))
        throw bad();

    for(; i < str.size() && std::isdigit((unsigned char)str[i]); ++i)
    {
        whole = whole * 10 + (str[i] - '0');
        if(whole > 999)
            throw bad();
    }

    if(i == str.size())
        return make(whole, 0);

    if(str[i++] != '.' || i == str.size())
        throw bad();

    int_type place = scale;
    for(; i < str.size(); ++i)
    {
        if(!std::isdigit((unsigned char)str[i]) || place == 1)
            throw bad();
        place /= 10;
        frac += (str[i] - '0') * place;
    }

    return make(whole, frac);
}

std::string perl_version_t::to_string() const
{
    std::string digits = std::to_string(frac() + scale).substr(1);
    while(digits.size() > 3 && digits.back() == '0')
        digits.pop_back();
    return fmt("%.%", whole(), digits);
}

std::ostream& operator<<(std::ostream& o, perl_version_t v)
{
    o << v.to_string();
    return o;
}

std::ostream& operator<<(std::ostream& o, maybe_version_t v)
{
    if(v)
        o << *v;
    else
        o << "undef";
    return o;
}

} // namespace rx
