#ifndef FORMAT_HPP
#define FORMAT_HPP

// Functions for formatting strings.

#include <sstream>
#include <string>

namespace rx
{

template<char F>
void fmt_impl(std::ostringstream& ss, char const* str)
{
    while(*str)
        ss.rdbuf()->sputc(*str++);
}

template<char F, typename T, typename... Ts>
void fmt_impl(std::ostringstream& ss, char const* str, T const& t, Ts const&... ts)
{
    while(*str)
    {
        char const c = *str++;
        if(c == F)
        {
            ss << t;
            fmt_impl<F>(ss, str, ts...);
            return;
        }
        else
            ss.rdbuf()->sputc(c);
    }
}

// Substitutes each placeholder with the next argument.
// Example use: fmt("child % of %", i, name)
template<char F = '%', typename... Ts>
std::string fmt(char const* str, Ts const&... ts)
{
    std::ostringstream ss;
    fmt_impl<F>(ss, str, ts...);
    return ss.str();
}

template<typename P>
void ezcat_impl(std::ostringstream& ss, P const& sep, bool first) {}

template<typename P, typename T, typename... Ts>
void ezcat_impl(std::ostringstream& ss, P const& sep, bool first, T const& t, Ts const&... ts)
{
    if(!first)
        ss << sep;
    ss << t;
    ezcat_impl(ss, sep, false, ts...);
}

// Joins the string representations, putting 'sep' between them.
template<typename P, typename... Ts>
std::string ezcat(P const& sep, Ts const&... ts)
{
    std::ostringstream ss;
    ezcat_impl(ss, sep, true, ts...);
    return ss.str();
}

} // namespace rx

#endif
