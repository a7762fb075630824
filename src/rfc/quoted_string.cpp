//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/rfc/quoted_string.hpp>
#include <fieldparse/rfc/token_rule.hpp>
#include <fieldparse/error.hpp>

namespace fieldparse {

bool
is_quoted_string(core::string_view s) noexcept
{
    if(s.size() < 2 || s.front() != '"')
        return false;
    std::size_t i = 1;
    while(i < s.size())
    {
        char const c = s[i];
        if(c == '\\')
        {
            i += 2;
            continue;
        }
        if(c == '"')
            return i == s.size() - 1;
        ++i;
    }
    return false;
}

system::result<std::string>
unquote(core::string_view s)
{
    if(! is_quoted_string(s))
        FIELDPARSE_RETURN_EC(
            error::unterminated_quote);

    std::string r;
    r.reserve(s.size() - 2);
    auto it = s.data() + 1;
    auto const end = s.data() + s.size() - 1;
    while(it != end)
    {
        if(*it == '\\')
            ++it;
        r.push_back(*it++);
    }
    return r;
}

void
append_quoted(
    std::string& dest,
    core::string_view s)
{
    dest.push_back('"');
    for(char c : s)
    {
        if(c == '"' || c == '\\')
            dest.push_back('\\');
        dest.push_back(c);
    }
    dest.push_back('"');
}

void
append_token_or_quoted(
    std::string& dest,
    core::string_view s)
{
    if(is_token(s))
        dest.append(s.data(), s.size());
    else
        append_quoted(dest, s);
}

} // fieldparse
