//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/rfc/list_rule.hpp>
#include <fieldparse/rfc/detail/ws.hpp>
#include <fieldparse/error.hpp>

namespace fieldparse {

system::result<std::vector<core::string_view>>
split_list(
    core::string_view s,
    split_options opt)
{
    std::vector<core::string_view> v;
    if(detail::trim_ows(s).empty())
        return v;

    bool quoted = false;
    bool angle = false;
    std::size_t depth = 0;
    std::size_t first = 0;
    for(std::size_t i = 0; i < s.size(); ++i)
    {
        char const c = s[i];
        if(quoted)
        {
            if(c == '\\')
                ++i;
            else if(c == '"')
                quoted = false;
            continue;
        }
        if(depth > 0)
        {
            if(c == '\\')
                ++i;
            else if(c == '(')
                ++depth;
            else if(c == ')')
                --depth;
            continue;
        }
        if(angle)
        {
            if(c == '>')
                angle = false;
            continue;
        }
        switch(c)
        {
        case '"':
            quoted = opt.quote_aware;
            break;
        case '(':
            if(opt.comment_aware)
                depth = 1;
            break;
        case '<':
            angle = opt.angle_aware;
            break;
        case ',':
            v.push_back(detail::trim_ows(
                s.substr(first, i - first)));
            first = i + 1;
            break;
        default:
            break;
        }
    }
    if(quoted)
        FIELDPARSE_RETURN_EC(
            error::unterminated_quote);
    if(depth > 0)
        FIELDPARSE_RETURN_EC(
            error::unterminated_comment);
    if(angle)
        FIELDPARSE_RETURN_EC(
            error::missing_angle_bracket);
    v.push_back(detail::trim_ows(
        s.substr(first)));
    return v;
}

} // fieldparse
