//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/list.hpp>
#include <fieldparse/error.hpp>
#include <fieldparse/rfc/list_rule.hpp>
#include <fieldparse/rfc/quoted_string.hpp>
#include "src/detail/text.hpp"

namespace fieldparse {

system::result<parsed<std::vector<std::string>>>
parse_list(
    core::string_view s,
    list_options opt)
{
    auto elems = split_list(s);
    if(! elems)
        return elems.error();

    parsed<std::vector<std::string>> r;
    r.value.reserve(elems->size());
    for(auto const e : *elems)
    {
        if(e.empty())
        {
            if(opt.strict)
                FIELDPARSE_RETURN_EC(
                    error::empty_element);
            continue;
        }
        if(is_quoted_string(e))
        {
            auto v = unquote(e);
            if(! v)
                return v.error();
            r.value.push_back(std::move(*v));
            continue;
        }
        r.value.push_back(detail::to_string(e));
    }
    return r;
}

} // fieldparse
