//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/forwarded.hpp>
#include <fieldparse/error.hpp>
#include <fieldparse/rfc/list_rule.hpp>
#include <fieldparse/rfc/parameter.hpp>
#include "src/detail/text.hpp"

namespace fieldparse {

namespace {

bool
is_standard(core::string_view name) noexcept
{
    return
        name == "for" ||
        name == "by" ||
        name == "host" ||
        name == "proto";
}

std::string
pair_text(
    core::string_view name,
    core::string_view value)
{
    std::string s;
    s.reserve(name.size() + value.size() + 1);
    s.append(name.data(), name.size());
    s.push_back('=');
    s.append(value.data(), value.size());
    return s;
}

} // (anon)

system::result<parsed<std::vector<forwarded_element>>>
parse_forwarded(
    core::string_view s,
    forwarded_options opt)
{
    auto elems = split_list(s);
    if(! elems)
        return elems.error();

    parsed<std::vector<forwarded_element>> r;
    for(auto const e : *elems)
    {
        if(e.empty())
            continue;

        parameter_options po;
        po.strict = opt.strict;
        auto rv = parse_parameters(e, po);
        if(! rv)
        {
            if(opt.strict)
                return rv.error();
            r.warnings.push_back(warning{
                rv.error(), detail::to_string(e) });
            continue;
        }
        for(auto& w : rv->warnings)
            r.warnings.push_back(std::move(w));

        forwarded_element fe;
        for(auto& p : rv->value)
        {
            if( opt.standard_only &&
                ! is_standard(p.name))
            {
                if(opt.strict)
                    FIELDPARSE_RETURN_EC(
                        error::nonstandard_parameter);
                r.warnings.push_back(warning{
                    make_error_code(error::nonstandard_parameter),
                    pair_text(p.name, p.value) });
                continue;
            }
            auto it = fe.find(p.name);
            if(it != fe.end())
            {
                if(opt.strict)
                    FIELDPARSE_RETURN_EC(
                        error::duplicate_parameter);
                r.warnings.push_back(warning{
                    make_error_code(error::duplicate_parameter),
                    pair_text(it->first, it->second) });
                it->second = std::move(p.value);
                continue;
            }
            fe.emplace(std::move(p.name), std::move(p.value));
        }
        if(! fe.empty())
            r.value.push_back(std::move(fe));
    }
    return r;
}

} // fieldparse
