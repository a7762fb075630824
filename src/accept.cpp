//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/accept.hpp>
#include <fieldparse/error.hpp>
#include <fieldparse/rfc/detail/ws.hpp>
#include <fieldparse/rfc/list_rule.hpp>
#include <fieldparse/rfc/qvalue_rule.hpp>
#include <fieldparse/rfc/token_rule.hpp>
#include "src/detail/quality_sort.hpp"
#include "src/detail/text.hpp"
#include <boost/url/grammar/parse.hpp>
#include <algorithm>

namespace fieldparse {

namespace {

// A weight which is not a qvalue is 0
system::result<qvalue>
parse_weight(
    core::string_view value,
    core::string_view element,
    bool strict,
    std::vector<warning>& warnings)
{
    auto rv = grammar::parse(value, qvalue_rule);
    if(rv)
        return *rv;
    if(strict)
        FIELDPARSE_RETURN_EC(
            error::bad_quality);
    warnings.push_back(warning{
        make_error_code(error::bad_quality),
        detail::to_string(element) });
    return qvalue{ 0 };
}

void
append(
    std::vector<warning>& dest,
    std::vector<warning>&& src)
{
    for(auto& w : src)
        dest.push_back(std::move(w));
}

system::result<parsed<std::vector<std::string>>>
parse_qualified_list(
    core::string_view s,
    qualified_list_options opt)
{
    auto elems = split_list(s);
    if(! elems)
        return elems.error();

    std::vector<std::pair<
        detail::rank, std::string>> v;
    std::vector<warning> warnings;
    for(auto const e : *elems)
    {
        if(e.empty())
            continue;
        auto const semi = e.find(';');
        auto const tok = detail::trim_ows(
            e.substr(0, semi));
        if(! is_token(tok))
        {
            if(opt.strict)
                FIELDPARSE_RETURN_EC(
                    error::bad_value);
            warnings.push_back(warning{
                make_error_code(error::bad_value),
                detail::to_string(e) });
            continue;
        }

        detail::rank r;
        r.specificity = tok == "*" ? 0 : 1;
        if(semi != core::string_view::npos)
        {
            parameter_options po;
            po.lowercase_values = true;
            po.tolerate_bad_whitespace = true;
            po.strict = opt.strict;
            auto rv = parse_parameters(
                e.substr(semi), po);
            if(! rv)
            {
                if(opt.strict)
                    return rv.error();
                warnings.push_back(warning{
                    rv.error(), detail::to_string(e) });
                continue;
            }
            append(warnings, std::move(rv->warnings));

            auto const it = std::find_if(
                rv->value.begin(), rv->value.end(),
                [](parameter const& p)
                {
                    return p.name == "q";
                });
            if(it != rv->value.end())
            {
                auto q = parse_weight(
                    it->value, e, opt.strict, warnings);
                if(! q)
                    return q.error();
                r.q = *q;
                r.explicit_q = true;
            }
        }
        v.emplace_back(r, detail::to_string(tok));
    }
    return parsed<std::vector<std::string>>{
        detail::quality_sort(std::move(v)),
        std::move(warnings) };
}

} // (anon)

system::result<parsed<std::vector<content_type>>>
parse_accept(
    core::string_view s,
    accept_options opt)
{
    split_options so;
    so.comment_aware = true;
    auto elems = split_list(s, so);
    if(! elems)
        return elems.error();

    std::vector<std::pair<
        detail::rank, content_type>> v;
    std::vector<warning> warnings;
    for(auto const e : *elems)
    {
        if(e.empty())
            continue;
        content_type_options co;
        co.strict = opt.strict;
        auto rv = parse_content_type(e, co);
        if(! rv)
        {
            if(opt.strict)
                return rv.error();
            warnings.push_back(warning{
                rv.error(), detail::to_string(e) });
            continue;
        }
        append(warnings, std::move(rv->warnings));

        auto ct = std::move(rv->value);
        auto const w = ct.param("q");
        if(w)
        {
            auto q = parse_weight(
                *w, e, opt.strict, warnings);
            if(! q)
                return q.error();
            ct = ct.without_parameter("q").with_quality(*q);
        }

        detail::rank r;
        r.q = ct.qval();
        r.explicit_q = ct.has_explicit_quality();
        r.specificity = ct.specificity();
        v.emplace_back(r, std::move(ct));
    }
    return parsed<std::vector<content_type>>{
        detail::quality_sort(std::move(v)),
        std::move(warnings) };
}

system::result<parsed<std::vector<std::string>>>
parse_accept_charset(
    core::string_view s,
    qualified_list_options opt)
{
    return parse_qualified_list(s, opt);
}

system::result<parsed<std::vector<std::string>>>
parse_accept_encoding(
    core::string_view s,
    qualified_list_options opt)
{
    return parse_qualified_list(s, opt);
}

system::result<parsed<std::vector<std::string>>>
parse_accept_language(
    core::string_view s,
    qualified_list_options opt)
{
    return parse_qualified_list(s, opt);
}

} // fieldparse
