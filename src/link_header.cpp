//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/link_header.hpp>
#include <fieldparse/error.hpp>
#include <fieldparse/detail/except.hpp>
#include <fieldparse/rfc/detail/ws.hpp>
#include <fieldparse/rfc/quoted_string.hpp>
#include <fieldparse/rfc/token_rule.hpp>
#include "src/detail/text.hpp"
#include <boost/url/grammar/ci_string.hpp>
#include <algorithm>

namespace fieldparse {

namespace {

// Parameters which RFC 8288 allows only once
bool
is_singular(core::string_view name) noexcept
{
    return
        name == "rel" ||
        name == "media" ||
        name == "type" ||
        name == "title" ||
        name == "title*";
}

parameter const*
find_name(
    std::vector<parameter> const& v,
    core::string_view name) noexcept
{
    for(auto const& p : v)
        if(p.name == name)
            return &p;
    return nullptr;
}

std::vector<parameter>
first_wins(
    std::vector<parameter> v,
    std::vector<warning>& warnings)
{
    std::vector<parameter> r;
    r.reserve(v.size());
    for(auto& p : v)
    {
        if( is_singular(p.name) &&
            find_name(r, p.name))
        {
            warnings.push_back(warning{
                make_error_code(error::duplicate_parameter),
                p.name + "=" + p.value });
            continue;
        }
        r.push_back(std::move(p));
    }
    // title* is preferred over title
    auto const ext = find_name(r, "title*");
    if(ext)
    {
        std::string const value = ext->value;
        for(auto& p : r)
            if(p.name == "title")
                p.value = value;
    }
    return r;
}

} // (anon)

link_header::
link_header(
    core::string_view target,
    std::vector<parameter> params)
    : target_(detail::to_string(
        detail::trim_ows(target)))
    , params_(std::move(params))
{
    if(target_.empty())
        detail::throw_invalid_argument(
            "link_header: empty target");
    for(auto& p : params_)
        p.name = detail::lowered(p.name);
}

std::string
link_header::
rel() const
{
    std::string s;
    for(auto const& p : params_)
    {
        if(p.name != "rel")
            continue;
        if(! s.empty())
            s.push_back(' ');
        s.append(p.value);
    }
    return s;
}

std::vector<core::string_view>
link_header::
values(core::string_view name) const
{
    std::vector<core::string_view> v;
    for(auto const& p : params_)
        if(grammar::ci_is_equal(p.name, name))
            v.emplace_back(p.value);
    return v;
}

bool
link_header::
contains(core::string_view name) const noexcept
{
    for(auto const& p : params_)
        if(grammar::ci_is_equal(p.name, name))
            return true;
    return false;
}

std::string
link_header::
to_string() const
{
    std::string s;
    s.push_back('<');
    s.append(target_);
    s.push_back('>');

    auto const r = rel();
    if(! r.empty())
    {
        s.append("; rel=");
        append_quoted(s, r);
    }

    std::vector<parameter const*> v;
    v.reserve(params_.size());
    for(auto const& p : params_)
        if(p.name != "rel")
            v.push_back(&p);
    std::stable_sort(v.begin(), v.end(),
        [](parameter const* a, parameter const* b)
        {
            return a->name < b->name;
        });
    for(auto p : v)
    {
        s.append("; ");
        s.append(p->name);
        s.push_back('=');
        if( ! p->name.empty() &&
            p->name.back() == '*' &&
            is_token(p->value))
            s.append(p->value);
        else
            append_quoted(s, p->value);
    }
    return s;
}

//------------------------------------------------

system::result<parsed<std::vector<link_header>>>
parse_link(
    core::string_view s,
    link_options opt)
{
    parsed<std::vector<link_header>> r;
    auto const n = s.size();
    std::size_t i = 0;
    for(;;)
    {
        while(i < n && (detail::ws(s[i]) || s[i] == ','))
            ++i;
        if(i == n)
            break;

        auto const first = i;
        if(s[i] != '<')
            FIELDPARSE_RETURN_EC(
                error::missing_angle_bracket);
        auto const gt = s.find('>', i + 1);
        if(gt == core::string_view::npos)
            FIELDPARSE_RETURN_EC(
                error::missing_angle_bracket);
        auto const target = detail::trim_ows(
            s.substr(i + 1, gt - i - 1));

        // parameters end at a "," outside a quoted-string
        i = gt + 1;
        auto const params_first = i;
        bool quoted = false;
        for(; i < n; ++i)
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
            if(c == '"')
                quoted = true;
            else if(c == ',')
                break;
        }
        if(quoted)
            FIELDPARSE_RETURN_EC(
                error::unterminated_quote);

        auto const params = detail::trim_ows(
            s.substr(params_first, i - params_first));
        if(! params.empty() && params.front() != ';')
            FIELDPARSE_RETURN_EC(
                error::missing_semicolon);

        parameter_options po;
        po.require_value = false;
        po.tolerate_bad_whitespace =
            opt.tolerate_bad_whitespace;
        po.strict = opt.strict;
        auto rv = parse_parameters(params, po);
        if(! rv)
            return rv.error();
        for(auto& w : rv->warnings)
            r.warnings.push_back(std::move(w));

        if(target.empty())
        {
            if(opt.strict)
                FIELDPARSE_RETURN_EC(
                    error::bad_value);
            r.warnings.push_back(warning{
                make_error_code(error::bad_value),
                detail::to_string(detail::trim_ows(
                    s.substr(first, i - first))) });
            continue;
        }

        if(opt.duplicates == link_duplicates::first_wins)
            r.value.emplace_back(target,
                first_wins(std::move(rv->value), r.warnings));
        else
            r.value.emplace_back(target,
                std::move(rv->value));
    }
    return r;
}

} // fieldparse
