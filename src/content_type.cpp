//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/content_type.hpp>
#include <fieldparse/error.hpp>
#include <fieldparse/detail/except.hpp>
#include <fieldparse/rfc/detail/ws.hpp>
#include <fieldparse/rfc/quoted_string.hpp>
#include <fieldparse/rfc/token_rule.hpp>
#include "src/detail/text.hpp"
#include <algorithm>
#include <cmath>

namespace fieldparse {

namespace {

// Last value wins, at the position of the first
void
put(
    std::vector<parameter>& v,
    std::string name,
    std::string value)
{
    for(auto& p : v)
    {
        if(p.name == name)
        {
            p.value = std::move(value);
            return;
        }
    }
    v.push_back(parameter{
        std::move(name), std::move(value) });
}

} // (anon)

content_type::
content_type(
    core::string_view type,
    core::string_view subtype,
    std::vector<parameter> params,
    core::string_view suffix)
    : type_(detail::lowered(detail::trim_ows(type)))
    , subtype_(detail::lowered(detail::trim_ows(subtype)))
    , suffix_(detail::lowered(detail::trim_ows(suffix)))
{
    if(type_.empty() || subtype_.empty())
        detail::throw_invalid_argument(
            "content_type: empty type or subtype");
    params_.reserve(params.size());
    for(auto& p : params)
        put(params_,
            detail::lowered(p.name),
            std::move(p.value));
}

boost::optional<core::string_view>
content_type::
param(core::string_view name) const noexcept
{
    for(auto const& p : params_)
        if(grammar::ci_is_equal(p.name, name))
            return core::string_view(p.value);
    return boost::none;
}

content_type
content_type::
with_parameter(
    core::string_view name,
    core::string_view value) const
{
    content_type ct(*this);
    put(ct.params_,
        detail::lowered(name),
        detail::to_string(value));
    return ct;
}

content_type
content_type::
without_parameter(
    core::string_view name) const
{
    content_type ct(*this);
    ct.params_.erase(
        std::remove_if(
            ct.params_.begin(),
            ct.params_.end(),
            [name](parameter const& p)
            {
                return grammar::ci_is_equal(p.name, name);
            }),
        ct.params_.end());
    return ct;
}

content_type
content_type::
with_quality(double q) const
{
    if(! (q >= 0.0 && q <= 1.0))
        detail::throw_invalid_argument(
            "content_type: quality out of range");
    return with_quality(qvalue{
        static_cast<std::uint16_t>(
            std::lround(q * 1000)) });
}

content_type
content_type::
with_quality(qvalue q) const
{
    if(q.thousandths > 1000)
        detail::throw_invalid_argument(
            "content_type: quality out of range");
    content_type ct(*this);
    ct.q_ = q;
    ct.explicit_q_ = true;
    return ct;
}

std::string
content_type::
to_string() const
{
    std::string s;
    s.reserve(type_.size() + subtype_.size() + 1);
    s.append(type_);
    s.push_back('/');
    s.append(subtype_);
    if(! suffix_.empty())
    {
        s.push_back('+');
        s.append(suffix_);
    }

    std::vector<parameter const*> v;
    v.reserve(params_.size());
    for(auto const& p : params_)
        v.push_back(&p);
    std::sort(v.begin(), v.end(),
        [](parameter const* a, parameter const* b)
        {
            return a->name < b->name;
        });
    for(auto p : v)
    {
        s.append("; ");
        s.append(p->name);
        s.push_back('=');
        append_token_or_quoted(s, p->value);
    }
    return s;
}

bool
operator==(
    content_type const& a,
    content_type const& b) noexcept
{
    if( a.type() != b.type() ||
        a.subtype() != b.subtype() ||
        a.suffix() != b.suffix() ||
        a.parameters().size() != b.parameters().size())
        return false;
    for(auto const& p : a.parameters())
    {
        auto const v = b.param(p.name);
        if(! v || *v != p.value)
            return false;
    }
    return true;
}

//------------------------------------------------

system::result<parsed<content_type>>
parse_content_type(
    core::string_view s,
    content_type_options opt)
{
    // media type, without comments, up
    // to the first ";" outside a comment
    std::string mt;
    std::size_t depth = 0;
    std::size_t i = 0;
    for(; i < s.size(); ++i)
    {
        char const c = s[i];
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
        if(c == ';')
            break;
        if(c == '(')
        {
            depth = 1;
            continue;
        }
        mt.push_back(c);
    }
    if(depth > 0)
        FIELDPARSE_RETURN_EC(
            error::unterminated_comment);

    auto const t = detail::trim_ows(mt);
    auto const slash = t.find('/');
    if(slash == core::string_view::npos)
        FIELDPARSE_RETURN_EC(
            error::missing_slash);

    auto const type = t.substr(0, slash);
    auto subtype = t.substr(slash + 1);
    core::string_view suffix;
    auto const plus = subtype.rfind('+');
    if(plus != core::string_view::npos)
    {
        suffix = subtype.substr(plus + 1);
        subtype = subtype.substr(0, plus);
        if(! is_token(suffix))
            FIELDPARSE_RETURN_EC(
                error::bad_type);
    }
    if( ! is_token(type) ||
        ! is_token(subtype))
        FIELDPARSE_RETURN_EC(
            error::bad_type);

    parameter_options po;
    po.comment_aware = true;
    po.lowercase_values = opt.lowercase_values;
    po.strict = opt.strict;
    auto rv = parse_parameters(
        s.substr(i), po);
    if(! rv)
        return rv.error();

    return parsed<content_type>{
        content_type(
            type, subtype,
            std::move(rv->value),
            suffix),
        std::move(rv->warnings) };
}

} // fieldparse
