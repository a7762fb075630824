//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/cache_control.hpp>
#include <fieldparse/error.hpp>
#include <fieldparse/rfc/detail/ws.hpp>
#include <fieldparse/rfc/list_rule.hpp>
#include <fieldparse/rfc/quoted_string.hpp>
#include <fieldparse/rfc/token_rule.hpp>
#include "src/detail/text.hpp"
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/grammar/digit_chars.hpp>

namespace fieldparse {

cache_directive const*
cache_control::
find(core::string_view name) const noexcept
{
    for(auto const& d : v_)
        if(grammar::ci_is_equal(d.name, name))
            return &d;
    return nullptr;
}

bool
cache_control::
is_set(core::string_view name) const noexcept
{
    auto const d = find(name);
    return d && ! d->value;
}

boost::optional<core::string_view>
cache_control::
value(core::string_view name) const noexcept
{
    auto const d = find(name);
    if(! d || ! d->value)
        return boost::none;
    return core::string_view(*d->value);
}

boost::optional<std::uint64_t>
cache_control::
delta_seconds(core::string_view name) const noexcept
{
    constexpr std::uint64_t limit = 2147483648;

    auto const v = value(name);
    if(! v || v->empty())
        return boost::none;
    std::uint64_t n = 0;
    for(char c : *v)
    {
        if(! grammar::digit_chars(c))
            return boost::none;
        if(n < limit)
            n = n * 10 + (c - '0');
    }
    if(n > limit)
        n = limit;
    return n;
}

void
cache_control::
set(
    core::string_view name,
    boost::optional<std::string> value)
{
    auto key = detail::lowered(name);
    for(auto& d : v_)
    {
        if(d.name == key)
        {
            d.value = std::move(value);
            return;
        }
    }
    v_.push_back(cache_directive{
        std::move(key), std::move(value) });
}

std::string
cache_control::
to_string() const
{
    std::string s;
    for(auto const& d : v_)
    {
        if(! s.empty())
            s.append(", ");
        s.append(d.name);
        if(d.value)
        {
            s.push_back('=');
            append_token_or_quoted(s, *d.value);
        }
    }
    return s;
}

//------------------------------------------------

system::result<parsed<cache_control>>
parse_cache_control(
    core::string_view s,
    cache_control_options opt)
{
    auto elems = split_list(s);
    if(! elems)
        return elems.error();

    parsed<cache_control> r;
    for(auto const e : *elems)
    {
        if(e.empty())
            continue;

        auto const eq = e.find('=');
        auto const name = detail::trim_ows(e.substr(0, eq));
        error ev = error::bad_parameter;
        if(is_token(name))
        {
            if(eq == core::string_view::npos)
            {
                r.value.set(name);
                continue;
            }
            auto const arg = detail::trim_ows(e.substr(eq + 1));
            if(is_quoted_string(arg))
            {
                auto v = unquote(arg);
                if(! v)
                    return v.error();
                r.value.set(name, std::move(*v));
                continue;
            }
            if(is_token(arg))
            {
                r.value.set(name, detail::to_string(arg));
                continue;
            }
            ev = error::bad_value;
        }
        if(opt.strict)
            return FIELDPARSE_ERR(ev);
        r.warnings.push_back(warning{
            make_error_code(ev),
            detail::to_string(e) });
    }
    return r;
}

} // fieldparse
