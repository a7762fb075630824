//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/url_rewrite.hpp>
#include <fieldparse/error.hpp>
#include <boost/url/grammar/alpha_chars.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/digit_chars.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/param.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>

namespace fieldparse {

namespace {

constexpr grammar::lut_chars scheme_chars =
    "+-."
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz";

// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
bool
is_scheme(core::string_view s) noexcept
{
    return
        ! s.empty() &&
        grammar::alpha_chars(s.front()) &&
        grammar::find_if_not(
            s.data(), s.data() + s.size(),
            scheme_chars) == s.data() + s.size();
}

bool
is_port(core::string_view s) noexcept
{
    return
        ! s.empty() &&
        grammar::find_if_not(
            s.data(), s.data() + s.size(),
            grammar::digit_chars) == s.data() + s.size();
}

// RFC 1035 section 2.3.4 limits, applied
// to the encoded reg-name
bool
is_host_length_ok(
    core::string_view host,
    bool enable_long_host) noexcept
{
    if( ! enable_long_host &&
        host.size() > 255)
        return false;
    std::size_t label = 0;
    for(auto c : host)
    {
        if(c == '.')
        {
            label = 0;
            continue;
        }
        if(++label > 63)
            return false;
    }
    return true;
}

} // (anon)

system::result<std::string>
rewrite_url(
    core::string_view s,
    url_rewrite const& rw)
{
    auto rv = urls::parse_uri_reference(s);
    if(! rv)
        return rv.error();
    urls::url u(*rv);

    if(rw.scheme.is_removed())
    {
        u.remove_scheme();
    }
    else if(! rw.scheme.is_kept())
    {
        if(! is_scheme(rw.scheme.value()))
            FIELDPARSE_RETURN_EC(error::bad_value);
        u.set_scheme(rw.scheme.value());
    }

    if(rw.user.is_removed())
        u.remove_userinfo();
    else if(! rw.user.is_kept())
        u.set_user(rw.user.value());

    if(rw.password.is_removed() ||
        (! rw.password.is_kept() &&
            rw.password.value().empty()))
    {
        u.remove_password();
    }
    else if(
        ! rw.password.is_kept() &&
        u.has_userinfo())
    {
        u.set_password(rw.password.value());
    }

    if(rw.host.is_removed())
    {
        u.remove_port();
        u.set_encoded_host("");
    }
    else if(! rw.host.is_kept())
    {
        u.set_host(rw.host.value());
        if( u.host_type() == urls::host_type::name &&
            ! is_host_length_ok(
                u.encoded_host(), rw.enable_long_host))
            FIELDPARSE_RETURN_EC(error::bad_value);
    }

    if(rw.port.is_removed())
    {
        u.remove_port();
    }
    else if(! rw.port.is_kept())
    {
        if(! is_port(rw.port.value()))
            FIELDPARSE_RETURN_EC(error::bad_value);
        if(! u.encoded_host().empty())
            u.set_port(rw.port.value());
    }

    if(rw.path.is_removed())
        u.set_path("/");
    else if(! rw.path.is_kept())
        u.set_path(rw.path.value());

    if(! rw.query_params.empty())
    {
        u.remove_query();
        auto ps = u.params();
        for(auto const& p : rw.query_params)
            ps.append(urls::param_view(
                core::string_view(p.first),
                core::string_view(p.second)));
    }
    else if(rw.query.is_removed())
    {
        u.remove_query();
    }
    else if(! rw.query.is_kept())
    {
        u.set_query(rw.query.value());
    }

    if(rw.fragment.is_removed())
        u.remove_fragment();
    else if(! rw.fragment.is_kept())
        u.set_fragment(rw.fragment.value());

    auto const b = u.buffer();
    return std::string(b.data(), b.size());
}

} // fieldparse
