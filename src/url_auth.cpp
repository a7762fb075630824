//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/url_auth.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>

namespace fieldparse {

system::result<url_auth>
remove_url_auth(core::string_view s)
{
    auto rv = urls::parse_uri_reference(s);
    if(! rv)
        return rv.error();

    urls::url u(*rv);
    url_auth r;
    if(u.has_userinfo())
    {
        auto user = u.user();
        if(! user.empty())
            r.user = std::move(user);
        if(u.has_password())
            r.password = u.password();
        u.remove_userinfo();
    }
    auto const b = u.buffer();
    r.url.assign(b.data(), b.size());
    return r;
}

} // fieldparse
