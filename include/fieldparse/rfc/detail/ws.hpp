//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_RFC_DETAIL_WS_HPP
#define FIELDPARSE_RFC_DETAIL_WS_HPP

#include <fieldparse/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>

namespace fieldparse {
namespace detail {

// WS         = SP / HTAB
struct ws_t
{
    constexpr
    bool
    operator()(char c) const noexcept
    {
        return c == ' ' || c == '\t';
    }
};

constexpr ws_t ws{};

// remove leading and trailing OWS
inline
core::string_view
trim_ows(core::string_view s) noexcept
{
    while(! s.empty() && ws(s.front()))
        s.remove_prefix(1);
    while(! s.empty() && ws(s.back()))
        s.remove_suffix(1);
    return s;
}

} // detail
} // fieldparse

#endif
