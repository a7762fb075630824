//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_DETAIL_TEXT_HPP
#define FIELDPARSE_DETAIL_TEXT_HPP

#include <fieldparse/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <string>

namespace fieldparse {
namespace detail {

inline
std::string
to_string(core::string_view s)
{
    return std::string(s.data(), s.size());
}

inline
std::string
lowered(core::string_view s)
{
    std::string r;
    r.reserve(s.size());
    for(char c : s)
        r.push_back(grammar::to_lower(c));
    return r;
}

} // detail
} // fieldparse

#endif
