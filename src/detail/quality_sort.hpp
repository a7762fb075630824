//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_DETAIL_QUALITY_SORT_HPP
#define FIELDPARSE_DETAIL_QUALITY_SORT_HPP

#include <fieldparse/rfc/qvalue_rule.hpp>
#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace fieldparse {
namespace detail {

// Sort key of one element of an Accept-style list
struct rank
{
    qvalue q;
    bool explicit_q = false;
    std::size_t specificity = 0;
};

// Returns true if `a` is preferred over `b`.
// Elements which compare equal keep their input order.
inline
bool
preferred(
    rank const& a,
    rank const& b) noexcept
{
    if(a.q != b.q)
        return a.q.thousandths > b.q.thousandths;
    // an explicit q=1 beats an implied one
    if( a.q.thousandths == 1000 &&
        a.explicit_q != b.explicit_q)
        return a.explicit_q;
    return a.specificity > b.specificity;
}

template<class T>
std::vector<T>
quality_sort(std::vector<std::pair<rank, T>> v)
{
    std::stable_sort(v.begin(), v.end(),
        []( std::pair<rank, T> const& a,
            std::pair<rank, T> const& b)
        {
            return preferred(a.first, b.first);
        });
    std::vector<T> r;
    r.reserve(v.size());
    for(auto& e : v)
        r.push_back(std::move(e.second));
    return r;
}

} // detail
} // fieldparse

#endif
