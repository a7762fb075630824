//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_DETAIL_EXCEPT_HPP
#define FIELDPARSE_DETAIL_EXCEPT_HPP

#include <fieldparse/detail/config.hpp>
#include <boost/assert/source_location.hpp>

namespace fieldparse {
namespace detail {

BOOST_NORETURN FIELDPARSE_DECL void throw_invalid_argument(
    char const* what,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // fieldparse

#endif
