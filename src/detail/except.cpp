//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/detail/except.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>

namespace fieldparse {
namespace detail {

void
throw_invalid_argument(
    char const* what,
    boost::source_location const& loc)
{
    boost::throw_exception(
        std::invalid_argument(what), loc);
}

} // detail
} // fieldparse
