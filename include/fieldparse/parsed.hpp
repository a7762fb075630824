//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_PARSED_HPP
#define FIELDPARSE_PARSED_HPP

#include <fieldparse/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <string>
#include <utility>
#include <vector>

namespace fieldparse {

/** A part of the input that a lenient parser skipped.
*/
struct warning
{
    /// Why the text was skipped.
    system::error_code ec;

    /// The skipped text, without surrounding whitespace.
    std::string text;
};

/** The value produced by a parser along with its warnings.

    Lenient parsers drop elements which do not follow the
    grammar instead of failing. Every dropped element is
    recorded in @ref warnings, so callers can log or reject
    the input after the fact. In strict mode the same
    condition makes the parser fail and `warnings` is
    always empty.

    @par Example
    @code
    auto rv = parse_accept( "text/html, *; q=.2" );
    if( rv && ! rv->warnings.empty() )
    {
        // rv->warnings[0].text == "*; q=.2"
    }
    @endcode
*/
template<class T>
struct parsed
{
    /// The parsed value.
    T value;

    /// Elements skipped by a lenient parse.
    std::vector<warning> warnings;

    /** Return true if nothing was skipped.
    */
    bool
    clean() const noexcept
    {
        return warnings.empty();
    }
};

} // fieldparse

#endif
