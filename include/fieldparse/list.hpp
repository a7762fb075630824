//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_LIST_HPP
#define FIELDPARSE_LIST_HPP

#include <fieldparse/detail/config.hpp>
#include <fieldparse/parsed.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>
#include <vector>

namespace fieldparse {

/** Options for @ref parse_list
*/
struct list_options
{
    /// Fail on an empty element instead of ignoring it.
    bool strict = false;
};

/** Parse a comma-separated field value

    Commas inside quoted-strings do not split
    elements. An element which is a single
    quoted-string is unquoted; other elements are
    returned as written, without surrounding
    whitespace. Empty elements are ignored.

    @par Example
    @code
    auto rv = parse_list( "a, \"b, c\", d" );
    // rv->value == { "a", "b, c", "d" }
    @endcode

    @par BNF
    @code
    #element    = [ element ] *( OWS "," OWS [ element ] )
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-5.6.1"
        >5.6.1.  Lists (#rule ABNF Extension) (rfc9110)</a>
*/
FIELDPARSE_DECL
system::result<parsed<std::vector<std::string>>>
parse_list(
    core::string_view s,
    list_options opt = {});

} // fieldparse

#endif
