//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_RFC_LIST_RULE_HPP
#define FIELDPARSE_RFC_LIST_RULE_HPP

#include <fieldparse/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <vector>

namespace fieldparse {

/** Options controlling how a list is split into elements.
*/
struct split_options
{
    /// Commas inside a quoted-string do not split.
    bool quote_aware = true;

    /// Commas inside a parenthesized comment do not split.
    bool comment_aware = false;

    /// Commas inside "<" and ">" do not split.
    bool angle_aware = false;
};

/** Split a comma-separated field value into elements

    Each element is returned with surrounding whitespace
    removed. Empty elements are returned as empty strings
    so that the caller decides whether they are an error.
    A value consisting only of whitespace has no elements.

    The returned views reference the input string.

    @par BNF
    @code
    #element    = [ element ] *( OWS "," OWS [ element ] )
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-5.6.1"
        >5.6.1.  Lists (#rule ABNF Extension) (rfc9110)</a>

    @return The elements, or an error if a quoted-string,
    comment or angle bracket is not closed.
*/
FIELDPARSE_DECL
system::result<std::vector<core::string_view>>
split_list(
    core::string_view s,
    split_options opt = {});

} // fieldparse

#endif
