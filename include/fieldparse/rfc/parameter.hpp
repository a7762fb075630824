//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_RFC_PARAMETER_HPP
#define FIELDPARSE_RFC_PARAMETER_HPP

#include <fieldparse/detail/config.hpp>
#include <fieldparse/parsed.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>
#include <vector>

namespace fieldparse {

/** A header parameter

    The name is always lower case. The value has its
    quotes and escapes removed.

    @par BNF
    @code
    parameter   = token "=" ( token / quoted-string )
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-5.6.6"
        >5.6.6.  Parameters (rfc9110)</a>
*/
struct parameter
{
    std::string name;
    std::string value;

    friend
    bool
    operator==(
        parameter const& a,
        parameter const& b) noexcept
    {
        return a.name == b.name && a.value == b.value;
    }

    friend
    bool
    operator!=(
        parameter const& a,
        parameter const& b) noexcept
    {
        return !(a == b);
    }
};

/** Options controlling the parameter tokenizer.
*/
struct parameter_options
{
    /// Recognize quoted-string values.
    bool quote_aware = true;

    /// Discard RFC 2045 comments outside of quoted-strings.
    bool comment_aware = false;

    /** Convert token values to lower case.

        Values written as a quoted-string keep their case.
    */
    bool lowercase_values = false;

    /// Accept whitespace before and after "=".
    bool tolerate_bad_whitespace = false;

    /** A name without "=" is an error.

        When `false` such a name produces a
        parameter with an empty value.
    */
    bool require_value = true;

    /// Fail on a segment which would otherwise be skipped.
    bool strict = false;
};

/** Parse a list of parameters

    The input is zero or more parameters separated by
    semicolons, with optional whitespace around each
    and an optional leading semicolon. Parameters are
    returned in the order they appear, duplicates
    included.

    A segment which does not follow the grammar is
    skipped and recorded as a warning, or fails the
    parse when `opt.strict` is set. An unterminated
    quoted-string or comment, and a missing "=" when
    `opt.require_value` is set, always fail.

    @par Example
    @code
    auto rv = parse_parameters( "; charset=\"UTF-8\"; format=flowed" );
    // rv->value[0].name == "charset"
    // rv->value[0].value == "UTF-8"
    @endcode

    @par BNF
    @code
    parameters  = *( OWS ";" OWS [ parameter ] )
    parameter   = token "=" ( token / quoted-string )
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-5.6.6"
        >5.6.6.  Parameters (rfc9110)</a>
    @li <a href="https://www.rfc-editor.org/rfc/rfc2045#section-5.1"
        >5.1.  Syntax of the Content-Type Header Field (rfc2045)</a>
*/
FIELDPARSE_DECL
system::result<parsed<std::vector<parameter>>>
parse_parameters(
    core::string_view s,
    parameter_options opt = {});

} // fieldparse

#endif
