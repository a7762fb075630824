//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_ERROR_HPP
#define FIELDPARSE_ERROR_HPP

#include <fieldparse/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

namespace fieldparse {

/** Error codes returned by the field parsers
*/
enum class error
{
    /// A quoted-string has no closing DQUOTE
    unterminated_quote = 1,

    /// A comment has no closing parenthesis
    unterminated_comment,

    /// A parameter has no "="
    missing_equals,

    /// Whitespace around "=" in a parameter
    bad_whitespace,

    /// A parameter name is missing or is not a token
    bad_parameter,

    /// A parameter value is missing or is not a token
    bad_value,

    /// A media type has no "/" between type and subtype
    missing_slash,

    /// A media type or subtype is empty or not a token
    bad_type,

    /// A quality value is not a valid qvalue
    bad_quality,

    /// A link value does not start with "<" or lacks ">"
    missing_angle_bracket,

    /// Link parameters do not start with ";"
    missing_semicolon,

    /// A list element has no content
    empty_element,

    /// A parameter name outside the registered set
    nonstandard_parameter,

    /// A parameter occurs more than once in one element
    duplicate_parameter,

    /// Content negotiation found no acceptable type
    no_match
};

//------------------------------------------------

/** Error conditions corresponding to sets of error codes.
*/
enum class condition
{
    /** The input does not follow the field grammar
    */
    malformed_value = 1,

    /** The input was rejected only because strict
        validation was requested
    */
    strict_violation,

    /** No acceptable representation was found
    */
    no_match
};

} // fieldparse

#include <fieldparse/impl/error.hpp>

#endif
