//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_ACCEPT_HPP
#define FIELDPARSE_ACCEPT_HPP

#include <fieldparse/detail/config.hpp>
#include <fieldparse/content_type.hpp>
#include <fieldparse/parsed.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>
#include <vector>

namespace fieldparse {

/** Options for @ref parse_accept
*/
struct accept_options
{
    /// Fail on an element which would otherwise be skipped.
    bool strict = false;
};

/** Options for the Accept-Charset, Accept-Encoding and Accept-Language parsers
*/
struct qualified_list_options
{
    /// Fail on an element which would otherwise be skipped.
    bool strict = false;
};

/** Parse an Accept field value

    The result is ordered from most to least preferred:

    @li by quality, highest first;
    @li at quality 1, an explicit "q=1" before an implied one;
    @li by specificity, so "text/plain;format=flowed" comes
        before "text/plain", which comes before a wildcard
        subtype, which comes before the full wildcard;
    @li otherwise in the order of the input.

    The "q" parameter is removed from each element and
    kept as its quality. An element which is not a
    media type is skipped with a warning. A quality which
    is not a valid qvalue is treated as 0 with a warning.

    @par Example
    @code
    auto rv = parse_accept( "text/\*, text/plain, text/plain;format=flowed, *\/*" );
    // rv->value[0].to_string() == "text/plain; format=flowed"
    // rv->value[3].to_string() == "*\/*"
    @endcode

    @par BNF
    @code
    Accept      = #( media-range [ weight ] )
    media-range = ( "*\/*"
                    / ( type "/" "*" )
                    / ( type "/" subtype )
                  ) parameters
    weight      = OWS ";" OWS "q=" qvalue
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-12.5.1"
        >12.5.1.  Accept (rfc9110)</a>
*/
FIELDPARSE_DECL
system::result<parsed<std::vector<content_type>>>
parse_accept(
    core::string_view s,
    accept_options opt = {});

/** Parse an Accept-Charset field value

    Each element is a token with an optional weight.
    The result holds the tokens without their weights,
    ordered from most to least preferred as in
    @ref parse_accept, where "*" is less specific than
    any other token. Tokens with a quality of 0 are
    rejected by the client and sort last.

    @par Example
    @code
    auto rv = parse_accept_charset( "acceptable, rejected;q=0, *" );
    // rv->value == { "acceptable", "*", "rejected" }
    @endcode

    @par BNF
    @code
    Accept-Charset = #( ( token / "*" ) [ weight ] )
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-12.5.2"
        >12.5.2.  Accept-Charset (rfc9110)</a>
*/
FIELDPARSE_DECL
system::result<parsed<std::vector<std::string>>>
parse_accept_charset(
    core::string_view s,
    qualified_list_options opt = {});

/** Parse an Accept-Encoding field value

    @see @ref parse_accept_charset

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-12.5.3"
        >12.5.3.  Accept-Encoding (rfc9110)</a>
*/
FIELDPARSE_DECL
system::result<parsed<std::vector<std::string>>>
parse_accept_encoding(
    core::string_view s,
    qualified_list_options opt = {});

/** Parse an Accept-Language field value

    Language ranges keep their case.

    @see @ref parse_accept_charset

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-12.5.4"
        >12.5.4.  Accept-Language (rfc9110)</a>
*/
FIELDPARSE_DECL
system::result<parsed<std::vector<std::string>>>
parse_accept_language(
    core::string_view s,
    qualified_list_options opt = {});

} // fieldparse

#endif
