//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_FORWARDED_HPP
#define FIELDPARSE_FORWARDED_HPP

#include <fieldparse/detail/config.hpp>
#include <fieldparse/parsed.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace fieldparse {

/** The parameters of one Forwarded element

    Names are in lower case. Values are unquoted
    and keep their case.
*/
using forwarded_element =
    std::map<std::string, std::string>;

/** Options for @ref parse_forwarded
*/
struct forwarded_options
{
    /** Keep only the "for", "by", "host" and "proto" parameters

        In strict mode any other parameter fails
        the parse instead of being dropped.
    */
    bool standard_only = false;

    /// Fail on a parameter or element which would otherwise be skipped.
    bool strict = false;
};

/** Parse a Forwarded field value

    Elements are returned in the order they appear,
    which is the order of the proxies that added them.
    A parameter which repeats within an element keeps
    its last value and records a warning.

    @par Example
    @code
    auto rv = parse_forwarded( "for=192.0.2.60;proto=http;by=203.0.113.43, for=\"[2001:db8:cafe::17]\"" );
    // rv->value.size() == 2
    // rv->value[1].at( "for" ) == "[2001:db8:cafe::17]"
    @endcode

    @par BNF
    @code
    Forwarded         = 1#forwarded-element
    forwarded-element = [ forwarded-pair ] *( ";" [ forwarded-pair ] )
    forwarded-pair    = token "=" value
    value             = token / quoted-string
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc7239#section-4"
        >4.  Forwarded HTTP Header Field (rfc7239)</a>
*/
FIELDPARSE_DECL
system::result<parsed<std::vector<forwarded_element>>>
parse_forwarded(
    core::string_view s,
    forwarded_options opt = {});

} // fieldparse

#endif
