//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_NEGOTIATE_HPP
#define FIELDPARSE_NEGOTIATE_HPP

#include <fieldparse/detail/config.hpp>
#include <fieldparse/content_type.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <vector>

namespace fieldparse {

/** The outcome of content negotiation
*/
struct selection
{
    /// The requested entry which matched.
    content_type requested;

    /// The available content type to produce.
    content_type available;
};

/** Select the content type of a response

    The requested entries are visited in order, which
    is normally the order produced by @ref parse_accept.
    For each one, the available content types are
    visited in order and the first match is selected.

    A requested entry matches an available content type
    when the types are equal or either is "*", and either
    subtype is "*" or the subtypes and suffixes are equal
    and every parameter of the available content type is
    present with the same value in the requested entry.
    Parameters that only the requested entry carries do
    not prevent a match.

    An entry with a quality of 0 is never selected. It
    also rejects every available content type it matches,
    unless a more specific entry with a nonzero quality
    selects it first.

    An empty requested list is treated as a single
    entry "*\/*".

    @par Example
    @code
    auto req = parse_accept( "application/vnd.example+json;version=2" );
    std::vector<content_type> avail{
        content_type( "application", "vnd.example", {{ "version", "3" }}, "json" ),
        content_type( "application", "vnd.example", {{ "version", "2" }}, "json" ) };
    auto rv = select_content_type( req->value, avail );
    // rv->available == avail[1]
    @endcode

    @return The matching pair, or @ref error::no_match.

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-12.5.1"
        >12.5.1.  Accept (rfc9110)</a>
*/
FIELDPARSE_DECL
system::result<selection>
select_content_type(
    std::vector<content_type> const& requested,
    std::vector<content_type> const& available);

/** Select the content type of a response, with a fallback

    When nothing matches, both members of the
    result are `fallback`.
*/
FIELDPARSE_DECL
selection
select_content_type(
    std::vector<content_type> const& requested,
    std::vector<content_type> const& available,
    content_type const& fallback);

/** Select the content type of a response from an Accept field value

    The field value is parsed leniently by
    @ref parse_accept.
*/
FIELDPARSE_DECL
system::result<selection>
select_content_type(
    core::string_view accept,
    std::vector<content_type> const& available);

} // fieldparse

#endif
