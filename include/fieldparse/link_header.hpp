//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_LINK_HEADER_HPP
#define FIELDPARSE_LINK_HEADER_HPP

#include <fieldparse/detail/config.hpp>
#include <fieldparse/parsed.hpp>
#include <fieldparse/rfc/parameter.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>
#include <vector>

namespace fieldparse {

/** One link of a Link field

    The parameters are an ordered sequence rather
    than a map, since some of them, such as
    "hreflang", may legally repeat. Parameter
    names are stored in lower case.

    @par Example
    @code
    link_header lh( "http://x/y", {{ "rel", "previous" }, { "title", "previous chapter" }} );
    // lh.to_string() == "<http://x/y>; rel=\"previous\"; title=\"previous chapter\""
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc8288#section-3"
        >3.  Link Serialisation in HTTP Headers (rfc8288)</a>
*/
class link_header
{
    std::string target_;
    std::vector<parameter> params_;

public:
    /** Constructor

        @throws std::invalid_argument `target` is empty.
    */
    FIELDPARSE_DECL
    link_header(
        core::string_view target,
        std::vector<parameter> params = {});

    /** Return the URI-reference between the angle brackets
    */
    core::string_view
    target() const noexcept
    {
        return target_;
    }

    std::vector<parameter> const&
    parameters() const noexcept
    {
        return params_;
    }

    /** Return the link relation types

        When "rel" appears more than once, the values
        are joined with a single space. An empty string
        means there is no "rel" parameter.
    */
    FIELDPARSE_DECL
    std::string
    rel() const;

    /** Return every value of a parameter, in order
    */
    FIELDPARSE_DECL
    std::vector<core::string_view>
    values(core::string_view name) const;

    /** Return true if the parameter is present
    */
    FIELDPARSE_DECL
    bool
    contains(core::string_view name) const noexcept;

    /** Return the serialized link

        The "rel" parameter is written first, followed
        by the other parameters sorted by name. Values
        are written as quoted-strings, except for
        extended parameters (whose names end in "*")
        whose value is a token.
    */
    FIELDPARSE_DECL
    std::string
    to_string() const;

    friend
    bool
    operator==(
        link_header const& a,
        link_header const& b) noexcept
    {
        return
            a.target_ == b.target_ &&
            a.params_ == b.params_;
    }

    friend
    bool
    operator!=(
        link_header const& a,
        link_header const& b) noexcept
    {
        return !(a == b);
    }
};

//------------------------------------------------

/** How repeated Link parameters are treated
*/
enum class link_duplicates
{
    /** Keep only the first "rel", "media", "type", "title" and "title*"

        When both "title*" and "title" are present, "title"
        takes the value of "title*". Other parameters are
        never removed.
    */
    first_wins,

    /// Keep every occurrence.
    keep_all
};

/** Options for @ref parse_link
*/
struct link_options
{
    /// Treatment of repeated parameters.
    link_duplicates duplicates = link_duplicates::first_wins;

    /// Fail on a parameter which would otherwise be skipped.
    bool strict = false;

    /// Accept whitespace before and after "=".
    bool tolerate_bad_whitespace = true;
};

/** Parse a Link field value

    A value which does not start with "<", a target
    without a closing ">", and parameters which do not
    start with ";" fail regardless of `opt.strict`.
    A parameter without "=" has an empty value.

    @par Example
    @code
    auto rv = parse_link( "<http://x/y>; rel=\"previous\"; title=\"previous chapter\"" );
    // rv->value[0].rel() == "previous"
    @endcode

    @par BNF
    @code
    Link       = #link-value
    link-value = "<" URI-Reference ">" *( OWS ";" OWS link-param )
    link-param = token BWS [ "=" BWS ( token / quoted-string ) ]
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc8288#section-3"
        >3.  Link Serialisation in HTTP Headers (rfc8288)</a>
*/
FIELDPARSE_DECL
system::result<parsed<std::vector<link_header>>>
parse_link(
    core::string_view s,
    link_options opt = {});

} // fieldparse

#endif
