//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_CONTENT_TYPE_HPP
#define FIELDPARSE_CONTENT_TYPE_HPP

#include <fieldparse/detail/config.hpp>
#include <fieldparse/parsed.hpp>
#include <fieldparse/rfc/parameter.hpp>
#include <fieldparse/rfc/qvalue_rule.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace fieldparse {

/** A media type with parameters

    Objects of this type are immutable. The type,
    subtype, suffix and parameter names are stored
    in lower case. Parameter names are unique; when
    a name repeats, the last value wins and the
    position of the first occurrence is kept.

    A content type produced by @ref parse_accept also
    carries the quality of the entry. The quality is
    not a parameter: it does not take part in equality
    and it is not written by @ref to_string.

    @par Example
    @code
    content_type ct( "Application", "Vnd.API", {{ "charset", "utf-8" }}, "json" );
    // ct.to_string() == "application/vnd.api+json; charset=utf-8"
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-8.3.1"
        >8.3.1.  Media Type (rfc9110)</a>
    @li <a href="https://www.rfc-editor.org/rfc/rfc6839#section-3"
        >3.  Structured Syntax Suffixes (rfc6839)</a>
*/
class content_type
{
    std::string type_;
    std::string subtype_;
    std::string suffix_;
    std::vector<parameter> params_;
    qvalue q_;
    bool explicit_q_ = false;

public:
    /** Constructor

        @throws std::invalid_argument `type` or
        `subtype` is empty.
    */
    FIELDPARSE_DECL
    content_type(
        core::string_view type,
        core::string_view subtype,
        std::vector<parameter> params = {},
        core::string_view suffix = {});

    /** Return the type, such as "text"
    */
    core::string_view
    type() const noexcept
    {
        return type_;
    }

    /** Return the subtype, such as "plain"
    */
    core::string_view
    subtype() const noexcept
    {
        return subtype_;
    }

    /** Return the structured syntax suffix

        The suffix does not include the plus
        sign. An empty string means there is
        no suffix.
    */
    core::string_view
    suffix() const noexcept
    {
        return suffix_;
    }

    std::vector<parameter> const&
    parameters() const noexcept
    {
        return params_;
    }

    /** Return the value of a parameter, if present

        The lookup is case-insensitive.
    */
    FIELDPARSE_DECL
    boost::optional<core::string_view>
    param(core::string_view name) const noexcept;

    /** Return the quality, from 0 to 1
    */
    double
    quality() const noexcept
    {
        return q_.value();
    }

    qvalue
    qval() const noexcept
    {
        return q_;
    }

    /** Return true if the quality was given explicitly
    */
    bool
    has_explicit_quality() const noexcept
    {
        return explicit_q_;
    }

    /** Return true if the type or subtype is "*"
    */
    bool
    is_wildcard() const noexcept
    {
        return type_ == "*" || subtype_ == "*";
    }

    /** Return the specificity used to rank Accept entries

        A full wildcard is 0, a wildcard subtype is 1,
        and a concrete media type is 2 plus its number
        of parameters.
    */
    std::size_t
    specificity() const noexcept
    {
        if(subtype_ == "*" || type_ == "*")
            return type_ == "*" && subtype_ == "*" ? 0 : 1;
        return 2 + params_.size();
    }

    /** Return a copy with a parameter added or replaced
    */
    FIELDPARSE_DECL
    content_type
    with_parameter(
        core::string_view name,
        core::string_view value) const;

    /** Return a copy without the named parameter
    */
    FIELDPARSE_DECL
    content_type
    without_parameter(
        core::string_view name) const;

    /** Return a copy with an explicit quality

        @throws std::invalid_argument `q` is not
        within [0, 1].
    */
    FIELDPARSE_DECL
    content_type
    with_quality(double q) const;

    /// @copydoc with_quality
    FIELDPARSE_DECL
    content_type
    with_quality(qvalue q) const;

    /** Return the canonical serialization

        Parameters are written sorted by name.
        A value which is not a token is written
        as a quoted-string.
    */
    FIELDPARSE_DECL
    std::string
    to_string() const;
};

/** Return true if two content types are equal

    The quality is not compared, and the order
    of parameters does not matter.
*/
FIELDPARSE_DECL
bool
operator==(
    content_type const& a,
    content_type const& b) noexcept;

inline
bool
operator!=(
    content_type const& a,
    content_type const& b) noexcept
{
    return !(a == b);
}

//------------------------------------------------

/** Options for @ref parse_content_type
*/
struct content_type_options
{
    /// Convert token parameter values to lower case.
    bool lowercase_values = false;

    /// Fail on a parameter which would otherwise be skipped.
    bool strict = false;
};

/** Parse a Content-Type field value

    Comments are removed. The subtype is split at its
    last plus sign into the subtype and the structured
    syntax suffix. A value without a slash, or whose
    type or subtype is not a token, fails.

    @par Example
    @code
    auto rv = parse_content_type( "message/HTTP+JSON; version=2.0 (someday)" );
    // rv->value.subtype() == "http"
    // rv->value.suffix() == "json"
    // *rv->value.param( "version" ) == "2.0"
    @endcode

    @par BNF
    @code
    media-type  = type "/" subtype [ "+" suffix ] parameters
    type        = token
    subtype     = token
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-8.3"
        >8.3.  Content-Type (rfc9110)</a>
    @li <a href="https://www.rfc-editor.org/rfc/rfc2045#section-5.1"
        >5.1.  Syntax of the Content-Type Header Field (rfc2045)</a>
*/
FIELDPARSE_DECL
system::result<parsed<content_type>>
parse_content_type(
    core::string_view s,
    content_type_options opt = {});

} // fieldparse

#endif
