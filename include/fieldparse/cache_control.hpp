//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_CACHE_CONTROL_HPP
#define FIELDPARSE_CACHE_CONTROL_HPP

#include <fieldparse/detail/config.hpp>
#include <fieldparse/parsed.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/optional/optional.hpp>
#include <boost/system/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace fieldparse {

/** A Cache-Control directive
*/
struct cache_directive
{
    /// The name, in lower case.
    std::string name;

    /// The argument, without quotes, if one was given.
    boost::optional<std::string> value;
};

/** The directives of a Cache-Control field

    Directives are kept in the order they first
    appear. Names are unique: setting a directive
    which is already present replaces its value.
*/
class cache_control
{
    std::vector<cache_directive> v_;

public:
    using const_iterator =
        std::vector<cache_directive>::const_iterator;

    const_iterator
    begin() const noexcept
    {
        return v_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return v_.end();
    }

    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    /** Return the directive with the given name, or nullptr

        The lookup is case-insensitive.
    */
    FIELDPARSE_DECL
    cache_directive const*
    find(core::string_view name) const noexcept;

    bool
    contains(core::string_view name) const noexcept
    {
        return find(name) != nullptr;
    }

    /** Return true if a directive is present without an argument

        This is how boolean directives such as "public"
        or "no-store" are expressed.
    */
    FIELDPARSE_DECL
    bool
    is_set(core::string_view name) const noexcept;

    /** Return the argument of a directive, if it has one
    */
    FIELDPARSE_DECL
    boost::optional<core::string_view>
    value(core::string_view name) const noexcept;

    /** Return the argument of a directive as delta-seconds

        An argument which does not consist only of
        digits yields no value. An argument larger
        than 2147483648 yields 2147483648.

        @par Specification
        @li <a href="https://www.rfc-editor.org/rfc/rfc9111#section-1.2.2"
            >1.2.2.  Delta Seconds (rfc9111)</a>
    */
    FIELDPARSE_DECL
    boost::optional<std::uint64_t>
    delta_seconds(core::string_view name) const noexcept;

    /** Add or replace a directive
    */
    FIELDPARSE_DECL
    void
    set(
        core::string_view name,
        boost::optional<std::string> value = boost::none);

    /** Return the serialized field value

        Arguments which are not tokens are
        written as quoted-strings.
    */
    FIELDPARSE_DECL
    std::string
    to_string() const;
};

/** Options for @ref parse_cache_control
*/
struct cache_control_options
{
    /// Fail on a directive which would otherwise be skipped.
    bool strict = false;
};

/** Parse a Cache-Control field value

    A directive whose name is not a token, or which
    has an "=" without an argument, is skipped with
    a warning. When a directive repeats, the last
    argument wins.

    @par Example
    @code
    auto rv = parse_cache_control( "public, max-age=2592000" );
    // rv->value.is_set( "public" )
    // *rv->value.delta_seconds( "max-age" ) == 2592000
    @endcode

    @par BNF
    @code
    Cache-Control   = #cache-directive
    cache-directive = token [ "=" ( token / quoted-string ) ]
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9111#section-5.2"
        >5.2.  Cache-Control (rfc9111)</a>
*/
FIELDPARSE_DECL
system::result<parsed<cache_control>>
parse_cache_control(
    core::string_view s,
    cache_control_options opt = {});

} // fieldparse

#endif
