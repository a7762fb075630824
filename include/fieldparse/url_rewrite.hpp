//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_URL_REWRITE_HPP
#define FIELDPARSE_URL_REWRITE_HPP

#include <fieldparse/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace fieldparse {

/// Tag type for @ref url_part
struct remove_part_t
{
    explicit constexpr remove_part_t() = default;
};

/** Constant which removes a component of a URL

    @see @ref url_rewrite
*/
BOOST_INLINE_CONSTEXPR remove_part_t remove_part{};

/** A change to one component of a URL

    A default-constructed part leaves the component
    as it is. Assigning a string replaces it, and
    assigning @ref remove_part removes it.
*/
class url_part
{
public:
    url_part() = default;

    url_part(remove_part_t) noexcept
        : kind_(kind::remove)
    {
    }

    url_part(std::string s) noexcept
        : kind_(kind::replace)
        , value_(std::move(s))
    {
    }

    url_part(core::string_view s)
        : url_part(std::string(s.data(), s.size()))
    {
    }

    url_part(char const* s)
        : url_part(std::string(s))
    {
    }

    /// Return true if the component is unchanged.
    bool
    is_kept() const noexcept
    {
        return kind_ == kind::keep;
    }

    /// Return true if the component is removed.
    bool
    is_removed() const noexcept
    {
        return kind_ == kind::remove;
    }

    /// Return the replacement, decoded.
    core::string_view
    value() const noexcept
    {
        return value_;
    }

private:
    enum class kind
    {
        keep,
        remove,
        replace
    };

    kind kind_ = kind::keep;
    std::string value_;
};

/** The changes applied by @ref rewrite_url

    Replacement values are plain text. Characters
    which may not appear in a component are
    percent-encoded as UTF-8.
*/
struct url_rewrite
{
    /** Replace or remove the scheme

        Removing the scheme turns the URL into a
        network-path reference.
    */
    url_part scheme;

    /** Replace or remove the user

        Removing the user also removes the password.
    */
    url_part user;

    /** Replace or remove the password

        A password is only written when the URL has
        a user. An empty password removes it.
    */
    url_part password;

    /** Replace or remove the host

        Removing the host keeps the authority, so
        `https://example.com/docs` becomes
        `https:///docs`. The port goes with it.
    */
    url_part host;

    /** Replace or remove the port

        The replacement must be decimal digits. The
        port is left alone when the URL has no host.
    */
    url_part port;

    /** Replace or remove the path

        Removing the path leaves "/".
    */
    url_part path;

    /// Replace or remove the query.
    url_part query;

    /** Replace the query with encoded pairs

        When not empty, this takes precedence over
        @ref query. Pairs are written in order.
    */
    std::vector<std::pair<
        std::string, std::string>> query_params;

    /// Replace or remove the fragment.
    url_part fragment;

    /** Allow a host name longer than 255 octets

        Labels longer than 63 octets are rejected
        regardless.
    */
    bool enable_long_host = false;
};

/** Return a URL with some of its components changed

    @par Example
    @code
    url_rewrite rw;
    rw.host = "www.example.com";
    rw.fragment = remove_part;
    auto rv = rewrite_url( "https://example.com:8080/docs#top", rw );
    // *rv == "https://www.example.com:8080/docs"
    @endcode

    @return The new URL, or an error if `s` is not a
    URI-reference or a replacement is invalid.

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc3986#section-3"
        >3.  Syntax Components (rfc3986)</a>
*/
FIELDPARSE_DECL
system::result<std::string>
rewrite_url(
    core::string_view s,
    url_rewrite const& rw);

} // fieldparse

#endif
