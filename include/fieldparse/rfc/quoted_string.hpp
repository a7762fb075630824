//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_RFC_QUOTED_STRING_HPP
#define FIELDPARSE_RFC_QUOTED_STRING_HPP

#include <fieldparse/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>

namespace fieldparse {

/** Return true if all of `s` is one quoted-string

    @par BNF
    @code
    quoted-string  = DQUOTE *( qdtext / quoted-pair ) DQUOTE
    quoted-pair    = "\" ( HTAB / SP / VCHAR / obs-text )
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-5.6.4"
        >5.6.4.  Quoted Strings (rfc9110)</a>
*/
FIELDPARSE_DECL
bool
is_quoted_string(core::string_view s) noexcept;

/** Remove the quotes and escapes from a quoted-string

    @return The unescaped contents, or
    @ref error::unterminated_quote if `s` is not
    exactly one quoted-string.
*/
FIELDPARSE_DECL
system::result<std::string>
unquote(core::string_view s);

/** Append `s` as a quoted-string

    Every DQUOTE and backslash in `s` is escaped.
*/
FIELDPARSE_DECL
void
append_quoted(
    std::string& dest,
    core::string_view s);

/** Append `s` as a token, or as a quoted-string if it is not one
*/
FIELDPARSE_DECL
void
append_token_or_quoted(
    std::string& dest,
    core::string_view s);

} // fieldparse

#endif
