//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_RFC_TOKEN_RULE_HPP
#define FIELDPARSE_RFC_TOKEN_RULE_HPP

#include <fieldparse/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/url/grammar/token_rule.hpp>

namespace fieldparse {

/** The set of token characters

    @par BNF
    @code
    tchar       = "!" / "#" / "$" / "%" / "&" / "'" / "*"
                / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
                / DIGIT / ALPHA
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-5.6.2"
        >5.6.2.  Tokens (rfc9110)</a>
*/
BOOST_INLINE_CONSTEXPR grammar::lut_chars tchars =
    "!#$%&'*+-.^_`|~"
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz";

/** Rule matching a token

    @par Value Type
    @code
    using value_type = core::string_view;
    @endcode

    @par BNF
    @code
    token       = 1*tchar
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-5.6.2"
        >5.6.2.  Tokens (rfc9110)</a>
*/
BOOST_INLINE_CONSTEXPR auto token_rule = grammar::token_rule(tchars);

/** Return true if `s` is a non-empty token
*/
inline
bool
is_token(core::string_view s) noexcept
{
    return grammar::parse(s, token_rule).has_value();
}

} // fieldparse

#endif
