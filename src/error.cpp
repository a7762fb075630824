//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/error.hpp>

namespace fieldparse {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "fieldparse";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::unterminated_quote: return "unterminated quoted-string";
    case error::unterminated_comment: return "unterminated comment";
    case error::missing_equals: return "missing '=' in parameter";
    case error::bad_whitespace: return "whitespace around '='";
    case error::bad_parameter: return "bad parameter name";
    case error::bad_value: return "bad parameter value";
    case error::missing_slash: return "missing '/' in media type";
    case error::bad_type: return "bad media type";
    case error::bad_quality: return "bad quality value";
    case error::missing_angle_bracket: return "missing '<' or '>' in link";
    case error::missing_semicolon: return "missing ';' before link parameters";
    case error::empty_element: return "empty list element";
    case error::nonstandard_parameter: return "nonstandard parameter";
    case error::duplicate_parameter: return "duplicate parameter";
    case error::no_match: return "no acceptable content type";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "fieldparse";
}

std::string
condition_cat_type::
message(int cv) const
{
    return message(cv, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int cv,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(cv))
    {
    case condition::malformed_value: return "malformed value";
    case condition::strict_violation: return "strict mode violation";
    case condition::no_match: return "no match";
    default:
        return "unknown";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int cv) const noexcept
{
    if(ec.category() != error_cat)
        return false;
    switch(static_cast<condition>(cv))
    {
    case condition::malformed_value:
        switch(static_cast<error>(ec.value()))
        {
        case error::unterminated_quote:
        case error::unterminated_comment:
        case error::missing_equals:
        case error::bad_parameter:
        case error::bad_value:
        case error::missing_slash:
        case error::bad_type:
        case error::bad_quality:
        case error::missing_angle_bracket:
        case error::missing_semicolon:
        case error::empty_element:
            return true;
        default:
            return false;
        }

    case condition::strict_violation:
        switch(static_cast<error>(ec.value()))
        {
        case error::bad_whitespace:
        case error::nonstandard_parameter:
        case error::duplicate_parameter:
            return true;
        default:
            return false;
        }

    case condition::no_match:
        return ec == error::no_match;

    default:
        return false;
    }
}

//-----------------------------------------------

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

} // detail
} // fieldparse
