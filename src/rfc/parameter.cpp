//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/rfc/parameter.hpp>
#include <fieldparse/rfc/token_rule.hpp>
#include <fieldparse/rfc/detail/ws.hpp>
#include <fieldparse/error.hpp>
#include <boost/url/grammar/ci_string.hpp>

namespace fieldparse {

namespace {

enum class state
{
    between,        // before a name
    name,
    after_name,     // whitespace after the name
    before_value,   // after "="
    bare_value,
    quoted_value,
    after_value,    // whitespace or comment after the value
    comment,
    skip            // discarding a segment up to the next ";"
};

// Everything the scan carries from one character to the next
struct scan_state
{
    state st = state::between;
    state resume = state::between;
    std::size_t depth = 0;
    std::size_t first = 0;
    bool spaced = false;
    bool in_quote = false;
    error reason = error::bad_parameter;
    std::string name;
    std::string value;
    std::vector<parameter> params;
    std::vector<warning> warnings;
};

void
open_comment(
    scan_state& ss,
    state resume) noexcept
{
    ss.resume = resume;
    ss.depth = 1;
    ss.st = state::comment;
}

void
commit(scan_state& ss)
{
    ss.params.push_back(parameter{
        std::move(ss.name), std::move(ss.value) });
    ss.name.clear();
    ss.value.clear();
    ss.spaced = false;
    ss.st = state::between;
}

// The caller reprocesses the current character
void
enter_skip(
    scan_state& ss,
    error reason) noexcept
{
    ss.reason = reason;
    ss.in_quote = false;
    ss.st = state::skip;
}

void
skipped(
    scan_state& ss,
    core::string_view s,
    std::size_t last)
{
    auto const text = detail::trim_ows(
        s.substr(ss.first, last - ss.first));
    ss.warnings.push_back(warning{
        make_error_code(ss.reason),
        std::string(text.data(), text.size()) });
    ss.name.clear();
    ss.value.clear();
    ss.spaced = false;
    ss.in_quote = false;
    ss.st = state::between;
}

} // (anon)

system::result<parsed<std::vector<parameter>>>
parse_parameters(
    core::string_view s,
    parameter_options opt)
{
    auto const fold = [&opt](char c)
    {
        return opt.lowercase_values ?
            grammar::to_lower(c) : c;
    };

    scan_state ss;
    std::size_t i = 0;
    while(i < s.size())
    {
        char const c = s[i];
        switch(ss.st)
        {
        case state::between:
            if(c == ';' || detail::ws(c))
                break;
            ss.first = i;
            if(opt.comment_aware && c == '(')
            {
                open_comment(ss, state::between);
                break;
            }
            if(tchars(c))
            {
                ss.name.push_back(grammar::to_lower(c));
                ss.st = state::name;
                break;
            }
            enter_skip(ss, error::bad_parameter);
            continue;

        case state::name:
            if(tchars(c))
            {
                ss.name.push_back(grammar::to_lower(c));
                break;
            }
            if(c == '=')
            {
                ss.st = state::before_value;
                break;
            }
            if(detail::ws(c))
            {
                ss.spaced = true;
                ss.st = state::after_name;
                break;
            }
            if(opt.comment_aware && c == '(')
            {
                open_comment(ss, state::after_name);
                break;
            }
            if(c == ';')
            {
                if(opt.require_value)
                    FIELDPARSE_RETURN_EC(
                        error::missing_equals);
                commit(ss);
                break;
            }
            enter_skip(ss, error::bad_parameter);
            continue;

        case state::after_name:
            if(detail::ws(c))
            {
                ss.spaced = true;
                break;
            }
            if(opt.comment_aware && c == '(')
            {
                open_comment(ss, state::after_name);
                break;
            }
            if(c == '=')
            {
                if(ss.spaced && ! opt.tolerate_bad_whitespace)
                {
                    enter_skip(ss, error::bad_whitespace);
                    continue;
                }
                ss.st = state::before_value;
                break;
            }
            if(c == ';')
            {
                if(opt.require_value)
                    FIELDPARSE_RETURN_EC(
                        error::missing_equals);
                commit(ss);
                break;
            }
            enter_skip(ss, error::bad_parameter);
            continue;

        case state::before_value:
            if(detail::ws(c))
            {
                if(! opt.tolerate_bad_whitespace)
                {
                    enter_skip(ss, error::bad_whitespace);
                    continue;
                }
                break;
            }
            if(opt.comment_aware && c == '(')
            {
                open_comment(ss, state::before_value);
                break;
            }
            if(opt.quote_aware && c == '"')
            {
                ss.st = state::quoted_value;
                break;
            }
            if(c == ';' || (opt.strict && ! tchars(c)))
            {
                enter_skip(ss, error::bad_value);
                continue;
            }
            ss.value.push_back(fold(c));
            ss.st = state::bare_value;
            break;

        case state::bare_value:
            if(c == ';')
            {
                commit(ss);
                break;
            }
            if(detail::ws(c))
            {
                ss.st = state::after_value;
                break;
            }
            if(opt.comment_aware && c == '(')
            {
                open_comment(ss, state::after_value);
                break;
            }
            if( (opt.quote_aware && c == '"') ||
                (opt.strict && ! tchars(c)))
            {
                enter_skip(ss, error::bad_value);
                continue;
            }
            ss.value.push_back(fold(c));
            break;

        case state::quoted_value:
            if(c == '\\')
            {
                if(++i == s.size())
                    FIELDPARSE_RETURN_EC(
                        error::unterminated_quote);
                ss.value.push_back(s[i]);
                break;
            }
            if(c == '"')
            {
                ss.st = state::after_value;
                break;
            }
            ss.value.push_back(c);
            break;

        case state::after_value:
            if(detail::ws(c))
                break;
            if(c == ';')
            {
                commit(ss);
                break;
            }
            if(opt.comment_aware && c == '(')
            {
                open_comment(ss, state::after_value);
                break;
            }
            enter_skip(ss, error::bad_value);
            continue;

        case state::comment:
            if(c == '\\')
                ++i;
            else if(c == '(')
                ++ss.depth;
            else if(c == ')' && --ss.depth == 0)
                ss.st = ss.resume;
            break;

        case state::skip:
            if(opt.strict)
                return FIELDPARSE_ERR(ss.reason);
            if(ss.in_quote)
            {
                if(c == '\\')
                    ++i;
                else if(c == '"')
                    ss.in_quote = false;
                break;
            }
            if(opt.quote_aware && c == '"')
            {
                ss.in_quote = true;
                break;
            }
            if(opt.comment_aware && c == '(')
            {
                open_comment(ss, state::skip);
                break;
            }
            if(c == ';')
                skipped(ss, s, i);
            break;
        }
        ++i;
    }

    switch(ss.st)
    {
    case state::between:
        break;

    case state::name:
    case state::after_name:
        if(opt.require_value)
            FIELDPARSE_RETURN_EC(
                error::missing_equals);
        commit(ss);
        break;

    case state::before_value:
        if(opt.strict)
            FIELDPARSE_RETURN_EC(
                error::bad_value);
        ss.reason = error::bad_value;
        skipped(ss, s, s.size());
        break;

    case state::bare_value:
    case state::after_value:
        commit(ss);
        break;

    case state::quoted_value:
        FIELDPARSE_RETURN_EC(
            error::unterminated_quote);

    case state::comment:
        FIELDPARSE_RETURN_EC(
            error::unterminated_comment);

    case state::skip:
        if(ss.in_quote)
            FIELDPARSE_RETURN_EC(
                error::unterminated_quote);
        skipped(ss, s, s.size());
        break;
    }

    return parsed<std::vector<parameter>>{
        std::move(ss.params),
        std::move(ss.warnings) };
}

} // fieldparse
