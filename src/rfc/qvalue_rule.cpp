//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/rfc/qvalue_rule.hpp>
#include <boost/url/grammar/digit_chars.hpp>
#include <boost/url/grammar/error.hpp>

namespace fieldparse {
namespace implementation_defined {

auto
qvalue_rule_t::
parse(
    char const*& it,
    char const* end) const noexcept ->
        system::result<value_type>
{
    if(it == end)
        FIELDPARSE_RETURN_EC(
            grammar::error::need_more);

    char const lead = *it;
    if(lead != '0' && lead != '1')
        FIELDPARSE_RETURN_EC(
            grammar::error::mismatch);
    ++it;

    std::uint16_t v = lead == '1' ? 1000 : 0;
    if(it == end || *it != '.')
        return qvalue{ v };
    ++it;

    std::uint16_t scale = 100;
    std::size_t n = 0;
    while(it != end && grammar::digit_chars(*it))
    {
        if(++n > 3)
            FIELDPARSE_RETURN_EC(
                grammar::error::mismatch);
        std::uint16_t const d = *it - '0';
        if(lead == '1' && d != 0)
            FIELDPARSE_RETURN_EC(
                grammar::error::mismatch);
        v += d * scale;
        scale /= 10;
        ++it;
    }
    return qvalue{ v };
}

} // implementation_defined
} // fieldparse
