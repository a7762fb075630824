//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_RFC_QVALUE_RULE_HPP
#define FIELDPARSE_RFC_QVALUE_RULE_HPP

#include <fieldparse/detail/config.hpp>
#include <boost/system/result.hpp>
#include <cstdint>

namespace fieldparse {

/** A quality value

    The value is kept in thousandths so that
    comparisons are exact. `1000` is a quality
    of 1.0 and `0` means "not acceptable".
*/
struct qvalue
{
    std::uint16_t thousandths = 1000;

    double
    value() const noexcept
    {
        return thousandths / 1000.0;
    }

    friend
    bool
    operator==(
        qvalue a, qvalue b) noexcept
    {
        return a.thousandths == b.thousandths;
    }

    friend
    bool
    operator!=(
        qvalue a, qvalue b) noexcept
    {
        return a.thousandths != b.thousandths;
    }
};

//------------------------------------------------

namespace implementation_defined {
struct qvalue_rule_t
{
    using value_type = qvalue;

    FIELDPARSE_DECL
    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>;
};
} // implementation_defined

/** Rule matching a quality value

    @par Value Type
    @code
    using value_type = qvalue;
    @endcode

    @par Example
    @code
    auto rv = grammar::parse( "0.25", qvalue_rule );
    // rv->thousandths == 250
    @endcode

    @par BNF
    @code
    qvalue      = ( "0" [ "." 0*3DIGIT ] )
                / ( "1" [ "." 0*3("0") ] )
    @endcode

    @par Specification
    @li <a href="https://www.rfc-editor.org/rfc/rfc9110#section-12.4.2"
        >12.4.2.  Quality Values (rfc9110)</a>
*/
BOOST_INLINE_CONSTEXPR implementation_defined::qvalue_rule_t qvalue_rule{};

} // fieldparse

#endif
