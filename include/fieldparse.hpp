//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_HPP
#define FIELDPARSE_HPP

#include <fieldparse/accept.hpp>
#include <fieldparse/cache_control.hpp>
#include <fieldparse/content_type.hpp>
#include <fieldparse/error.hpp>
#include <fieldparse/forwarded.hpp>
#include <fieldparse/link_header.hpp>
#include <fieldparse/list.hpp>
#include <fieldparse/negotiate.hpp>
#include <fieldparse/parsed.hpp>
#include <fieldparse/url_auth.hpp>
#include <fieldparse/url_rewrite.hpp>

#include <fieldparse/rfc/list_rule.hpp>
#include <fieldparse/rfc/parameter.hpp>
#include <fieldparse/rfc/quoted_string.hpp>
#include <fieldparse/rfc/qvalue_rule.hpp>
#include <fieldparse/rfc/token_rule.hpp>

#endif
