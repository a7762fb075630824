//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <fieldparse/negotiate.hpp>
#include <fieldparse/accept.hpp>
#include <fieldparse/error.hpp>

namespace fieldparse {

namespace {

bool
matches(
    content_type const& req,
    content_type const& avail)
{
    if( req.type() != "*" &&
        avail.type() != "*" &&
        req.type() != avail.type())
        return false;
    if( req.subtype() == "*" ||
        avail.subtype() == "*")
        return true;
    if( req.subtype() != avail.subtype() ||
        req.suffix() != avail.suffix())
        return false;
    for(auto const& p : avail.parameters())
    {
        auto const v = req.param(p.name);
        if(! v || *v != p.value)
            return false;
    }
    return true;
}

// True if an entry with quality 0, at least as
// specific as `req`, also matches `avail`.
bool
refused(
    std::vector<content_type> const& requested,
    content_type const& req,
    content_type const& avail)
{
    for(auto const& r : requested)
    {
        if( r.qval().thousandths == 0 &&
            r.specificity() >= req.specificity() &&
            matches(r, avail))
            return true;
    }
    return false;
}

} // (anon)

system::result<selection>
select_content_type(
    std::vector<content_type> const& requested,
    std::vector<content_type> const& available)
{
    if(requested.empty())
        return select_content_type(
            std::vector<content_type>{
                content_type("*", "*") },
            available);

    for(auto const& req : requested)
    {
        if(req.qval().thousandths == 0)
            continue;
        for(auto const& avail : available)
        {
            if(! matches(req, avail))
                continue;
            if(refused(requested, req, avail))
                continue;
            return selection{ req, avail };
        }
    }
    FIELDPARSE_RETURN_EC(error::no_match);
}

selection
select_content_type(
    std::vector<content_type> const& requested,
    std::vector<content_type> const& available,
    content_type const& fallback)
{
    auto rv = select_content_type(
        requested, available);
    if(rv)
        return *rv;
    return selection{ fallback, fallback };
}

system::result<selection>
select_content_type(
    core::string_view accept,
    std::vector<content_type> const& available)
{
    auto rv = parse_accept(accept);
    if(! rv)
        return rv.error();
    return select_content_type(
        rv->value, available);
}

} // fieldparse
