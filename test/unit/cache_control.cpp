//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <fieldparse/cache_control.hpp>

#include <fieldparse/error.hpp>

#include "test_suite.hpp"

namespace fieldparse {

struct cache_control_test
{
    void
    test_parse()
    {
        auto rv = parse_cache_control("public, max-age=2592000");
        BOOST_TEST(rv.has_value());
        if(! rv)
            return;
        auto const& cc = rv->value;
        BOOST_TEST(rv->clean());
        BOOST_TEST_EQ(cc.size(), 2u);
        BOOST_TEST(cc.is_set("public"));
        BOOST_TEST(! cc.is_set("max-age"));
        BOOST_TEST(! cc.value("public").has_value());
        BOOST_TEST_EQ(*cc.value("max-age"), "2592000");
        BOOST_TEST_EQ(*cc.delta_seconds("max-age"), 2592000u);
        BOOST_TEST(! cc.contains("private"));
        BOOST_TEST(! cc.is_set("private"));

        auto it = cc.begin();
        BOOST_TEST_EQ(it->name, "public");
        ++it;
        BOOST_TEST_EQ(it->name, "max-age");
        ++it;
        BOOST_TEST(it == cc.end());
    }

    void
    test_quoted()
    {
        auto rv = parse_cache_control(
            "no-cache=\"Set-Cookie, X-Foo\", private");
        BOOST_TEST(rv.has_value());
        if(! rv)
            return;
        BOOST_TEST_EQ(rv->value.size(), 2u);
        BOOST_TEST_EQ(*rv->value.value("no-cache"), "Set-Cookie, X-Foo");
        BOOST_TEST(rv->value.is_set("private"));
    }

    void
    test_names()
    {
        auto rv = parse_cache_control("Max-Age=10, max-age=20, NO-STORE");
        BOOST_TEST(rv.has_value());
        if(! rv)
            return;
        auto const& cc = rv->value;
        BOOST_TEST_EQ(cc.size(), 2u);
        BOOST_TEST(cc.find("MAX-AGE") != nullptr);
        BOOST_TEST_EQ(cc.find("max-age")->name, "max-age");
        BOOST_TEST_EQ(*cc.value("max-age"), "20");
        BOOST_TEST(cc.is_set("no-store"));
    }

    void
    test_delta_seconds()
    {
        cache_control cc;
        cc.set("a", std::string("abc"));
        cc.set("b", std::string("99999999999"));
        cc.set("c", std::string("0"));
        cc.set("d");
        cc.set("e", std::string());
        BOOST_TEST(! cc.delta_seconds("a").has_value());
        BOOST_TEST_EQ(*cc.delta_seconds("b"), 2147483648u);
        BOOST_TEST_EQ(*cc.delta_seconds("c"), 0u);
        BOOST_TEST(! cc.delta_seconds("d").has_value());
        BOOST_TEST(! cc.delta_seconds("e").has_value());
        BOOST_TEST(! cc.delta_seconds("z").has_value());
    }

    void
    test_skip()
    {
        auto rv = parse_cache_control("max-age=, public, =5, a=b c");
        BOOST_TEST(rv.has_value());
        if(! rv)
            return;
        BOOST_TEST_EQ(rv->value.size(), 1u);
        BOOST_TEST(rv->value.is_set("public"));
        BOOST_TEST_EQ(rv->warnings.size(), 3u);
        if(rv->warnings.size() == 3)
        {
            BOOST_TEST(rv->warnings[0].ec == error::bad_value);
            BOOST_TEST_EQ(rv->warnings[0].text, "max-age=");
            BOOST_TEST(rv->warnings[1].ec == error::bad_parameter);
            BOOST_TEST(rv->warnings[2].ec == error::bad_value);
        }

        cache_control_options opt;
        opt.strict = true;
        auto rv2 = parse_cache_control("public, max-age=", opt);
        BOOST_TEST(rv2.has_error());
        if(! rv2)
            BOOST_TEST(rv2.error() == error::bad_value);

        auto rv3 = parse_cache_control("no-cache=\"abc");
        BOOST_TEST(rv3.has_error());
        if(! rv3)
            BOOST_TEST(rv3.error() == error::unterminated_quote);
    }

    void
    test_to_string()
    {
        auto rv = parse_cache_control(
            "public,max-age=60 ,  no-cache=\"a b\", private=\"x\"");
        BOOST_TEST(rv.has_value());
        if(rv)
            BOOST_TEST_EQ(rv->value.to_string(),
                "public, max-age=60, no-cache=\"a b\", private=x");

        cache_control cc;
        BOOST_TEST(cc.empty());
        BOOST_TEST_EQ(cc.to_string(), "");
    }

    void
    run()
    {
        test_parse();
        test_quoted();
        test_names();
        test_delta_seconds();
        test_skip();
        test_to_string();
    }
};

TEST_SUITE(
    cache_control_test,
    "fieldparse.cache_control");

} // fieldparse
