//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <fieldparse/content_type.hpp>

#include <fieldparse/error.hpp>

#include "test_suite.hpp"

#include <stdexcept>

namespace fieldparse {

struct content_type_test
{
    void
    bad(core::string_view s, error e)
    {
        auto rv = parse_content_type(s);
        BOOST_TEST(rv.has_error());
        if(! rv)
            BOOST_TEST(rv.error() == e);
    }

    void
    test_construct()
    {
        content_type ct("Text", " HTML ");
        BOOST_TEST_EQ(ct.type(), "text");
        BOOST_TEST_EQ(ct.subtype(), "html");
        BOOST_TEST(ct.suffix().empty());
        BOOST_TEST(ct.parameters().empty());
        BOOST_TEST(ct.quality() == 1.0);
        BOOST_TEST(! ct.has_explicit_quality());
        BOOST_TEST(! ct.is_wildcard());

        // last value wins, first position is kept
        content_type ct2("a", "b",
            {{ "X", "1" }, { "y", "2" }, { "x", "3" }});
        BOOST_TEST_EQ(ct2.parameters().size(), 2u);
        BOOST_TEST_EQ(ct2.parameters()[0].name, "x");
        BOOST_TEST_EQ(ct2.parameters()[0].value, "3");
        BOOST_TEST_EQ(ct2.parameters()[1].name, "y");

        BOOST_TEST_THROWS(content_type("", "plain"), std::invalid_argument);
        BOOST_TEST_THROWS(content_type("text", " "), std::invalid_argument);
    }

    void
    test_param()
    {
        content_type ct("text", "plain", {{ "charset", "utf-8" }});
        BOOST_TEST(ct.param("charset").has_value());
        BOOST_TEST_EQ(*ct.param("CharSet"), "utf-8");
        BOOST_TEST(! ct.param("format").has_value());

        auto ct2 = ct.with_parameter("Format", "flowed");
        BOOST_TEST_EQ(*ct2.param("format"), "flowed");
        BOOST_TEST(! ct.param("format").has_value());

        auto ct3 = ct2.with_parameter("charset", "latin1");
        BOOST_TEST_EQ(*ct3.param("charset"), "latin1");
        BOOST_TEST_EQ(ct3.parameters()[0].name, "charset");

        auto ct4 = ct2.without_parameter("CHARSET");
        BOOST_TEST(! ct4.param("charset").has_value());
        BOOST_TEST_EQ(ct4.parameters().size(), 1u);
        BOOST_TEST(ct2.param("charset").has_value());
    }

    void
    test_quality()
    {
        content_type ct("text", "plain");
        auto ct2 = ct.with_quality(0.5);
        BOOST_TEST(ct2.quality() == 0.5);
        BOOST_TEST_EQ(ct2.qval().thousandths, 500);
        BOOST_TEST(ct2.has_explicit_quality());
        BOOST_TEST(! ct2.param("q").has_value());
        BOOST_TEST(ct2 == ct);
        BOOST_TEST_EQ(ct2.to_string(), "text/plain");

        BOOST_TEST_EQ(ct.with_quality(qvalue{ 0 }).qval().thousandths, 0);
        BOOST_TEST_THROWS(ct.with_quality(1.5), std::invalid_argument);
        BOOST_TEST_THROWS(ct.with_quality(-0.1), std::invalid_argument);
        BOOST_TEST_THROWS(ct.with_quality(qvalue{ 1001 }), std::invalid_argument);
    }

    void
    test_specificity()
    {
        BOOST_TEST_EQ(content_type("*", "*").specificity(), 0u);
        BOOST_TEST_EQ(content_type("text", "*").specificity(), 1u);
        BOOST_TEST_EQ(content_type("text", "plain").specificity(), 2u);
        BOOST_TEST_EQ(content_type("text", "plain",
            {{ "format", "flowed" }}).specificity(), 3u);
        BOOST_TEST(content_type("*", "*").is_wildcard());
        BOOST_TEST(content_type("text", "*").is_wildcard());
    }

    void
    test_to_string()
    {
        BOOST_TEST_EQ(
            content_type("Application", "Vnd.API",
                {{ "charset", "utf-8" }}, "json").to_string(),
            "application/vnd.api+json; charset=utf-8");
        BOOST_TEST_EQ(
            content_type("text", "plain",
                {{ "z", "1" }, { "a", "hello world" }}).to_string(),
            "text/plain; a=\"hello world\"; z=1");
        BOOST_TEST_EQ(
            content_type("text", "plain",
                {{ "a", "x\"y" }, { "b", "" }}).to_string(),
            "text/plain; a=\"x\\\"y\"; b=\"\"");
    }

    void
    test_equality()
    {
        BOOST_TEST(
            content_type("a", "b", {{ "x", "1" }, { "y", "2" }}) ==
            content_type("A", "B", {{ "Y", "2" }, { "x", "1" }}));
        BOOST_TEST(
            content_type("a", "b", {{ "x", "1" }}) !=
            content_type("a", "b", {{ "x", "2" }}));
        BOOST_TEST(
            content_type("a", "b", {{ "x", "1" }}) !=
            content_type("a", "b"));
        BOOST_TEST(
            content_type("a", "b", {}, "json") !=
            content_type("a", "b"));
        BOOST_TEST(
            content_type("a", "b") !=
            content_type("a", "c"));
    }

    void
    test_parse()
    {
        {
            auto rv = parse_content_type("text/plain");
            BOOST_TEST(rv.has_value());
            if(rv)
            {
                BOOST_TEST_EQ(rv->value.type(), "text");
                BOOST_TEST_EQ(rv->value.subtype(), "plain");
                BOOST_TEST(rv->value.suffix().empty());
                BOOST_TEST(rv->value.parameters().empty());
                BOOST_TEST(rv->clean());
            }
        }
        {
            auto rv = parse_content_type(
                "message/HTTP+JSON; version=2.0 (someday); MsgType=\"Request\"");
            BOOST_TEST(rv.has_value());
            if(rv)
            {
                auto const& ct = rv->value;
                BOOST_TEST_EQ(ct.type(), "message");
                BOOST_TEST_EQ(ct.subtype(), "http");
                BOOST_TEST_EQ(ct.suffix(), "json");
                BOOST_TEST_EQ(*ct.param("version"), "2.0");
                BOOST_TEST_EQ(*ct.param("msgtype"), "Request");
                BOOST_TEST(rv->clean());
            }
        }
        {
            auto rv = parse_content_type("application/vnd.a+b+json");
            BOOST_TEST(rv.has_value());
            if(rv)
            {
                BOOST_TEST_EQ(rv->value.subtype(), "vnd.a+b");
                BOOST_TEST_EQ(rv->value.suffix(), "json");
            }
        }
        {
            auto rv = parse_content_type("text/plain (a comment)");
            BOOST_TEST(rv.has_value());
            if(rv)
                BOOST_TEST_EQ(rv->value.subtype(), "plain");
        }
        {
            auto rv = parse_content_type("*/*");
            BOOST_TEST(rv.has_value());
            if(rv)
                BOOST_TEST(rv->value.is_wildcard());
        }

        content_type const html(
            "text", "html", {{ "charset", "utf-8" }});
        for(auto s : {
            "text/html;charset=utf-8",
            "Text/HTML;Charset=\"utf-8\"",
            "text/html; charset=\"utf-8\"" })
        {
            auto rv = parse_content_type(s);
            BOOST_TEST(rv.has_value());
            if(rv)
                BOOST_TEST(rv->value == html);
        }
    }

    void
    test_parse_case()
    {
        {
            auto rv = parse_content_type(
                "text/plain; charset=UTF-8");
            BOOST_TEST(rv.has_value());
            if(rv)
                BOOST_TEST_EQ(*rv->value.param("charset"), "UTF-8");
        }
        {
            content_type_options opt;
            opt.lowercase_values = true;
            auto rv = parse_content_type(
                "multipart/mixed; Charset=UTF-8; boundary=\"AbC\"", opt);
            BOOST_TEST(rv.has_value());
            if(rv)
            {
                BOOST_TEST_EQ(*rv->value.param("charset"), "utf-8");
                BOOST_TEST_EQ(*rv->value.param("boundary"), "AbC");
            }
        }
    }

    void
    test_parse_errors()
    {
        bad("", error::missing_slash);
        bad("*", error::missing_slash);
        bad("text", error::missing_slash);
        bad("text/", error::bad_type);
        bad("/plain", error::bad_type);
        bad("text/plain+", error::bad_type);
        bad("text/+json", error::bad_type);
        bad("te xt/plain", error::bad_type);
        bad("text/plain/x", error::bad_type);
        bad("text/plain (comment", error::unterminated_comment);
        bad("text/plain; a=\"b", error::unterminated_quote);
        bad("text/plain; a", error::missing_equals);
    }

    void
    test_parse_lenient()
    {
        auto rv = parse_content_type(
            "text/plain; charset = utf-8; format=flowed");
        BOOST_TEST(rv.has_value());
        if(! rv)
            return;
        BOOST_TEST_EQ(rv->value.parameters().size(), 1u);
        BOOST_TEST_EQ(*rv->value.param("format"), "flowed");
        BOOST_TEST_EQ(rv->warnings.size(), 1u);
        if(rv->warnings.size() == 1)
        {
            BOOST_TEST(rv->warnings[0].ec == error::bad_whitespace);
            BOOST_TEST_EQ(rv->warnings[0].text, "charset = utf-8");
        }

        content_type_options opt;
        opt.strict = true;
        auto rv2 = parse_content_type(
            "text/plain; charset = utf-8", opt);
        BOOST_TEST(rv2.has_error());
        if(! rv2)
        {
            BOOST_TEST(rv2.error() == error::bad_whitespace);
            BOOST_TEST(rv2.error() == condition::strict_violation);
        }
    }

    void
    test_round_trip()
    {
        content_type const v[] = {
            content_type("text", "plain"),
            content_type("multipart", "form-data",
                {{ "boundary", "a;b" }, { "charset", "utf-8" }}),
            content_type("application", "vnd.x", {{ "v", "1.0" }}, "json"),
            content_type("text", "plain", {{ "title", "say \"hi\"" }}),
            content_type("text", "plain", {{ "charset", "UTF-8" }}),
            content_type("multipart", "mixed",
                {{ "boundary", "AbC dEf" }}) };
        for(auto const& ct : v)
        {
            auto rv = parse_content_type(ct.to_string());
            BOOST_TEST(rv.has_value());
            if(rv)
            {
                BOOST_TEST_EQ(rv->value.to_string(), ct.to_string());
                BOOST_TEST(rv->value == ct);
            }
        }
    }

    void
    run()
    {
        test_construct();
        test_param();
        test_quality();
        test_specificity();
        test_to_string();
        test_equality();
        test_parse();
        test_parse_case();
        test_parse_errors();
        test_parse_lenient();
        test_round_trip();
    }
};

TEST_SUITE(
    content_type_test,
    "fieldparse.content_type");

} // fieldparse
