//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <fieldparse/accept.hpp>

#include <fieldparse/error.hpp>

#include "test_suite.hpp"

#include <initializer_list>

namespace fieldparse {

struct accept_test
{
    using parser = system::result<parsed<
        std::vector<std::string>>>(*)(
            core::string_view, qualified_list_options);

    void
    check_types(
        core::string_view s,
        std::initializer_list<char const*> init)
    {
        auto rv = parse_accept(s);
        BOOST_TEST(rv.has_value());
        if(! rv)
            return;
        BOOST_TEST_EQ(rv->value.size(), init.size());
        if(rv->value.size() != init.size())
            return;
        auto it = init.begin();
        for(auto const& ct : rv->value)
            BOOST_TEST_EQ(ct.to_string(), *it++);
    }

    void
    check_tokens(
        parser f,
        core::string_view s,
        std::initializer_list<char const*> init)
    {
        auto rv = f(s, {});
        BOOST_TEST(rv.has_value());
        if(! rv)
            return;
        BOOST_TEST_EQ(rv->value.size(), init.size());
        if(rv->value.size() != init.size())
            return;
        auto it = init.begin();
        for(auto const& tok : rv->value)
            BOOST_TEST_EQ(tok, *it++);
    }

    void
    test_accept()
    {
        {
            auto rv = parse_accept("text/html");
            BOOST_TEST(rv.has_value());
            if(rv && rv->value.size() == 1)
            {
                auto const& ct = rv->value[0];
                BOOST_TEST(ct.quality() == 1.0);
                BOOST_TEST(! ct.has_explicit_quality());
                BOOST_TEST(! ct.param("q").has_value());
            }
        }

        check_types(
            "text/*, text/plain, text/plain;format=flowed, */*",
            { "text/plain; format=flowed", "text/plain", "text/*", "*/*" });

        check_types(
            "audio/*;q=0.2, audio/basic, audio/aiff;q=0",
            { "audio/basic", "audio/*", "audio/aiff" });

        check_types(
            "text/html, application/json;q=1.0",
            { "application/json", "text/html" });

        check_types(
            "b/b;q=0.5, a/a;q=0.5, c/c;q=0.7",
            { "c/c", "b/b", "a/a" });

        check_types("", {});
        check_types(" , ", {});
    }

    void
    test_accept_quality()
    {
        auto rv = parse_accept(
            "audio/*;q=0.2, audio/basic, audio/aiff;q=0");
        BOOST_TEST(rv.has_value());
        if(! rv || rv->value.size() != 3)
            return;
        BOOST_TEST(rv->value[0] == content_type("audio", "basic"));
        BOOST_TEST(rv->value[1].quality() == 0.2);
        BOOST_TEST(rv->value[1].has_explicit_quality());
        BOOST_TEST_EQ(rv->value[2].qval().thousandths, 0);
        for(auto const& ct : rv->value)
            BOOST_TEST(! ct.param("q").has_value());
    }

    void
    test_accept_params()
    {
        {
            auto rv = parse_accept("application/json;charset=\"utf-8\"");
            BOOST_TEST(rv.has_value());
            if(rv && rv->value.size() == 1)
                BOOST_TEST(rv->value[0] == content_type(
                    "application", "json", {{ "charset", "utf-8" }}));
        }
        {
            auto rv = parse_accept("application/json;x-foo=\" something else\"");
            BOOST_TEST(rv.has_value());
            if(rv && rv->value.size() == 1)
                BOOST_TEST_EQ(*rv->value[0].param("x-foo"), " something else");
        }
    }

    void
    test_accept_lenient()
    {
        core::string_view const s =
            "text/html, image/gif, image/jpeg, *; q=.2, */*; q=.2";
        auto rv = parse_accept(s);
        BOOST_TEST(rv.has_value());
        if(! rv)
            return;
        BOOST_TEST_EQ(rv->value.size(), 4u);
        if(rv->value.size() == 4)
        {
            BOOST_TEST(rv->value[0] == content_type("text", "html"));
            BOOST_TEST(rv->value[1] == content_type("image", "gif"));
            BOOST_TEST(rv->value[2] == content_type("image", "jpeg"));
            BOOST_TEST(rv->value[3] == content_type("*", "*"));
        }
        BOOST_TEST_EQ(rv->warnings.size(), 2u);
        if(rv->warnings.size() == 2)
        {
            BOOST_TEST(rv->warnings[0].ec == error::missing_slash);
            BOOST_TEST_EQ(rv->warnings[0].text, "*; q=.2");
            BOOST_TEST(rv->warnings[1].ec == error::bad_quality);
            BOOST_TEST_EQ(rv->warnings[1].text, "*/*; q=.2");
        }

        accept_options opt;
        opt.strict = true;
        auto rv2 = parse_accept(s, opt);
        BOOST_TEST(rv2.has_error());
        if(! rv2)
            BOOST_TEST(rv2.error() == error::missing_slash);

        auto rv3 = parse_accept("*");
        BOOST_TEST(rv3.has_value());
        if(rv3)
        {
            BOOST_TEST(rv3->value.empty());
            BOOST_TEST_EQ(rv3->warnings.size(), 1u);
        }

        auto rv4 = parse_accept("text/html;q=\"0.5");
        BOOST_TEST(rv4.has_error());
        if(! rv4)
            BOOST_TEST(rv4.error() == error::unterminated_quote);
    }

    void
    test_accept_charset()
    {
        check_tokens(parse_accept_charset, "*", { "*" });
        check_tokens(parse_accept_charset,
            "acceptable, rejected;q=0, *",
            { "acceptable", "*", "rejected" });
        check_tokens(parse_accept_charset,
            "us-ascii;q=0.1, latin1;q=0.5,utf-8; q=1.0",
            { "utf-8", "latin1", "us-ascii" });
        check_tokens(parse_accept_charset,
            "us-ascii;q=0.1,utf-8,latin1;q=0.8",
            { "utf-8", "latin1", "us-ascii" });
        check_tokens(parse_accept_charset,
            "latin1;q=0.5, utf-8;q=1.0, us-ascii;q=0.1, ebcdic;q=0, *",
            { "utf-8", "*", "latin1", "us-ascii", "ebcdic" });
        check_tokens(parse_accept_charset,
            "utf-8;Q=0.5, latin1",
            { "latin1", "utf-8" });
    }

    void
    test_accept_charset_quality()
    {
        auto rv = parse_accept_charset(
            "acceptable, rejected;q=0.0009, *");
        BOOST_TEST(rv.has_value());
        if(rv)
        {
            BOOST_TEST(rv->value == (std::vector<std::string>{
                "acceptable", "*", "rejected" }));
            BOOST_TEST_EQ(rv->warnings.size(), 1u);
            if(rv->warnings.size() == 1)
                BOOST_TEST(rv->warnings[0].ec == error::bad_quality);
        }

        qualified_list_options opt;
        opt.strict = true;
        auto rv2 = parse_accept_charset(
            "acceptable, rejected;q=0.0009, *", opt);
        BOOST_TEST(rv2.has_error());
        if(! rv2)
            BOOST_TEST(rv2.error() == error::bad_quality);

        auto rv3 = parse_accept_charset("utf 8, latin1");
        BOOST_TEST(rv3.has_value());
        if(rv3)
        {
            BOOST_TEST(rv3->value == (std::vector<std::string>{ "latin1" }));
            BOOST_TEST_EQ(rv3->warnings.size(), 1u);
        }

        auto rv4 = parse_accept_charset("utf 8, latin1", opt);
        BOOST_TEST(rv4.has_error());
        if(! rv4)
            BOOST_TEST(rv4.error() == error::bad_value);
    }

    void
    test_accept_encoding()
    {
        check_tokens(parse_accept_encoding, "*", { "*" });
        check_tokens(parse_accept_encoding,
            "compress, gzip;q=0.8, bzip;q=0.7",
            { "compress", "gzip", "bzip" });
        check_tokens(parse_accept_encoding,
            "snappy;q=0.1,gzip,bzip;q=0.8",
            { "gzip", "bzip", "snappy" });
        check_tokens(parse_accept_encoding,
            "bzip, gzip;q=0.0009, *",
            { "bzip", "*", "gzip" });
    }

    void
    test_accept_language()
    {
        check_tokens(parse_accept_language, "*", { "*" });
        check_tokens(parse_accept_language,
            "de, en-gb;q=0.8, en;q=0.7",
            { "de", "en-gb", "en" });
        check_tokens(parse_accept_language,
            "de-Latn-DE,de-Latf-DE,de-Latn-DE-1996",
            { "de-Latn-DE", "de-Latf-DE", "de-Latn-DE-1996" });
        check_tokens(parse_accept_language,
            "de-Latn-DE,de-Latf-DE,de-Latn-DE-1996;q=1.0",
            { "de-Latn-DE-1996", "de-Latn-DE", "de-Latf-DE" });
        check_tokens(parse_accept_language,
            "de-Latn-DE,de-Latf-DE;q=1.0,de-Latn-DE-1996;q=1.0",
            { "de-Latf-DE", "de-Latn-DE-1996", "de-Latn-DE" });
    }

    void
    run()
    {
        test_accept();
        test_accept_quality();
        test_accept_params();
        test_accept_lenient();
        test_accept_charset();
        test_accept_charset_quality();
        test_accept_encoding();
        test_accept_language();
    }
};

TEST_SUITE(
    accept_test,
    "fieldparse.accept");

} // fieldparse
