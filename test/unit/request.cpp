//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

// Test that header file is self-contained.
#include <boost/endpoints/header.hpp>
#include <boost/endpoints/query.hpp>
#include <boost/endpoints/verb.hpp>

#include <boost/endpoints/and.hpp>
#include <boost/endpoints/path.hpp>
#include "test_suite.hpp"
#include "test_helpers.hpp"

#include <string>

namespace boost {
namespace endpoints {

struct request_test
{
    void
    testInput()
    {
        input in("POST", "/a/b?x=1&y=2");
        BOOST_TEST(in.verb() == method::post);
        BOOST_TEST(in.method_string() == "POST");
        BOOST_TEST(in.target() == "/a/b?x=1&y=2");
        BOOST_TEST(in.path() == "/a/b");
        BOOST_TEST(in.query() == std::string_view("x=1&y=2"));

        input in2("GET", "/a");
        BOOST_TEST(in2.path() == "/a");
        BOOST_TEST(! in2.query());

        input in3("GET", "/a?");
        BOOST_TEST(in3.query() == std::string_view());

        in.set_header("Content-Type", "text/plain")
          .set_header("X-Id", "1")
          .set_header("x-id", "2");
        BOOST_TEST(in.header("content-type") ==
            std::string_view("text/plain"));
        BOOST_TEST(in.header("X-ID") == std::string_view("1"));
        BOOST_TEST(! in.header("Accept"));
    }

    void
    testVerb()
    {
        std::size_t n = 0;
        {
            input in("GET", "/");
            BOOST_TEST(test::apply_to(get(), in, n).has_value());
            auto r = test::apply_to(post(), in, n);
            BOOST_TEST(r.has_error());
            BOOST_TEST(r.error().is_method_not_allowed());
            BOOST_TEST(r.error().allowed() == verbs::post());
        }
        {
            auto const e = verb(verbs::get() | verbs::head());
            input in1("HEAD", "/");
            BOOST_TEST(test::apply_to(e, in1, n).has_value());
            input in2("DELETE", "/");
            auto r = test::apply_to(e, in2, n);
            BOOST_TEST(r.has_error());
            BOOST_TEST_EQ(r.error().allowed().size(), 2u);
        }
        {
            input in("PATCH", "/");
            BOOST_TEST(test::apply_to(patch(), in, n).has_value());
            BOOST_TEST(test::apply_to(delete_(), in, n).has_error());
        }
    }

    void
    testHeader()
    {
        std::size_t n = 0;
        input in("GET", "/");
        in.set_header("Content-Length", "42");
        in.set_header("X-Mode", "Fast");
        in.set_header("X-Bad", "4x");
        {
            auto r = test::apply_to(
                header<std::size_t>("content-length"), in, n);
            BOOST_TEST(r.has_value());
            BOOST_TEST_EQ(std::get<0>(*run_sync(*r)), 42u);
        }
        {
            auto r = test::apply_to(
                header<std::string>("Accept"), in, n);
            BOOST_TEST(r.has_error());
            BOOST_TEST(r.error().is_invalid_request());
            BOOST_TEST(r.error().reason() == error::missing_header);
            BOOST_TEST(r.error().what() == "Accept");
        }
        {
            auto r = test::apply_to(header<int>("X-Bad"), in, n);
            BOOST_TEST(r.has_error());
            BOOST_TEST(r.error().reason() == error::invalid_header);
        }
        {
            auto r = test::apply_to(
                header_optional<int>("Content-Length"), in, n);
            BOOST_TEST_EQ(*std::get<0>(*run_sync(*r)), 42);
            auto r2 = test::apply_to(
                header_optional<int>("Accept"), in, n);
            BOOST_TEST(! std::get<0>(*run_sync(*r2)));
            auto r3 = test::apply_to(
                header_optional<int>("x-bad"), in, n);
            BOOST_TEST(r3.has_error());
        }
        {
            BOOST_TEST(test::apply_to(
                header_equals("x-mode", "fast"), in, n).has_value());
            auto r = test::apply_to(
                header_equals("x-mode", "slow"), in, n);
            BOOST_TEST(r.has_error() && r.error().is_not_matched());
            BOOST_TEST(test::apply_to(
                header_equals("Accept", "*/*"), in, n).has_error());
        }
        {
            // field values are taken as written
            input in2("GET", "/");
            in2.set_header("X-Progress", "50%");
            in2.set_header("X-Raw", "%41 b");
            auto r = test::apply_to(
                header<std::string>("x-progress"), in2, n);
            BOOST_TEST(r.has_value());
            BOOST_TEST_EQ(std::get<0>(*run_sync(*r)), "50%");
            auto r2 = test::apply_to(
                header_optional<std::string>("X-Raw"), in2, n);
            BOOST_TEST(r2.has_value());
            BOOST_TEST_EQ(*std::get<0>(*run_sync(*r2)), "%41 b");
            BOOST_TEST_EQ(
                *header_traits<std::string>::parse("a%20b"), "a%20b");
            BOOST_TEST_EQ(*header_traits<int>::parse("7"), 7);
        }
    }

    void
    testQuery()
    {
        std::size_t n = 0;
        {
            input in("GET", "/search?q=a%20b");
            auto r = test::apply_to(query<std::string>(), in, n);
            BOOST_TEST(r.has_value());
            BOOST_TEST_EQ(std::get<0>(*run_sync(*r)), "q=a b");
        }
        {
            input in("GET", "/search");
            auto r = test::apply_to(query<std::string>(), in, n);
            BOOST_TEST(r.has_error());
            BOOST_TEST(r.error().reason() == error::missing_query);
        }
        {
            input in("GET", "/page?x");
            auto r = test::apply_to(query<int>(), in, n);
            BOOST_TEST(r.has_error());
            BOOST_TEST(r.error().reason() == error::invalid_param);
        }
        {
            // the query does not affect path matching
            input in("GET", "/page?3");
            auto const e = segment("page")
                .and_(eos())
                .and_(query<int>());
            auto r = test::apply_to(e, in, n);
            BOOST_TEST(r.has_value());
            BOOST_TEST_EQ(std::get<0>(*run_sync(*r)), 3);
        }
    }

    void
    run()
    {
        testInput();
        testVerb();
        testHeader();
        testQuery();
    }
};

TEST_SUITE(
    request_test,
    "boost.endpoints.request");

} // endpoints
} // boost
