//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

// Test that header file is self-contained.
#include <boost/endpoints/and.hpp>

#include <boost/endpoints/path.hpp>
#include <boost/endpoints/value.hpp>
#include <boost/endpoints/verb.hpp>
#include "test_suite.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <string>

namespace boost {
namespace endpoints {

struct and_test
{
    void
    testOutput()
    {
        auto const e = segment("users")
            .and_(param<int>())
            .and_(value(std::string("x")))
            .and_(eos());
        static_assert(std::is_same_v<
            decltype(e)::output_type,
            std::tuple<int, std::string>>);

        input in("GET", "/users/7");
        std::size_t n = 0;
        auto r = test::apply_to(e, in, n);
        BOOST_TEST(r.has_value());
        BOOST_TEST_EQ(n, 2u);
        auto v = run_sync(*r);
        BOOST_TEST(v.has_value());
        BOOST_TEST_EQ(std::get<0>(*v), 7);
        BOOST_TEST_EQ(std::get<1>(*v), "x");
    }

    void
    testRestore()
    {
        auto const e = segment("a")
            .and_("b")
            .and_("c");
        std::size_t n = 0;
        {
            input in("GET", "/a/b/x");
            auto r = test::apply_to(e, in, n);
            BOOST_TEST(r.has_error());
            BOOST_TEST(r.error().is_not_matched());
            BOOST_TEST_EQ(n, 0u);
        }
        {
            input in("GET", "/a/b/c/d");
            BOOST_TEST(test::apply_to(e, in, n).has_value());
            BOOST_TEST_EQ(n, 3u);
        }
    }

    void
    testFirstError()
    {
        // the second endpoint is not applied
        auto const e = get().and_(param<int>());
        input in("POST", "/oops");
        std::size_t n = 0;
        auto r = test::apply_to(e, in, n);
        BOOST_TEST(r.has_error());
        BOOST_TEST(r.error().is_method_not_allowed());
        BOOST_TEST(r.error().allowed() == verbs::get());
    }

    void
    testPollOrder()
    {
        auto log = std::make_shared<test::poll_log>();
        auto const e =
            test::counting_endpoint(1, 2, 10, log).and_(
            test::counting_endpoint(2, 0, 20, log));

        input in("GET", "/");
        apply_context cx(in);
        auto r = e.apply(cx);
        BOOST_TEST(r.has_value());
        int pending_polls = 0;
        auto v = test::drive(*r, pending_polls);
        BOOST_TEST(v.has_value());
        BOOST_TEST_EQ(pending_polls, 2);
        BOOST_TEST(*v == std::make_tuple(10, 20));

        // a finished child is not polled again
        BOOST_TEST((*log == test::poll_log{ 1, 2, 1, 1 }));

        BOOST_TEST_THROWS(r->poll_task(), std::logic_error);
    }

    void
    testErrorPrecedence()
    {
        auto const ec1 = make_error_code(error::bad_body);
        auto const ec2 = make_error_code(error::poll_failed);
        input in("GET", "/");
        {
            // the first child to fail decides
            auto log = std::make_shared<test::poll_log>();
            auto const e =
                test::counting_endpoint(1, 2, 0, log, ec1).and_(
                test::counting_endpoint(2, 0, 0, log, ec2));
            apply_context cx(in);
            auto r = e.apply(cx);
            int pending_polls = 0;
            auto v = test::drive(*r, pending_polls);
            BOOST_TEST(v.has_error());
            BOOST_TEST(v.error() == ec2);
            BOOST_TEST_EQ(pending_polls, 0);
            BOOST_TEST_THROWS(r->poll_task(), std::logic_error);
        }
        {
            // the left fails while the right is pending
            auto log = std::make_shared<test::poll_log>();
            auto const e =
                test::counting_endpoint(1, 0, 0, log, ec1).and_(
                test::counting_endpoint(2, 3, 0, log));
            apply_context cx(in);
            auto r = e.apply(cx);
            int pending_polls = 0;
            auto v = test::drive(*r, pending_polls);
            BOOST_TEST(v.has_error());
            BOOST_TEST(v.error() == ec1);
            BOOST_TEST_EQ(pending_polls, 0);
            BOOST_TEST((*log == test::poll_log{ 1 }));
            BOOST_TEST_THROWS(r->poll_task(), std::logic_error);
        }
        {
            // on the same poll the left error wins
            auto const e =
                test::counting_endpoint(1, 0, 0, nullptr, ec1).and_(
                test::counting_endpoint(2, 0, 0, nullptr, ec2));
            apply_context cx(in);
            auto r = e.apply(cx);
            auto v = run_sync(*r);
            BOOST_TEST(v.has_error());
            BOOST_TEST(v.error() == ec1);
        }
        {
            // the right error after the left completed
            auto const e =
                test::counting_endpoint(1, 0, 5, nullptr).and_(
                test::counting_endpoint(2, 3, 0, nullptr, ec2));
            apply_context cx(in);
            auto r = e.apply(cx);
            auto v = run_sync(*r);
            BOOST_TEST(v.has_error());
            BOOST_TEST(v.error() == ec2);
        }
    }

    void
    run()
    {
        testOutput();
        testRestore();
        testFirstError();
        testPollOrder();
        testErrorPrecedence();
    }
};

TEST_SUITE(
    and_test,
    "boost.endpoints.and");

} // endpoints
} // boost
