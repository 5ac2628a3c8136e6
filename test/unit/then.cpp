//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

// Test that header file is self-contained.
#include <boost/endpoints/then.hpp>

#include <boost/endpoints/and.hpp>
#include <boost/endpoints/path.hpp>
#include <boost/endpoints/value.hpp>
#include "test_suite.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <string>

namespace boost {
namespace endpoints {

struct then_test
{
    static
    system::error_code
    failed() noexcept
    {
        return make_error_code(error::poll_failed);
    }

    template<class E>
    static
    auto
    apply_and_run(E const& e, std::string_view target)
    {
        input in("GET", target);
        apply_context cx(in);
        auto r = e.apply(cx);
        if(r.has_error())
            detail::throw_logic_error("route did not match");
        return run_sync(*r);
    }

    void
    testThen()
    {
        {
            auto const e = param<int>().then(
                [](system::result<int> r)
                {
                    return r.has_value() ? *r * 2 : -1;
                });
            auto v = apply_and_run(e, "/21");
            BOOST_TEST_EQ(std::get<0>(*v), 42);
        }
        {
            // the function sees the runtime error
            auto const e = test::counting_endpoint(
                1, 1, 0, nullptr, failed()).then(
                [](system::result<int> r)
                {
                    return r.has_error() &&
                        r.error() == error::poll_failed;
                });
            auto v = apply_and_run(e, "/");
            BOOST_TEST(v.has_value());
            BOOST_TEST(std::get<0>(*v));
        }
        {
            auto const e = segment("a").then(
                [](system::result<std::tuple<>> r)
                {
                    return std::string(
                        r.has_value() ? "ok" : "fail");
                });
            static_assert(std::is_same_v<
                decltype(e)::output_type,
                std::tuple<std::string>>);
            auto v = apply_and_run(e, "/a");
            BOOST_TEST_EQ(std::get<0>(*v), "ok");
        }
    }

    void
    testAndThen()
    {
        {
            auto const e = segment("users")
                .and_(param<int>())
                .and_(param<std::string>())
                .and_then(
                    [](int id, std::string name)
                    {
                        return name + "#" + std::to_string(id);
                    });
            auto v = apply_and_run(e, "/users/3/bob");
            BOOST_TEST_EQ(std::get<0>(*v), "bob#3");
        }
        {
            // a returned tuple is the output as-is
            auto const e = param<int>().and_then(
                [](int x)
                {
                    return std::make_tuple(x, x + 1);
                });
            auto v = apply_and_run(e, "/1");
            BOOST_TEST(*v == std::make_tuple(1, 2));
        }
        {
            auto const e = param<int>().and_then(
                [](int) -> system::result<int>
                {
                    return make_error_code(error::bad_body);
                });
            auto v = apply_and_run(e, "/1");
            BOOST_TEST(v.has_error());
            BOOST_TEST(v.error() == error::bad_body);
        }
        {
            int calls = 0;
            auto const e = param<int>().and_then(
                [&calls](int)
                {
                    ++calls;
                });
            static_assert(std::is_same_v<
                decltype(e)::output_type, std::tuple<>>);
            auto v = apply_and_run(e, "/1");
            BOOST_TEST(v.has_value());
            BOOST_TEST_EQ(calls, 1);
        }
        {
            // errors pass through without calling
            int calls = 0;
            auto const e = test::counting_endpoint(
                1, 0, 0, nullptr, failed()).and_then(
                [&calls](int x)
                {
                    ++calls;
                    return x;
                });
            auto v = apply_and_run(e, "/");
            BOOST_TEST(v.has_error());
            BOOST_TEST(v.error() == failed());
            BOOST_TEST_EQ(calls, 0);
        }
    }

    void
    testAndThenTask()
    {
        // a returned task is driven to completion
        auto log = std::make_shared<test::poll_log>();
        auto const e = param<int>().and_then(
            [log](int x)
            {
                return test::counting_task(2, 3, x * 10, log);
            });
        input in("GET", "/4");
        apply_context cx(in);
        auto r = e.apply(cx);
        int pending_polls = 0;
        auto v = test::drive(*r, pending_polls);
        BOOST_TEST_EQ(pending_polls, 3);
        BOOST_TEST_EQ(std::get<0>(*v), 40);
        BOOST_TEST_EQ(log->size(), 4u);
        BOOST_TEST_THROWS(r->poll_task(), std::logic_error);
    }

    void
    testOrElse()
    {
        {
            auto const e = test::counting_endpoint(
                1, 0, 0, nullptr, failed()).or_else(
                [](system::error_code ec)
                {
                    return ec == error::poll_failed ? 7 : 0;
                });
            auto v = apply_and_run(e, "/");
            BOOST_TEST(v.has_value());
            BOOST_TEST_EQ(std::get<0>(*v), 7);
        }
        {
            int calls = 0;
            auto const e = param<int>().or_else(
                [&calls](system::error_code)
                {
                    ++calls;
                    return 0;
                });
            auto v = apply_and_run(e, "/9");
            BOOST_TEST_EQ(std::get<0>(*v), 9);
            BOOST_TEST_EQ(calls, 0);
        }
        {
            // the recovery may fail again
            auto const e = test::counting_endpoint(
                1, 0, 0, nullptr, failed()).or_else(
                [](system::error_code) -> system::result<int>
                {
                    return make_error_code(error::bad_body);
                });
            auto v = apply_and_run(e, "/");
            BOOST_TEST(v.error() == error::bad_body);
        }
    }

    void
    testCalledOncePerTask()
    {
        int calls = 0;
        auto const e = unit().and_then(
            [&calls]
            {
                return ++calls;
            });
        BOOST_TEST_EQ(std::get<0>(*apply_and_run(e, "/")), 1);
        BOOST_TEST_EQ(std::get<0>(*apply_and_run(e, "/")), 2);
        BOOST_TEST_EQ(calls, 2);
    }

    void
    testRouteFailure()
    {
        int calls = 0;
        auto const e = segment("x").and_then(
            [&calls]
            {
                ++calls;
            });
        input in("GET", "/y");
        std::size_t n = 0;
        auto r = test::apply_to(e, in, n);
        BOOST_TEST(r.has_error());
        BOOST_TEST(r.error().is_not_matched());
        BOOST_TEST_EQ(calls, 0);
    }

    void
    run()
    {
        testThen();
        testAndThen();
        testAndThenTask();
        testOrElse();
        testCalledOncePerTask();
        testRouteFailure();
    }
};

TEST_SUITE(
    then_test,
    "boost.endpoints.then");

} // endpoints
} // boost
