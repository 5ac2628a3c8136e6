//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

// Test that header file is self-contained.
#include <boost/endpoints/runner.hpp>

#include <boost/endpoints.hpp>
#include "test_suite.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace boost {
namespace endpoints {

struct runner_test
{
    static
    auto
    make_api()
    {
        auto const hello = get()
            .and_("hello")
            .and_(param<std::string>())
            .and_(eos())
            .and_then(
                [](std::string name)
                {
                    return "Hi, " + name;
                });
        auto const echo = post()
            .and_("echo")
            .and_(eos())
            .and_(body<std::string>());
        return hello.or_strict(echo);
    }

    void
    testValue()
    {
        auto const api = make_api();
        {
            input in("GET", "/hello/world");
            auto out = endpoints::run(api, in);
            BOOST_TEST(out.has_value());
            BOOST_TEST_EQ(out.status(), 200u);
            BOOST_TEST_EQ(std::get<0>(out.value()), "Hi, world");
            BOOST_TEST(out.allow().empty());
            BOOST_TEST_THROWS(out.routing_error(), std::logic_error);
            BOOST_TEST_THROWS(out.runtime_error(), std::logic_error);
        }
        {
            input in("POST", "/echo/");
            in.set_body(std::make_unique<buffered_body>("ping"));
            auto out = endpoints::run(api, in);
            BOOST_TEST_EQ(std::get<0>(out.value()), "ping");
        }
    }

    void
    testRoutingErrors()
    {
        auto const api = make_api();
        {
            auto const e = segment("a").or_(segment("b"));
            input in("GET", "/nowhere");
            auto out = endpoints::run(e, in);
            BOOST_TEST(out.has_routing_error());
            BOOST_TEST(out.routing_error().is_not_matched());
            BOOST_TEST_EQ(out.status(), 404u);
            BOOST_TEST_THROWS(out.value(), std::logic_error);
        }
        {
            // the path did not match, but a method was refused
            input in("GET", "/nowhere");
            auto out = endpoints::run(api, in);
            BOOST_TEST_EQ(out.status(), 405u);
            BOOST_TEST_EQ(out.allow(), "POST");
        }
        {
            input in("DELETE", "/echo");
            auto out = endpoints::run(api, in);
            BOOST_TEST(out.has_routing_error());
            BOOST_TEST_EQ(out.status(), 405u);
            BOOST_TEST_EQ(out.allow(), "GET, POST");
        }
        {
            auto const e = get().and_("n").and_(param<int>());
            input in("GET", "/n/x");
            auto out = endpoints::run(e, in);
            BOOST_TEST_EQ(out.status(), 400u);
            BOOST_TEST(out.routing_error().reason() ==
                error::invalid_param);
        }
    }

    void
    testRuntimeErrors()
    {
        {
            auto const e = lazy(
                []() -> system::result<int>
                {
                    return make_error_code(error::bad_body);
                });
            input in("GET", "/");
            auto out = endpoints::run(e, in);
            BOOST_TEST(out.has_runtime_error());
            BOOST_TEST(out.runtime_error() == error::bad_body);
            BOOST_TEST_EQ(out.status(), 400u);
        }
        {
            auto const e = lazy(
                []() -> system::result<int>
                {
                    return make_error_code(error::poll_failed);
                });
            input in("GET", "/");
            BOOST_TEST_EQ(endpoints::run(e, in).status(), 500u);
        }
    }

    void
    testPollReady()
    {
        auto log = std::make_shared<test::poll_log>();
        auto const e = test::counting_endpoint(1, 2, 9, log);
        input in("GET", "/");
        auto t = apply_request(e, in);
        BOOST_TEST(t.poll_ready().is_pending());
        BOOST_TEST(t.poll_ready().is_pending());
        auto p = t.poll_ready();
        BOOST_TEST(p.is_ready());
        BOOST_TEST_EQ(std::get<0>(p.value().value()), 9);
        BOOST_TEST_THROWS(t.poll_ready(), std::logic_error);

        // a routing failure is ready at once
        auto t2 = apply_request(segment("x"), in);
        auto p2 = t2.poll_ready();
        BOOST_TEST(p2.is_ready());
        BOOST_TEST(p2.value().has_routing_error());
    }

    void
    testLogging()
    {
        std::vector<std::string> lines;
        auto prev = set_log_sink(
            [&lines](std::string_view s)
            {
                lines.emplace_back(s);
            });
        auto sect = default_log_sections().get("endpoints");
        auto const level = sect.threshold();

        auto const api = make_api();
        auto const e = segment("x");
        {
            // debug lines are squelched by default
            sect.set_threshold(2);
            input in("GET", "/nowhere");
            endpoints::run(e, in);
            BOOST_TEST(lines.empty());
        }
        {
            sect.set_threshold(1);
            input in("GET", "/nowhere");
            endpoints::run(e, in);
            input in2("GET", "/hello/world");
            endpoints::run(api, in2);
            BOOST_TEST_EQ(lines.size(), 1u);
            if(! lines.empty())
                BOOST_TEST_EQ(lines[0],
                    "endpoints GET /nowhere: not matched (404)");
        }

        sect.set_threshold(level);
        set_log_sink(std::move(prev));
    }

    void
    run()
    {
        testValue();
        testRoutingErrors();
        testRuntimeErrors();
        testPollReady();
        testLogging();
    }
};

TEST_SUITE(
    runner_test,
    "boost.endpoints.runner");

} // endpoints
} // boost
