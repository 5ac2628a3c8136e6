//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

// Test that header file is self-contained.
#include <boost/endpoints/method.hpp>

#include "test_suite.hpp"

namespace boost {
namespace endpoints {

struct method_test
{
    void
    testStrings()
    {
        auto const check =
            [](method m, std::string_view s)
            {
                BOOST_TEST(to_string(m) == s);
                BOOST_TEST(string_to_method(s) == m);
            };
        check(method::get, "GET");
        check(method::head, "HEAD");
        check(method::post, "POST");
        check(method::put, "PUT");
        check(method::delete_, "DELETE");
        check(method::connect, "CONNECT");
        check(method::options, "OPTIONS");
        check(method::trace, "TRACE");
        check(method::patch, "PATCH");

        // method strings are case-sensitive
        BOOST_TEST(string_to_method("get") == method::unknown);
        BOOST_TEST(string_to_method("PROPFIND") == method::unknown);
        BOOST_TEST(string_to_method("") == method::unknown);
    }

    void
    testVerbs()
    {
        verbs v;
        BOOST_TEST(v.empty());
        BOOST_TEST_EQ(v.size(), 0u);
        BOOST_TEST(v.to_string().empty());
        BOOST_TEST(! v.contains(method::get));

        v |= verbs::post();
        v |= method::get;
        BOOST_TEST(! v.empty());
        BOOST_TEST_EQ(v.size(), 2u);
        BOOST_TEST(v.contains(method::get));
        BOOST_TEST(v.contains(method::post));
        BOOST_TEST(! v.contains(method::put));
        BOOST_TEST(! v.contains(method::unknown));

        // enumeration order, not insertion order
        BOOST_TEST_EQ(v.to_string(), "GET, POST");

        BOOST_TEST(v == (verbs::get() | verbs::post()));
        BOOST_TEST(! (v == verbs::get()));

        auto all = verbs::get() | verbs::head() |
            verbs::post() | verbs::put() | verbs::delete_() |
            verbs::connect() | verbs::options() |
            verbs::trace() | verbs::patch();
        BOOST_TEST_EQ(all.size(), 9u);
        BOOST_TEST_EQ(all.to_string(),
            "GET, HEAD, POST, PUT, DELETE, "
            "CONNECT, OPTIONS, TRACE, PATCH");
    }

    void
    run()
    {
        testStrings();
        testVerbs();
    }
};

TEST_SUITE(
    method_test,
    "boost.endpoints.method");

} // endpoints
} // boost
