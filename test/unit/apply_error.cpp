//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

// Test that header file is self-contained.
#include <boost/endpoints/apply_error.hpp>

#include <boost/endpoints/error.hpp>
#include <boost/system/system_error.hpp>

#include "test_suite.hpp"

namespace boost {
namespace endpoints {

struct apply_error_test
{
    void
    testCategory()
    {
        auto const check =
            [](apply_errc ev)
            {
                auto const ec = make_error_code(ev);
                BOOST_TEST(std::string(ec.category().name()) ==
                    "boost.endpoints.apply");
                BOOST_TEST(! ec.message().empty());
                BOOST_TEST(is_apply_error(ec));
                BOOST_TEST(
                    std::addressof(ec.category()) ==
                    std::addressof(make_error_code(ev).category()));
            };
        check(apply_errc::not_matched);
        check(apply_errc::method_not_allowed);
        check(apply_errc::invalid_request);

        BOOST_TEST(! is_apply_error(
            make_error_code(error::bad_body)));
        BOOST_TEST(! is_apply_error(system::error_code()));
    }

    void
    testKinds()
    {
        {
            auto e = apply_error::not_matched();
            BOOST_TEST(e.is_not_matched());
            BOOST_TEST(e.kind() == apply_errc::not_matched);
            BOOST_TEST(e.code() == apply_errc::not_matched);
            BOOST_TEST(e.allowed().empty());
            BOOST_TEST_EQ(e.message(), "not matched");
        }
        {
            auto e = apply_error::method_not_allowed(
                verbs::post() | verbs::get());
            BOOST_TEST(e.is_method_not_allowed());
            BOOST_TEST(e.code() == apply_errc::method_not_allowed);
            BOOST_TEST(e.allowed() ==
                (verbs::get() | verbs::post()));
            BOOST_TEST_EQ(e.message(),
                "method not allowed (allowed methods: GET, POST)");
        }
        {
            auto e = apply_error::invalid_request(
                error::missing_header, "Authorization");
            BOOST_TEST(e.is_invalid_request());
            BOOST_TEST(e.code() == apply_errc::invalid_request);
            BOOST_TEST(e.reason() == error::missing_header);
            BOOST_TEST(e.what() == "Authorization");
            BOOST_TEST_EQ(e.message(),
                "missing header: `Authorization'");
        }
        {
            auto e = apply_error::invalid_request(
                error::bad_body);
            BOOST_TEST_EQ(e.message(),
                "failed to convert the request body");
        }
    }

    void
    testMerge()
    {
        auto const nm = apply_error::not_matched();
        auto const get = apply_error::method_not_allowed(
            verbs::get());
        auto const post = apply_error::method_not_allowed(
            verbs::post());
        auto const bad1 = apply_error::invalid_request(
            error::invalid_param);
        auto const bad2 = apply_error::invalid_request(
            error::missing_header);

        BOOST_TEST(nm.merge(nm).is_not_matched());

        BOOST_TEST(nm.merge(get).is_method_not_allowed());
        BOOST_TEST(nm.merge(get).allowed() == verbs::get());
        BOOST_TEST(get.merge(nm).allowed() == verbs::get());

        auto const both = get.merge(post);
        BOOST_TEST(both.is_method_not_allowed());
        BOOST_TEST(both.allowed() ==
            (verbs::get() | verbs::post()));

        BOOST_TEST(nm.merge(bad1).reason() == error::invalid_param);
        BOOST_TEST(bad1.merge(nm).reason() == error::invalid_param);
        BOOST_TEST(get.merge(bad1).is_invalid_request());
        BOOST_TEST(bad1.merge(get).is_invalid_request());

        // the left reason wins
        BOOST_TEST(bad1.merge(bad2).reason() == error::invalid_param);
        BOOST_TEST(bad2.merge(bad1).reason() == error::missing_header);
    }

    void
    testThrow()
    {
        apply_result<int> r = apply_error::method_not_allowed(
            verbs::get());
        BOOST_TEST(r.has_error());
        BOOST_TEST_THROWS(r.value(), system::system_error);
        try
        {
            r.value();
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == apply_errc::method_not_allowed);
        }
    }

    void
    run()
    {
        testCategory();
        testKinds();
        testMerge();
        testThrow();
    }
};

TEST_SUITE(
    apply_error_test,
    "boost.endpoints.apply_error");

} // endpoints
} // boost
