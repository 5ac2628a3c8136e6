//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_TEST_SUITE_HPP
#define BOOST_ENDPOINTS_TEST_SUITE_HPP

#include <boost/core/lightweight_test.hpp>
#include <vector>

namespace test_suite {

// A registered suite
struct any_suite
{
    virtual ~any_suite() = default;
    virtual char const* name() const noexcept = 0;
    virtual void run() const = 0;
};

inline
std::vector<any_suite const*>&
suites()
{
    static std::vector<any_suite const*> v;
    return v;
}

namespace detail {

template<class T>
struct instance : any_suite
{
    explicit
    instance(char const* name) noexcept
        : name_(name)
    {
        suites().push_back(this);
    }

    char const*
    name() const noexcept override
    {
        return name_;
    }

    void
    run() const override
    {
        T t;
        t.run();
    }

private:
    char const* name_;
};

} // detail
} // test_suite

#define TEST_SUITE(type, name) \
    static ::test_suite::detail::instance<type> type##_instance_(name)

#endif
