//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_VALUE_HPP
#define BOOST_ENDPOINTS_VALUE_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <tuple>
#include <type_traits>
#include <utility>

namespace boost {
namespace endpoints {

/** An endpoint which always matches and outputs nothing.
*/
class unit_endpoint
    : public endpoint_base<unit_endpoint>
{
public:
    using output_type = std::tuple<>;
    using task_type = ready_task<output_type>;

    apply_result<task_type>
    apply(apply_context&) const
    {
        return task_type(output_type());
    }
};

/** An endpoint which always matches and outputs a copy of a value.
*/
template<class T>
class value_endpoint
    : public endpoint_base<value_endpoint<T>>
{
public:
    using output_type = std::tuple<T>;
    using task_type = ready_task<output_type>;

    explicit
    value_endpoint(T t)
        : t_(std::move(t))
    {
    }

    apply_result<task_type>
    apply(apply_context&) const
    {
        return task_type(output_type(t_));
    }

private:
    T t_;
};

/** An endpoint which always matches and calls a function when polled.

    The function is copied into each task and called on
    its first poll. It may return a plain value or a
    `system::result`; an error becomes the runtime error
    of the task.
*/
template<class F>
class lazy_endpoint
    : public endpoint_base<lazy_endpoint<F>>
{
public:
    using task_type = lazy_task<F>;
    using output_type = typename task_type::output_type;

    explicit
    lazy_endpoint(F f)
        : f_(std::move(f))
    {
    }

    apply_result<task_type>
    apply(apply_context&) const
    {
        return task_type(f_);
    }

private:
    F f_;
};

//------------------------------------------------

/** Return an endpoint which always matches.
*/
inline
unit_endpoint
unit() noexcept
{
    return {};
}

/** Return an endpoint which always outputs `t`.

    @par Example
    @code
    auto e = segment( "version" ).and_( value( 3 ) );
    @endcode
*/
template<class T>
value_endpoint<std::decay_t<T>>
value(T&& t)
{
    return value_endpoint<std::decay_t<T>>(
        std::forward<T>(t));
}

/** Return an endpoint which calls `f` when its task is polled.
*/
template<class F>
lazy_endpoint<std::decay_t<F>>
lazy(F&& f)
{
    return lazy_endpoint<std::decay_t<F>>(
        std::forward<F>(f));
}

} // endpoints
} // boost

#endif
