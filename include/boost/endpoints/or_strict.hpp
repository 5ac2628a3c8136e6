//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_OR_STRICT_HPP
#define BOOST_ENDPOINTS_OR_STRICT_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <type_traits>
#include <utility>
#include <variant>

namespace boost {
namespace endpoints {

/** A task driving one of two tasks with the same output.
*/
template<class T1, class T2>
class or_strict_task
{
public:
    using output_type = typename T1::output_type;

    static_assert(std::is_same_v<
        output_type, typename T2::output_type>,
        "both alternatives must have the same output type");

    template<std::size_t I, class T>
    or_strict_task(std::in_place_index_t<I> i, T&& t)
        : v_(i, std::forward<T>(t))
    {
    }

    poll_result<output_type>
    poll_task()
    {
        return std::visit(
            [](auto& t)
            {
                return t.poll_task();
            }, v_);
    }

private:
    std::variant<T1, T2> v_;
};

/** An endpoint matching the first of two endpoints which matches.

    The second endpoint is applied only when the first
    fails, from the position before the first was applied.
    When neither matches their errors are combined with
    @ref apply_error::merge.

    @see endpoint_base::or_strict
*/
template<class E1, class E2>
class or_strict_endpoint
    : public endpoint_base<or_strict_endpoint<E1, E2>>
{
public:
    using task_type = or_strict_task<
        typename E1::task_type,
        typename E2::task_type>;
    using output_type = typename task_type::output_type;

    or_strict_endpoint(E1 e1, E2 e2)
        : e1_(std::move(e1))
        , e2_(std::move(e2))
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto const saved = cx.segments();
        auto r1 = e1_.apply(cx);
        if(r1.has_value())
            return task_type(
                std::in_place_index<0>, std::move(*r1));
        cx.segments() = saved;
        auto r2 = e2_.apply(cx);
        if(r2.has_value())
            return task_type(
                std::in_place_index<1>, std::move(*r2));
        cx.segments() = saved;
        return r1.error().merge(r2.error());
    }

private:
    E1 e1_;
    E2 e2_;
};

} // endpoints
} // boost

#endif
