//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_LIFT_HPP
#define BOOST_ENDPOINTS_LIFT_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <boost/endpoints/detail/type_traits.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <optional>
#include <tuple>
#include <utility>

namespace boost {
namespace endpoints {

/** A task yielding the output of an optional task.

    Without a task it yields an empty optional on the
    first poll. Runtime errors of the task pass through.
*/
template<class T>
class lift_task
{
public:
    using value_type = detail::untuple_t<
        typename T::output_type>;
    using output_type = std::tuple<std::optional<value_type>>;

    lift_task() = default;

    explicit
    lift_task(T t)
        : t_(std::move(t))
    {
    }

    poll_result<output_type>
    poll_task()
    {
        if(done_)
            detail::throw_logic_error(
                "lift_task: polled after completion");
        if(! t_)
        {
            done_ = true;
            return system::result<output_type>(
                output_type(std::nullopt));
        }
        auto p = t_->poll_task();
        if(p.is_pending())
            return pending;
        done_ = true;
        t_.reset();
        auto& r = p.value();
        if(r.has_error())
            return system::result<output_type>(r.error());
        return system::result<output_type>(output_type(
            detail::untuple_value(std::move(*r))));
    }

private:
    std::optional<T> t_;
    bool done_ = false;
};

/** An endpoint which matches whether or not its inner endpoint does.

    When the inner endpoint fails the cursor is
    restored and the output is an empty optional.

    @see endpoint_base::lift
*/
template<class E>
class lift_endpoint
    : public endpoint_base<lift_endpoint<E>>
{
public:
    using task_type = lift_task<typename E::task_type>;
    using output_type = typename task_type::output_type;

    explicit
    lift_endpoint(E e)
        : e_(std::move(e))
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto const saved = cx.segments();
        auto r = e_.apply(cx);
        if(r.has_error())
        {
            cx.segments() = saved;
            return task_type();
        }
        return task_type(std::move(*r));
    }

private:
    E e_;
};

} // endpoints
} // boost

#endif
