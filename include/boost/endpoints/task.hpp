//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_TASK_HPP
#define BOOST_ENDPOINTS_TASK_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <boost/endpoints/detail/type_traits.hpp>
#include <boost/endpoints/poll.hpp>
#include <boost/system/result.hpp>
#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace boost {
namespace endpoints {

/** A cooperative, poll-driven unit of deferred computation.

    A task makes progress only when its `poll_task` member is
    called. It reports @ref pending until it completes, then
    reports its output or a runtime error exactly once. Calling
    `poll_task` again after completion is a protocol violation
    and throws `std::logic_error`.

    Tasks are move-only values owned by whoever polls them.
    Destroying a task before it completes cancels it.
*/
template<class T>
concept task =
    std::move_constructible<T> &&
    requires(T& t)
    {
        typename T::output_type;
        { t.poll_task() } -> std::same_as<
            poll_result<typename T::output_type>>;
    };

//------------------------------------------------

/** A task which completes on its first poll.
*/
template<class T>
class ready_task
{
public:
    using output_type = T;

    /** Constructor.

        @param r The value or error to report.
    */
    explicit
    ready_task(
        system::result<T> r)
        : r_(std::move(r))
    {
    }

    poll_result<T>
    poll_task()
    {
        if(! r_)
            detail::throw_logic_error(
                "ready_task: polled after completion");
        system::result<T> r = std::move(*r_);
        r_.reset();
        return poll_result<T>(std::move(r));
    }

private:
    std::optional<system::result<T>> r_;
};

/** Return a task which completes with `t`.
*/
template<class T>
ready_task<std::decay_t<T>>
make_ready_task(T&& t)
{
    return ready_task<std::decay_t<T>>(
        std::forward<T>(t));
}

/** Return a task which fails with `ec`.
*/
template<class T>
ready_task<T>
make_error_task(
    system::error_code ec)
{
    return ready_task<T>(ec);
}

//------------------------------------------------

namespace detail {

template<class R>
struct result_value
{
    using type = R;
};

template<class U>
struct result_value<system::result<U>>
{
    using type = U;
};

template<class R>
using result_value_t =
    typename result_value<std::decay_t<R>>::type;

template<class R>
constexpr bool is_system_result_v =
    ! std::is_same_v<result_value_t<R>, std::decay_t<R>>;

// output of calling F, normalized to a tuple
template<class F, class... Args>
using call_output_t = mp11::mp_if_c<
    std::is_void_v<std::invoke_result_t<F, Args...>>,
    std::tuple<>,
    tuplize_t<result_value_t<std::invoke_result_t<F, Args...>>>>;

// call f, converting the outcome to a tupled result
template<class F, class... Args>
system::result<call_output_t<F, Args...>>
call_to_result(F&& f, Args&&... args)
{
    using R = std::invoke_result_t<F, Args...>;
    if constexpr(std::is_void_v<R>)
    {
        std::invoke(std::forward<F>(f),
            std::forward<Args>(args)...);
        return std::tuple<>();
    }
    else if constexpr(is_system_result_v<R>)
    {
        auto r = std::invoke(std::forward<F>(f),
            std::forward<Args>(args)...);
        if(r.has_error())
            return r.error();
        return tuplize(std::move(*r));
    }
    else
    {
        return tuplize(std::invoke(std::forward<F>(f),
            std::forward<Args>(args)...));
    }
}

} // detail

/** A task which calls a function on its first poll.

    The function may return a plain value, a
    `system::result`, or nothing. The output is
    normalized to a tuple.
*/
template<class F>
class lazy_task
{
public:
    using output_type = detail::call_output_t<F&>;

    explicit
    lazy_task(F f)
        : f_(std::move(f))
    {
    }

    poll_result<output_type>
    poll_task()
    {
        if(! f_)
            detail::throw_logic_error(
                "lazy_task: polled after completion");
        auto f = std::move(*f_);
        f_.reset();
        return detail::call_to_result(f);
    }

private:
    std::optional<F> f_;
};

//------------------------------------------------

/** Convert a value into a task.

    @li A task is returned unchanged.
    @li A `system::result<U>` becomes a @ref ready_task of `U`.
    @li Any other value becomes a @ref ready_task holding it.
*/
template<class R>
auto
into_task(R&& r)
{
    using T = std::decay_t<R>;
    if constexpr(task<T>)
        return T(std::forward<R>(r));
    else if constexpr(detail::is_system_result_v<T>)
        return ready_task<detail::result_value_t<T>>(
            std::forward<R>(r));
    else
        return ready_task<T>(std::forward<R>(r));
}

namespace detail {

// invoke f and convert what it returns into a task
template<class F, class... Args>
auto
invoke_into_task(F&& f, Args&&... args)
{
    using R = std::invoke_result_t<F, Args...>;
    if constexpr(std::is_void_v<R>)
    {
        std::invoke(std::forward<F>(f),
            std::forward<Args>(args)...);
        return ready_task<std::tuple<>>(std::tuple<>());
    }
    else
    {
        return into_task(std::invoke(std::forward<F>(f),
            std::forward<Args>(args)...));
    }
}

template<class F, class... Args>
using invoke_into_task_t = decltype(
    invoke_into_task(std::declval<F>(), std::declval<Args>()...));

} // detail

//------------------------------------------------

/** A type-erased task.

    Holds any task whose output type is `T`. This is the
    uniform representation used when tasks of different
    concrete types must be stored together.
*/
template<class T>
class any_task
{
public:
    using output_type = T;

    any_task(any_task&&) noexcept = default;
    any_task& operator=(any_task&&) noexcept = default;

    /** Constructor.

        @param t The task to own.
    */
    template<class Task>
        requires task<Task> &&
            (! std::is_same_v<Task, any_task>) &&
            std::is_same_v<typename Task::output_type, T>
    any_task(Task t)
        : p_(std::make_unique<impl<Task>>(std::move(t)))
    {
    }

    poll_result<T>
    poll_task()
    {
        if(! p_)
            detail::throw_logic_error(
                "any_task: empty");
        return p_->poll();
    }

private:
    struct base
    {
        virtual ~base() = default;
        virtual poll_result<T> poll() = 0;
    };

    template<class Task>
    struct impl : base
    {
        Task t;

        explicit
        impl(Task&& t_)
            : t(std::move(t_))
        {
        }

        poll_result<T>
        poll() override
        {
            return t.poll_task();
        }
    };

    std::unique_ptr<base> p_;
};

//------------------------------------------------

/** Drive a task to completion.

    The task is polled repeatedly until it is ready. This
    is intended for tests and for tasks whose pending states
    do not depend on external readiness.

    @return The output of the task or its runtime error.
*/
template<class Task>
    requires task<Task>
system::result<typename Task::output_type>
run_sync(Task& t)
{
    for(;;)
    {
        auto p = t.poll_task();
        if(p.is_ready())
            return std::move(p).value();
    }
}

} // endpoints
} // boost

#endif
