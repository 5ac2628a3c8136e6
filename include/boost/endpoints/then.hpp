//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_THEN_HPP
#define BOOST_ENDPOINTS_THEN_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <boost/endpoints/detail/one_shot.hpp>
#include <boost/endpoints/detail/type_traits.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace boost {
namespace endpoints {

/** How a chained function receives the result of a task.
*/
enum class chain_kind
{
    /// The function receives `system::result<V>`.
    then,

    /// The function receives the output elements; errors pass through.
    and_then,

    /// The function receives the error; outputs pass through.
    or_else
};

namespace detail {

template<class F, class Tuple>
auto
spread_into_task(F&& f, Tuple&& t)
{
    return std::apply(
        [&f](auto&&... args)
        {
            return invoke_into_task(std::forward<F>(f),
                std::forward<decltype(args)>(args)...);
        }, std::forward<Tuple>(t));
}

template<chain_kind K, class F, class O>
struct chain_derived;

template<class F, class O>
struct chain_derived<chain_kind::then, F, O>
{
    using type = invoke_into_task_t<
        F, system::result<untuple_t<O>>>;
};

template<class F, class O>
struct chain_derived<chain_kind::and_then, F, O>
{
    using type = decltype(spread_into_task(
        std::declval<F>(), std::declval<O>()));
};

template<class F, class O>
struct chain_derived<chain_kind::or_else, F, O>
{
    using type = invoke_into_task_t<
        F, system::error_code>;
};

} // detail

/** A task which feeds the result of a task into a function.

    The task has three states. First the inner task is
    driven. When it is ready the function is extracted
    exactly once and its return value is converted into
    a derived task with @ref into_task, which is then
    driven to completion. Polling after completion
    throws `std::logic_error`.
*/
template<chain_kind K, class T, class F>
class chain_task
{
    using inner_output = typename T::output_type;
    using derived_type = typename detail::chain_derived<
        K, F, inner_output>::type;

public:
    using output_type = detail::tuplize_t<
        typename derived_type::output_type>;

    static_assert(
        K != chain_kind::or_else ||
            std::is_same_v<output_type, inner_output>,
        "the recovered output must match the endpoint output");

    chain_task(T t, F f)
        : v_(std::in_place_index<0>,
            std::move(t), std::move(f))
    {
    }

    poll_result<output_type>
    poll_task()
    {
        for(;;)
        {
            switch(v_.index())
            {
            case 0:
            {
                auto p = std::get<0>(v_).t.poll_task();
                if(p.is_pending())
                    return pending;
                auto f = std::get<0>(v_).f.take();
                if(auto rv = start(
                    std::move(f), std::move(p).value()))
                {
                    v_.template emplace<2>();
                    return std::move(*rv);
                }
                break;
            }
            case 1:
            {
                auto p = std::get<1>(v_).poll_task();
                if(p.is_pending())
                    return pending;
                v_.template emplace<2>();
                auto& r = p.value();
                if(r.has_error())
                    return system::result<output_type>(r.error());
                return system::result<output_type>(
                    detail::tuplize(std::move(*r)));
            }
            default:
                detail::throw_logic_error(
                    "chain_task: polled after completion");
            }
        }
    }

private:
    struct first
    {
        T t;
        detail::one_shot<F> f;

        first(T t_, F f_)
            : t(std::move(t_))
            , f(std::move(f_))
        {
        }
    };

    struct done
    {
    };

    // enter the derived state, or return
    // the final result when it passes through
    std::optional<system::result<output_type>>
    start(F f, system::result<inner_output> r)
    {
        if constexpr(K == chain_kind::then)
        {
            using arg_type = system::result<
                detail::untuple_t<inner_output>>;
            arg_type arg = r.has_value() ?
                arg_type(detail::untuple_value(std::move(*r))) :
                arg_type(r.error());
            v_.template emplace<1>(detail::invoke_into_task(
                std::move(f), std::move(arg)));
        }
        else if constexpr(K == chain_kind::and_then)
        {
            if(r.has_error())
                return system::result<output_type>(r.error());
            v_.template emplace<1>(detail::spread_into_task(
                std::move(f), std::move(*r)));
        }
        else
        {
            if(r.has_value())
                return std::move(r);
            v_.template emplace<1>(detail::invoke_into_task(
                std::move(f), r.error()));
        }
        return std::nullopt;
    }

    std::variant<first, derived_type, done> v_;
};

//------------------------------------------------

/** An endpoint whose task result is fed into a function.

    @see endpoint_base::then
    @see endpoint_base::and_then
    @see endpoint_base::or_else
*/
template<chain_kind K, class E, class F>
class chain_endpoint
    : public endpoint_base<chain_endpoint<K, E, F>>
{
public:
    using task_type = chain_task<K, typename E::task_type, F>;
    using output_type = typename task_type::output_type;

    chain_endpoint(E e, F f)
        : e_(std::move(e))
        , f_(std::move(f))
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto r = e_.apply(cx);
        if(r.has_error())
            return r.error();
        return task_type(std::move(*r), f_);
    }

private:
    E e_;
    F f_;
};

template<class E, class F>
class then_endpoint
    : public chain_endpoint<chain_kind::then, E, F>
{
public:
    using chain_endpoint<chain_kind::then, E, F>::chain_endpoint;
};

template<class E, class F>
class and_then_endpoint
    : public chain_endpoint<chain_kind::and_then, E, F>
{
public:
    using chain_endpoint<chain_kind::and_then, E, F>::chain_endpoint;
};

template<class E, class F>
class or_else_endpoint
    : public chain_endpoint<chain_kind::or_else, E, F>
{
public:
    using chain_endpoint<chain_kind::or_else, E, F>::chain_endpoint;
};

} // endpoints
} // boost

#endif
