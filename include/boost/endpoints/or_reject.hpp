//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_OR_REJECT_HPP
#define BOOST_ENDPOINTS_OR_REJECT_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <boost/endpoints/input.hpp>
#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace boost {
namespace endpoints {

/** A task which runs a task or fails with a stored error.

    A task holding a routing failure records it on the
    request with @ref input::set_rejection before failing
    with its code. A task holding a plain error code
    fails with that code.
*/
template<class T>
class or_reject_task
{
public:
    using output_type = typename T::output_type;

    explicit
    or_reject_task(T t)
        : v_(std::in_place_index<0>, std::move(t))
    {
    }

    or_reject_task(
        apply_error e,
        input& in)
        : v_(std::in_place_index<1>,
            rejected{ std::move(e), &in })
    {
    }

    explicit
    or_reject_task(system::error_code ec)
        : v_(std::in_place_index<2>, ec)
    {
    }

    poll_result<output_type>
    poll_task()
    {
        switch(v_.index())
        {
        case 0:
            return std::get<0>(v_).poll_task();
        case 1:
        {
            auto r = std::move(std::get<1>(v_));
            v_.template emplace<3>();
            auto const ec = r.e.code();
            r.in->set_rejection(std::move(r.e));
            return system::result<output_type>(ec);
        }
        case 2:
        {
            auto ec = std::get<2>(v_);
            v_.template emplace<3>();
            return system::result<output_type>(ec);
        }
        default:
            detail::throw_logic_error(
                "or_reject_task: polled after completion");
        }
    }

private:
    struct rejected
    {
        apply_error e;
        input* in;
    };

    struct done
    {
    };

    std::variant<T, rejected, system::error_code, done> v_;
};

/** An endpoint which always matches, deferring its failure.

    When the inner endpoint fails the rest of the path is
    consumed and the task fails on its first poll with the
    code of the routing failure. The failure itself is kept
    on the request, so the outcome still carries the allowed
    methods or the reason. This stops alternatives from
    being tried and reports the failure at run time.

    @see endpoint_base::or_reject
*/
template<class E>
class or_reject_endpoint
    : public endpoint_base<or_reject_endpoint<E>>
{
public:
    using task_type = or_reject_task<typename E::task_type>;
    using output_type = typename task_type::output_type;

    explicit
    or_reject_endpoint(E e)
        : e_(std::move(e))
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto r = e_.apply(cx);
        if(r.has_error())
        {
            cx.segments().drain();
            return task_type(
                std::move(r.error()),
                cx.mutable_request());
        }
        return task_type(std::move(*r));
    }

private:
    E e_;
};

/** An endpoint which always matches, mapping its failure.

    When the inner endpoint fails the rest of the path is
    consumed and the function is called with the failure
    and the context. The task fails on its first poll with
    the error code the function returns.

    @par Example
    @code
    auto e = param< int >().or_reject_with(
        []( apply_error const&, apply_context& )
        {
            return system::error_code( error::invalid_param );
        });
    @endcode

    @see endpoint_base::or_reject_with
*/
template<class E, class F>
class or_reject_with_endpoint
    : public endpoint_base<or_reject_with_endpoint<E, F>>
{
public:
    using task_type = or_reject_task<typename E::task_type>;
    using output_type = typename task_type::output_type;

    static_assert(std::convertible_to<
        std::invoke_result_t<F const&,
            apply_error const&, apply_context&>,
        system::error_code>,
        "the function must return an error code");

    or_reject_with_endpoint(E e, F f)
        : e_(std::move(e))
        , f_(std::move(f))
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto r = e_.apply(cx);
        if(r.has_error())
        {
            cx.segments().drain();
            system::error_code ec = f_(r.error(), cx);
            return task_type(ec);
        }
        return task_type(std::move(*r));
    }

private:
    E e_;
    F f_;
};

} // endpoints
} // boost

#endif
