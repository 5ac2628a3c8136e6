//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_ENDPOINT_HPP
#define BOOST_ENDPOINTS_ENDPOINT_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/type_traits.hpp>
#include <boost/endpoints/apply_context.hpp>
#include <boost/endpoints/apply_error.hpp>
#include <boost/endpoints/task.hpp>
#include <concepts>
#include <string_view>
#include <type_traits>
#include <utility>

namespace boost {
namespace endpoints {

/** A routable unit which produces a task.

    An endpoint is applied to a request once. `apply`
    either matches, advancing the path cursor and returning
    a task, or fails with an @ref apply_error and leaves the
    number of extracted segments unchanged.

    The output of an endpoint is always a `std::tuple`,
    and the output of its task is the same tuple.
*/
template<class E>
concept endpoint =
    std::copy_constructible<E> &&
    requires(E const& e, apply_context& cx)
    {
        typename E::output_type;
        typename E::task_type;
        requires detail::is_tuple_v<typename E::output_type>;
        requires task<typename E::task_type>;
        requires std::same_as<
            typename E::task_type::output_type,
            typename E::output_type>;
        { e.apply(cx) } -> std::same_as<
            apply_result<typename E::task_type>>;
    };

template<class E1, class E2> class and_endpoint;
template<class E1, class E2> class or_endpoint;
template<class E1, class E2> class or_strict_endpoint;
template<class E, class F> class then_endpoint;
template<class E, class F> class and_then_endpoint;
template<class E, class F> class or_else_endpoint;
template<class E> class lift_endpoint;
template<class E> class or_reject_endpoint;
template<class E, class F> class or_reject_with_endpoint;
template<class E, class F> class before_apply_endpoint;
class segment_endpoint;

//------------------------------------------------

/** Return an endpoint unchanged.
*/
template<class E>
    requires endpoint<std::decay_t<E>>
std::decay_t<E>
into_endpoint(E&& e)
{
    return std::forward<E>(e);
}

/** Return an endpoint matching one literal segment.

    This allows strings to be used wherever
    an endpoint is expected.

    @par Example
    @code
    auto e = segment( "api" ).and_( "v1" );
    @endcode
*/
BOOST_ENDPOINTS_DECL
segment_endpoint
into_endpoint(std::string_view s);

template<class E>
using into_endpoint_t = decltype(
    into_endpoint(std::declval<E>()));

//------------------------------------------------

/** Base class providing the fluent combinators.

    Every endpoint of the library derives from this
    class, passing itself as `Derived`.

    @par Example
    @code
    auto e = segment( "users" )
        .and_( param< int >() )
        .and_( eos() )
        .and_then( []( int id ) { return id * 2; } );
    @endcode
*/
template<class Derived>
class endpoint_base
{
public:
    /** Match both endpoints in sequence.

        @see and_endpoint
    */
    template<class E>
    and_endpoint<Derived, into_endpoint_t<E>>
    and_(E&& e) const
    {
        return and_endpoint<Derived, into_endpoint_t<E>>(
            derived(), into_endpoint(std::forward<E>(e)));
    }

    /** Match either endpoint, preferring the longer match.

        @see or_endpoint
    */
    template<class E>
    or_endpoint<Derived, into_endpoint_t<E>>
    or_(E&& e) const
    {
        return or_endpoint<Derived, into_endpoint_t<E>>(
            derived(), into_endpoint(std::forward<E>(e)));
    }

    /** Match this endpoint, or else the other.

        Both endpoints must have the same output type.

        @see or_strict_endpoint
    */
    template<class E>
    or_strict_endpoint<Derived, into_endpoint_t<E>>
    or_strict(E&& e) const
    {
        return or_strict_endpoint<Derived, into_endpoint_t<E>>(
            derived(), into_endpoint(std::forward<E>(e)));
    }

    /** Transform the result of the task.

        The function receives a `system::result`
        holding the output or the runtime error.
    */
    template<class F>
    then_endpoint<Derived, std::decay_t<F>>
    then(F&& f) const
    {
        return then_endpoint<Derived, std::decay_t<F>>(
            derived(), std::forward<F>(f));
    }

    /** Transform the output of a successful task.

        The elements of the output are passed as arguments.
        Runtime errors pass through unchanged.
    */
    template<class F>
    and_then_endpoint<Derived, std::decay_t<F>>
    and_then(F&& f) const
    {
        return and_then_endpoint<Derived, std::decay_t<F>>(
            derived(), std::forward<F>(f));
    }

    /** Recover from a runtime error of the task.
    */
    template<class F>
    or_else_endpoint<Derived, std::decay_t<F>>
    or_else(F&& f) const
    {
        return or_else_endpoint<Derived, std::decay_t<F>>(
            derived(), std::forward<F>(f));
    }

    /** Turn a routing failure into an empty optional.
    */
    lift_endpoint<Derived>
    lift() const
    {
        return lift_endpoint<Derived>(derived());
    }

    /** Turn a routing failure into a failing task.
    */
    or_reject_endpoint<Derived>
    or_reject() const
    {
        return or_reject_endpoint<Derived>(derived());
    }

    /** Turn a routing failure into a task failing with a chosen code.

        The function is called with the failure and the
        context and returns the error code of the task.
    */
    template<class F>
    or_reject_with_endpoint<Derived, std::decay_t<F>>
    or_reject_with(F&& f) const
    {
        return or_reject_with_endpoint<Derived, std::decay_t<F>>(
            derived(), std::forward<F>(f));
    }

    /** Run a check before this endpoint is applied.
    */
    template<class F>
    before_apply_endpoint<Derived, std::decay_t<F>>
    before_apply(F&& f) const
    {
        return before_apply_endpoint<Derived, std::decay_t<F>>(
            derived(), std::forward<F>(f));
    }

private:
    Derived const&
    derived() const noexcept
    {
        return static_cast<Derived const&>(*this);
    }
};

} // endpoints
} // boost

#endif
