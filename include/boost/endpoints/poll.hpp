//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_POLL_HPP
#define BOOST_ENDPOINTS_POLL_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <boost/system/result.hpp>
#include <optional>
#include <type_traits>
#include <utility>

namespace boost {
namespace endpoints {

/** Tag type indicating that a value is not ready yet.
*/
struct pending_t
{
    explicit constexpr pending_t(int) noexcept {}
};

/** Constant used to return a pending @ref poll.
*/
inline constexpr pending_t pending{0};

/** The outcome of polling a task once.

    A poll is either ready, holding a value of type `T`,
    or pending. A pending poll promises nothing about when
    the value becomes available; the driver decides when
    to poll again.

    @par Example
    @code
    poll< int > p = pending;
    BOOST_ASSERT( p.is_pending() );
    p = 42;
    BOOST_ASSERT( p.is_ready() && p.value() == 42 );
    @endcode
*/
template<class T>
class poll
{
public:
    using value_type = T;

    /** Constructor.

        The poll is pending.
    */
    poll(pending_t) noexcept
    {
    }

    /** Constructor.

        The poll is ready with `t`.
    */
    template<class U = T>
        requires std::is_constructible_v<T, U&&> &&
            (! std::is_same_v<std::decay_t<U>, pending_t>) &&
            (! std::is_same_v<std::decay_t<U>, poll>)
    poll(U&& u)
        : v_(std::in_place, std::forward<U>(u))
    {
    }

    bool
    is_ready() const noexcept
    {
        return v_.has_value();
    }

    bool
    is_pending() const noexcept
    {
        return ! v_.has_value();
    }

    /** Return the ready value.

        @throw std::logic_error if the poll is pending.
    */
    T&
    value() &
    {
        if(! v_)
            detail::throw_logic_error(
                "poll::value: pending");
        return *v_;
    }

    T const&
    value() const&
    {
        if(! v_)
            detail::throw_logic_error(
                "poll::value: pending");
        return *v_;
    }

    T&&
    value() &&
    {
        if(! v_)
            detail::throw_logic_error(
                "poll::value: pending");
        return std::move(*v_);
    }

    /** Transform the ready value.

        A pending poll stays pending.
    */
    template<class F>
    auto
    map(F&& f) && ->
        poll<std::invoke_result_t<F, T&&>>
    {
        if(! v_)
            return pending;
        return std::forward<F>(f)(std::move(*v_));
    }

private:
    std::optional<T> v_;
};

/** The outcome of polling a fallible task once.

    When ready, the result holds either the
    output of the task or a runtime error.
*/
template<class T>
using poll_result = poll<system::result<T>>;

/** Return true if `p` is ready with a value.
*/
template<class T>
bool
is_ok(poll_result<T> const& p) noexcept
{
    return p.is_ready() && p.value().has_value();
}

/** Return true if `p` is ready with an error.
*/
template<class T>
bool
is_err(poll_result<T> const& p) noexcept
{
    return p.is_ready() && p.value().has_error();
}

} // endpoints
} // boost

#endif
