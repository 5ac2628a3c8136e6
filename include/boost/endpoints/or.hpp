//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_OR_HPP
#define BOOST_ENDPOINTS_OR_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <tuple>
#include <utility>
#include <variant>

namespace boost {
namespace endpoints {

/** A value of one of two types.

    This is the output of an @ref or_endpoint, where
    `L` and `R` are the output tuples of the alternatives.

    @par Example
    @code
    auto e = segment( "a" ).and_( value( 1 ) )
        .or_( segment( "b" ).and_( value( std::string( "x" ) ) ) );
    // output_type is std::tuple< either<
    //     std::tuple< int >, std::tuple< std::string > > >
    @endcode
*/
template<class L, class R>
class either
{
public:
    /** Constructor.

        The value is the left alternative.
    */
    template<class... Args>
    explicit
    either(std::in_place_index_t<0>, Args&&... args)
        : v_(std::in_place_index<0>, std::forward<Args>(args)...)
    {
    }

    /** Constructor.

        The value is the right alternative.
    */
    template<class... Args>
    explicit
    either(std::in_place_index_t<1>, Args&&... args)
        : v_(std::in_place_index<1>, std::forward<Args>(args)...)
    {
    }

    bool
    is_left() const noexcept
    {
        return v_.index() == 0;
    }

    bool
    is_right() const noexcept
    {
        return v_.index() == 1;
    }

    /** Return the left value.

        @throw std::logic_error if the value is on the right.
    */
    L&
    left()
    {
        if(! is_left())
            detail::throw_logic_error(
                "either::left: value is on the right");
        return std::get<0>(v_);
    }

    L const&
    left() const
    {
        if(! is_left())
            detail::throw_logic_error(
                "either::left: value is on the right");
        return std::get<0>(v_);
    }

    /** Return the right value.

        @throw std::logic_error if the value is on the left.
    */
    R&
    right()
    {
        if(! is_right())
            detail::throw_logic_error(
                "either::right: value is on the left");
        return std::get<1>(v_);
    }

    R const&
    right() const
    {
        if(! is_right())
            detail::throw_logic_error(
                "either::right: value is on the left");
        return std::get<1>(v_);
    }

    /** Invoke `f` with the value, whichever it is.
    */
    template<class F>
    decltype(auto)
    visit(F&& f)
    {
        return std::visit(std::forward<F>(f), v_);
    }

    template<class F>
    decltype(auto)
    visit(F&& f) const
    {
        return std::visit(std::forward<F>(f), v_);
    }

private:
    std::variant<L, R> v_;
};

//------------------------------------------------

/** A task driving the alternative which matched.
*/
template<class T1, class T2>
class or_task
{
public:
    using either_type = either<
        typename T1::output_type,
        typename T2::output_type>;
    using output_type = std::tuple<either_type>;

    template<std::size_t I, class T>
    or_task(std::in_place_index_t<I> i, T&& t)
        : v_(i, std::forward<T>(t))
    {
    }

    poll_result<output_type>
    poll_task()
    {
        if(v_.index() == 0)
            return poll_one<0>();
        return poll_one<1>();
    }

private:
    template<std::size_t I>
    poll_result<output_type>
    poll_one()
    {
        auto p = std::get<I>(v_).poll_task();
        if(p.is_pending())
            return pending;
        auto& r = p.value();
        if(r.has_error())
            return system::result<output_type>(r.error());
        return system::result<output_type>(output_type(
            either_type(std::in_place_index<I>, std::move(*r))));
    }

    std::variant<T1, T2> v_;
};

/** An endpoint matching either of two endpoints.

    Both alternatives are applied from the same position.
    When both match, the one which consumed more segments
    wins, and the first wins a tie. When neither matches
    their errors are combined with @ref apply_error::merge.

    @see endpoint_base::or_
*/
template<class E1, class E2>
class or_endpoint
    : public endpoint_base<or_endpoint<E1, E2>>
{
public:
    using task_type = or_task<
        typename E1::task_type,
        typename E2::task_type>;
    using output_type = typename task_type::output_type;

    or_endpoint(E1 e1, E2 e2)
        : e1_(std::move(e1))
        , e2_(std::move(e2))
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto const saved = cx.segments();
        auto r1 = e1_.apply(cx);
        auto const after1 = cx.segments();
        cx.segments() = saved;
        auto r2 = e2_.apply(cx);

        if(r1.has_value())
        {
            if( r2.has_error() ||
                after1.popped() >= cx.segments().popped())
            {
                cx.segments() = after1;
                return task_type(
                    std::in_place_index<0>, std::move(*r1));
            }
        }
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
