//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_AND_HPP
#define BOOST_ENDPOINTS_AND_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <boost/endpoints/detail/maybe_done.hpp>
#include <boost/endpoints/detail/type_traits.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <tuple>
#include <utility>

namespace boost {
namespace endpoints {

/** A task which drives two tasks and joins their outputs.

    Each poll advances every child which is not done yet,
    in order. The first child to fail decides the error,
    and both children are released. The output is the
    concatenation of the two output tuples.
*/
template<class T1, class T2>
class and_task
{
public:
    using output_type = detail::tuple_concat_t<
        typename T1::output_type,
        typename T2::output_type>;

    and_task(T1 t1, T2 t2)
        : t1_(std::move(t1))
        , t2_(std::move(t2))
    {
    }

    poll_result<output_type>
    poll_task()
    {
        if(done_)
            detail::throw_logic_error(
                "and_task: polled after completion");
        auto r1 = t1_.poll_done();
        if(r1.has_error())
            return fail(r1.error());
        auto r2 = t2_.poll_done();
        if(r2.has_error())
            return fail(r2.error());
        if(! *r1 || ! *r2)
            return pending;
        done_ = true;
        return system::result<output_type>(std::tuple_cat(
            t1_.take_output(), t2_.take_output()));
    }

private:
    poll_result<output_type>
    fail(system::error_code ec)
    {
        done_ = true;
        t1_.clear();
        t2_.clear();
        return system::result<output_type>(ec);
    }

    detail::maybe_done<T1> t1_;
    detail::maybe_done<T2> t2_;
    bool done_ = false;
};

/** An endpoint matching two endpoints in sequence.

    The second endpoint is applied on the cursor left by
    the first, and only if the first matched. If the second
    fails the cursor is restored to where it was before the
    first was applied.

    @see endpoint_base::and_
*/
template<class E1, class E2>
class and_endpoint
    : public endpoint_base<and_endpoint<E1, E2>>
{
public:
    using task_type = and_task<
        typename E1::task_type,
        typename E2::task_type>;
    using output_type = typename task_type::output_type;

    and_endpoint(E1 e1, E2 e2)
        : e1_(std::move(e1))
        , e2_(std::move(e2))
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto const saved = cx.segments();
        auto r1 = e1_.apply(cx);
        if(r1.has_error())
            return r1.error();
        auto r2 = e2_.apply(cx);
        if(r2.has_error())
        {
            cx.segments() = saved;
            return r2.error();
        }
        return task_type(std::move(*r1), std::move(*r2));
    }

private:
    E1 e1_;
    E2 e2_;
};

} // endpoints
} // boost

#endif
