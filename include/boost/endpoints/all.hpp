//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_ALL_HPP
#define BOOST_ENDPOINTS_ALL_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <boost/endpoints/detail/maybe_done.hpp>
#include <boost/endpoints/detail/type_traits.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <tuple>
#include <utility>
#include <vector>

namespace boost {
namespace endpoints {

/** A task which drives a sequence of tasks and collects their outputs.

    Each poll advances every child which is not done yet,
    in order. The task completes when every child is done,
    yielding the outputs in the order of the children. The
    first child in order to fail decides the error, and all
    children are released.
*/
template<class Task>
class join_all_task
{
public:
    using value_type = detail::untuple_t<
        typename Task::output_type>;
    using output_type = std::tuple<std::vector<value_type>>;

    explicit
    join_all_task(std::vector<Task> tasks)
    {
        v_.reserve(tasks.size());
        for(auto& t : tasks)
            v_.emplace_back(std::move(t));
    }

    poll_result<output_type>
    poll_task()
    {
        if(done_)
            detail::throw_logic_error(
                "join_all_task: polled after completion");
        bool ready = true;
        for(auto& slot : v_)
        {
            auto r = slot.poll_done();
            if(r.has_error())
            {
                done_ = true;
                v_.clear();
                return system::result<output_type>(r.error());
            }
            if(! *r)
                ready = false;
        }
        if(! ready)
            return pending;
        done_ = true;
        std::vector<value_type> out;
        out.reserve(v_.size());
        for(auto& slot : v_)
            out.push_back(detail::untuple_value(
                slot.take_output()));
        v_.clear();
        return system::result<output_type>(
            output_type(std::move(out)));
    }

private:
    std::vector<detail::maybe_done<Task>> v_;
    bool done_ = false;
};

/** Return a task which drives every task in `tasks`.

    @par Example
    @code
    std::vector< ready_task< std::tuple< int > > > v;
    v.push_back( make_ready_task( std::tuple< int >( 1 ) ) );
    v.push_back( make_ready_task( std::tuple< int >( 2 ) ) );
    auto t = join_all( std::move( v ) );
    // run_sync( t ) holds std::tuple< std::vector< int > >{ { 1, 2 } }
    @endcode
*/
template<class Task>
    requires task<Task>
join_all_task<Task>
join_all(std::vector<Task> tasks)
{
    return join_all_task<Task>(std::move(tasks));
}

//------------------------------------------------

/** An endpoint matching every endpoint of a sequence.

    The endpoints are applied in order on the advancing
    cursor. If any of them fails the cursor is restored
    and the failure is returned.

    Endpoints of different types are combined by
    storing them as @ref any_endpoint.
*/
template<class E>
class all_endpoint
    : public endpoint_base<all_endpoint<E>>
{
public:
    using task_type = join_all_task<typename E::task_type>;
    using output_type = typename task_type::output_type;

    explicit
    all_endpoint(std::vector<E> v)
        : v_(std::move(v))
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto const saved = cx.segments();
        std::vector<typename E::task_type> tasks;
        tasks.reserve(v_.size());
        for(auto const& e : v_)
        {
            auto r = e.apply(cx);
            if(r.has_error())
            {
                cx.segments() = saved;
                return r.error();
            }
            tasks.push_back(std::move(*r));
        }
        return task_type(std::move(tasks));
    }

private:
    std::vector<E> v_;
};

/** Return an endpoint matching every endpoint in `v`.
*/
template<class E>
    requires endpoint<E>
all_endpoint<E>
all(std::vector<E> v)
{
    return all_endpoint<E>(std::move(v));
}

} // endpoints
} // boost

#endif
