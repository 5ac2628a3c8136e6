//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_RUNNER_HPP
#define BOOST_ENDPOINTS_RUNNER_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <boost/endpoints/apply_context.hpp>
#include <boost/endpoints/apply_error.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <boost/endpoints/input.hpp>
#include <boost/endpoints/status.hpp>
#include <boost/system/error_code.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace boost {
namespace endpoints {

/** The final result of handling a request.

    An outcome holds exactly one of the output of the
    task, the routing failure, or the runtime error.
*/
template<class T>
class outcome
{
public:
    using value_type = T;

    /** Constructor.

        The outcome holds a value.
    */
    explicit
    outcome(std::in_place_index_t<0>, T t)
        : v_(std::in_place_index<0>, std::move(t))
    {
    }

    /** Constructor.

        The outcome holds a routing failure.
    */
    explicit
    outcome(apply_error e)
        : v_(std::in_place_index<1>, std::move(e))
    {
    }

    /** Constructor.

        The outcome holds a runtime error.
    */
    explicit
    outcome(system::error_code ec) noexcept
        : v_(std::in_place_index<2>, ec)
    {
    }

    bool
    has_value() const noexcept
    {
        return v_.index() == 0;
    }

    bool
    has_routing_error() const noexcept
    {
        return v_.index() == 1;
    }

    bool
    has_runtime_error() const noexcept
    {
        return v_.index() == 2;
    }

    /** Return the value.

        @throw std::logic_error if there is no value.
    */
    T&
    value()
    {
        if(! has_value())
            detail::throw_logic_error(
                "outcome::value: no value");
        return std::get<0>(v_);
    }

    /** Return the routing failure.

        @throw std::logic_error if there is none.
    */
    apply_error const&
    routing_error() const
    {
        if(! has_routing_error())
            detail::throw_logic_error(
                "outcome::routing_error: none");
        return std::get<1>(v_);
    }

    /** Return the runtime error.

        @throw std::logic_error if there is none.
    */
    system::error_code
    runtime_error() const
    {
        if(! has_runtime_error())
            detail::throw_logic_error(
                "outcome::runtime_error: none");
        return std::get<2>(v_);
    }

    /** Return the HTTP status code for the outcome.

        A value is 200 OK; failures map with @ref status_of.
    */
    unsigned
    status() const noexcept
    {
        switch(v_.index())
        {
        case 1:  return status_of(std::get<1>(v_));
        case 2:  return status_of(std::get<2>(v_));
        default: return 200;
        }
    }

    /** Return the value of the Allow field.

        This is empty unless the outcome is a
        method not allowed routing failure.
    */
    std::string
    allow() const
    {
        if(! has_routing_error())
            return {};
        return allow_header(std::get<1>(v_));
    }

private:
    std::variant<T, apply_error, system::error_code> v_;
};

//------------------------------------------------

namespace detail {

BOOST_ENDPOINTS_DECL
void
log_routing_failure(
    std::string_view method,
    std::string_view target,
    apply_error const& e);

BOOST_ENDPOINTS_DECL
void
log_runtime_error(
    std::string_view method,
    std::string_view target,
    system::error_code const& ec);

} // detail

/** The in-flight handling of one request.

    Holds the task produced by routing, or the
    routing failure. Polling drives the task and
    converts its result into an @ref outcome. A
    failure deferred by `or_reject` becomes a
    routing failure of the outcome.
*/
template<class Task>
class request_task
{
public:
    using output_type = typename Task::output_type;

    request_task(
        input& in,
        apply_result<Task> r)
        : in_(&in)
        , method_(in.method_string())
        , target_(in.target())
        , v_(std::move(r))
    {
    }

    /** Poll the task.

        A request which did not match is ready on the
        first poll. Polling after the outcome was
        returned throws `std::logic_error`.
    */
    poll<outcome<output_type>>
    poll_ready()
    {
        if(done_)
            detail::throw_logic_error(
                "request_task: polled after completion");
        if(v_.has_error())
        {
            done_ = true;
            detail::log_routing_failure(
                method_, target_, v_.error());
            return outcome<output_type>(v_.error());
        }
        auto p = v_->poll_task();
        if(p.is_pending())
            return pending;
        done_ = true;
        auto& r = p.value();
        if(r.has_error())
        {
            // a failure deferred by or_reject
            auto const& rej = in_->rejection();
            if( rej &&
                is_apply_error(r.error()) &&
                rej->code() == r.error())
            {
                detail::log_routing_failure(
                    method_, target_, *rej);
                return outcome<output_type>(*rej);
            }
            detail::log_runtime_error(
                method_, target_, r.error());
            return outcome<output_type>(r.error());
        }
        return outcome<output_type>(
            std::in_place_index<0>, std::move(*r));
    }

private:
    input* in_;
    std::string method_;
    std::string target_;
    apply_result<Task> v_;
    bool done_ = false;
};

/** Route a request and return the in-flight task.

    @param e The top-level endpoint.

    @param in The request. It must outlive the returned task.

    @param opts The routing options.
*/
template<class E>
    requires endpoint<E>
request_task<typename E::task_type>
apply_request(
    E const& e,
    input& in,
    apply_options opts = {})
{
    apply_context cx(in, opts);
    return request_task<typename E::task_type>(
        in, e.apply(cx));
}

/** Route a request and drive it to completion.

    @par Example
    @code
    auto e = get().and_( "hello" ).and_( param< std::string >() )
        .and_then( []( std::string name ) { return "Hi, " + name; } );
    input in( "GET", "/hello/world" );
    auto out = run( e, in );
    // out.value() == std::tuple< std::string >( "Hi, world" )
    @endcode
*/
template<class E>
    requires endpoint<E>
outcome<typename E::output_type>
run(
    E const& e,
    input& in,
    apply_options opts = {})
{
    auto t = apply_request(e, in, opts);
    for(;;)
    {
        auto p = t.poll_ready();
        if(p.is_ready())
            return std::move(p).value();
    }
}

} // endpoints
} // boost

#endif
