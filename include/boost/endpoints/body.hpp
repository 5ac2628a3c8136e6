//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_BODY_HPP
#define BOOST_ENDPOINTS_BODY_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <boost/endpoints/error.hpp>
#include <boost/endpoints/input.hpp>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace boost {
namespace endpoints {

/** Conversion of a complete request body into a typed value.

    Specializations provide a static member function

    @code
    static system::result< T > from_body( std::string s );
    @endcode

    A conversion failure is reported to the client
    as @ref error::bad_body.
*/
template<class T>
struct body_traits;

/** Conversion of the body to text.

    The body must be valid UTF-8.
*/
template<>
struct body_traits<std::string>
{
    BOOST_ENDPOINTS_DECL
    static
    system::result<std::string>
    from_body(std::string s) noexcept;
};

template<>
struct body_traits<std::vector<unsigned char>>
{
    static
    system::result<std::vector<unsigned char>>
    from_body(std::string s)
    {
        return std::vector<unsigned char>(
            s.begin(), s.end());
    }
};

//------------------------------------------------

/** A task yielding the request body handle.

    The handle is taken from the request when the
    task is first polled.
*/
class raw_body_task
{
public:
    using output_type =
        std::tuple<std::unique_ptr<body_source>>;

    explicit
    raw_body_task(input& in) noexcept
        : in_(&in)
    {
    }

    BOOST_ENDPOINTS_DECL
    poll_result<output_type>
    poll_task();

private:
    input* in_;
    bool done_ = false;
};

/** A task reading the whole body and converting it.

    The body is taken from the request on the first
    poll. Each poll then reads chunks until the source
    is pending, fails, or reaches the end of the body.
*/
template<class T>
class body_task
{
public:
    using output_type = std::tuple<T>;

    explicit
    body_task(input& in) noexcept
        : in_(&in)
    {
    }

    poll_result<output_type>
    poll_task()
    {
        if(done_)
            detail::throw_logic_error(
                "body_task: polled after completion");
        if(in_)
        {
            b_ = std::exchange(in_, nullptr)->take_body();
            if(! b_)
            {
                done_ = true;
                BOOST_ENDPOINTS_RETURN_EC(
                    error::body_already_taken);
            }
        }
        for(;;)
        {
            auto p = b_->poll_data();
            if(p.is_pending())
                return pending;
            auto& r = p.value();
            if(r.has_error())
            {
                done_ = true;
                b_.reset();
                return system::result<output_type>(r.error());
            }
            if(*r)
            {
                buf_.append(**r);
                continue;
            }
            break;
        }
        done_ = true;
        b_.reset();
        auto rv = body_traits<T>::from_body(std::move(buf_));
        if(rv.has_error())
            BOOST_ENDPOINTS_RETURN_EC(
                error::bad_body);
        return system::result<output_type>(
            output_type(std::move(*rv)));
    }

private:
    input* in_;
    std::unique_ptr<body_source> b_;
    std::string buf_;
    bool done_ = false;
};

//------------------------------------------------

/** An endpoint taking the request body handle.

    Routing never consumes the body. The task takes
    the handle when it is first polled, and fails with
    @ref error::body_already_taken if another task
    took it first.
*/
class raw_body_endpoint
    : public endpoint_base<raw_body_endpoint>
{
public:
    using task_type = raw_body_task;
    using output_type = task_type::output_type;

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        return task_type(cx.mutable_request());
    }
};

/** An endpoint reading the request body as a `T`.

    @see body_traits
*/
template<class T>
class body_endpoint
    : public endpoint_base<body_endpoint<T>>
{
public:
    using task_type = body_task<T>;
    using output_type = typename task_type::output_type;

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        return task_type(cx.mutable_request());
    }
};

/** Return an endpoint taking the request body handle.
*/
inline
raw_body_endpoint
raw_body() noexcept
{
    return {};
}

/** Return an endpoint reading the request body as a `T`.

    @par Example
    @code
    auto e = post()
        .and_( segment( "echo" ) )
        .and_( body< std::string >() );
    @endcode
*/
template<class T>
body_endpoint<T>
body()
{
    return {};
}

} // endpoints
} // boost

#endif
