//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_VERB_HPP
#define BOOST_ENDPOINTS_VERB_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <boost/endpoints/method.hpp>
#include <tuple>

namespace boost {
namespace endpoints {

/** An endpoint matching the request method.

    When the method is not in the set the endpoint fails
    with @ref apply_errc::method_not_allowed, carrying the
    set so alternatives can report every allowed method.
*/
class verb_endpoint
    : public endpoint_base<verb_endpoint>
{
public:
    using output_type = std::tuple<>;
    using task_type = ready_task<output_type>;

    explicit
    verb_endpoint(verbs allowed) noexcept
        : allowed_(allowed)
    {
    }

    /** Return the allowed methods.
    */
    verbs
    allowed() const noexcept
    {
        return allowed_;
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        if(allowed_.contains(cx.request().verb()))
            return task_type(output_type());
        return apply_error::method_not_allowed(allowed_);
    }

private:
    verbs allowed_;
};

/** Return an endpoint matching any method in `allowed`.

    @par Example
    @code
    auto e = verb( verbs::get() | verbs::head() )
        .and_( segment( "status" ) );
    @endcode
*/
inline
verb_endpoint
verb(verbs allowed) noexcept
{
    return verb_endpoint(allowed);
}

inline verb_endpoint get() noexcept { return verb(verbs::get()); }
inline verb_endpoint post() noexcept { return verb(verbs::post()); }
inline verb_endpoint put() noexcept { return verb(verbs::put()); }
inline verb_endpoint delete_() noexcept { return verb(verbs::delete_()); }
inline verb_endpoint head() noexcept { return verb(verbs::head()); }
inline verb_endpoint patch() noexcept { return verb(verbs::patch()); }
inline verb_endpoint options() noexcept { return verb(verbs::options()); }

} // endpoints
} // boost

#endif
