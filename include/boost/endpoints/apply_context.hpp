//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_APPLY_CONTEXT_HPP
#define BOOST_ENDPOINTS_APPLY_CONTEXT_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/apply_options.hpp>
#include <boost/endpoints/input.hpp>
#include <boost/endpoints/segments.hpp>

namespace boost {
namespace endpoints {

/** The state shared by endpoints while routing one request.

    The context refers to the request and owns the path
    cursor. It is passed by reference through nested calls
    to `apply`, so each endpoint sees the position left by
    the endpoints applied before it.
*/
class apply_context
{
public:
    /** Constructor.

        @param in The request. It must outlive the context.

        @param opts The routing options.
    */
    explicit
    apply_context(
        input& in,
        apply_options opts = {}) noexcept
        : in_(in)
        , segs_(in.path())
        , opts_(opts)
    {
    }

    apply_context(apply_context const&) = delete;
    apply_context& operator=(apply_context const&) = delete;

    /** Return the request.
    */
    input const&
    request() const noexcept
    {
        return in_;
    }

    /** Return the path cursor.
    */
    endpoints::segments&
    segments() noexcept
    {
        return segs_;
    }

    endpoints::segments const&
    segments() const noexcept
    {
        return segs_;
    }

    /** Return the routing options.
    */
    apply_options const&
    options() const noexcept
    {
        return opts_;
    }

    /** Return the request for modification.

        Endpoints do not change the request while routing.
        Tasks that claim the body keep this reference and
        take the body when they are first polled.
    */
    input&
    mutable_request() noexcept
    {
        return in_;
    }

private:
    input& in_;
    endpoints::segments segs_;
    apply_options opts_;
};

} // endpoints
} // boost

#endif
