//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_STATUS_HPP
#define BOOST_ENDPOINTS_STATUS_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/apply_error.hpp>
#include <boost/system/error_code.hpp>
#include <string>

namespace boost {
namespace endpoints {

/** Return the HTTP status code for a routing failure.

    @li @ref apply_errc::not_matched is 404 Not Found
    @li @ref apply_errc::method_not_allowed is 405 Method Not Allowed
    @li @ref apply_errc::invalid_request is 400 Bad Request

    @param e The routing failure.
*/
BOOST_ENDPOINTS_DECL
unsigned
status_of(apply_error const& e) noexcept;

/** Return the HTTP status code for a runtime error.

    Routing codes surfaced by `or_reject` map as they do
    for an @ref apply_error. Other codes equivalent to
    @ref condition::client_error are 400 Bad Request, and
    everything else is 500 Internal Server Error. A code
    which does not indicate failure is 200 OK.

    @param ec The error reported by a task.
*/
BOOST_ENDPOINTS_DECL
unsigned
status_of(system::error_code const& ec) noexcept;

/** Return the value of the Allow field for a routing failure.

    @return The allowed methods separated by `", "`, or
    an empty string unless the failure is
    @ref apply_errc::method_not_allowed.
*/
BOOST_ENDPOINTS_DECL
std::string
allow_header(apply_error const& e);

} // endpoints
} // boost

#endif
