//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/status.hpp>
#include <boost/endpoints/error.hpp>

namespace boost {
namespace endpoints {

namespace {

unsigned
status_of_kind(apply_errc k) noexcept
{
    switch(k)
    {
    case apply_errc::not_matched:        return 404;
    case apply_errc::method_not_allowed: return 405;
    case apply_errc::invalid_request:    return 400;
    default:
        return 500;
    }
}

} // (anon)

unsigned
status_of(apply_error const& e) noexcept
{
    return status_of_kind(e.kind());
}

unsigned
status_of(system::error_code const& ec) noexcept
{
    if(! ec.failed())
        return 200;
    if(is_apply_error(ec))
        return status_of_kind(
            static_cast<apply_errc>(ec.value()));
    if(ec == condition::client_error)
        return 400;
    return 500;
}

std::string
allow_header(apply_error const& e)
{
    if(! e.is_method_not_allowed())
        return {};
    return e.allowed().to_string();
}

} // endpoints
} // boost
