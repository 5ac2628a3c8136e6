//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/runner.hpp>
#include <boost/endpoints/logger.hpp>

namespace boost {
namespace endpoints {
namespace detail {

namespace {

section&
runner_log()
{
    static section sect =
        default_log_sections().get("endpoints");
    return sect;
}

} // (anon)

void
log_routing_failure(
    std::string_view method,
    std::string_view target,
    apply_error const& e)
{
    auto& sect = runner_log();
    LOG_DBG(sect)("{} {}: {} ({})",
        method, target, e.message(), status_of(e));
}

void
log_runtime_error(
    std::string_view method,
    std::string_view target,
    system::error_code const& ec)
{
    auto& sect = runner_log();
    LOG_DBG(sect)("{} {}: {} ({})",
        method, target, ec.message(), status_of(ec));
}

} // detail
} // endpoints
} // boost
