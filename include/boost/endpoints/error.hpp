//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_ERROR_HPP
#define BOOST_ENDPOINTS_ERROR_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <string>
#include <type_traits>

namespace boost {
namespace endpoints {

/** Error codes returned by library endpoints and tasks.

    Runtime errors surfaced from a task are reported as
    `system::error_code`; any error enumeration registered
    with `system::is_error_code_enum` converts into one, so
    user tasks may report their own errors alongside these.
*/
enum class error
{
    /// The request body was already taken by another endpoint.
    body_already_taken = 1,

    /// The request body could not be converted to the requested type.
    bad_body,

    /// A path segment could not be converted to the requested type.
    invalid_param,

    /// A header value could not be converted to the requested type.
    invalid_header,

    /// A required header is absent.
    missing_header,

    /// The request target has no query.
    missing_query,

    /// A body source failed while producing data.
    poll_failed
};

/** Error conditions used to classify runtime errors.
*/
enum class condition
{
    /// The error was caused by the request and can be corrected by the client.
    client_error = 1,

    /// The error was caused by the server.
    server_error
};

} // endpoints

namespace system {
template<>
struct is_error_code_enum<
    ::boost::endpoints::error>
{
    static bool const value = true;
};
template<>
struct is_error_condition_enum<
    ::boost::endpoints::condition>
{
    static bool const value = true;
};
} // system

namespace endpoints {

namespace detail {

struct BOOST_ENDPOINTS_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    BOOST_ENDPOINTS_DECL const char* name() const noexcept override;
    BOOST_ENDPOINTS_DECL std::string message(int) const override;
    BOOST_ENDPOINTS_DECL char const* message(
        int, char*, std::size_t) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x7e1f3c0b9a4d2e61)
    {
    }
};

struct BOOST_ENDPOINTS_SYMBOL_VISIBLE
    condition_cat_type
    : system::error_category
{
    BOOST_ENDPOINTS_DECL const char* name() const noexcept override;
    BOOST_ENDPOINTS_DECL std::string message(int) const override;
    BOOST_ENDPOINTS_DECL char const* message(
        int, char*, std::size_t) const noexcept override;
    BOOST_ENDPOINTS_DECL bool equivalent(
        system::error_code const&, int) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR condition_cat_type()
        : error_category(0x3a84c6e27d05b19f)
    {
    }
};

BOOST_ENDPOINTS_DECL extern error_cat_type error_cat;
BOOST_ENDPOINTS_DECL extern condition_cat_type condition_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(error ev) noexcept
{
    return system::error_code{static_cast<
        std::underlying_type<error>::type>(ev),
        detail::error_cat};
}

inline
BOOST_SYSTEM_CONSTEXPR
system::error_condition
make_error_condition(condition c) noexcept
{
    return system::error_condition{static_cast<
        std::underlying_type<condition>::type>(c),
        detail::condition_cat};
}

} // endpoints
} // boost

#endif
