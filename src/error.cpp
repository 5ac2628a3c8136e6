//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/error.hpp>
#include <boost/endpoints/apply_error.hpp>

namespace boost {
namespace endpoints {

namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "boost.endpoints";
}

std::string
error_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
error_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(code))
    {
    case error::body_already_taken: return "the request body has already been taken";
    case error::bad_body:           return "failed to convert the request body";
    case error::invalid_param:      return "invalid path parameter";
    case error::invalid_header:     return "invalid header";
    case error::missing_header:     return "missing header";
    case error::missing_query:      return "missing query";
    case error::poll_failed:        return "the body source failed";
    default:
        return "?";
    }
}

//------------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "boost.endpoints.condition";
}

std::string
condition_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(code))
    {
    case condition::client_error: return "client error";
    case condition::server_error: return "server error";
    default:
        return "?";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int code) const noexcept
{
    // routing failures surfaced at run time are always
    // attributed to the request
    if(is_apply_error(ec))
        return static_cast<condition>(code) ==
            condition::client_error;

    if(&ec.category() != &error_cat)
        return false;

    switch(static_cast<condition>(code))
    {
    case condition::client_error:
        switch(static_cast<error>(ec.value()))
        {
        case error::bad_body:
        case error::invalid_param:
        case error::invalid_header:
        case error::missing_header:
        case error::missing_query:
            return true;
        default:
            return false;
        }

    case condition::server_error:
        switch(static_cast<error>(ec.value()))
        {
        case error::body_already_taken:
        case error::poll_failed:
            return true;
        default:
            return false;
        }

    default:
        return false;
    }
}

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail

} // endpoints
} // boost
