//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/apply_error.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>

namespace boost {
namespace endpoints {

namespace detail {

const char*
apply_cat_type::
name() const noexcept
{
    return "boost.endpoints.apply";
}

std::string
apply_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
apply_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<apply_errc>(code))
    {
    case apply_errc::not_matched:        return "not matched";
    case apply_errc::method_not_allowed: return "method not allowed";
    case apply_errc::invalid_request:    return "invalid request";
    default:
        return "?";
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
constinit apply_cat_type apply_cat;
#else
apply_cat_type apply_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail

apply_error
apply_error::
invalid_request(
    system::error_code reason,
    std::string_view what)
{
    apply_error e;
    e.kind_ = apply_errc::invalid_request;
    e.reason_ = reason;
    e.what_ = what;
    return e;
}

std::string
apply_error::
message() const
{
    switch(kind_)
    {
    case apply_errc::not_matched:
        return "not matched";

    case apply_errc::method_not_allowed:
    {
        std::string s = "method not allowed (allowed methods: ";
        s.append(allowed_.to_string());
        s.push_back(')');
        return s;
    }

    case apply_errc::invalid_request:
    default:
        break;
    }
    std::string s = reason_.failed() ?
        reason_.message() : std::string("invalid request");
    if(! what_.empty())
    {
        s.append(": `");
        s.append(what_);
        s.push_back('\'');
    }
    return s;
}

apply_error
apply_error::
merge(apply_error const& other) const
{
    if(kind_ == apply_errc::invalid_request)
        return *this;
    if(other.kind_ == apply_errc::invalid_request)
        return other;
    if(kind_ == apply_errc::method_not_allowed)
    {
        if(other.kind_ == apply_errc::method_not_allowed)
            return method_not_allowed(
                allowed_ | other.allowed_);
        return *this;
    }
    // not_matched on the left
    return other;
}

void
throw_exception_from_error(
    apply_error const& e,
    source_location const& loc)
{
    throw_exception(
        system::system_error(e.code(), e.message()), loc);
}

} // endpoints
} // boost
