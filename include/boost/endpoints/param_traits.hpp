//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_PARAM_TRAITS_HPP
#define BOOST_ENDPOINTS_PARAM_TRAITS_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/error.hpp>
#include <boost/system/result.hpp>
#include <charconv>
#include <concepts>
#include <string>
#include <string_view>
#include <system_error>

namespace boost {
namespace endpoints {

/** Conversion of request text into a typed value.

    Specializations provide a static member function

    @code
    static system::result< T > parse( std::string_view s );
    @endcode

    which receives the still percent-encoded text of a
    path segment, a header value, or the query. They may
    also provide `static constexpr bool skip_on_error`;
    when it is `true` a conversion failure of a path
    parameter means "not matched" instead of an invalid
    request.

    @par Example
    @code
    struct user_id { int v; };

    template<>
    struct param_traits< user_id >
    {
        static constexpr bool skip_on_error = true;

        static system::result< user_id >
        parse( std::string_view s )
        {
            auto rv = param_traits< int >::parse( s );
            if( rv.has_error() )
                return rv.error();
            return user_id{ *rv };
        }
    };
    @endcode
*/
template<class T>
struct param_traits;

/** Percent-decoded text.
*/
template<>
struct param_traits<std::string>
{
    BOOST_ENDPOINTS_DECL
    static
    system::result<std::string>
    parse(std::string_view s);
};

/** The encoded text, without copying.
*/
template<>
struct param_traits<std::string_view>
{
    static
    system::result<std::string_view>
    parse(std::string_view s) noexcept
    {
        return s;
    }
};

/** The literals `true` and `false`.
*/
template<>
struct param_traits<bool>
{
    BOOST_ENDPOINTS_DECL
    static
    system::result<bool>
    parse(std::string_view s) noexcept;
};

/** Decimal integers.
*/
template<class T>
    requires std::integral<T> &&
        (! std::same_as<T, bool>)
struct param_traits<T>
{
    static
    system::result<T>
    parse(std::string_view s) noexcept
    {
        T v{};
        auto const end = s.data() + s.size();
        auto rv = std::from_chars(s.data(), end, v);
        if( rv.ec != std::errc() ||
            rv.ptr != end ||
            s.empty())
            BOOST_ENDPOINTS_RETURN_EC(
                error::invalid_param);
        return v;
    }
};

/** Floating point numbers.
*/
template<class T>
    requires std::floating_point<T>
struct param_traits<T>
{
    static
    system::result<T>
    parse(std::string_view s) noexcept
    {
        T v{};
        auto const end = s.data() + s.size();
        auto rv = std::from_chars(s.data(), end, v);
        if( rv.ec != std::errc() ||
            rv.ptr != end ||
            s.empty())
            BOOST_ENDPOINTS_RETURN_EC(
                error::invalid_param);
        return v;
    }
};

namespace detail {

template<class T>
constexpr
bool
param_skip_on_error() noexcept
{
    if constexpr(requires { param_traits<T>::skip_on_error; })
        return param_traits<T>::skip_on_error;
    else
        return false;
}

} // detail

/** True if a failed conversion of `T` means "not matched".
*/
template<class T>
constexpr bool param_skip_on_error_v =
    detail::param_skip_on_error<T>();

} // endpoints
} // boost

#endif
