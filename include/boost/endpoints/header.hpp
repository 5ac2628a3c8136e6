//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_HEADER_HPP
#define BOOST_ENDPOINTS_HEADER_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <boost/endpoints/error.hpp>
#include <boost/endpoints/param_traits.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace boost {
namespace endpoints {

/** Conversion of a header field value into a `T`.

    Field values are not percent-encoded. Types other
    than `std::string` convert with @ref param_traits;
    a `std::string` receives the value unchanged.

    Specializations provide a static member function

    @code
    static system::result< T > parse( std::string_view s );
    @endcode
*/
template<class T>
struct header_traits
{
    static
    system::result<T>
    parse(std::string_view s)
    {
        return param_traits<T>::parse(s);
    }
};

template<>
struct header_traits<std::string>
{
    static
    system::result<std::string>
    parse(std::string_view s)
    {
        return std::string(s);
    }
};

/** An endpoint extracting a required header value.

    A missing header is an invalid request with reason
    @ref error::missing_header; a value which does not
    convert is one with reason @ref error::invalid_header.

    @see header_traits
*/
template<class T>
class header_endpoint
    : public endpoint_base<header_endpoint<T>>
{
public:
    using output_type = std::tuple<T>;
    using task_type = ready_task<output_type>;

    explicit
    header_endpoint(std::string_view name)
        : name_(name)
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto v = cx.request().header(name_);
        if(! v)
            return apply_error::invalid_request(
                error::missing_header, name_);
        auto rv = header_traits<T>::parse(*v);
        if(rv.has_error())
            return apply_error::invalid_request(
                error::invalid_header, name_);
        return task_type(output_type(std::move(*rv)));
    }

private:
    std::string name_;
};

/** An endpoint extracting an optional header value.
*/
template<class T>
class header_optional_endpoint
    : public endpoint_base<header_optional_endpoint<T>>
{
public:
    using output_type = std::tuple<std::optional<T>>;
    using task_type = ready_task<output_type>;

    explicit
    header_optional_endpoint(std::string_view name)
        : name_(name)
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto v = cx.request().header(name_);
        if(! v)
            return task_type(output_type(std::nullopt));
        auto rv = header_traits<T>::parse(*v);
        if(rv.has_error())
            return apply_error::invalid_request(
                error::invalid_header, name_);
        return task_type(output_type(std::move(*rv)));
    }

private:
    std::string name_;
};

/** An endpoint matching a header with a given value.

    The value is compared case-insensitively. A missing
    or different header does not match.
*/
class header_equals_endpoint
    : public endpoint_base<header_equals_endpoint>
{
public:
    using output_type = std::tuple<>;
    using task_type = ready_task<output_type>;

    header_equals_endpoint(
        std::string_view name,
        std::string_view value)
        : name_(name)
        , value_(value)
    {
    }

    BOOST_ENDPOINTS_DECL
    apply_result<task_type>
    apply(apply_context& cx) const;

private:
    std::string name_;
    std::string value_;
};

//------------------------------------------------

/** Return an endpoint extracting the header `name` as a `T`.

    @par Example
    @code
    auto e = post().and_( header< std::size_t >( "Content-Length" ) );
    @endcode
*/
template<class T>
header_endpoint<T>
header(std::string_view name)
{
    return header_endpoint<T>(name);
}

/** Return an endpoint extracting the header `name`, if present.
*/
template<class T>
header_optional_endpoint<T>
header_optional(std::string_view name)
{
    return header_optional_endpoint<T>(name);
}

/** Return an endpoint matching when header `name` equals `value`.
*/
inline
header_equals_endpoint
header_equals(
    std::string_view name,
    std::string_view value)
{
    return header_equals_endpoint(name, value);
}

} // endpoints
} // boost

#endif
