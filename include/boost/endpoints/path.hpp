//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_PATH_HPP
#define BOOST_ENDPOINTS_PATH_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <boost/endpoints/error.hpp>
#include <boost/endpoints/param_traits.hpp>
#include <string>
#include <string_view>
#include <tuple>

namespace boost {
namespace endpoints {

/** An endpoint matching one literal segment.

    The path segment is percent-decoded while it is
    compared with the literal, so any equivalent encoding
    of the literal matches. An escaped `/` in the path
    matches a `/` in the literal, which can therefore
    never match more than one segment.
*/
class segment_endpoint
    : public endpoint_base<segment_endpoint>
{
public:
    using output_type = std::tuple<>;
    using task_type = ready_task<output_type>;

    /** Constructor.

        @param s The literal, not percent-encoded.
    */
    BOOST_ENDPOINTS_DECL
    explicit
    segment_endpoint(std::string_view s);

    /** Return the literal.
    */
    std::string_view
    literal() const noexcept
    {
        return plain_;
    }

    /** Return the encoded literal.
    */
    std::string_view
    encoded() const noexcept
    {
        return s_;
    }

    BOOST_ENDPOINTS_DECL
    apply_result<task_type>
    apply(apply_context& cx) const;

private:
    std::string plain_;
    std::string s_;
};

/** An endpoint matching the end of the path.

    When @ref apply_options::strict is set, a path
    ending in a slash other than `"/"` does not match.
*/
class eos_endpoint
    : public endpoint_base<eos_endpoint>
{
public:
    using output_type = std::tuple<>;
    using task_type = ready_task<output_type>;

    BOOST_ENDPOINTS_DECL
    apply_result<task_type>
    apply(apply_context& cx) const;
};

/** An endpoint extracting one segment as a value.

    The segment is converted with `param_traits<T>::parse`.
    A missing segment does not match. A conversion failure
    is an invalid request, or does not match when
    `param_traits<T>::skip_on_error` is `true`.
*/
template<class T>
class param_endpoint
    : public endpoint_base<param_endpoint<T>>
{
public:
    using output_type = std::tuple<T>;
    using task_type = ready_task<output_type>;

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto const saved = cx.segments();
        auto s = cx.segments().next();
        if(! s)
            return apply_error::not_matched();
        auto rv = param_traits<T>::parse(s->encoded());
        if(rv.has_error())
        {
            cx.segments() = saved;
            if constexpr(param_skip_on_error_v<T>)
                return apply_error::not_matched();
            else
                return apply_error::invalid_request(
                    error::invalid_param, s->encoded());
        }
        return task_type(output_type(std::move(*rv)));
    }
};

/** An endpoint extracting the rest of the path as a value.

    The remaining path is converted with `param_traits<T>::parse`
    and the cursor is drained whether or not the conversion
    succeeds.
*/
template<class T>
class remains_endpoint
    : public endpoint_base<remains_endpoint<T>>
{
public:
    using output_type = std::tuple<T>;
    using task_type = ready_task<output_type>;

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto const rest = cx.segments().remaining_path();
        cx.segments().drain();
        auto rv = param_traits<T>::parse(rest);
        if(rv.has_error())
        {
            if constexpr(param_skip_on_error_v<T>)
                return apply_error::not_matched();
            else
                return apply_error::invalid_request(
                    error::invalid_param, rest);
        }
        return task_type(output_type(std::move(*rv)));
    }
};

//------------------------------------------------

/** Return an endpoint matching the literal segment `s`.

    @par Example
    @code
    auto e = segment( "api" ).and_( "v1" ).and_( eos() );
    @endcode
*/
inline
segment_endpoint
segment(std::string_view s)
{
    return segment_endpoint(s);
}

/** Return an endpoint matching the end of the path.
*/
inline
eos_endpoint
eos() noexcept
{
    return {};
}

/** Return an endpoint extracting one segment as a `T`.

    @par Example
    @code
    auto e = segment( "users" ).and_( param< int >() );
    @endcode
*/
template<class T>
param_endpoint<T>
param()
{
    return {};
}

/** Return an endpoint extracting the rest of the path as a `T`.
*/
template<class T>
remains_endpoint<T>
remains()
{
    return {};
}

} // endpoints
} // boost

#endif
