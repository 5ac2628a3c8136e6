//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_BEFORE_APPLY_HPP
#define BOOST_ENDPOINTS_BEFORE_APPLY_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <concepts>
#include <type_traits>
#include <utility>

namespace boost {
namespace endpoints {

/** An endpoint which runs a check before its inner endpoint.

    The function is called with the context and returns
    `apply_result<void>`. A failure is returned without
    applying the inner endpoint.

    @par Example
    @code
    auto e = body< std::string >().before_apply(
        []( apply_context& cx ) -> apply_result< void >
        {
            if( ! cx.request().header( "Content-Type" ) )
                return apply_error::invalid_request(
                    error::missing_header, "Content-Type" );
            return {};
        });
    @endcode

    @see endpoint_base::before_apply
*/
template<class E, class F>
class before_apply_endpoint
    : public endpoint_base<before_apply_endpoint<E, F>>
{
public:
    using task_type = typename E::task_type;
    using output_type = typename E::output_type;

    static_assert(std::same_as<
        std::invoke_result_t<F const&, apply_context&>,
        apply_result<void>>,
        "the check must return apply_result<void>");

    before_apply_endpoint(E e, F f)
        : e_(std::move(e))
        , f_(std::move(f))
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto rv = f_(cx);
        if(rv.has_error())
            return rv.error();
        return e_.apply(cx);
    }

private:
    E e_;
    F f_;
};

} // endpoints
} // boost

#endif
