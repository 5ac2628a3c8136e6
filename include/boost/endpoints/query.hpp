//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_QUERY_HPP
#define BOOST_ENDPOINTS_QUERY_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <boost/endpoints/error.hpp>
#include <boost/endpoints/param_traits.hpp>
#include <tuple>

namespace boost {
namespace endpoints {

/** An endpoint extracting the query string as a value.

    The raw query, without the leading `?`, is converted
    with `param_traits<T>::parse`. A target without a query
    is an invalid request with reason @ref error::missing_query.
*/
template<class T>
class query_endpoint
    : public endpoint_base<query_endpoint<T>>
{
public:
    using output_type = std::tuple<T>;
    using task_type = ready_task<output_type>;

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        auto q = cx.request().query();
        if(! q)
            return apply_error::invalid_request(
                error::missing_query);
        auto rv = param_traits<T>::parse(*q);
        if(rv.has_error())
            return apply_error::invalid_request(
                error::invalid_param, *q);
        return task_type(output_type(std::move(*rv)));
    }
};

/** Return an endpoint extracting the query string as a `T`.
*/
template<class T>
query_endpoint<T>
query()
{
    return {};
}

} // endpoints
} // boost

#endif
