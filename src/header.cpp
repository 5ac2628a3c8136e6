//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/header.hpp>
#include "src/detail/pct_decode.hpp"

namespace boost {
namespace endpoints {

auto
header_equals_endpoint::
apply(apply_context& cx) const ->
    apply_result<task_type>
{
    auto v = cx.request().header(name_);
    if( v &&
        detail::ci_is_equal(*v, value_))
        return task_type(output_type());
    return apply_error::not_matched();
}

} // endpoints
} // boost
