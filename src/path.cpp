//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/path.hpp>
#include "src/detail/pct_decode.hpp"

namespace boost {
namespace endpoints {

segment_endpoint::
segment_endpoint(std::string_view s)
    : plain_(s)
    , s_(detail::pct_encode_segment(s))
{
}

auto
segment_endpoint::
apply(apply_context& cx) const ->
    apply_result<task_type>
{
    auto const saved = cx.segments();
    auto seg = cx.segments().next();
    if(seg)
    {
        if(detail::pct_is_equal(
                seg->encoded(), plain_,
                cx.options().is_case_sensitive()))
            return task_type(std::tuple<>());
    }
    cx.segments() = saved;
    return apply_error::not_matched();
}

auto
eos_endpoint::
apply(apply_context& cx) const ->
    apply_result<task_type>
{
    auto const& segs = cx.segments();
    if(! segs.empty())
        return apply_error::not_matched();
    if(cx.options().is_strict())
    {
        // a trailing slash is significant
        auto const p = segs.path();
        if( p.size() > 1 &&
            p.back() == '/')
            return apply_error::not_matched();
    }
    return task_type(std::tuple<>());
}

segment_endpoint
into_endpoint(std::string_view s)
{
    return segment_endpoint(s);
}

//------------------------------------------------

system::result<std::string>
param_traits<std::string>::
parse(std::string_view s)
{
    auto rv = detail::pct_decode(s);
    if(rv.has_error())
        BOOST_ENDPOINTS_RETURN_EC(
            error::invalid_param);
    return std::move(*rv);
}

system::result<bool>
param_traits<bool>::
parse(std::string_view s) noexcept
{
    if(s == "true")
        return true;
    if(s == "false")
        return false;
    BOOST_ENDPOINTS_RETURN_EC(
        error::invalid_param);
}

} // endpoints
} // boost
