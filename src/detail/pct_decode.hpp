//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_SRC_DETAIL_PCT_DECODE_HPP
#define BOOST_ENDPOINTS_SRC_DETAIL_PCT_DECODE_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/system/result.hpp>
#include <string>
#include <string_view>

namespace boost {
namespace endpoints {
namespace detail {

bool
ci_is_equal(
    std::string_view s0,
    std::string_view s1) noexcept;

// decode all percent escapes, failing on a malformed escape
system::result<std::string>
pct_decode(
    std::string_view s);

// compare the decoded form of `encoded` with `plain`,
// a malformed escape never compares equal
bool
pct_is_equal(
    std::string_view encoded,
    std::string_view plain,
    bool case_sensitive) noexcept;

// encode a literal segment for comparison with the encoded path
std::string
pct_encode_segment(
    std::string_view s);

} // detail
} // endpoints
} // boost

#endif
