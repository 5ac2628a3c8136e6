//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include "src/detail/pct_decode.hpp"
#include <boost/url/encode.hpp>
#include <boost/url/pct_string_view.hpp>
#include <boost/url/rfc/pchars.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>

namespace boost {
namespace endpoints {
namespace detail {

bool
ci_is_equal(
    std::string_view s0,
    std::string_view s1) noexcept
{
    auto n = s0.size();
    if(s1.size() != n)
        return false;
    auto p1 = s0.data();
    auto p2 = s1.data();
    char a, b;
    // fast loop
    while(n--)
    {
        a = *p1++;
        b = *p2++;
        if(a != b)
            goto slow;
    }
    return true;
    do
    {
        a = *p1++;
        b = *p2++;
    slow:
        if( urls::grammar::to_lower(a) !=
            urls::grammar::to_lower(b))
            return false;
    }
    while(n--);
    return true;
}

system::result<std::string>
pct_decode(
    std::string_view s)
{
    // rejects truncated and non-hex escapes
    auto rv = urls::make_pct_string_view(
        core::string_view(s.data(), s.size()));
    if(rv.has_error())
        return rv.error();

    std::string result;
    result.reserve(s.size());
    auto it = s.data();
    auto const end = it + s.size();
    while(it != end)
    {
        if(*it != '%')
        {
            result.push_back(*it++);
            continue;
        }
        ++it;
        auto d0 = urls::grammar::hexdig_value(*it++);
        auto d1 = urls::grammar::hexdig_value(*it++);
        result.push_back(static_cast<char>(d0 * 16 + d1));
    }
    return result;
}

bool
pct_is_equal(
    std::string_view encoded,
    std::string_view plain,
    bool case_sensitive) noexcept
{
    auto it = encoded.data();
    auto const end = it + encoded.size();
    auto p = plain.data();
    auto const pend = p + plain.size();
    while(it != end)
    {
        char c = *it++;
        if(c == '%')
        {
            if(end - it < 2)
                return false;
            auto d0 = urls::grammar::hexdig_value(*it++);
            auto d1 = urls::grammar::hexdig_value(*it++);
            if(d0 < 0 || d1 < 0)
                return false;
            c = static_cast<char>(d0 * 16 + d1);
        }
        if(p == pend)
            return false;
        char const d = *p++;
        if(c == d)
            continue;
        if( case_sensitive ||
            urls::grammar::to_lower(c) !=
            urls::grammar::to_lower(d))
            return false;
    }
    return p == pend;
}

std::string
pct_encode_segment(
    std::string_view s)
{
    // '/' is not a pchar, so it is always escaped
    return urls::encode(
        core::string_view(s.data(), s.size()),
        urls::pchars);
}

} // detail
} // endpoints
} // boost
