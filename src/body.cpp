//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/body.hpp>
#include <cstdint>
#include <string_view>

namespace boost {
namespace endpoints {

auto
raw_body_task::
poll_task() ->
    poll_result<output_type>
{
    if(done_)
        detail::throw_logic_error(
            "raw_body_task: polled after completion");
    done_ = true;
    auto b = in_->take_body();
    if(! b)
        BOOST_ENDPOINTS_RETURN_EC(
            error::body_already_taken);
    return system::result<output_type>(
        output_type(std::move(b)));
}

namespace {

// Returns true if `s` is well-formed UTF-8: no
// overlong forms, no surrogates, nothing past U+10FFFF.
bool
is_valid_utf8(std::string_view s) noexcept
{
    auto it = reinterpret_cast<
        unsigned char const*>(s.data());
    auto const end = it + s.size();
    while(it != end)
    {
        unsigned char const c = *it++;
        if(c < 0x80)
            continue;
        std::size_t n;
        std::uint32_t cp;
        std::uint32_t min;
        if((c & 0xe0) == 0xc0)
        {
            n = 1;
            cp = c & 0x1f;
            min = 0x80;
        }
        else if((c & 0xf0) == 0xe0)
        {
            n = 2;
            cp = c & 0x0f;
            min = 0x800;
        }
        else if((c & 0xf8) == 0xf0)
        {
            n = 3;
            cp = c & 0x07;
            min = 0x10000;
        }
        else
        {
            return false;
        }
        if(static_cast<std::size_t>(end - it) < n)
            return false;
        for(; n > 0; --n)
        {
            unsigned char const d = *it++;
            if((d & 0xc0) != 0x80)
                return false;
            cp = (cp << 6) | (d & 0x3f);
        }
        if( cp < min ||
            cp > 0x10ffff ||
            (cp >= 0xd800 && cp <= 0xdfff))
            return false;
    }
    return true;
}

} // (anon)

system::result<std::string>
body_traits<std::string>::
from_body(std::string s) noexcept
{
    if(! is_valid_utf8(s))
        BOOST_ENDPOINTS_RETURN_EC(
            error::bad_body);
    return s;
}

} // endpoints
} // boost
