//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/segments.hpp>
#include "src/detail/pct_decode.hpp"

namespace boost {
namespace endpoints {

system::result<std::string>
path_segment::
decode() const
{
    return detail::pct_decode(s_);
}

//------------------------------------------------

segments::
segments(
    std::string_view path) noexcept
    : path_(path)
{
    if( ! path_.empty() &&
        path_.front() == '/')
        pos_ = 1;
}

std::optional<path_segment>
segments::
next() noexcept
{
    if(pos_ >= path_.size())
        return std::nullopt;
    auto const first = pos_;
    auto const n = path_.find('/', first);
    std::size_t last;
    if(n == std::string_view::npos)
    {
        last = path_.size();
        pos_ = last;
    }
    else
    {
        // a trailing slash ends the path
        last = n;
        pos_ = n + 1;
    }
    ++popped_;
    return path_segment(
        path_.substr(first, last - first), first);
}

void
segments::
drain() noexcept
{
    while(next())
    {
    }
}

std::vector<path_segment>
split_path(std::string_view path)
{
    std::vector<path_segment> v;
    segments s(path);
    while(auto seg = s.next())
        v.push_back(*seg);
    return v;
}

} // endpoints
} // boost
