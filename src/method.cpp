//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/method.hpp>

namespace boost {
namespace endpoints {

method
string_to_method(
    std::string_view s) noexcept
{
    switch(s.size())
    {
    case 3:
        if(s == "GET")
            return method::get;
        if(s == "PUT")
            return method::put;
        break;
    case 4:
        if(s == "HEAD")
            return method::head;
        if(s == "POST")
            return method::post;
        break;
    case 5:
        if(s == "PATCH")
            return method::patch;
        if(s == "TRACE")
            return method::trace;
        break;
    case 6:
        if(s == "DELETE")
            return method::delete_;
        break;
    case 7:
        if(s == "CONNECT")
            return method::connect;
        if(s == "OPTIONS")
            return method::options;
        break;
    default:
        break;
    }
    return method::unknown;
}

std::string_view
to_string(method m) noexcept
{
    switch(m)
    {
    case method::get:       return "GET";
    case method::head:      return "HEAD";
    case method::post:      return "POST";
    case method::put:       return "PUT";
    case method::delete_:   return "DELETE";
    case method::connect:   return "CONNECT";
    case method::options:   return "OPTIONS";
    case method::trace:     return "TRACE";
    case method::patch:     return "PATCH";
    default:
        return "<unknown>";
    }
}

std::size_t
verbs::
size() const noexcept
{
    std::size_t n = 0;
    for_each([&n](method){ ++n; });
    return n;
}

std::string
verbs::
to_string() const
{
    std::string s;
    for_each(
        [&s](method m)
        {
            if(! s.empty())
                s.append(", ");
            s.append(endpoints::to_string(m));
        });
    return s;
}

} // endpoints
} // boost
