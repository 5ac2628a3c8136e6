//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/logger.hpp>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace boost {
namespace endpoints {

namespace {

struct sink_state
{
    std::mutex m;
    log_sink sink;
};

sink_state&
get_sink_state()
{
    static sink_state st;
    return st;
}

void
write_line(std::string_view s)
{
    auto& st = get_sink_state();
    std::lock_guard<std::mutex> lock(st.m);
    if(st.sink)
    {
        st.sink(s);
        return;
    }
    std::cerr << s << std::endl;
}

} // (anon)

log_sink
set_log_sink(log_sink sink)
{
    auto& st = get_sink_state();
    std::lock_guard<std::mutex> lock(st.m);
    std::swap(st.sink, sink);
    return sink;
}

//------------------------------------------------

section::
section() noexcept = default;

void
section::
format_impl(
    std::string_view fs,
    char const* data,
    std::size_t* plen,
    std::size_t n)
{
    std::string s = impl_->name;
    s.push_back(' ');
    char const* p = fs.data();
    char const* end = fs.data() + fs.size();
    auto p0 = p;
    while(p != end)
    {
        if(*p++ != '{')
            continue;
        if(p == end)
            break;
        if(*p++ != '}')
            continue;
        s.append(p0, p - p0 - 2);
        if(n)
        {
            s.append(data, *plen);
            data += *plen++;
            --n;
        }
        p0 = p;
    }
    s.append(p0, end - p0);
    write_line(s);
}

section::
section(std::string_view name)
    : impl_(std::make_shared<impl>())
{
    impl_->name = name;
}

//------------------------------------------------

struct log_sections::impl
{
    struct hash
    {
        std::size_t
        operator()(std::string_view const& s) const noexcept
        {
        #if SIZE_MAX == 4294967295U
            std::size_t hash = 2166136261; // FNV offset basis
            for (unsigned char c : s)
                hash ^= c, hash *= 16777619;   // FNV prime
        #else
            std::size_t hash = 1469598103934665603; // FNV offset basis
            for (unsigned char c : s)
                hash ^= c, hash *= 1099511628211;   // FNV prime
        #endif
            return hash;
        }
    };

    std::mutex m;
    std::unordered_map<std::string_view, section, hash> map;
};

log_sections::
~log_sections()
{
    delete impl_;
}

log_sections::
log_sections()
    : impl_(new impl)
{
}

section
log_sections::
get(std::string_view name)
{
    std::lock_guard<std::mutex> lock(impl_->m);
    auto it = impl_->map.find(name);
    if(it != impl_->map.end())
        return it->second;
    auto v = section(name);
    impl_->map.emplace(std::string_view(v.impl_->name), v);
    return v;
}

log_sections&
default_log_sections()
{
    static log_sections ls;
    return ls;
}

} // endpoints
} // boost
