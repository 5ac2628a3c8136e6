//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/input.hpp>
#include "src/detail/pct_decode.hpp"

namespace boost {
namespace endpoints {

buffered_body::
buffered_body(std::string s)
{
    if(! s.empty())
        chunks_.push_back(std::move(s));
}

buffered_body::
buffered_body(
    std::vector<std::string> chunks)
    : chunks_(std::move(chunks))
{
}

poll_result<std::optional<std::string>>
buffered_body::
poll_data()
{
    if(i_ >= chunks_.size())
        return system::result<std::optional<std::string>>(
            std::nullopt);
    return system::result<std::optional<std::string>>(
        std::move(chunks_[i_++]));
}

//------------------------------------------------

input::
input(
    std::string_view method,
    std::string_view target)
    : method_(method)
    , target_(target)
    , path_end_(target_.find('?'))
    , verb_(string_to_method(method))
{
}

std::optional<std::string_view>
input::
query() const noexcept
{
    if(path_end_ == std::string::npos)
        return std::nullopt;
    return std::string_view(target_).substr(path_end_ + 1);
}

input&
input::
set_header(
    std::string_view name,
    std::string_view value)
{
    fields_.emplace_back(name, value);
    return *this;
}

std::optional<std::string_view>
input::
header(std::string_view name) const noexcept
{
    for(auto const& f : fields_)
        if(detail::ci_is_equal(f.first, name))
            return std::string_view(f.second);
    return std::nullopt;
}

std::unique_ptr<body_source>
input::
take_body()
{
    if(body_taken_)
        return nullptr;
    body_taken_ = true;
    if(! body_)
        return std::make_unique<buffered_body>(std::string());
    return std::move(body_);
}

} // endpoints
} // boost
