//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_DETAIL_ONE_SHOT_HPP
#define BOOST_ENDPOINTS_DETAIL_ONE_SHOT_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <optional>
#include <utility>

namespace boost {
namespace endpoints {
namespace detail {

// A function which may be extracted exactly once
template<class F>
class one_shot
{
public:
    explicit
    one_shot(F f)
        : f_(std::move(f))
    {
    }

    bool
    empty() const noexcept
    {
        return ! f_.has_value();
    }

    F
    take()
    {
        if(! f_)
            throw_logic_error(
                "one_shot: function already taken");
        F f = std::move(*f_);
        f_.reset();
        return f;
    }

private:
    std::optional<F> f_;
};

} // detail
} // endpoints
} // boost

#endif
