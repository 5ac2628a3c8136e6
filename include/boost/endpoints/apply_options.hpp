//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_APPLY_OPTIONS_HPP
#define BOOST_ENDPOINTS_APPLY_OPTIONS_HPP

#include <boost/endpoints/detail/config.hpp>

namespace boost {
namespace endpoints {

/** Options for routing a request.

    Options are set by chaining calls on a default
    constructed value.

    @par Example
    @code
    apply_context cx( in, apply_options()
        .case_sensitive( false )
        .strict( true ) );
    @endcode
*/
struct apply_options
{
    /** Constructor.

        Segment literals are compared case-sensitively
        and a trailing slash is not significant.
    */
    apply_options() = default;

    /** Set whether segment literals are compared case-sensitively.

        @param value `true` to compare literals exactly.

        @return A reference to `*this` for chaining.
    */
    apply_options&
    case_sensitive(
        bool value) noexcept
    {
        if(value)
            v_ = (v_ & ~3) | 1;
        else
            v_ = (v_ & ~3) | 2;
        return *this;
    }

    /** Set whether end-of-path matching is strict.

        With strict matching a trailing slash is significant:
        `eos()` matches `"/api"` but not `"/api/"`. Otherwise
        both paths end after the segment `"api"`.

        @param value `true` to enable strict matching.

        @return A reference to `*this` for chaining.
    */
    apply_options&
    strict(
        bool value) noexcept
    {
        if(value)
            v_ = (v_ & ~12) | 4;
        else
            v_ = (v_ & ~12) | 8;
        return *this;
    }

    /** Return true if literals are compared case-sensitively.
    */
    bool
    is_case_sensitive() const noexcept
    {
        // unset means the default
        return (v_ & 2) == 0;
    }

    /** Return true if end-of-path matching is strict.
    */
    bool
    is_strict() const noexcept
    {
        return (v_ & 4) != 0;
    }

private:
    unsigned int v_ = 0;
};

} // endpoints
} // boost

#endif
