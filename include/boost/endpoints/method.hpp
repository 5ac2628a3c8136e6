//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_METHOD_HPP
#define BOOST_ENDPOINTS_METHOD_HPP

#include <boost/endpoints/detail/config.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace boost {
namespace endpoints {

/** HTTP request methods known to the library.

    Requests using any other method string are
    reported as @ref method::unknown; the method
    string as received remains available from the input.
*/
enum class method : unsigned char
{
    unknown = 0,
    get,
    head,
    post,
    put,
    delete_,
    connect,
    options,
    trace,
    patch
};

/** Return the method for a string.

    The comparison is case-sensitive, as required
    by RFC 9110. Unrecognized strings produce
    @ref method::unknown.
*/
BOOST_ENDPOINTS_DECL
method
string_to_method(
    std::string_view s) noexcept;

/** Return the canonical string for a method.
*/
BOOST_ENDPOINTS_DECL
std::string_view
to_string(method m) noexcept;

//------------------------------------------------

/** A set of HTTP methods.

    Used by verb endpoints to describe the methods
    they accept, and by @ref apply_error to report
    the methods allowed on a route.
*/
class verbs
{
public:
    /** Constructor.

        Default constructed sets are empty.
    */
    constexpr verbs() noexcept = default;

    /** Constructor.

        The set contains only `m`.
    */
    constexpr
    verbs(method m) noexcept
        : v_(bit(m))
    {
    }

    static constexpr verbs get() noexcept { return method::get; }
    static constexpr verbs head() noexcept { return method::head; }
    static constexpr verbs post() noexcept { return method::post; }
    static constexpr verbs put() noexcept { return method::put; }
    static constexpr verbs delete_() noexcept { return method::delete_; }
    static constexpr verbs connect() noexcept { return method::connect; }
    static constexpr verbs options() noexcept { return method::options; }
    static constexpr verbs trace() noexcept { return method::trace; }
    static constexpr verbs patch() noexcept { return method::patch; }

    /** Return true if the set is empty.
    */
    constexpr
    bool
    empty() const noexcept
    {
        return v_ == 0;
    }

    /** Return true if `m` is in the set.
    */
    constexpr
    bool
    contains(method m) const noexcept
    {
        return m != method::unknown &&
            (v_ & bit(m)) != 0;
    }

    /** Return the number of methods in the set.
    */
    BOOST_ENDPOINTS_DECL
    std::size_t
    size() const noexcept;

    /** Return the set as a header field value.

        Methods appear in enumeration order separated
        by `", "`, for example `"GET, POST"`. This is
        the value of an `Allow` header.
    */
    BOOST_ENDPOINTS_DECL
    std::string
    to_string() const;

    /** Invoke `f` with each method in the set, in order.
    */
    template<class F>
    void
    for_each(F&& f) const
    {
        for(unsigned i = 1; i <= max_; ++i)
            if(v_ & (1u << i))
                f(static_cast<method>(i));
    }

    constexpr
    verbs&
    operator|=(verbs other) noexcept
    {
        v_ |= other.v_;
        return *this;
    }

    friend
    constexpr
    verbs
    operator|(verbs a, verbs b) noexcept
    {
        return a |= b;
    }

    friend
    constexpr
    bool
    operator==(verbs a, verbs b) noexcept
    {
        return a.v_ == b.v_;
    }

private:
    static constexpr unsigned max_ =
        static_cast<unsigned>(method::patch);

    static
    constexpr
    std::uint16_t
    bit(method m) noexcept
    {
        return m == method::unknown ? 0 :
            static_cast<std::uint16_t>(
                1u << static_cast<unsigned>(m));
    }

    std::uint16_t v_ = 0;
};

} // endpoints
} // boost

#endif
