//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_INPUT_HPP
#define BOOST_ENDPOINTS_INPUT_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/apply_error.hpp>
#include <boost/endpoints/method.hpp>
#include <boost/endpoints/poll.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace boost {
namespace endpoints {

/** A source of request body data.

    The body is delivered as a sequence of chunks.
    Implementations which must wait for data return
    @ref pending; the driver polls again later.
*/
class BOOST_ENDPOINTS_SYMBOL_VISIBLE
    body_source
{
public:
    virtual ~body_source() = default;

    /** Poll for the next chunk.

        @return A ready chunk, a ready `std::nullopt` at the
        end of the body, a ready error, or pending.
    */
    virtual
    poll_result<std::optional<std::string>>
    poll_data() = 0;
};

/** A body source over chunks held in memory.
*/
class BOOST_ENDPOINTS_SYMBOL_VISIBLE
    buffered_body
    : public body_source
{
public:
    /** Constructor.

        The body is one chunk, or none if `s` is empty.
    */
    BOOST_ENDPOINTS_DECL
    explicit
    buffered_body(std::string s);

    /** Constructor.

        The chunks are delivered in order.
    */
    BOOST_ENDPOINTS_DECL
    explicit
    buffered_body(std::vector<std::string> chunks);

    BOOST_ENDPOINTS_DECL
    poll_result<std::optional<std::string>>
    poll_data() override;

private:
    std::vector<std::string> chunks_;
    std::size_t i_ = 0;
};

//------------------------------------------------

/** An incoming request, as seen by endpoints.

    The request target is split into the path and
    the optional query. Header names are compared
    case-insensitively. The body handle can be taken
    at most once.

    @par Example
    @code
    input in( "POST", "/users?limit=10" );
    in.set_header( "Content-Type", "text/plain" );
    in.set_body( std::make_unique< buffered_body >( "hello" ) );
    @endcode
*/
class input
{
public:
    /** Constructor.

        @param method The method string, for example `"GET"`.

        @param target The request target, a path
        optionally followed by `?` and a query.
    */
    BOOST_ENDPOINTS_DECL
    input(
        std::string_view method,
        std::string_view target);

    input(input&&) noexcept = default;
    input& operator=(input&&) noexcept = default;

    /** Return the known method.
    */
    method
    verb() const noexcept
    {
        return verb_;
    }

    /** Return the method string as received.
    */
    std::string_view
    method_string() const noexcept
    {
        return method_;
    }

    /** Return the request target.
    */
    std::string_view
    target() const noexcept
    {
        return target_;
    }

    /** Return the path part of the target.
    */
    std::string_view
    path() const noexcept
    {
        return std::string_view(target_).substr(0, path_end_);
    }

    /** Return the query, if the target has one.

        The leading `?` is not included.
    */
    BOOST_ENDPOINTS_DECL
    std::optional<std::string_view>
    query() const noexcept;

    /** Append a header field.

        @return A reference to `*this` for chaining.
    */
    BOOST_ENDPOINTS_DECL
    input&
    set_header(
        std::string_view name,
        std::string_view value);

    /** Return the value of the first field named `name`.

        The comparison is case-insensitive.
    */
    BOOST_ENDPOINTS_DECL
    std::optional<std::string_view>
    header(std::string_view name) const noexcept;

    /** Set the body handle.

        @return A reference to `*this` for chaining.
    */
    input&
    set_body(
        std::unique_ptr<body_source> body) noexcept
    {
        body_ = std::move(body);
        body_taken_ = false;
        return *this;
    }

    /** Return true if the body handle was not taken.
    */
    bool
    has_body() const noexcept
    {
        return ! body_taken_;
    }

    /** Take the body handle.

        A request without a body yields an empty
        body the first time.

        @return The handle, or null if it was already taken.
    */
    BOOST_ENDPOINTS_DECL
    std::unique_ptr<body_source>
    take_body();

    /** Record a routing failure deferred to run time.

        Tasks created by `or_reject` store the failure
        here before failing with its code, so the driver
        can report the allowed methods or the reason.
    */
    void
    set_rejection(apply_error e)
    {
        rejection_ = std::move(e);
    }

    /** Return the deferred routing failure, if any.
    */
    std::optional<apply_error> const&
    rejection() const noexcept
    {
        return rejection_;
    }

private:
    std::string method_;
    std::string target_;
    std::size_t path_end_;
    std::vector<std::pair<
        std::string, std::string>> fields_;
    std::unique_ptr<body_source> body_;
    std::optional<apply_error> rejection_;
    method verb_;
    bool body_taken_ = false;
};

} // endpoints
} // boost

#endif
