//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_APPLY_ERROR_HPP
#define BOOST_ENDPOINTS_APPLY_ERROR_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/method.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>
#include <string>
#include <string_view>
#include <type_traits>

namespace boost {
namespace endpoints {

/** The kinds of routing failure.

    These values are produced only while an endpoint
    is applied to a request, never while a task runs.
*/
enum class apply_errc
{
    /** The endpoint does not match the request.
    */
    not_matched = 1,

    /** The path matched but the request method did not.

        The allowed methods are carried by the
        @ref apply_error holding this value.
    */
    method_not_allowed,

    /** The request was addressed to the endpoint but is malformed.

        The reason is carried by the @ref apply_error
        holding this value.
    */
    invalid_request
};

} // endpoints
namespace system {
template<>
struct is_error_code_enum<
    ::boost::endpoints::apply_errc>
{
    static bool const value = true;
};
} // system
namespace endpoints {

namespace detail {
struct BOOST_ENDPOINTS_SYMBOL_VISIBLE
    apply_cat_type
    : system::error_category
{
    BOOST_ENDPOINTS_DECL const char* name() const noexcept override;
    BOOST_ENDPOINTS_DECL std::string message(int) const override;
    BOOST_ENDPOINTS_DECL char const* message(
        int, char*, std::size_t) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR apply_cat_type()
        : error_category(0x51c90d393754ecd1)
    {
    }
};
BOOST_ENDPOINTS_DECL extern apply_cat_type apply_cat;
} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(apply_errc ev) noexcept
{
    return system::error_code{static_cast<
        std::underlying_type<apply_errc>::type>(ev),
        detail::apply_cat};
}

/** Return true if `ec` holds a routing failure.
*/
inline
bool
is_apply_error(
    system::error_code const& ec) noexcept
{
    return &ec.category() == &detail::apply_cat;
}

//------------------------------------------------

/** A routing failure reported by `apply`.

    Sibling combinators recover from these locally; when
    every alternative fails the failures are combined with
    @ref merge so the most specific one is reported.
*/
class apply_error
{
public:
    /** Constructor.

        Default constructed errors are @ref apply_errc::not_matched.
    */
    apply_error() = default;

    /** Return an error indicating the endpoint did not match.
    */
    static
    apply_error
    not_matched() noexcept
    {
        return apply_error();
    }

    /** Return an error indicating the method is not allowed.

        @param allowed The methods the route accepts.
    */
    static
    apply_error
    method_not_allowed(
        verbs allowed) noexcept
    {
        apply_error e;
        e.kind_ = apply_errc::method_not_allowed;
        e.allowed_ = allowed;
        return e;
    }

    /** Return an error indicating a malformed request.

        @param reason The cause, usually a value of @ref error.

        @param what Optional context such as a header name,
        included in the message.
    */
    BOOST_ENDPOINTS_DECL
    static
    apply_error
    invalid_request(
        system::error_code reason,
        std::string_view what = {});

    /** Return the kind of failure.
    */
    apply_errc
    kind() const noexcept
    {
        return kind_;
    }

    bool
    is_not_matched() const noexcept
    {
        return kind_ == apply_errc::not_matched;
    }

    bool
    is_method_not_allowed() const noexcept
    {
        return kind_ == apply_errc::method_not_allowed;
    }

    bool
    is_invalid_request() const noexcept
    {
        return kind_ == apply_errc::invalid_request;
    }

    /** Return the allowed methods.

        The set is empty unless the kind is
        @ref apply_errc::method_not_allowed.
    */
    verbs
    allowed() const noexcept
    {
        return allowed_;
    }

    /** Return the reason of an invalid request.
    */
    system::error_code
    reason() const noexcept
    {
        return reason_;
    }

    /** Return the context string of an invalid request.
    */
    std::string_view
    what() const noexcept
    {
        return what_;
    }

    /** Return the error code for the kind of failure.
    */
    system::error_code
    code() const noexcept
    {
        return make_error_code(kind_);
    }

    /** Return a human readable description.
    */
    BOOST_ENDPOINTS_DECL
    std::string
    message() const;

    /** Combine two failures of alternative endpoints.

        The result follows these rules:

        @li not_matched and not_matched is not_matched
        @li not_matched and method_not_allowed is method_not_allowed
        @li two method_not_allowed give the union of the allowed sets
        @li an invalid_request on either side wins; when both
            sides are invalid the left reason is kept
    */
    BOOST_ENDPOINTS_DECL
    apply_error
    merge(apply_error const& other) const;

private:
    std::string what_;
    system::error_code reason_;
    apply_errc kind_ = apply_errc::not_matched;
    verbs allowed_;
};

/** Throw a routing failure as an exception.

    This is found by `system::result` when
    `value()` is called on a failed result.
*/
BOOST_ENDPOINTS_DECL
BOOST_NORETURN
void
throw_exception_from_error(
    apply_error const& e,
    source_location const& loc);

/** The result of applying an endpoint.
*/
template<class T>
using apply_result = system::result<T, apply_error>;

} // endpoints
} // boost

#endif
