//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_SEGMENTS_HPP
#define BOOST_ENDPOINTS_SEGMENTS_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace boost {
namespace endpoints {

/** A single path segment.

    The segment refers to the still percent-encoded
    text between two slashes of the request path. It
    does not own the characters.
*/
class path_segment
{
public:
    /** Constructor.

        @param s The encoded text of the segment.

        @param first The offset of `s` in the path.
    */
    path_segment(
        std::string_view s,
        std::size_t first) noexcept
        : s_(s)
        , first_(first)
    {
    }

    /** Return the encoded text.
    */
    std::string_view
    encoded() const noexcept
    {
        return s_;
    }

    /** Return the byte range `[first, last)` within the path.
    */
    std::pair<std::size_t, std::size_t>
    range() const noexcept
    {
        return { first_, first_ + s_.size() };
    }

    /** Return the size of the encoded text.
    */
    std::size_t
    size() const noexcept
    {
        return s_.size();
    }

    /** Return a percent-decoded copy of the segment.

        @return The decoded string, or an error if
        the segment holds an invalid escape.
    */
    BOOST_ENDPOINTS_DECL
    system::result<std::string>
    decode() const;

private:
    std::string_view s_;
    std::size_t first_;
};

//------------------------------------------------

/** A cursor over the segments of a request path.

    The path is split strictly on `/`. A leading slash
    is skipped and a trailing slash ends the path, so
    `""` and `"/"` have no segments and `"/a/"` has one.
    Empty segments between two slashes are kept, so
    `"/a//b"` yields `"a"`, `""`, `"b"`.

    The cursor is a small value. Combinators which
    backtrack save a copy and assign it back.

    @par Example
    @code
    segments s( "/api/v1" );
    BOOST_ASSERT( s.next()->encoded() == "api" );
    BOOST_ASSERT( s.remaining_path() == "v1" );
    @endcode
*/
class segments
{
public:
    /** Constructor.

        @param path The request path, without the query.
        The characters must remain valid while the cursor
        is used.
    */
    BOOST_ENDPOINTS_DECL
    explicit
    segments(std::string_view path) noexcept;

    /** Extract the next segment.

        @return The segment, or `std::nullopt` if
        the cursor is exhausted.
    */
    BOOST_ENDPOINTS_DECL
    std::optional<path_segment>
    next() noexcept;

    /** Return the text which has not been extracted.
    */
    std::string_view
    remaining_path() const noexcept
    {
        return path_.substr(pos_);
    }

    /** Return the offset of the next segment.
    */
    std::size_t
    position() const noexcept
    {
        return pos_;
    }

    /** Return the number of extracted segments.
    */
    std::size_t
    popped() const noexcept
    {
        return popped_;
    }

    /** Return true if no segment remains.
    */
    bool
    empty() const noexcept
    {
        return pos_ >= path_.size();
    }

    /** Extract every remaining segment.
    */
    BOOST_ENDPOINTS_DECL
    void
    drain() noexcept;

    /** Return the full path.
    */
    std::string_view
    path() const noexcept
    {
        return path_;
    }

private:
    std::string_view path_;
    std::size_t pos_ = 0;
    std::size_t popped_ = 0;
};

/** Return all segments of a path.

    The path is split with the same rules
    as a @ref segments cursor.
*/
BOOST_ENDPOINTS_DECL
std::vector<path_segment>
split_path(std::string_view path);

} // endpoints
} // boost

#endif
