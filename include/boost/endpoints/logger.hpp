//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_LOGGER_HPP
#define BOOST_ENDPOINTS_LOGGER_HPP

#include <boost/endpoints/detail/config.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

namespace boost {
namespace endpoints {

/** A named log section.

    Copies of a section share the name and the threshold.
    Each message is prefixed with the section name and
    `{}` placeholders in the format string are replaced
    in order by the arguments, which are written with
    `operator<<`.

    @par Example
    @code
    auto sect = default_log_sections().get( "endpoints" );
    sect.set_threshold( 0 );
    LOG_DBG( sect )( "matched {} segments of {}", 2, "/a/b" );
    @endcode
*/
class section
{
public:
    BOOST_ENDPOINTS_DECL
    section() noexcept;

    /** Return the level below which logging is squelched
    */
    int threshold() const noexcept
    {
        return impl_->level;
    }

    /** Set the level below which logging is squelched
    */
    void set_threshold(int level) noexcept
    {
        impl_->level = level;
    }

    std::string_view name() const noexcept
    {
        return impl_->name;
    }

    template<class... Args>
    void operator()(
        std::string_view fs,
        Args const&... args)
    {
        auto const N = sizeof...(Args);
        std::size_t len[N + 1];
        std::stringstream ss;
        write(ss, len, args...);
        std::string s(ss.str());
        format_impl(fs, s.data(), len, N);
    }

private:
    static void write(
        std::stringstream&,
        std::size_t*)
    {
    }

    template<class T, class... TN>
    static void write(
        std::stringstream& ss,
        std::size_t* plen,
        T const& t,
        TN const&... tn)
    {
        auto const n0 = ss.tellp();
        ss << t;
        *plen = static_cast<std::size_t>(ss.tellp() - n0);
        write(ss, plen + 1, tn...);
    }

    BOOST_ENDPOINTS_DECL
    void format_impl(std::string_view,
        char const*, std::size_t*, std::size_t n);

    BOOST_ENDPOINTS_DECL
    section(std::string_view);

    friend class log_sections;

    struct impl
    {
        std::string name;
        int level = 2;
    };

    std::shared_ptr<impl> impl_;
};

//------------------------------------------------

/** A registry of log sections.
*/
class log_sections
{
public:
    /** Destructor
    */
    BOOST_ENDPOINTS_DECL
    ~log_sections();

    /** Constructor
    */
    BOOST_ENDPOINTS_DECL
    log_sections();

    log_sections(log_sections const&) = delete;
    log_sections& operator=(log_sections const&) = delete;

    /** Return a log section by name.

        If the section does not already exist, it is created
        with a threshold of 2, so only info and above is
        written. The name is case sensitive.
    */
    BOOST_ENDPOINTS_DECL
    section
    get(std::string_view name);

private:
    struct impl;
    impl* impl_;
};

/** Return the process-wide log sections.
*/
BOOST_ENDPOINTS_DECL
log_sections&
default_log_sections();

/** The function receiving each formatted log line.
*/
using log_sink = std::function<void(std::string_view)>;

/** Replace the destination of log lines.

    Lines go to `std::cerr` when no sink is set.

    @return The previous sink.
*/
BOOST_ENDPOINTS_DECL
log_sink
set_log_sink(log_sink sink);

//------------------------------------------------

#ifndef LOG_AT_LEVEL
#define LOG_AT_LEVEL(sect, level) \
    if((level) < (sect).threshold()) {} else sect
#endif

/// Log at trace level
#ifndef LOG_TRC
#define LOG_TRC(sect) LOG_AT_LEVEL(sect, 0)
#endif

/// Log at debug level
#ifndef LOG_DBG
#define LOG_DBG(sect) LOG_AT_LEVEL(sect, 1)
#endif

/// Log at info level (normal)
#ifndef LOG_INF
#define LOG_INF(sect) LOG_AT_LEVEL(sect, 2)
#endif

/// Log at warning level
#ifndef LOG_WRN
#define LOG_WRN(sect) LOG_AT_LEVEL(sect, 3)
#endif

/// Log at error level
#ifndef LOG_ERR
#define LOG_ERR(sect) LOG_AT_LEVEL(sect, 4)
#endif

} // endpoints
} // boost

#endif
