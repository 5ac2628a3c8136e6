//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_DETAIL_CONFIG_HPP
#define BOOST_ENDPOINTS_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

namespace boost {

namespace endpoints {

//------------------------------------------------

# if (defined(BOOST_ENDPOINTS_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_ENDPOINTS_STATIC_LINK)
#  if defined(BOOST_ENDPOINTS_SOURCE)
#   define BOOST_ENDPOINTS_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_ENDPOINTS_BUILD_DLL
#  else
#   define BOOST_ENDPOINTS_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  BOOST_ENDPOINTS_DECL
#  define BOOST_ENDPOINTS_DECL
# endif

#if defined(__MINGW32__)
    #define BOOST_ENDPOINTS_SYMBOL_VISIBLE BOOST_ENDPOINTS_DECL
#else
    #define BOOST_ENDPOINTS_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

# if !defined(BOOST_ENDPOINTS_SOURCE) && !defined(BOOST_ALL_NO_LIB) && !defined(BOOST_ENDPOINTS_NO_LIB)
#  define BOOST_LIB_NAME boost_endpoints
#  if defined(BOOST_ALL_DYN_LINK) || defined(BOOST_ENDPOINTS_DYN_LINK)
#   define BOOST_DYN_LINK
#  endif
#  include <boost/config/auto_link.hpp>
# endif

//-----------------------------------------------

// Add source location to error codes
#ifdef BOOST_ENDPOINTS_NO_SOURCE_LOCATION
# define BOOST_ENDPOINTS_RETURN_EC(ev) return (ev)
#else
# define BOOST_ENDPOINTS_RETURN_EC(ev)                                   \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

} // endpoints
} // boost

#endif
