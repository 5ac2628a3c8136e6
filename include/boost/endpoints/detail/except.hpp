//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_DETAIL_EXCEPT_HPP
#define BOOST_ENDPOINTS_DETAIL_EXCEPT_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <string_view>

namespace boost {
namespace endpoints {
namespace detail {

BOOST_ENDPOINTS_DECL void BOOST_NORETURN throw_logic_error(
    std::string_view s,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // endpoints
} // boost

#endif
