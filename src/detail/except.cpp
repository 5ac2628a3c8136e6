//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#include <boost/endpoints/detail/except.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>
#include <string>

namespace boost {
namespace endpoints {
namespace detail {

void
throw_logic_error(
    std::string_view s,
    source_location const& loc)
{
    throw_exception(std::logic_error(std::string(s)), loc);
}

} // detail
} // endpoints
} // boost
