//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_HPP
#define BOOST_ENDPOINTS_HPP

#include <boost/endpoints/all.hpp>
#include <boost/endpoints/and.hpp>
#include <boost/endpoints/any_endpoint.hpp>
#include <boost/endpoints/apply_context.hpp>
#include <boost/endpoints/apply_error.hpp>
#include <boost/endpoints/apply_options.hpp>
#include <boost/endpoints/before_apply.hpp>
#include <boost/endpoints/body.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <boost/endpoints/error.hpp>
#include <boost/endpoints/header.hpp>
#include <boost/endpoints/input.hpp>
#include <boost/endpoints/lift.hpp>
#include <boost/endpoints/logger.hpp>
#include <boost/endpoints/method.hpp>
#include <boost/endpoints/or.hpp>
#include <boost/endpoints/or_reject.hpp>
#include <boost/endpoints/or_strict.hpp>
#include <boost/endpoints/param_traits.hpp>
#include <boost/endpoints/path.hpp>
#include <boost/endpoints/poll.hpp>
#include <boost/endpoints/query.hpp>
#include <boost/endpoints/runner.hpp>
#include <boost/endpoints/segments.hpp>
#include <boost/endpoints/status.hpp>
#include <boost/endpoints/task.hpp>
#include <boost/endpoints/then.hpp>
#include <boost/endpoints/value.hpp>
#include <boost/endpoints/verb.hpp>

#endif
