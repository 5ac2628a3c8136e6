//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_DETAIL_MAYBE_DONE_HPP
#define BOOST_ENDPOINTS_DETAIL_MAYBE_DONE_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/detail/except.hpp>
#include <boost/endpoints/task.hpp>
#include <boost/system/result.hpp>
#include <variant>
#include <utility>

namespace boost {
namespace endpoints {
namespace detail {

/*  A slot holding a task, then its output, then nothing.

    Joining tasks keep one slot per child. A slot which
    holds an output is never polled again; taking the
    output leaves the slot empty.
*/
template<class Task>
class maybe_done
{
public:
    using output_type = typename Task::output_type;

    explicit
    maybe_done(Task t)
        : v_(std::in_place_index<0>, std::move(t))
    {
    }

    bool
    is_done() const noexcept
    {
        return v_.index() == 1;
    }

    bool
    is_gone() const noexcept
    {
        return v_.index() == 2;
    }

    // true when the output is stored; an error
    // from the task is returned to the caller
    system::result<bool>
    poll_done()
    {
        switch(v_.index())
        {
        case 0:
        {
            auto p = std::get<0>(v_).poll_task();
            if(p.is_pending())
                return false;
            auto& r = p.value();
            if(r.has_error())
            {
                v_.template emplace<2>();
                return r.error();
            }
            v_.template emplace<1>(std::move(*r));
            return true;
        }
        case 1:
            return true;
        default:
            throw_logic_error(
                "maybe_done: polled after the output was taken");
        }
    }

    output_type
    take_output()
    {
        if(v_.index() != 1)
            throw_logic_error(
                "maybe_done: no output to take");
        output_type t = std::move(std::get<1>(v_));
        v_.template emplace<2>();
        return t;
    }

    // release the task or output
    void
    clear() noexcept
    {
        v_.template emplace<2>();
    }

private:
    struct gone
    {
    };

    std::variant<Task, output_type, gone> v_;
};

} // detail
} // endpoints
} // boost

#endif
