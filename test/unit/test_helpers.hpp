//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_TEST_HELPERS_HPP
#define BOOST_ENDPOINTS_TEST_HELPERS_HPP

#include <boost/endpoints/apply_context.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <boost/endpoints/input.hpp>
#include <boost/endpoints/task.hpp>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace boost {
namespace endpoints {
namespace test {

// Polls recorded by the counting tasks, in order
using poll_log = std::vector<int>;

// A task which is pending `n` times, then completes
// with `value`, or fails with `ec` when it is set.
class counting_task
{
public:
    using output_type = std::tuple<int>;

    counting_task(
        int id,
        int n,
        int value,
        std::shared_ptr<poll_log> log,
        system::error_code ec = {})
        : id_(id)
        , n_(n)
        , value_(value)
        , log_(std::move(log))
        , ec_(ec)
    {
    }

    poll_result<output_type>
    poll_task()
    {
        if(done_)
            detail::throw_logic_error(
                "counting_task: polled after completion");
        if(log_)
            log_->push_back(id_);
        if(n_ > 0)
        {
            --n_;
            return pending;
        }
        done_ = true;
        if(ec_.failed())
            return system::result<output_type>(ec_);
        return system::result<output_type>(
            output_type(value_));
    }

private:
    int id_;
    int n_;
    int value_;
    std::shared_ptr<poll_log> log_;
    system::error_code ec_;
    bool done_ = false;
};

// An endpoint which always matches and
// produces a counting_task
class counting_endpoint
    : public endpoint_base<counting_endpoint>
{
public:
    using output_type = std::tuple<int>;
    using task_type = counting_task;

    counting_endpoint(
        int id,
        int n,
        int value,
        std::shared_ptr<poll_log> log,
        system::error_code ec = {})
        : id_(id)
        , n_(n)
        , value_(value)
        , log_(std::move(log))
        , ec_(ec)
    {
    }

    apply_result<task_type>
    apply(apply_context&) const
    {
        return task_type(id_, n_, value_, log_, ec_);
    }

private:
    int id_;
    int n_;
    int value_;
    std::shared_ptr<poll_log> log_;
    system::error_code ec_;
};

// An endpoint which always fails with `e`
class failing_endpoint
    : public endpoint_base<failing_endpoint>
{
public:
    using output_type = std::tuple<>;
    using task_type = ready_task<output_type>;

    explicit
    failing_endpoint(apply_error e)
        : e_(std::move(e))
    {
    }

    apply_result<task_type>
    apply(apply_context&) const
    {
        return e_;
    }

private:
    apply_error e_;
};

// An endpoint which matches without consuming
// anything and counts the calls to apply
class apply_counter
    : public endpoint_base<apply_counter>
{
public:
    using output_type = std::tuple<int>;
    using task_type = ready_task<output_type>;

    apply_counter(
        int value,
        std::shared_ptr<int> count)
        : value_(value)
        , count_(std::move(count))
    {
    }

    apply_result<task_type>
    apply(apply_context&) const
    {
        ++*count_;
        return task_type(output_type(value_));
    }

private:
    int value_;
    std::shared_ptr<int> count_;
};

// A body source which is pending before each chunk,
// and optionally fails instead of ending
class trickle_body
    : public body_source
{
public:
    trickle_body(
        std::vector<std::string> chunks,
        system::error_code ec = {})
        : chunks_(std::move(chunks))
        , ec_(ec)
    {
    }

    poll_result<std::optional<std::string>>
    poll_data() override
    {
        using result_type =
            system::result<std::optional<std::string>>;
        ready_ = ! ready_;
        if(! ready_)
            return pending;
        if(i_ < chunks_.size())
            return result_type(std::move(chunks_[i_++]));
        if(ec_.failed())
            return result_type(ec_);
        return result_type(std::nullopt);
    }

private:
    std::vector<std::string> chunks_;
    std::size_t i_ = 0;
    system::error_code ec_;
    bool ready_ = false;
};

// Poll `t` until ready, counting the pending polls
template<class Task>
system::result<typename Task::output_type>
drive(Task& t, int& pending_polls)
{
    pending_polls = 0;
    for(;;)
    {
        auto p = t.poll_task();
        if(p.is_ready())
            return std::move(p).value();
        ++pending_polls;
    }
}

// Apply `e` to a request and return the
// result with the cursor state afterwards
template<class E>
auto
apply_to(
    E const& e,
    input& in,
    std::size_t& popped,
    apply_options opts = {})
{
    apply_context cx(in, opts);
    auto r = e.apply(cx);
    popped = cx.segments().popped();
    return r;
}

} // test
} // endpoints
} // boost

#endif
