//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_ANY_ENDPOINT_HPP
#define BOOST_ENDPOINTS_ANY_ENDPOINT_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/endpoints/endpoint.hpp>
#include <memory>
#include <type_traits>
#include <utility>

namespace boost {
namespace endpoints {

/** A type-erased endpoint.

    Holds any endpoint whose output type is `Output`.
    Copies share the stored endpoint, which is never
    modified after construction.

    @par Example
    @code
    std::vector< any_endpoint< std::tuple< int > > > v;
    v.emplace_back( segment( "a" ).and_( value( 1 ) ) );
    v.emplace_back( param< int >() );
    auto e = all( std::move( v ) );
    @endcode

    @tparam Output A `std::tuple` of the output values.
*/
template<class Output>
class any_endpoint
    : public endpoint_base<any_endpoint<Output>>
{
public:
    using output_type = Output;
    using task_type = any_task<Output>;

    /** Constructor.

        @param e The endpoint to store.
    */
    template<class E>
        requires endpoint<E> &&
            (! std::is_same_v<E, any_endpoint>) &&
            std::is_same_v<typename E::output_type, Output>
    any_endpoint(E e)
        : p_(std::make_shared<impl<E>>(std::move(e)))
    {
    }

    apply_result<task_type>
    apply(apply_context& cx) const
    {
        return p_->apply(cx);
    }

private:
    struct base
    {
        virtual ~base() = default;
        virtual apply_result<task_type> apply(
            apply_context& cx) const = 0;
    };

    template<class E>
    struct impl : base
    {
        E e;

        explicit
        impl(E&& e_)
            : e(std::move(e_))
        {
        }

        apply_result<task_type>
        apply(apply_context& cx) const override
        {
            auto r = e.apply(cx);
            if(r.has_error())
                return r.error();
            return task_type(std::move(*r));
        }
    };

    std::shared_ptr<base const> p_;
};

} // endpoints
} // boost

#endif
