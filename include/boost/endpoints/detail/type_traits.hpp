//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/endpoints
//

#ifndef BOOST_ENDPOINTS_DETAIL_TYPE_TRAITS_HPP
#define BOOST_ENDPOINTS_DETAIL_TYPE_TRAITS_HPP

#include <boost/endpoints/detail/config.hpp>
#include <boost/mp11/algorithm.hpp>
#include <boost/mp11/list.hpp>
#include <tuple>
#include <type_traits>
#include <utility>

namespace boost {
namespace endpoints {
namespace detail {

template<class T>
struct is_tuple : std::false_type
{
};

template<class... Ts>
struct is_tuple<std::tuple<Ts...>> : std::true_type
{
};

template<class T>
constexpr bool is_tuple_v = is_tuple<T>::value;

// concatenation of two tuple types
template<class T1, class T2>
using tuple_concat_t = mp11::mp_append<T1, T2>;

// T if T is a tuple, else std::tuple<T>
template<class T>
using tuplize_t = mp11::mp_if<
    is_tuple<T>, T, std::tuple<T>>;

template<class T>
tuplize_t<std::decay_t<T>>
tuplize(T&& t)
{
    if constexpr(is_tuple_v<std::decay_t<T>>)
        return std::forward<T>(t);
    else
        return std::tuple<std::decay_t<T>>(
            std::forward<T>(t));
}

// the element of a one-element tuple, else the tuple itself
template<class T>
struct untuple
{
    using type = T;
};

template<class T>
struct untuple<std::tuple<T>>
{
    using type = T;
};

template<class T>
using untuple_t = typename untuple<T>::type;

template<class T>
untuple_t<T>
untuple_value(T t)
{
    if constexpr(mp11::mp_size<T>::value == 1)
        return std::get<0>(std::move(t));
    else
        return t;
}

} // detail
} // endpoints
} // boost

#endif
