#ifndef BPLUS_DETAIL_ITER_TOOLS_HPP
#define BPLUS_DETAIL_ITER_TOOLS_HPP

#include <bplus/defs.hpp>

#include <tuple>
#include <type_traits>
#include <utility>

namespace bplus::detail {

template<typename Tuple, typename Visitor, size_t... I>
constexpr void tuple_for_each_impl(Tuple&& t, Visitor&& v, std::index_sequence<I...>) {
    ((void) v(std::get<I>(t)), ...);
}

// Invokes the visitor for every element of the tuple, in order.
template<typename Tuple, typename Visitor>
constexpr void tuple_for_each(Tuple&& t, Visitor&& v) {
    return tuple_for_each_impl(std::forward<Tuple>(t), std::forward<Visitor>(v),
                               std::make_index_sequence<std::tuple_size_v<std::decay_t<Tuple>>>());
}

} // namespace bplus::detail

#endif // BPLUS_DETAIL_ITER_TOOLS_HPP
