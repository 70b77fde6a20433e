#pragma once

#include <concepts>
#include <ranges>
#include <type_traits>

namespace evo::util {

template<typename Range, typename Value>
concept sized_range_of =
    std::ranges::sized_range<Range> &&
    std::convertible_to<std::ranges::range_reference_t<Range>, Value>;

template<typename Ty>
using const_ref_t = std::add_lvalue_reference_t<std::add_const_t<Ty>>;

template<typename Ty>
using ref_t = std::add_lvalue_reference_t<Ty>;

} // namespace evo::util
