#pragma once

#include "errors.hpp"

#include <cmath>
#include <compare>
#include <concepts>
#include <functional>

namespace evo {

using fitness_t = double;

template<typename Type>
concept fitness = std::floating_point<Type>;

template<fitness Ty>
inline bool is_comparable(Ty value) noexcept {
  return !std::isnan(value);
}

// total order over fitness values, higher is better. NaN cannot be placed in
// the order so any comparison involving it throws noncomparable_fitness.
struct fitness_three_way {
  using order = std::weak_ordering;

  template<fitness Ty, fitness Tx>
  inline order operator()(Ty left, Tx right) const {
    if (!is_comparable(left) || !is_comparable(right)) {
      throw noncomparable_fitness{
          "fitness values cannot be ordered: NaN encountered"};
    }

    return right < left   ? order::greater
           : left < right ? order::less
                          : order::equivalent;
  }
};

namespace details {

  struct order_greater_equal {
    inline static constexpr bool test(std::weak_ordering order) noexcept {
      return order >= 0;
    }
  };

  template<typename Comparator, typename Bound>
  struct fitness_cmp_impl {
    Comparator cmp_;

    template<fitness Ty>
    inline bool operator()(Ty left, Ty right) const {
      return Bound::test(std::invoke(cmp_, left, right));
    }
  };

} // namespace details

template<typename Comparator = fitness_three_way>
struct fitness_not_worse
    : details::fitness_cmp_impl<Comparator, details::order_greater_equal> {};

} // namespace evo
