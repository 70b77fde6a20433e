#pragma once

#include "errors.hpp"
#include "fitness.hpp"
#include "random.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <functional>
#include <iterator>
#include <vector>

namespace evo {

template<typename Fn>
concept index_producer = std::is_invocable_r_v<std::size_t, Fn>;

class nonunique_sample {
public:
  inline explicit nonunique_sample(std::size_t size) noexcept
      : size_{size} {
  }

  inline auto size() const noexcept {
    return size_;
  }

private:
  std::size_t size_;
};

namespace details {

  template<typename Individual>
  inline void ensure_sampleable(std::vector<Individual> const& individuals,
                                std::vector<fitness_t> const& fitness) {
    if (individuals.empty()) {
      throw contract_violation{"cannot sample from an empty population"};
    }

    if (fitness.size() != individuals.size()) {
      throw contract_violation{
          fmt::format("{} fitness values supplied for {} individuals",
                      fitness.size(),
                      individuals.size())};
    }
  }

} // namespace details

// produces copies of the individuals at the indices returned by produce,
// individuals may be drawn more than once
template<typename Individual, index_producer Fn>
auto sample_many(std::vector<Individual> const& individuals,
                 nonunique_sample state,
                 Fn&& produce) {
  std::vector<Individual> result;
  result.reserve(state.size());

  std::ranges::generate_n(
      std::back_inserter(result),
      static_cast<std::ptrdiff_t>(state.size()),
      [&individuals, &produce] { return individuals[std::invoke(produce)]; });

  return result;
}

template<index_producer Fn>
std::vector<std::size_t> sample_many(nonunique_sample state, Fn&& produce) {
  std::vector<std::size_t> result(state.size());

  std::ranges::generate_n(
      result.begin(), static_cast<std::ptrdiff_t>(state.size()), [&produce] {
        return std::invoke(produce);
      });

  return result;
}

} // namespace evo
