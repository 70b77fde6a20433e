#pragma once

#include "candidate.hpp"
#include "execution.hpp"

#include <fmt/format.h>

#include <functional>
#include <vector>

namespace evo {

template<basic_candidate Candidate>
class population {
public:
  using candidate_t = Candidate;
  using collection_t = std::vector<candidate_t>;

public:
  inline explicit population(std::size_t target_size)
      : target_size_{target_size} {
    individuals_.reserve(target_size_);
  }

  inline population(collection_t individuals, std::size_t target_size)
      : target_size_{target_size}
      , individuals_{std::move(individuals)} {
    if (individuals_.size() != target_size_) {
      throw contract_violation{
          fmt::format("population holds {} individuals, expected {}",
                      individuals_.size(),
                      target_size_)};
    }
  }

  template<typename Fn>
  inline void fill(Fn&& produce) {
    while (individuals_.size() < target_size_) {
      individuals_.push_back(std::invoke(produce));
    }
  }

  // fitness of every individual, index-aligned with individuals()
  std::vector<fitness_t> evaluate(execution mode) const {
    std::vector<fitness_t> result(individuals_.size());

    for_each_index(mode, individuals_.size(), [&result, this](std::size_t idx) {
      result[idx] = get_fitness(individuals_[idx]);
    });

    return result;
  }

  inline auto& individuals() noexcept {
    return individuals_;
  }

  inline auto const& individuals() const noexcept {
    return individuals_;
  }

  inline collection_t take() && noexcept {
    return std::move(individuals_);
  }

  inline std::size_t current_size() const noexcept {
    return individuals_.size();
  }

  inline std::size_t target_size() const noexcept {
    return target_size_;
  }

private:
  std::size_t target_size_;
  collection_t individuals_;
};

} // namespace evo
