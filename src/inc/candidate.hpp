#pragma once

#include "fitness.hpp"
#include "utility.hpp"

#include <concepts>
#include <utility>

namespace evo {

template<typename Type>
concept basic_candidate =
    std::copyable<Type> && requires(util::const_ref_t<Type> c) {
      { c.fitness() } -> std::convertible_to<fitness_t>;
      { c.crossover(c) } -> std::convertible_to<std::pair<Type, Type>>;
    };

template<typename Type, typename Generator>
concept candidate =
    basic_candidate<Type> &&
    requires(util::ref_t<Type> c, util::ref_t<Generator> generator) {
      c.mutate(generator);
    };

// candidates whose perturbation magnitude can be controlled by the caller
template<typename Type, typename Generator>
concept strength_mutable =
    candidate<Type, Generator> &&
    requires(util::ref_t<Type> c,
             util::ref_t<Generator> generator,
             double strength) { c.mutate(generator, strength); };

template<basic_candidate Candidate>
inline fitness_t get_fitness(Candidate const& target) {
  return static_cast<fitness_t>(target.fitness());
}

} // namespace evo
