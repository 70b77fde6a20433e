#pragma once

#include "candidate.hpp"
#include "random.hpp"
#include "utility.hpp"

#include <functional>
#include <type_traits>
#include <vector>

namespace evo {

template<typename Operation, typename Candidate, typename Generator>
concept seeded_initializator =
    std::is_invocable_r_v<Candidate, Operation, util::ref_t<Generator>>;

template<typename Operation, typename Candidate>
concept unseeded_initializator = std::is_invocable_r_v<Candidate, Operation>;

template<typename Operation, typename Candidate, typename Generator>
concept initializator =
    seeded_initializator<Operation, Candidate, Generator> ||
    unseeded_initializator<Operation, Candidate>;

template<typename Operation, typename Candidate, typename Generator>
concept selection =
    std::is_invocable_v<Operation,
                        util::const_ref_t<std::vector<Candidate>>,
                        util::const_ref_t<std::vector<fitness_t>>,
                        util::ref_t<Generator>> &&
    util::sized_range_of<
        std::invoke_result_t<Operation,
                             util::const_ref_t<std::vector<Candidate>>,
                             util::const_ref_t<std::vector<fitness_t>>,
                             util::ref_t<Generator>>,
        Candidate>;

template<typename Operation, typename Candidate>
concept crossover =
    std::is_invocable_v<Operation,
                        util::const_ref_t<Candidate>,
                        util::const_ref_t<Candidate>> &&
    util::sized_range_of<std::invoke_result_t<Operation,
                                              util::const_ref_t<Candidate>,
                                              util::const_ref_t<Candidate>>,
                         Candidate>;

template<typename Operation, typename Candidate, typename Generator>
concept mutation = std::is_invocable_r_v<void,
                                         Operation,
                                         util::ref_t<Candidate>,
                                         util::ref_t<Generator>>;

template<typename Candidate, typename Operation, typename Generator>
  requires initializator<Operation, Candidate, Generator>
inline Candidate spawn_one(Operation& operation, Generator& generator) {
  if constexpr (seeded_initializator<Operation, Candidate, Generator>) {
    return std::invoke(operation, generator);
  }
  else {
    return std::invoke(operation);
  }
}

struct evaluation_time_t {};

inline constexpr evaluation_time_t evaluation_time_tag{};

struct selection_time_t {};

inline constexpr selection_time_t selection_time_tag{};

struct recombination_time_t {};
struct crossover_count_t {};

inline constexpr recombination_time_t recombination_time_tag{};
inline constexpr crossover_count_t crossover_count_tag{};

struct mutation_time_t {};

inline constexpr mutation_time_t mutation_time_tag{};

} // namespace evo
