#pragma once

#include <candidate.hpp>
#include <errors.hpp>
#include <fitness.hpp>

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tests {

// candidate identified by id, fitness is fixed at construction
struct tagged {
  int id{};
  double value{};
  bool crossed{};
  int mutations{};

  inline double fitness() const noexcept {
    return value;
  }

  inline std::pair<tagged, tagged> crossover(tagged const& other) const {
    return {tagged{id, value, true, mutations},
            tagged{other.id, other.value, true, other.mutations}};
  }

  template<typename Generator>
  inline void mutate(Generator& /*unused*/) {
    ++mutations;
  }

  bool operator==(tagged const&) const = default;
};

inline std::vector<tagged> make_tagged(std::vector<double> const& values) {
  std::vector<tagged> result;
  for (int id = 0; auto value : values) {
    result.push_back(tagged{id++, value});
  }

  return result;
}

inline std::vector<int> get_ids(std::vector<tagged> const& individuals) {
  std::vector<int> result;
  for (auto const& individual : individuals) {
    result.push_back(individual.id);
  }

  return result;
}

inline std::vector<double>
    get_fitness(std::vector<tagged> const& individuals) {
  std::vector<double> result;
  for (auto const& individual : individuals) {
    result.push_back(individual.fitness());
  }

  return result;
}

// candidate whose fitness evaluation fails
struct faulty {
  int id{};

  inline double fitness() const {
    throw std::runtime_error{"fitness evaluation failed"};
  }

  inline std::pair<faulty, faulty> crossover(faulty const& other) const {
    return {*this, other};
  }

  template<typename Generator>
  inline void mutate(Generator& /*unused*/) {
  }
};

// returns the population in its current order
struct select_identity {
  template<typename Candidate, typename Generator>
  inline std::vector<Candidate>
      operator()(std::vector<Candidate> const& population,
                 std::vector<evo::fitness_t> const& /*unused*/,
                 Generator& /*unused*/) const {
    return population;
  }
};

// drops the last individual
struct select_fewer {
  template<typename Candidate, typename Generator>
  inline std::vector<Candidate>
      operator()(std::vector<Candidate> const& population,
                 std::vector<evo::fitness_t> const& /*unused*/,
                 Generator& /*unused*/) const {
    return {population.begin(), population.end() - 1};
  }
};

// produces count copies of the first parent and records every invocation
struct cross_n {
  std::size_t count;
  std::shared_ptr<std::vector<std::pair<int, int>>> calls{
      std::make_shared<std::vector<std::pair<int, int>>>()};

  inline std::vector<tagged> operator()(tagged const& left,
                                        tagged const& right) const {
    calls->emplace_back(left.id, right.id);

    auto child = left;
    child.crossed = true;
    return std::vector<tagged>(count, child);
  }
};

struct mutate_failing {
  template<typename Candidate, typename Generator>
  inline void operator()(Candidate& /*unused*/, Generator& /*unused*/) const {
    throw std::runtime_error{"mutation failed"};
  }
};

} // namespace tests
