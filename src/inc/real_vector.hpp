#pragma once

#include "errors.hpp"
#include "fitness.hpp"
#include "random.hpp"

#include <cstddef>
#include <numeric>
#include <random>
#include <utility>
#include <vector>

namespace evo {

// candidate made of real-valued genes, its fitness is the sum of the genes
class real_vector {
public:
  using gene_t = double;
  using genes_t = std::vector<gene_t>;

  inline static constexpr double default_strength = 0.1;

public:
  real_vector() = default;

  inline explicit real_vector(genes_t genes)
      : genes_{std::move(genes)} {
  }

  inline real_vector(std::size_t length, gene_t value)
      : genes_(length, value) {
  }

  template<std::uniform_random_bit_generator Generator>
  inline static real_vector
      random(std::size_t length, Generator& generator, gene_t min, gene_t max) {
    std::uniform_real_distribution<gene_t> dist{min, max};

    genes_t genes(length);
    for (auto& gene : genes) {
      gene = dist(generator);
    }

    return real_vector{std::move(genes)};
  }

  inline fitness_t fitness() const noexcept {
    return std::accumulate(genes_.begin(), genes_.end(), fitness_t{});
  }

  // both parents are split at the middle, each child takes its head from one
  // parent and its tail from the other
  std::pair<real_vector, real_vector> crossover(real_vector const& other) const {
    if (other.genes_.size() != genes_.size()) {
      throw contract_violation{"cannot cross vectors of different lengths"};
    }

    auto point = genes_.size() / 2;

    auto splice = [point](genes_t const& head, genes_t const& tail) {
      genes_t result{head.begin(),
                     head.begin() + static_cast<std::ptrdiff_t>(point)};
      result.insert(result.end(),
                    tail.begin() + static_cast<std::ptrdiff_t>(point),
                    tail.end());
      return real_vector{std::move(result)};
    };

    return {splice(genes_, other.genes_), splice(other.genes_, genes_)};
  }

  template<std::uniform_random_bit_generator Generator>
  inline void mutate(Generator& generator) {
    mutate(generator, default_strength);
  }

  // adds a value from [-strength, strength) to one randomly chosen gene
  template<std::uniform_random_bit_generator Generator>
  void mutate(Generator& generator, double strength) {
    if (genes_.empty()) {
      return;
    }

    auto idx = random_index_adapter<Generator>{generator, genes_.size()}();
    genes_[idx] +=
        std::uniform_real_distribution<gene_t>{-strength, strength}(generator);
  }

  inline auto const& genes() const noexcept {
    return genes_;
  }

  inline auto size() const noexcept {
    return genes_.size();
  }

  inline bool operator==(real_vector const&) const = default;

private:
  genes_t genes_;
};

} // namespace evo
