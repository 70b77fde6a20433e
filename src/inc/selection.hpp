#pragma once

#include "sampling.hpp"

#include <cmath>
#include <iterator>
#include <numeric>

namespace evo {
namespace select {

  class random {
  public:
    template<typename Candidate, std::uniform_random_bit_generator Generator>
    std::vector<Candidate> operator()(std::vector<Candidate> const& population,
                                      std::vector<fitness_t> const& fitness,
                                      Generator& generator) const {
      evo::details::ensure_sampleable(population, fitness);

      random_index_adapter<Generator> draw{generator, population.size()};
      return sample_many(
          population, nonunique_sample{population.size()}, [&draw] {
            return draw();
          });
    }
  };

  /** \brief Tournament selection.
   *
   * Every output slot is filled by the fittest of \b size individuals drawn
   * uniformly with replacement. A later draw replaces the current winner when
   * its fitness is not worse, so among equally fit draws the last one wins.
   *
   * Throws contract_violation when the population is empty or fitness values
   * are not index-aligned with it, and noncomparable_fitness when a compared
   * fitness value is NaN. */
  class tournament {
  public:
    inline explicit tournament(std::size_t size)
        : size_{size} {
      if (size_ == 0) {
        throw contract_violation{"tournament size must be at least one"};
      }
    }

    template<typename Candidate, std::uniform_random_bit_generator Generator>
    std::vector<Candidate> operator()(std::vector<Candidate> const& population,
                                      std::vector<fitness_t> const& fitness,
                                      Generator& generator) const {
      evo::details::ensure_sampleable(population, fitness);

      fitness_not_worse<> cmp{};
      random_index_adapter<Generator> draw{generator, population.size()};

      return sample_many(population,
                         nonunique_sample{population.size()},
                         [&fitness, &cmp, &draw, this] {
                           auto best_idx = draw();

                           for (auto i = size_ - 1; i > 0; --i) {
                             if (auto idx = draw();
                                 cmp(fitness[idx], fitness[best_idx])) {
                               best_idx = idx;
                             }
                           }

                           return best_idx;
                         });
    }

    inline auto size() const noexcept {
      return size_;
    }

  private:
    std::size_t size_;
  };

  namespace details {

    inline auto generate_wheel(std::vector<fitness_t> const& fitness) {
      std::vector<fitness_t> wheel;
      wheel.reserve(fitness.size());

      fitness_t total{};
      for (auto value : fitness) {
        if (!std::isfinite(value) || value < 0.) {
          throw contract_violation{fmt::format(
              "roulette selection requires finite non-negative fitness, got {}",
              value)};
        }

        total += value;
        wheel.push_back(total);
      }

      if (!(total > 0.)) {
        throw contract_violation{
            "roulette selection requires a positive total fitness"};
      }

      return wheel;
    }

    template<typename Generator>
    inline std::size_t roll_wheel(std::vector<fitness_t> const& wheel,
                                  std::size_t last_positive,
                                  Generator& generator) {
      auto selected =
          std::uniform_real_distribution<fitness_t>{0., wheel.back()}(generator);

      auto idx = static_cast<std::size_t>(
          std::ranges::upper_bound(wheel, selected) - wheel.begin());

      // the distribution may round up to the upper bound
      return std::min(idx, last_positive);
    }

  } // namespace details

  // fitness-proportional selection, individuals with zero fitness are never
  // selected
  class roulette {
  public:
    template<typename Candidate, std::uniform_random_bit_generator Generator>
    std::vector<Candidate> operator()(std::vector<Candidate> const& population,
                                      std::vector<fitness_t> const& fitness,
                                      Generator& generator) const {
      evo::details::ensure_sampleable(population, fitness);

      auto wheel = details::generate_wheel(fitness);

      auto last = std::ranges::find_if(
          fitness.rbegin(), fitness.rend(), [](auto f) { return f > 0.; });
      auto last_positive =
          static_cast<std::size_t>(std::distance(last, fitness.rend())) - 1;

      return sample_many(population,
                         nonunique_sample{population.size()},
                         [&wheel, last_positive, &generator] {
                           return details::roll_wheel(
                               wheel, last_positive, generator);
                         });
    }
  };

} // namespace select
} // namespace evo
