#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <random>
#include <vector>

namespace evo {

// generators that can be forked: a child generator of the same type is
// constructed from a value drawn from the parent
template<typename Generator>
concept seedable_generator =
    std::uniform_random_bit_generator<Generator> &&
    std::constructible_from<Generator, typename Generator::result_type>;

template<seedable_generator Generator>
inline auto draw_seeds(Generator& generator, std::size_t count) {
  std::vector<typename Generator::result_type> seeds(count);
  std::ranges::generate(seeds, std::ref(generator));

  return seeds;
}

template<typename Generator>
class random_index_adapter {
public:
  using generator_t = Generator;
  using distribution_t = std::uniform_int_distribution<std::size_t>;

public:
  inline random_index_adapter(generator_t& generator,
                              std::size_t min_idx,
                              std::size_t max_idx) noexcept
      : generator_{&generator}
      , dist_{min_idx, max_idx} {
  }

  inline random_index_adapter(generator_t& generator, std::size_t size) noexcept
      : random_index_adapter{generator, 0, size - 1} {
  }

  inline auto operator()() {
    return dist_(*generator_);
  }

private:
  generator_t* generator_;
  distribution_t dist_;
};

template<typename Generator>
class probabilistic_operation {
public:
  using generator_t = Generator;
  using distribution_t = std::uniform_real_distribution<double>;

public:
  inline probabilistic_operation(generator_t& generator,
                                 double probability) noexcept
      : generator_{&generator}
      , probability_{probability} {
  }

  inline bool operator()() const {
    if (probability_ <= 0.) {
      return false;
    }

    if (probability_ >= 1.) {
      return true;
    }

    return distribution_t{0., 1.}(*generator_) < probability_;
  }

private:
  generator_t* generator_;
  double probability_;
};

inline bool is_probability(double value) noexcept {
  return value >= 0. && value <= 1.;
}

} // namespace evo
