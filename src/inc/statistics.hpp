#pragma once

#include "fitness.hpp"
#include "operation.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <tuple>
#include <vector>

namespace evo {
namespace stats {

  template<typename Tag>
  class generic_timer {
  public:
    using tag_t = Tag;
    using timer_t = std::chrono::steady_clock;

  public:
    inline auto elapsed_value() const noexcept {
      return stop_ - start_;
    }

    inline void start_timer() noexcept {
      start_ = stop_ = timer_t::now();
    }

    inline void stop_timer() noexcept {
      stop_ = timer_t::now();
    }

  private:
    timer_t::time_point start_{};
    timer_t::time_point stop_{};
  };

  template<typename Tag>
  class generic_counter {
  public:
    using tag_t = Tag;

  public:
    inline auto count_value() const noexcept {
      return value_;
    }

    inline void increment(std::size_t increment) noexcept {
      value_ += increment;
    }

  private:
    std::size_t value_{};
  };

  // NaN values are left out of the fitness summary; when nothing comparable
  // was evaluated the best, worst and average are NaN
  class fitness_summary {
  public:
    fitness_summary() = default;

    inline explicit fitness_summary(std::vector<fitness_t> const& values) {
      fitness_t total{};

      for (auto value : values) {
        if (!is_comparable(value)) {
          continue;
        }

        if (count_ == 0) {
          best_ = worst_ = value;
        }
        else {
          best_ = std::max(best_, value);
          worst_ = std::min(worst_, value);
        }

        total += value;
        ++count_;
      }

      if (count_ != 0) {
        average_ = total / static_cast<fitness_t>(count_);
      }
    }

    inline auto best() const noexcept {
      return best_;
    }

    inline auto worst() const noexcept {
      return worst_;
    }

    inline auto average() const noexcept {
      return average_;
    }

    inline auto comparable_count() const noexcept {
      return count_;
    }

  private:
    fitness_t best_{std::numeric_limits<fitness_t>::quiet_NaN()};
    fitness_t worst_{std::numeric_limits<fitness_t>::quiet_NaN()};
    fitness_t average_{std::numeric_limits<fitness_t>::quiet_NaN()};
    std::size_t count_{};
  };

  /** \brief Measurements taken during a single generation.
   *
   * Fitness values describe the population as it was evaluated at the start
   * of the generation, timings cover the steps that produced the next one. */
  class generation_statistics {
  private:
    using timers_t = std::tuple<generic_timer<evaluation_time_t>,
                                generic_timer<selection_time_t>,
                                generic_timer<recombination_time_t>,
                                generic_timer<mutation_time_t>>;

    using counters_t = std::tuple<generic_counter<crossover_count_t>>;

  public:
    generation_statistics() = default;

    inline generation_statistics(std::size_t generation,
                                 std::size_t population_size) noexcept
        : generation_{generation}
        , population_size_{population_size} {
    }

    inline auto generation_value() const noexcept {
      return generation_;
    }

    inline auto population_size_value() const noexcept {
      return population_size_;
    }

    inline void record_fitness(std::vector<fitness_t> const& values) {
      fitness_ = fitness_summary{values};
    }

    inline auto const& fitness() const noexcept {
      return fitness_;
    }

    inline auto fitness_best_value() const noexcept {
      return fitness_.best();
    }

    inline auto fitness_worst_value() const noexcept {
      return fitness_.worst();
    }

    inline auto fitness_average_value() const noexcept {
      return fitness_.average();
    }

    template<typename Tag>
    inline auto& timer(Tag /*unused*/) noexcept {
      return std::get<generic_timer<Tag>>(timers_);
    }

    template<typename Tag>
    inline auto const& timer(Tag /*unused*/) const noexcept {
      return std::get<generic_timer<Tag>>(timers_);
    }

    template<typename Tag>
    inline auto elapsed(Tag tag) const noexcept {
      return timer(tag).elapsed_value();
    }

    template<typename Tag>
    inline auto& counter(Tag /*unused*/) noexcept {
      return std::get<generic_counter<Tag>>(counters_);
    }

    template<typename Tag>
    inline auto count(Tag /*unused*/) const noexcept {
      return std::get<generic_counter<Tag>>(counters_).count_value();
    }

  private:
    std::size_t generation_{};
    std::size_t population_size_{};

    fitness_summary fitness_{};

    timers_t timers_{};
    counters_t counters_{};
  };

  template<typename Tag>
  class scoped_timer {
  public:
    inline scoped_timer(generation_statistics& statistics, Tag tag) noexcept
        : timer_{&statistics.timer(tag)} {
      timer_->start_timer();
    }

    inline ~scoped_timer() noexcept {
      timer_->stop_timer();
    }

    scoped_timer(scoped_timer&&) = delete;
    scoped_timer(scoped_timer const&) = delete;

    scoped_timer& operator=(scoped_timer&&) = delete;
    scoped_timer& operator=(scoped_timer const&) = delete;

  private:
    generic_timer<Tag>* timer_;
  };

  template<typename Tag>
  inline auto start_timer(generation_statistics& statistics, Tag tag) {
    return scoped_timer<Tag>{statistics, tag};
  }

  template<typename Tag>
  inline void increment_count(generation_statistics& statistics,
                              Tag tag,
                              std::size_t increment = 1) {
    statistics.counter(tag).increment(increment);
  }

  // milliseconds with fractional part, for reporting
  template<typename Duration>
  inline double to_milliseconds(Duration elapsed) noexcept {
    return std::chrono::duration<double, std::milli>{elapsed}.count();
  }

} // namespace stats
} // namespace evo
