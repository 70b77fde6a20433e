#include "crossover.hpp"
#include "engine.hpp"
#include "mutation.hpp"
#include "real_vector.hpp"
#include "selection.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <random>
#include <string_view>

namespace simple {

struct settings {
  std::size_t population{32};
  std::size_t generations{100};
  std::size_t genes{10};
  std::mt19937::result_type seed{42};
};

struct spawn {
  std::size_t genes_;

  inline evo::real_vector operator()(std::mt19937& rng) const {
    return evo::real_vector::random(genes_, rng, -1., 1.);
  }
};

struct observe {
  inline void operator()(evo::population<evo::real_vector> const& population,
                         evo::stats::generation_statistics const& stats) const {
    if (stats.generation_value() % 10 == 0) {
      spdlog::info("{:-^48}", stats.generation_value());
      spdlog::info("best {:9.4f} | average {:9.4f} | worst {:9.4f}",
                   stats.fitness_best_value(),
                   stats.fitness_average_value(),
                   stats.fitness_worst_value());
      spdlog::info("{} individuals", population.current_size());
    }
  }
};

template<typename Ty>
bool parse_argument(std::string_view text, Ty& value) {
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc{} && ptr == text.data() + text.size();
}

bool parse(int argc, char** argv, settings& result) {
  if (argc > 1 && !parse_argument(argv[1], result.population)) {
    return false;
  }

  if (argc > 2 && !parse_argument(argv[2], result.generations)) {
    return false;
  }

  if (argc > 3 && !parse_argument(argv[3], result.genes)) {
    return false;
  }

  return argc <= 4 || parse_argument(argv[4], result.seed);
}

} // namespace simple

int main(int argc, char** argv) {
  using namespace evo;

  simple::settings settings{};
  if (!simple::parse(argc, argv, settings)) {
    spdlog::error("usage: {} [population] [generations] [genes] [seed]",
                  argv[0]);
    return 1;
  }

  evo::log::logger()->set_level(spdlog::level::info);

  std::mt19937 rng{settings.seed};

  try {
    auto engine = config::for_map<engine_config_map>()
                      .begin()
                      .limit(settings.population)
                      .candidate<real_vector>()
                      .spawn(simple::spawn{settings.genes})
                      .select(evo::select::tournament{3})
                      .cross(cross::singlepoint{})
                      .mutate(mutate::gaussian{0.1, 0.1})
                      .execute(execution::parallel)
                      .observe(observe{generation_event, simple::observe{}})
                      .build<evo::engine>();

    auto result = engine.evolve(settings.generations, rng);

    auto best = std::ranges::max_element(
        result, {}, [](auto const& c) { return c.fitness(); });

    spdlog::info("best individual, fitness {:.4f}", best->fitness());
    spdlog::info("genes [{:.4f}]", fmt::join(best->genes(), ", "));
  }
  catch (evolution_error const& e) {
    spdlog::error("evolution failed: {}", e.what());
    return 1;
  }

  return 0;
}
