#pragma once

#include "configuration.hpp"
#include "logging.hpp"
#include "population.hpp"
#include "random.hpp"
#include "statistics.hpp"

#include <exception>
#include <functional>
#include <iterator>
#include <optional>
#include <string_view>

namespace evo {

enum class engine_state {
  initializing,
  evaluating,
  selecting,
  recombining,
  mutating,
  done
};

inline constexpr std::string_view state_name(engine_state state) noexcept {
  switch (state) {
  case engine_state::initializing: return "initializing";
  case engine_state::evaluating: return "evaluating";
  case engine_state::selecting: return "selecting";
  case engine_state::recombining: return "recombining";
  case engine_state::mutating: return "mutating";
  case engine_state::done: return "done";
  }

  return "unknown";
}

struct engine_config_map {
  using type = config::entry_map<

      config::entry<config::root_ptype, config::plist<config::size_ptype>>,

      config::entry<config::size_ptype, config::plist<config::candidate_ptype>>,

      config::entry<
          config::candidate_ptype,
          config::plist<config::spawn_ptype, config::select_ptype>>,

      config::entry<config::select_ptype, config::plist<config::cross_ptype>>,

      config::entry<config::cross_ptype, config::plist<config::mutate_ptype>>,

      config::entry<
          config::mutate_ptype,
          config::plist<config::execute_ptype, config::observe_ptype>>>;
};

template<typename Config>
concept engine_config = requires(Config const& c) {
  requires basic_candidate<typename Config::candidate_t>;

  { c.population_size() } -> std::convertible_to<std::size_t>;

  c.selection();
  c.crossover();
  c.mutation();
};

namespace details {

  template<typename Config>
  concept spawn_config = requires(Config const& c) { c.initializator(); };

  template<typename Config>
  concept execute_config = requires(Config const& c) {
    { c.execution_mode() } -> std::same_as<execution>;
  };

  template<typename Config>
  concept observe_config = requires(Config const& c) { c.observers(); };

  template<typename Collection, typename Range>
  inline Collection to_collection(Range&& range) {
    if constexpr (std::same_as<std::remove_cvref_t<Range>, Collection>) {
      return std::forward<Range>(range);
    }
    else {
      return Collection(std::ranges::begin(range), std::ranges::end(range));
    }
  }

} // namespace details

/** \brief Generational evolution loop.
 *
 * Every generation evaluates the population, selects as many parents as there
 * are individuals, recombines consecutive pairs of parents and mutates the
 * offspring, which then replace the population wholesale. Evaluation and
 * mutation run over OpenMP threads when the configured execution mode is
 * parallel; the result does not depend on the mode or on thread scheduling.
 *
 * The engine holds only its configuration. Every evolve call tracks its own
 * state, so one engine can serve several concurrent calls as long as the
 * configured operations and observers tolerate concurrent invocation.
 *
 * \tparam Config Configuration produced by the \b config builder
 *                (see engine_config_map) or by make_engine. */
template<typename Config>
class engine {
  static_assert(engine_config<Config>,
                "configuration lacks population size, candidate type or one "
                "of the selection, crossover and mutation operations");

public:
  using config_t = Config;
  using candidate_t = typename config_t::candidate_t;
  using population_t = population<candidate_t>;
  using collection_t = typename population_t::collection_t;

private:
  using selection_t =
      std::remove_cvref_t<decltype(std::declval<config_t const&>().selection())>;
  using crossover_t =
      std::remove_cvref_t<decltype(std::declval<config_t const&>().crossover())>;
  using mutation_t =
      std::remove_cvref_t<decltype(std::declval<config_t const&>().mutation())>;

  static_assert(crossover<crossover_t, candidate_t>,
                "configured crossover cannot recombine this candidate type");

public:
  inline explicit engine(config_t const& config)
      : config_{config} {
    if (config_.population_size() == 0) {
      throw contract_violation{"population size must be positive"};
    }
  }

  /** \brief Runs exactly \b generations generations.
   *
   * \param generations Number of generations, zero returns the initial
   *                    population.
   * \param generator Source of all randomness used by the run.
   * \param initial Starting population; when absent it is spawned with the
   *                configured individual-generation function.
   * \return The final population.
   *
   * \throws missing_generator No initial population and nothing to spawn it.
   * \throws contract_violation An operation broke its contract or \b initial
   *                            has the wrong size.
   * \throws noncomparable_fitness Fitness values could not be ordered. */
  template<seedable_generator Generator>
  collection_t evolve(std::size_t generations,
                      Generator& generator,
                      std::optional<collection_t> initial = std::nullopt) const {
    static_assert(selection<selection_t, candidate_t, Generator>,
                  "configured selection cannot select this candidate type");
    static_assert(mutation<mutation_t, candidate_t, Generator>,
                  "configured mutation cannot mutate this candidate type");

    auto logger = log::logger();
    auto state = engine_state::initializing;

    try {
      return run(generations, generator, std::move(initial), state, *logger);
    }
    catch (std::exception const& e) {
      logger->error("evolution aborted in state {}: {}",
                    state_name(state),
                    e.what());
      throw;
    }
  }

  inline std::size_t population_size() const noexcept {
    return config_.population_size();
  }

  inline execution execution_mode() const noexcept {
    if constexpr (details::execute_config<config_t>) {
      return config_.execution_mode();
    }
    else {
      return execution::parallel;
    }
  }

  inline auto const& config() const noexcept {
    return config_;
  }

private:
  template<typename Generator>
  collection_t run(std::size_t generations,
                   Generator& generator,
                   std::optional<collection_t> initial,
                   engine_state& state,
                   spdlog::logger& logger) const {
    logger.trace("engine state {}", state_name(state));
    auto current = initialize(generator, std::move(initial));

    logger.info("evolution started: {} individuals, {} generations, {} "
                "execution",
                current.target_size(),
                generations,
                execution_name(execution_mode()));

    for (std::size_t generation = 1; generation <= generations; ++generation) {
      stats::generation_statistics statistics{generation,
                                              current.target_size()};

      current = step(current, generator, statistics, state, logger);
      report(statistics, logger);

      if constexpr (details::observe_config<config_t>) {
        config_.observers().observe(generation_event, current, statistics);
      }
    }

    transition(state, engine_state::done, logger);
    logger.info("evolution finished after {} generations", generations);

    return std::move(current).take();
  }

  template<typename Generator>
  population_t initialize(Generator& generator,
                          std::optional<collection_t> initial) const {
    if (initial) {
      return population_t{std::move(*initial), config_.population_size()};
    }

    if constexpr (details::spawn_config<config_t>) {
      using spawn_t = std::remove_cvref_t<decltype(config_.initializator())>;
      static_assert(initializator<spawn_t const, candidate_t, Generator>,
                    "configured spawn function does not produce candidates");

      population_t result{config_.population_size()};
      result.fill([&generator, this] {
        return spawn_one<candidate_t>(config_.initializator(), generator);
      });

      return result;
    }
    else {
      throw missing_generator{};
    }
  }

  template<typename Generator>
  population_t step(population_t const& current,
                    Generator& generator,
                    stats::generation_statistics& statistics,
                    engine_state& state,
                    spdlog::logger& logger) const {
    transition(state, engine_state::evaluating, logger);
    auto fitness = evaluate(current, statistics);

    transition(state, engine_state::selecting, logger);
    auto parents = select(current, fitness, generator, statistics);

    transition(state, engine_state::recombining, logger);
    auto offspring = recombine(parents, statistics);

    transition(state, engine_state::mutating, logger);
    mutate(offspring, generator, statistics);

    return population_t{std::move(offspring), config_.population_size()};
  }

  inline auto evaluate(population_t const& current,
                       stats::generation_statistics& statistics) const {
    auto timer = stats::start_timer(statistics, evaluation_time_tag);

    auto fitness = current.evaluate(execution_mode());
    statistics.record_fitness(fitness);

    return fitness;
  }

  template<typename Generator>
  collection_t select(population_t const& current,
                      std::vector<fitness_t> const& fitness,
                      Generator& generator,
                      stats::generation_statistics& statistics) const {
    auto timer = stats::start_timer(statistics, selection_time_tag);

    auto parents = details::to_collection<collection_t>(std::invoke(
        config_.selection(), current.individuals(), fitness, generator));

    if (parents.size() != current.current_size()) {
      throw contract_violation{
          fmt::format("selection returned {} parents for {} individuals",
                      parents.size(),
                      current.current_size())};
    }

    return parents;
  }

  // pairs (0, 1), (2, 3), ... are recombined, an unpaired last parent is
  // copied as it is
  collection_t recombine(collection_t const& parents,
                         stats::generation_statistics& statistics) const {
    auto timer = stats::start_timer(statistics, recombination_time_tag);

    auto target = config_.population_size();

    collection_t offspring;
    offspring.reserve(target);

    std::size_t idx{};
    for (; idx + 1 < parents.size(); idx += 2) {
      auto children = std::invoke(
          config_.crossover(), parents[idx], parents[idx + 1]);

      if (std::ranges::size(children) == 0) {
        throw contract_violation{"crossover produced no children"};
      }

      std::ranges::move(children, std::back_inserter(offspring));
      stats::increment_count(statistics, crossover_count_tag);
    }

    if (idx < parents.size()) {
      offspring.push_back(parents[idx]);
    }

    if (offspring.size() < target) {
      throw contract_violation{
          fmt::format("recombination produced {} offspring, expected {}",
                      offspring.size(),
                      target)};
    }

    offspring.erase(offspring.begin() + static_cast<std::ptrdiff_t>(target),
                    offspring.end());

    return offspring;
  }

  // every offspring gets its own generator seeded from the caller's one, so
  // the outcome does not depend on the order in which threads run
  template<typename Generator>
  void mutate(collection_t& offspring,
              Generator& generator,
              stats::generation_statistics& statistics) const {
    auto timer = stats::start_timer(statistics, mutation_time_tag);

    auto seeds = draw_seeds(generator, offspring.size());
    auto const& operation = config_.mutation();

    for_each_index(
        execution_mode(),
        offspring.size(),
        [&offspring, &seeds, &operation](std::size_t idx) {
          Generator local{seeds[idx]};
          std::invoke(operation, offspring[idx], local);
        });
  }

  void report(stats::generation_statistics const& statistics,
              spdlog::logger& logger) const {
    logger.debug("generation {}: best {:.6g}, average {:.6g}, worst {:.6g}, "
                 "{} crossovers | evaluation {:.3f} ms, selection {:.3f} ms, "
                 "recombination {:.3f} ms, mutation {:.3f} ms",
                 statistics.generation_value(),
                 statistics.fitness_best_value(),
                 statistics.fitness_average_value(),
                 statistics.fitness_worst_value(),
                 statistics.count(crossover_count_tag),
                 stats::to_milliseconds(statistics.elapsed(evaluation_time_tag)),
                 stats::to_milliseconds(statistics.elapsed(selection_time_tag)),
                 stats::to_milliseconds(
                     statistics.elapsed(recombination_time_tag)),
                 stats::to_milliseconds(statistics.elapsed(mutation_time_tag)));
  }

  inline static void transition(engine_state& state,
                                engine_state next,
                                spdlog::logger& logger) noexcept {
    logger.trace("engine state {} -> {}", state_name(state), state_name(next));
    state = next;
  }

private:
  config_t config_;
};

template<basic_candidate Candidate,
         typename Selection,
         typename Crossover,
         typename Mutation>
inline auto make_engine(std::size_t population_size,
                        Selection const& selection,
                        Crossover const& crossover,
                        Mutation const& mutation) {
  return config::for_map<engine_config_map>()
      .begin()
      .limit(population_size)
      .template candidate<Candidate>()
      .select(selection)
      .cross(crossover)
      .mutate(mutation)
      .template build<engine>();
}

template<basic_candidate Candidate,
         typename Selection,
         typename Crossover,
         typename Mutation,
         typename Spawn>
inline auto make_engine(std::size_t population_size,
                        Selection const& selection,
                        Crossover const& crossover,
                        Mutation const& mutation,
                        Spawn const& spawn) {
  return config::for_map<engine_config_map>()
      .begin()
      .limit(population_size)
      .template candidate<Candidate>()
      .spawn(spawn)
      .select(selection)
      .cross(crossover)
      .mutate(mutation)
      .template build<engine>();
}

} // namespace evo
