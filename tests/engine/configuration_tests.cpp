#include <crossover.hpp>
#include <engine.hpp>
#include <mutation.hpp>
#include <selection.hpp>

#include "../helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <random>

namespace tests::configuration {

struct configuration_tests : public ::testing::Test {
protected:
  std::mt19937 rng_{};
};

TEST_F(configuration_tests, builder_collects_sections) {
  // act
  auto config = evo::config::for_map<evo::engine_config_map>()
                    .begin()
                    .limit(12)
                    .candidate<tagged>()
                    .select(evo::select::tournament{5})
                    .cross(evo::cross::clone{})
                    .mutate(evo::mutate::gaussian{0.2, 0.3})
                    .end();

  // assert
  EXPECT_TRUE(evo::engine_config<decltype(config)>);
  EXPECT_THAT(config.population_size(), ::testing::Eq(12u));
  EXPECT_THAT(config.selection().size(), ::testing::Eq(5u));
  EXPECT_THAT(config.mutation().rate(), ::testing::DoubleEq(0.2));
  EXPECT_THAT(config.mutation().strength(), ::testing::DoubleEq(0.3));
}

TEST_F(configuration_tests, execution_defaults_to_parallel) {
  // act
  auto engine = evo::make_engine<tagged>(4,
                                         evo::select::tournament{2},
                                         evo::cross::singlepoint{},
                                         evo::mutate::none{});

  // assert
  EXPECT_THAT(engine.execution_mode(),
              ::testing::Eq(evo::execution::parallel));
  EXPECT_THAT(engine.population_size(), ::testing::Eq(4u));
}

TEST_F(configuration_tests, execution_mode_configurable) {
  // act
  auto engine = evo::config::for_map<evo::engine_config_map>()
                    .begin()
                    .limit(4)
                    .candidate<tagged>()
                    .select(evo::select::tournament{2})
                    .cross(evo::cross::singlepoint{})
                    .mutate(evo::mutate::none{})
                    .execute(evo::execution::sequential)
                    .build<evo::engine>();

  // assert
  EXPECT_THAT(engine.execution_mode(),
              ::testing::Eq(evo::execution::sequential));
}

TEST_F(configuration_tests, spawn_is_optional) {
  // act
  auto config = evo::config::for_map<evo::engine_config_map>()
                    .begin()
                    .limit(4)
                    .candidate<tagged>()
                    .spawn([] { return tagged{}; })
                    .select(evo::select::random{})
                    .cross(evo::cross::singlepoint{})
                    .mutate(evo::mutate::none{})
                    .end();

  // assert
  EXPECT_TRUE(evo::details::spawn_config<decltype(config)>);
  EXPECT_FALSE(evo::details::execute_config<decltype(config)>);
  EXPECT_FALSE(evo::details::observe_config<decltype(config)>);
}

TEST_F(configuration_tests, zero_population_size_rejected) {
  // act & assert
  EXPECT_THROW(evo::make_engine<tagged>(0,
                                        evo::select::tournament{2},
                                        evo::cross::singlepoint{},
                                        evo::mutate::none{}),
               evo::contract_violation);
}

} // namespace tests::configuration
