#include <selection.hpp>

#include "../helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <random>

namespace tests::selection {

class selection_tests : public ::testing::Test {
protected:
  void SetUp() override {
    population_ = make_tagged({7., 6., 4., 8., 9., 3., 2., 1., 5.});
    fitness_ = get_fitness(population_);
  }

  std::vector<tagged> population_;
  std::vector<evo::fitness_t> fitness_;
  std::mt19937 rng_{};
};

TEST_F(selection_tests, random_selection_size) {
  // arrange
  evo::select::random op{};

  // act
  auto result = op(population_, fitness_, rng_);

  // assert
  EXPECT_THAT(result, ::testing::SizeIs(population_.size()));
}

TEST_F(selection_tests, random_selection_content) {
  // arrange
  evo::select::random op{};

  // act
  auto result = op(population_, fitness_, rng_);

  // assert
  EXPECT_THAT(get_ids(result),
              ::testing::Each(::testing::AllOf(::testing::Ge(0),
                                               ::testing::Lt(9))));
}

TEST_F(selection_tests, tournament_selection_size) {
  // arrange
  evo::select::tournament op{2};

  // act
  auto result = op(population_, fitness_, rng_);

  // assert
  EXPECT_THAT(result, ::testing::SizeIs(population_.size()));
}

TEST_F(selection_tests, tournament_selection_keeps_individuals_unchanged) {
  // arrange
  evo::select::tournament op{3};

  // act
  auto result = op(population_, fitness_, rng_);

  // assert
  for (auto const& selected : result) {
    EXPECT_THAT(selected, ::testing::Eq(population_[selected.id]));
  }
}

TEST_F(selection_tests, tournament_covering_population_selects_best) {
  // arrange
  evo::select::tournament op{200};

  // act
  auto result = op(population_, fitness_, rng_);

  // assert
  EXPECT_THAT(get_ids(result), ::testing::Each(::testing::Eq(4)));
}

TEST_F(selection_tests, tournament_equal_fitness_selects_last_draw) {
  // arrange
  auto population = make_tagged({3., 3., 3., 3., 3.});
  auto fitness = get_fitness(population);

  std::mt19937 rng{11};
  std::mt19937 replay{11};
  evo::random_index_adapter<std::mt19937> draw{replay, population.size()};

  std::vector<int> expected;
  for (std::size_t slot = 0; slot < population.size(); ++slot) {
    draw();
    draw();
    expected.push_back(static_cast<int>(draw()));
  }

  evo::select::tournament op{3};

  // act
  auto result = op(population, fitness, rng);

  // assert
  EXPECT_THAT(get_ids(result), ::testing::ElementsAreArray(expected));
}

TEST_F(selection_tests, tournament_duplicate_maximum_selects_last_drawn) {
  // arrange
  auto population = make_tagged({1., 5., 2., 5., 3., 5.});
  auto fitness = get_fitness(population);

  std::mt19937 rng{5};
  std::mt19937 replay{5};
  evo::random_index_adapter<std::mt19937> draw{replay, population.size()};

  std::vector<int> expected;
  for (std::size_t slot = 0; slot < population.size(); ++slot) {
    std::vector<std::size_t> draws{draw(), draw(), draw(), draw()};

    auto maximum = std::ranges::max(
        draws, {}, [&fitness](auto idx) { return fitness[idx]; });
    auto last = std::ranges::find_if(
        draws.rbegin(), draws.rend(), [&fitness, maximum](auto idx) {
          return fitness[idx] == fitness[maximum];
        });

    expected.push_back(static_cast<int>(*last));
  }

  evo::select::tournament op{4};

  // act
  auto result = op(population, fitness, rng);

  // assert
  EXPECT_THAT(get_ids(result), ::testing::ElementsAreArray(expected));
}

TEST_F(selection_tests, tournament_zero_size_rejected) {
  // act & assert
  EXPECT_THROW(evo::select::tournament{0}, evo::contract_violation);
}

TEST_F(selection_tests, tournament_empty_population_rejected) {
  // arrange
  evo::select::tournament op{2};
  std::vector<tagged> population{};
  std::vector<evo::fitness_t> fitness{};

  // act & assert
  EXPECT_THROW(op(population, fitness, rng_), evo::contract_violation);
}

TEST_F(selection_tests, tournament_mismatched_fitness_rejected) {
  // arrange
  evo::select::tournament op{2};
  fitness_.pop_back();

  // act & assert
  EXPECT_THROW(op(population_, fitness_, rng_), evo::contract_violation);
}

TEST_F(selection_tests, tournament_nan_fitness_rejected) {
  // arrange
  auto nan = std::numeric_limits<double>::quiet_NaN();
  auto population = make_tagged({nan, nan, nan});
  auto fitness = get_fitness(population);

  evo::select::tournament op{2};

  // act & assert
  EXPECT_THROW(op(population, fitness, rng_), evo::noncomparable_fitness);
}

TEST_F(selection_tests, random_mismatched_fitness_rejected) {
  // arrange
  evo::select::random op{};
  fitness_.push_back(1.);

  // act & assert
  EXPECT_THROW(op(population_, fitness_, rng_), evo::contract_violation);
}

TEST_F(selection_tests, roulette_selection_size) {
  // arrange
  evo::select::roulette op{};

  // act
  auto result = op(population_, fitness_, rng_);

  // assert
  EXPECT_THAT(result, ::testing::SizeIs(population_.size()));
}

TEST_F(selection_tests, roulette_skips_zero_fitness) {
  // arrange
  auto population = make_tagged({0., 0., 3., 0.});
  auto fitness = get_fitness(population);

  evo::select::roulette op{};

  // act
  auto result = op(population, fitness, rng_);

  // assert
  EXPECT_THAT(get_ids(result), ::testing::Each(::testing::Eq(2)));
}

TEST_F(selection_tests, roulette_negative_fitness_rejected) {
  // arrange
  auto population = make_tagged({1., -1., 3.});
  auto fitness = get_fitness(population);

  evo::select::roulette op{};

  // act & assert
  EXPECT_THROW(op(population, fitness, rng_), evo::contract_violation);
}

TEST_F(selection_tests, roulette_zero_total_rejected) {
  // arrange
  auto population = make_tagged({0., 0., 0.});
  auto fitness = get_fitness(population);

  evo::select::roulette op{};

  // act & assert
  EXPECT_THROW(op(population, fitness, rng_), evo::contract_violation);
}

TEST_F(selection_tests, roulette_infinite_fitness_rejected) {
  // arrange
  auto population =
      make_tagged({1., std::numeric_limits<double>::infinity(), 3.});
  auto fitness = get_fitness(population);

  evo::select::roulette op{};

  // act & assert
  EXPECT_THROW(op(population, fitness, rng_), evo::contract_violation);
}

} // namespace tests::selection
