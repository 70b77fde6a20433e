#include <crossover.hpp>
#include <real_vector.hpp>

#include "../helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>

namespace tests::crossover {

struct crossover_tests : public ::testing::Test {
protected:
  void SetUp() override {
    even_ = {evo::real_vector{{10, 11, 12, 13, 14, 15, 16, 17, 18, 19}},
             evo::real_vector{{20, 21, 22, 23, 24, 25, 26, 27, 28, 29}}};

    odd_ = {evo::real_vector{{10, 11, 12, 13, 14, 15, 16}},
            evo::real_vector{{20, 21, 22, 23, 24, 25, 26}}};
  }

  std::array<evo::real_vector, 2> even_;
  std::array<evo::real_vector, 2> odd_;
};

TEST_F(crossover_tests, singlepoint_produces_two_children) {
  // arrange
  evo::cross::singlepoint op{};

  // act
  auto children = op(even_[0], even_[1]);

  // assert
  EXPECT_THAT(children, ::testing::SizeIs(2));
}

TEST_F(crossover_tests, singlepoint_even_length_split) {
  // arrange
  evo::cross::singlepoint op{};

  // act
  auto children = op(even_[0], even_[1]);

  // assert
  EXPECT_THAT(children[0].genes(),
              ::testing::ElementsAre(10, 11, 12, 13, 14, 25, 26, 27, 28, 29));

  EXPECT_THAT(children[1].genes(),
              ::testing::ElementsAre(20, 21, 22, 23, 24, 15, 16, 17, 18, 19));
}

TEST_F(crossover_tests, singlepoint_odd_length_split) {
  // arrange
  evo::cross::singlepoint op{};

  // act
  auto children = op(odd_[0], odd_[1]);

  // assert
  EXPECT_THAT(children[0].genes(),
              ::testing::ElementsAre(10, 11, 12, 23, 24, 25, 26));

  EXPECT_THAT(children[1].genes(),
              ::testing::ElementsAre(20, 21, 22, 13, 14, 15, 16));
}

TEST_F(crossover_tests, singlepoint_children_keep_length) {
  // arrange
  evo::cross::singlepoint op{};

  // act
  auto children = op(odd_[0], odd_[1]);

  // assert
  EXPECT_THAT(children[0].size(), ::testing::Eq(7u));
  EXPECT_THAT(children[1].size(), ::testing::Eq(7u));
}

TEST_F(crossover_tests, singlepoint_parents_unchanged) {
  // arrange
  evo::cross::singlepoint op{};
  auto parents = even_;

  // act
  op(even_[0], even_[1]);

  // assert
  EXPECT_THAT(even_, ::testing::ElementsAreArray(parents));
}

TEST_F(crossover_tests, singlepoint_returns_candidate_children_unmodified) {
  // arrange
  evo::cross::singlepoint op{};
  auto parents = make_tagged({1., 2.});

  // act
  auto children = op(parents[0], parents[1]);

  // assert
  auto [first, second] = parents[0].crossover(parents[1]);
  EXPECT_THAT(children, ::testing::ElementsAre(first, second));
}

TEST_F(crossover_tests, clone_copies_parents) {
  // arrange
  evo::cross::clone op{};

  // act
  auto children = op(even_[0], even_[1]);

  // assert
  EXPECT_THAT(children, ::testing::ElementsAre(even_[0], even_[1]));
}

} // namespace tests::crossover
