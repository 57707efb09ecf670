#include "../random.hpp"

#include <selection.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace tests::selection {

using genotype_t = gopt::genotype<int>;
using chromosome_t = genotype_t::chromosome_t;
using population_t = gopt::population<int>;

class selection_tests : public ::testing::Test {
protected:
  population_t create(std::initializer_list<double> fitness) const {
    population_t result{fitness.size()};

    for (auto value : fitness) {
      genotype_t individual{binary_, {chromosome_t{1, 0}}};
      individual.evaluation().set_raw(value);
      result.insert(std::move(individual));
    }

    return result;
  }

  gopt::alphabet<int> binary_{0, 1};
};

TEST_F(selection_tests, roulette_proportional_to_fitness) {
  // arrange
  auto population = create({1., 2., 3.});
  gopt::exclusion excluded{3};

  deterministic_source source{{}, {0., 0.5, 0.9}};
  gopt::select::roulette op{source};

  // act
  auto first = op(population, excluded);
  auto second = op(population, excluded);
  auto third = op(population, excluded);

  // assert
  EXPECT_EQ(first, 0);
  EXPECT_EQ(second, 1);
  EXPECT_EQ(third, 2);
}

TEST_F(selection_tests, roulette_skips_excluded) {
  // arrange
  auto population = create({1., 2., 3.});
  gopt::exclusion excluded{3};
  excluded.insert(1);

  deterministic_source source{{}, {0.5, 0.2}};
  gopt::select::roulette op{source};

  // act
  auto first = op(population, excluded);
  auto second = op(population, excluded);

  // assert
  EXPECT_EQ(first, 2);
  EXPECT_EQ(second, 0);
}

TEST_F(selection_tests, roulette_uses_scaled_fitness) {
  // arrange
  auto population = create({1., 1.});
  population.individuals()[0].evaluation().set_scaled(0.);
  population.individuals()[1].evaluation().set_scaled(4.);

  gopt::exclusion excluded{2};

  deterministic_source source({}, {0.1});
  gopt::select::roulette op{source};

  // act
  auto result = op(population, excluded);

  // assert
  EXPECT_EQ(result, 1);
}

TEST_F(selection_tests, roulette_without_fitness_picks_first_available) {
  // arrange
  auto population = create({0., 0., 0.});
  gopt::exclusion excluded{3};
  excluded.insert(0);

  deterministic_source source({}, {0.7});
  gopt::select::roulette op{source};

  // act
  auto result = op(population, excluded);

  // assert
  EXPECT_EQ(result, 1);
}

TEST_F(selection_tests, roulette_with_engine_source_stays_in_range) {
  // arrange
  auto population = create({0.5, 0., 2., 1.});
  gopt::exclusion excluded{4};
  excluded.insert(2);

  gopt::engine_source<> source{7};
  gopt::select::roulette op{source};

  // act & assert
  for (int i = 0; i < 100; ++i) {
    auto result = op(population, excluded);

    EXPECT_LT(result, 4);
    EXPECT_NE(result, 2);
    EXPECT_NE(result, 1);
  }
}

} // namespace tests::selection
