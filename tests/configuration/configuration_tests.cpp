#include <configuration.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace tests::configuration {

using settings_t = gopt::settings<int>;
using configuration_t = gopt::configuration<int>;

struct configuration_tests : public ::testing::Test {
protected:
  void SetUp() override {
    settings_.lengths = {8};
    settings_.population_size = 10;
  }

  settings_t settings_{};
};

TEST_F(configuration_tests, binary_defaults) {
  // act
  auto result = gopt::resolve(settings_);

  // assert
  EXPECT_EQ(result.chromosomes(), 1);
  EXPECT_THAT(result.lengths(), ::testing::ElementsAre(8));
  EXPECT_TRUE(result.alphabet().equals({0, 1}));
  EXPECT_EQ(result.encoding(), gopt::encoding::standard);
  EXPECT_TRUE(result.immortal());
  EXPECT_FALSE(result.monogamous());
  EXPECT_EQ(result.children(), 2);

  auto const& tuning = result.tuning();
  EXPECT_DOUBLE_EQ(tuning.crossover_probability, 0.6);
  EXPECT_DOUBLE_EQ(tuning.mutation_probability, 0.0333);
  EXPECT_DOUBLE_EQ(tuning.inversion_probability, 0.);
  EXPECT_DOUBLE_EQ(tuning.population_growth, 1.);
  EXPECT_DOUBLE_EQ(tuning.overpopulation, 1.3);
  ASSERT_TRUE(tuning.fitness_scale.has_value());
  EXPECT_DOUBLE_EQ(*tuning.fitness_scale, 1.6);
  EXPECT_DOUBLE_EQ(tuning.float_sigma, 1.2);
  EXPECT_DOUBLE_EQ(tuning.float_sigma_adapt, 0.85);
}

TEST_F(configuration_tests, single_length_is_shared) {
  // arrange
  settings_.chromosomes = 3;

  // act
  auto result = gopt::resolve(settings_);

  // assert
  EXPECT_THAT(result.lengths(), ::testing::ElementsAre(8, 8, 8));
}

TEST_F(configuration_tests, lengths_must_match_chromosomes) {
  // arrange
  settings_.chromosomes = 3;
  settings_.lengths = {4, 5};

  // act & assert
  EXPECT_THROW(gopt::resolve(settings_), gopt::configuration_error);
}

TEST_F(configuration_tests, lengths_must_be_positive) {
  // arrange
  settings_.chromosomes = 2;
  settings_.lengths = {4, 0};

  // act & assert
  EXPECT_THROW(gopt::resolve(settings_), gopt::configuration_error);
}

TEST_F(configuration_tests, population_must_not_be_empty) {
  // arrange
  settings_.population_size = 0;

  // act & assert
  EXPECT_THROW(gopt::resolve(settings_), gopt::configuration_error);
}

TEST_F(configuration_tests, diploid_default_alphabet) {
  // arrange
  settings_.chromosome_sets = 2;

  // act
  auto result = gopt::resolve(settings_);

  // assert
  EXPECT_TRUE(result.alphabet().equals({-1, 0, 1}));
  EXPECT_EQ(result.chromosome_sets(), 2);
}

TEST_F(configuration_tests, unsupported_chromosome_sets) {
  // arrange
  settings_.chromosome_sets = 3;

  // act & assert
  EXPECT_THROW(gopt::resolve(settings_), gopt::configuration_error);
}

TEST_F(configuration_tests, odd_children) {
  // arrange
  settings_.children = 3;

  // act & assert
  EXPECT_THROW(gopt::resolve(settings_), gopt::configuration_error);
}

TEST_F(configuration_tests, probability_out_of_range) {
  // arrange
  settings_.mutation_probability = 1.5;

  // act & assert
  EXPECT_THROW(gopt::resolve(settings_), gopt::configuration_error);
}

TEST_F(configuration_tests, negative_growth) {
  // arrange
  settings_.population_growth = -1.;

  // act & assert
  EXPECT_THROW(gopt::resolve(settings_), gopt::configuration_error);
}

TEST_F(configuration_tests, explicit_probabilities) {
  // arrange
  settings_.crossover_probability = 0.;
  settings_.mutation_probability = 1.;

  // act
  auto result = gopt::resolve(settings_);

  // assert
  EXPECT_EQ(result.tuning().crossover_probability, 0.);
  EXPECT_EQ(result.tuning().mutation_probability, 1.);
}

TEST_F(configuration_tests, permutation_defaults) {
  // arrange
  settings_.lengths = {5};
  settings_.pmx = true;

  // act
  auto result = gopt::resolve(settings_);

  // assert
  EXPECT_EQ(result.encoding(), gopt::encoding::permutation);
  EXPECT_TRUE(result.alphabet().equals({0, 1, 2, 3, 4}));
  EXPECT_DOUBLE_EQ(result.tuning().crossover_probability, 0.9);
  EXPECT_DOUBLE_EQ(result.tuning().mutation_probability, 0.4);
  EXPECT_FALSE(result.tuning().fitness_scale.has_value());
}

TEST_F(configuration_tests, permutation_length_must_match_alphabet) {
  // arrange
  settings_.pmx = true;
  settings_.alleles = gopt::alphabet<int>{0, 1, 2};

  // act & assert
  EXPECT_THROW(gopt::resolve(settings_), gopt::configuration_error);
}

TEST_F(configuration_tests, permutation_requires_haploid) {
  // arrange
  settings_.pmx = true;
  settings_.chromosome_sets = 2;

  // act & assert
  EXPECT_THROW(gopt::resolve(settings_), gopt::configuration_error);
}

TEST_F(configuration_tests, permutation_requires_two_children) {
  // arrange
  settings_.pmx = true;
  settings_.children = 4;

  // act & assert
  EXPECT_THROW(gopt::resolve(settings_), gopt::configuration_error);
}

TEST_F(configuration_tests, continuous_defaults) {
  // arrange
  gopt::settings<double> settings{};
  settings.lengths = {3};
  settings.population_size = 10;
  settings.alleles = gopt::alphabet<double>{gopt::unit_interval};

  // act
  auto result = gopt::resolve(settings);

  // assert
  EXPECT_EQ(result.encoding(), gopt::encoding::continuous);
  EXPECT_DOUBLE_EQ(result.tuning().crossover_probability, 0.);
  EXPECT_DOUBLE_EQ(result.tuning().mutation_probability, 0.3);
  EXPECT_FALSE(result.tuning().fitness_scale.has_value());
}

TEST_F(configuration_tests, continuous_requires_haploid) {
  // arrange
  gopt::settings<double> settings{};
  settings.lengths = {3};
  settings.population_size = 10;
  settings.chromosome_sets = 2;
  settings.alleles = gopt::alphabet<double>{gopt::unit_interval};

  // act & assert
  EXPECT_THROW(gopt::resolve(settings), gopt::configuration_error);
}

TEST_F(configuration_tests, characters_require_alphabet) {
  // arrange
  gopt::settings<char> settings{};
  settings.lengths = {3};
  settings.population_size = 10;

  // act & assert
  EXPECT_THROW(gopt::resolve(settings), gopt::configuration_error);
}

TEST_F(configuration_tests, characters_are_not_scaled) {
  // arrange
  gopt::settings<char> settings{};
  settings.lengths = {3};
  settings.population_size = 10;
  settings.alleles = gopt::alphabets::alnum();

  // act
  auto result = gopt::resolve(settings);

  // assert
  EXPECT_FALSE(result.tuning().fitness_scale.has_value());
  EXPECT_EQ(result.alphabet().size(), 63);
}

TEST_F(configuration_tests, scaling_disabled) {
  // arrange
  settings_.fitness_scale = gopt::no_scaling{};

  // act
  auto result = gopt::resolve(settings_);

  // assert
  EXPECT_FALSE(result.tuning().fitness_scale.has_value());
}

TEST_F(configuration_tests, explicit_scale_factor) {
  // arrange
  settings_.fitness_scale = 2.5;

  // act
  auto result = gopt::resolve(settings_);

  // assert
  ASSERT_TRUE(result.tuning().fitness_scale.has_value());
  EXPECT_EQ(*result.tuning().fitness_scale, 2.5);
}

TEST_F(configuration_tests, scale_factor_must_exceed_one) {
  // arrange
  settings_.fitness_scale = 1.;

  // act & assert
  EXPECT_THROW(gopt::resolve(settings_), gopt::configuration_error);
}

} // namespace tests::configuration
