#include <decoder.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace tests::decoder {

using genotype_t = gopt::genotype<int>;
using chromosome_t = genotype_t::chromosome_t;
using phenotype_t = gopt::phenotype<int>;

struct decoder_tests : public ::testing::Test {
protected:
  gopt::alphabet<int> binary_{0, 1};
  gopt::alphabet<int> ternary_{-1, 0, 1};

  gopt::generic_decoder<int> decode_{};
};

TEST_F(decoder_tests, binary_fraction_of_single_chromosome) {
  // arrange
  genotype_t target{binary_, {chromosome_t{1, 0, 1}}};

  // act
  auto result = decode_(target);

  // assert
  ASSERT_EQ(result.kind(), gopt::phenotype_kind::real);
  EXPECT_DOUBLE_EQ(result.real(), 5. / 7.);
}

TEST_F(decoder_tests, binary_fraction_bounds) {
  // arrange
  genotype_t zeros{binary_, {chromosome_t{0, 0, 0, 0}}};
  genotype_t ones{binary_, {chromosome_t{1, 1, 1, 1}}};

  // act
  auto low = decode_(zeros);
  auto high = decode_(ones);

  // assert
  EXPECT_DOUBLE_EQ(low.real(), 0.);
  EXPECT_DOUBLE_EQ(high.real(), 1.);
}

TEST_F(decoder_tests, binary_fraction_per_chromosome) {
  // arrange
  genotype_t target{binary_, {chromosome_t{1, 0}, chromosome_t{0, 1, 1}}};

  // act
  auto result = decode_(target);

  // assert
  ASSERT_EQ(result.kind(), gopt::phenotype_kind::reals);
  EXPECT_THAT(result.reals(),
              ::testing::ElementsAre(::testing::DoubleEq(2. / 3.),
                                     ::testing::DoubleEq(3. / 7.)));
}

TEST_F(decoder_tests, binary_decoding_is_pure) {
  // arrange
  genotype_t target{binary_, {chromosome_t{0, 1, 1, 0, 1}}};

  // act
  auto first = decode_(target);
  auto second = decode_(target);

  // assert
  EXPECT_EQ(first.real(), second.real());
  EXPECT_GE(first.real(), 0.);
  EXPECT_LE(first.real(), 1.);
}

TEST_F(decoder_tests, diploid_dominance) {
  // arrange
  genotype_t dominant{ternary_, {chromosome_t{{1, -1}}}};
  genotype_t neutral{ternary_, {chromosome_t{{0, 0}}}};
  genotype_t recessive{ternary_, {chromosome_t{{-1, -1}}}};
  genotype_t masked{ternary_, {chromosome_t{{-1, 0}}}};

  // act & assert
  EXPECT_DOUBLE_EQ(decode_(dominant).real(), 1.);
  EXPECT_DOUBLE_EQ(decode_(neutral).real(), 0.);
  EXPECT_DOUBLE_EQ(decode_(recessive).real(), 1.);
  EXPECT_DOUBLE_EQ(decode_(masked).real(), 0.);
}

TEST_F(decoder_tests, diploid_binary_fraction) {
  // arrange
  genotype_t target{ternary_, {chromosome_t{{1, -1}, {0, 0}, {-1, -1}}}};

  // act
  auto result = decode_(target);

  // assert
  EXPECT_DOUBLE_EQ(result.real(), 5. / 7.);
}

TEST_F(decoder_tests, unsupported_haploid_alphabet) {
  // arrange
  genotype_t target{ternary_, {chromosome_t{1, 0, -1}}};

  // act & assert
  EXPECT_THROW(decode_(target), gopt::unsupported_encoding);
}

TEST_F(decoder_tests, unsupported_diploid_alphabet) {
  // arrange
  genotype_t target{binary_, {chromosome_t{{1, 0}, {0, 0}}}};

  // act & assert
  EXPECT_THROW(decode_(target), gopt::unsupported_encoding);
}

TEST_F(decoder_tests, permutation_sequence) {
  // arrange
  gopt::alphabet<int> positions{0, 1, 2, 3};
  genotype_t target{positions, {chromosome_t{3, 1, 0, 2}}, true};

  // act
  auto result = decode_(target);

  // assert
  ASSERT_EQ(result.kind(), gopt::phenotype_kind::sequence);
  EXPECT_THAT(result.sequence(), ::testing::ElementsAre(3, 1, 0, 2));
}

TEST_F(decoder_tests, continuous_sequences) {
  // arrange
  gopt::alphabet<double> interval{gopt::unit_interval};
  gopt::genotype<double> target{interval,
                                {gopt::chromosome<double>{0.5, 0.25},
                                 gopt::chromosome<double>{0.75}}};

  // act
  auto result = gopt::generic_decoder<double>{}(target);

  // assert
  ASSERT_EQ(result.kind(), gopt::phenotype_kind::sequences);
  EXPECT_THAT(result.sequences(),
              ::testing::ElementsAre(::testing::ElementsAre(0.5, 0.25),
                                     ::testing::ElementsAre(0.75)));
}

TEST_F(decoder_tests, continuous_single_gene) {
  // arrange
  gopt::alphabet<double> interval{gopt::unit_interval};
  gopt::genotype<double> target{interval, {gopt::chromosome<double>{0.125}}};

  // act
  auto result = gopt::generic_decoder<double>{}(target);

  // assert
  ASSERT_EQ(result.kind(), gopt::phenotype_kind::scalar);
  EXPECT_DOUBLE_EQ(result.scalar(), 0.125);
}

TEST_F(decoder_tests, character_text) {
  // arrange
  gopt::genotype<char> target{gopt::alphabets::alnum(),
                              {gopt::chromosome<char>{'a', 'b', '1'}}};

  // act
  auto result = gopt::generic_decoder<char>{}(target);

  // assert
  ASSERT_EQ(result.kind(), gopt::phenotype_kind::text);
  EXPECT_EQ(result.text(), "ab1");
}

TEST_F(decoder_tests, character_texts) {
  // arrange
  gopt::genotype<char> target{
      gopt::alphabets::alpha(),
      {gopt::chromosome<char>{'a', 'b'}, gopt::chromosome<char>{'C'}}};

  // act
  auto result = gopt::generic_decoder<char>{}(target);

  // assert
  EXPECT_THAT(result.texts(), ::testing::ElementsAre("ab", "C"));
}

TEST_F(decoder_tests, diploid_characters_are_unsupported) {
  // arrange
  gopt::genotype<char> target{gopt::alphabets::alpha(),
                              {gopt::chromosome<char>{{'a', 'b'}}}};

  // act & assert
  EXPECT_THROW(gopt::generic_decoder<char>{}(target),
               gopt::unsupported_encoding);
}

TEST_F(decoder_tests, wrong_kind_access_throws) {
  // arrange
  genotype_t target{binary_, {chromosome_t{1, 0, 1}}};
  auto result = decode_(target);

  // act & assert
  EXPECT_THROW(result.text(), std::bad_variant_access);
}

} // namespace tests::decoder
