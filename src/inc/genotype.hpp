#pragma once

#include "chromosome.hpp"
#include "fitness.hpp"
#include "sampling.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <ostream>
#include <string>

namespace gopt {

enum class encoding { standard, continuous, permutation };

template<allele Allele>
class genotype {
public:
  using allele_t = Allele;
  using alphabet_t = gopt::alphabet<allele_t>;
  using chromosome_t = gopt::chromosome<allele_t>;
  using genome_t = std::vector<chromosome_t>;

public:
  genotype(alphabet_t const& alphabet, genome_t genome, bool pmx = false)
      : alphabet_{alphabet}
      , genome_{std::move(genome)}
      , pmx_{pmx} {
    validate();
  }

  template<random_source Source>
  static genotype random(alphabet_t const& alphabet,
                         std::vector<std::size_t> const& lengths,
                         std::size_t sets,
                         bool pmx,
                         Source& source) {
    genome_t genome;
    genome.reserve(lengths.size());

    for (auto length : lengths) {
      auto& chromo = genome.emplace_back(length, sets);

      for (std::size_t set{0}; set < sets; ++set) {
        auto column = chromo.column(set);

        if (pmx) {
          auto order = permutation(source, length);
          std::ranges::transform(order, column.begin(), [&alphabet](auto idx) {
            return alphabet[idx];
          });
        }
        else if (alphabet.continuous()) {
          std::ranges::generate(column, [&source] {
            return static_cast<allele_t>(source.uniform());
          });
        }
        else {
          std::ranges::generate(column, [&source, &alphabet] {
            return alphabet[source.index(0, alphabet.size() - 1)];
          });
        }
      }
    }

    return genotype{alphabet, std::move(genome), pmx, trusted_t{}};
  }

  static genotype filled(alphabet_t const& alphabet,
                         std::vector<std::size_t> const& lengths,
                         std::size_t sets,
                         allele_t const& value) {
    genome_t genome;
    genome.reserve(lengths.size());

    for (auto length : lengths) {
      genome.emplace_back(length, sets, value);
    }

    return genotype{alphabet, std::move(genome), false};
  }

  inline genome_t const& genome() const noexcept {
    return genome_;
  }

  inline chromosome_t const& chromosome(std::size_t index) const noexcept {
    return genome_[index];
  }

  inline chromosome_t& chromosome(std::size_t index) noexcept {
    return genome_[index];
  }

  inline std::size_t chromosome_count() const noexcept {
    return genome_.size();
  }

  std::vector<std::size_t> lengths() const {
    std::vector<std::size_t> result;
    result.reserve(genome_.size());

    for (auto const& chromo : genome_) {
      result.push_back(chromo.length());
    }

    return result;
  }

  inline std::size_t ploidy() const noexcept {
    return genome_.front().sets();
  }

  inline bool haploid() const noexcept {
    return ploidy() == 1;
  }

  inline alphabet_t const& alphabet() const noexcept {
    return alphabet_;
  }

  inline std::size_t alphabet_size() const noexcept {
    return alphabet_.size();
  }

  inline bool printable() const {
    return alphabet_.printable();
  }

  inline bool pmx() const noexcept {
    return pmx_;
  }

  inline gopt::encoding encoding() const noexcept {
    if (pmx_) {
      return gopt::encoding::permutation;
    }

    return alphabet_.continuous() ? gopt::encoding::continuous
                                  : gopt::encoding::standard;
  }

  inline gopt::evaluation& evaluation() noexcept {
    return evaluation_;
  }

  inline gopt::evaluation const& evaluation() const noexcept {
    return evaluation_;
  }

  inline bool evaluated() const noexcept {
    return evaluation_.evaluated();
  }

  // genes changed, fitness has to be evaluated again
  inline void clear_evaluation() noexcept {
    evaluation_ = {};
  }

  std::string to_string() const {
    std::string result;

    for (auto const& chromo : genome_) {
      if (!result.empty()) {
        result += ", ";
      }

      if (pmx_ || alphabet_.continuous()) {
        result += fmt::format("{}", fmt::join(chromo.column(0), " "));
      }
      else if (chromo.sets() == 1) {
        result += fmt::format("{}", fmt::join(chromo.column(0), ""));
      }
      else {
        result += fmt::format("({}),({})",
                              fmt::join(chromo.column(0), ""),
                              fmt::join(chromo.column(1), ""));
      }
    }

    return result;
  }

  inline bool operator==(genotype const& other) const {
    return genome_ == other.genome_;
  }

private:
  struct trusted_t {};

  inline genotype(alphabet_t const& alphabet,
                  genome_t genome,
                  bool pmx,
                  trusted_t /*unused*/) noexcept
      : alphabet_{alphabet}
      , genome_{std::move(genome)}
      , pmx_{pmx} {
  }

  void validate() const {
    if (genome_.empty()) {
      throw configuration_error{"genotype needs at least one chromosome"};
    }

    auto sets = genome_.front().sets();
    if (sets != 1 && sets != 2) {
      throw configuration_error{
          fmt::format("chromosome sets must be 1 or 2, got {}", sets)};
    }

    for (auto const& chromo : genome_) {
      if (chromo.sets() != sets) {
        throw configuration_error{
            "all chromosomes need the same number of sets"};
      }

      if (chromo.length() == 0) {
        throw configuration_error{"chromosome length must be positive"};
      }

      for (auto const& value : chromo.alleles()) {
        if (!alphabet_.contains(value)) {
          throw configuration_error{
              fmt::format("allele {} is not part of the alphabet", value)};
        }
      }

      if (pmx_ && !is_permutation(chromo)) {
        throw configuration_error{
            "permutation genotype requires every chromosome to be a "
            "permutation of the alphabet"};
      }
    }
  }

  inline bool is_permutation(chromosome_t const& chromo) const {
    auto const& symbols = alphabet_.symbols();
    return chromo.sets() == 1 && chromo.length() == symbols.size() &&
           std::ranges::is_permutation(chromo.column(0), symbols);
  }

private:
  alphabet_t alphabet_;
  genome_t genome_;
  bool pmx_;
  gopt::evaluation evaluation_{};
};

template<allele Allele>
inline std::ostream& operator<<(std::ostream& stream,
                                genotype<Allele> const& value) {
  return stream << value.to_string();
}

} // namespace gopt
