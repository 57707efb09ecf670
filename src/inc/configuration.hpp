#pragma once

#include "genotype.hpp"
#include "logging.hpp"
#include "operation.hpp"

#include <cstdint>
#include <optional>
#include <variant>

namespace gopt {

struct automatic_scaling {};
struct no_scaling {};

// default factor, disabled factor or an explicit factor greater than one
using scaling_option = std::variant<automatic_scaling, no_scaling, double>;

inline constexpr double default_scale_factor = 1.6;

// knobs that can be adjusted between generations
struct tuning {
  double crossover_probability;
  double mutation_probability;
  double inversion_probability;
  double population_growth;
  double overpopulation;
  std::optional<double> fitness_scale;
  double float_sigma;
  double float_sigma_adapt;
};

template<allele Allele>
struct settings {
  using allele_t = Allele;
  using alphabet_t = gopt::alphabet<allele_t>;

  std::size_t chromosomes{1};

  // single length is shared by all chromosomes
  std::vector<std::size_t> lengths{};

  std::size_t population_size{};

  // defaults to [0, 1] for haploid, [-1, 0, 1] for diploid and to the gene
  // positions for permutations
  std::optional<alphabet_t> alleles{};

  bool pmx{false};

  std::optional<double> crossover_probability{};
  std::optional<double> mutation_probability{};
  double inversion_probability{0.};

  double population_growth{1.};
  double overpopulation{1.3};

  std::size_t chromosome_sets{1};

  scaling_option fitness_scale{automatic_scaling{}};

  bool monogamous{false};
  std::size_t children{2};
  bool immortal{true};

  double float_sigma{1.2};
  double float_sigma_adapt{0.85};

  bool parallel{false};

  std::optional<std::uint64_t> seed{};
};

namespace details {

  inline void require(bool condition, std::string_view message) {
    if (!condition) {
      throw configuration_error{std::string{message}};
    }
  }

  inline void require_probability(double value, std::string_view name) {
    if (!valid_probability(value)) {
      throw configuration_error{
          fmt::format("{} must be in [0, 1], got {}", name, value)};
    }
  }

  inline void require_positive(double value, std::string_view name) {
    if (!(value > 0.)) {
      throw configuration_error{
          fmt::format("{} must be positive, got {}", name, value)};
    }
  }

  inline void require_scale(std::optional<double> const& factor) {
    if (factor && !(*factor > 1.)) {
      throw configuration_error{fmt::format(
          "fitness scale must be greater than 1, got {}", *factor)};
    }
  }

  struct probability_defaults {
    double crossover;
    double mutation;
  };

  inline probability_defaults get_defaults(encoding kind) noexcept {
    switch (kind) {
    case encoding::continuous:
      return {0.0, 0.3};
    case encoding::permutation:
      return {0.9, 0.4};
    default:
      return {0.6, 0.0333};
    }
  }

} // namespace details

// throws configuration_error when a knob is out of its range
inline void validate(tuning const& knobs) {
  details::require_probability(knobs.crossover_probability,
                               "crossover probability");
  details::require_probability(knobs.mutation_probability,
                               "mutation probability");
  details::require_probability(knobs.inversion_probability,
                               "inversion probability");

  details::require_positive(knobs.population_growth, "population growth");
  details::require_positive(knobs.overpopulation, "overpopulation");
  details::require_positive(knobs.float_sigma, "float sigma");
  details::require_positive(knobs.float_sigma_adapt, "float sigma adaptation");

  details::require_scale(knobs.fitness_scale);
}

template<allele Allele>
class configuration {
public:
  using allele_t = Allele;
  using alphabet_t = gopt::alphabet<allele_t>;
  using settings_t = gopt::settings<allele_t>;

public:
  explicit configuration(settings_t const& settings)
      : population_size_{settings.population_size}
      , lengths_{resolve_lengths(settings)}
      , sets_{settings.chromosome_sets}
      , pmx_{settings.pmx}
      , alphabet_{resolve_alphabet(settings, lengths_)}
      , monogamous_{settings.monogamous}
      , children_{settings.children}
      , immortal_{settings.immortal}
      , parallel_{settings.parallel}
      , seed_{settings.seed} {
    validate();
    tuning_ = resolve_tuning(settings);

    logger()->debug("configuration: chromosomes: {}, lengths: [{}], sets: {}, "
                    "population: {}, alphabet size: {}, pmx: {}",
                    lengths_.size(),
                    fmt::join(lengths_, ", "),
                    sets_,
                    population_size_,
                    describe_alphabet_size(),
                    pmx_);
  }

  inline std::size_t population_size() const noexcept {
    return population_size_;
  }

  inline std::size_t chromosomes() const noexcept {
    return lengths_.size();
  }

  inline std::vector<std::size_t> const& lengths() const noexcept {
    return lengths_;
  }

  inline std::size_t chromosome_sets() const noexcept {
    return sets_;
  }

  inline alphabet_t const& alphabet() const noexcept {
    return alphabet_;
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

  inline bool monogamous() const noexcept {
    return monogamous_;
  }

  inline std::size_t children() const noexcept {
    return children_;
  }

  inline bool immortal() const noexcept {
    return immortal_;
  }

  inline bool parallel() const noexcept {
    return parallel_;
  }

  inline std::optional<std::uint64_t> const& seed() const noexcept {
    return seed_;
  }

  // initial values of the adjustable knobs
  inline gopt::tuning const& tuning() const noexcept {
    return tuning_;
  }

private:
  static std::vector<std::size_t> resolve_lengths(settings_t const& settings) {
    details::require(settings.chromosomes > 0,
                     "number of chromosomes must be positive");
    details::require(!settings.lengths.empty(),
                     "chromosome lengths are missing");

    auto lengths = settings.lengths;
    if (lengths.size() == 1) {
      lengths.resize(settings.chromosomes, lengths.front());
    }

    if (lengths.size() != settings.chromosomes) {
      throw configuration_error{
          fmt::format("{} chromosome lengths given for {} chromosomes",
                      settings.lengths.size(),
                      settings.chromosomes)};
    }

    details::require(std::ranges::find(lengths, 0) == lengths.end(),
                     "chromosome length must be positive");

    return lengths;
  }

  static alphabet_t resolve_alphabet(settings_t const& settings,
                                     std::vector<std::size_t> const& lengths) {
    if (settings.alleles) {
      return *settings.alleles;
    }

    if constexpr (std::same_as<allele_t, char>) {
      throw configuration_error{"character alleles require an alphabet"};
    }
    else {
      if (settings.pmx) {
        typename alphabet_t::symbols_t positions(lengths.front());
        for (std::size_t i{0}; i < positions.size(); ++i) {
          positions[i] = static_cast<allele_t>(i);
        }

        return alphabet_t{std::move(positions)};
      }

      if (settings.chromosome_sets == 2) {
        if constexpr (std::is_signed_v<allele_t>) {
          return alphabet_t{-1, 0, 1};
        }
        else {
          throw configuration_error{
              "default diploid alphabet requires signed alleles"};
        }
      }

      return alphabet_t{0, 1};
    }
  }

  void validate() const {
    details::require(population_size_ > 0, "population size must be positive");

    if (sets_ != 1 && sets_ != 2) {
      throw configuration_error{
          fmt::format("chromosome sets must be 1 or 2, got {}", sets_)};
    }

    if (children_ == 0 || children_ % 2 != 0) {
      throw configuration_error{fmt::format(
          "number of children must be even and positive, got {}", children_)};
    }

    if (alphabet_.continuous()) {
      details::require(sets_ == 1,
                       "continuous alphabet requires haploid chromosomes");
    }

    if (pmx_) {
      details::require(!alphabet_.continuous(),
                       "partially matched crossover requires a discrete "
                       "alphabet");
      details::require(sets_ == 1,
                       "partially matched crossover requires haploid "
                       "chromosomes");
      details::require(children_ == 2,
                       "partially matched crossover produces two children");

      for (auto length : lengths_) {
        if (length != alphabet_.size()) {
          throw configuration_error{fmt::format(
              "partially matched crossover requires chromosome length {} to "
              "match alphabet size {}",
              length,
              alphabet_.size())};
        }
      }
    }
  }

  gopt::tuning resolve_tuning(settings_t const& settings) const {
    auto defaults = details::get_defaults(encoding());

    gopt::tuning result{
        settings.crossover_probability.value_or(defaults.crossover),
        settings.mutation_probability.value_or(defaults.mutation),
        settings.inversion_probability,
        settings.population_growth,
        settings.overpopulation,
        resolve_scale(settings.fitness_scale),
        settings.float_sigma,
        settings.float_sigma_adapt};

    gopt::validate(result);
    return result;
  }

  std::optional<double> resolve_scale(scaling_option const& option) const {
    if (std::holds_alternative<no_scaling>(option)) {
      return std::nullopt;
    }

    if (auto const* factor = std::get_if<double>(&option); factor != nullptr) {
      details::require_scale(*factor);
      return *factor;
    }

    if (encoding() != gopt::encoding::standard || alphabet_.printable()) {
      return std::nullopt;
    }

    return default_scale_factor;
  }

  inline std::string describe_alphabet_size() const {
    return alphabet_.continuous() ? std::string{"unbounded"}
                                  : fmt::format("{}", alphabet_.size());
  }

private:
  std::size_t population_size_;
  std::vector<std::size_t> lengths_;
  std::size_t sets_;
  bool pmx_;
  alphabet_t alphabet_;
  bool monogamous_;
  std::size_t children_;
  bool immortal_;
  bool parallel_;
  std::optional<std::uint64_t> seed_;
  gopt::tuning tuning_{};
};

template<allele Allele>
inline configuration<Allele> resolve(settings<Allele> const& settings) {
  return configuration<Allele>{settings};
}

} // namespace gopt
