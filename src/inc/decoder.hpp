#pragma once

#include "genotype.hpp"

#include <cmath>
#include <string>
#include <variant>

namespace gopt {

enum class phenotype_kind : std::size_t {
  scalar,
  sequence,
  sequences,
  real,
  reals,
  text,
  texts
};

// value produced by the generic decoder for the objective function
template<allele Allele>
class phenotype {
public:
  using allele_t = Allele;
  using sequence_t = std::vector<allele_t>;

  using value_t = std::variant<allele_t,
                               sequence_t,
                               std::vector<sequence_t>,
                               double,
                               std::vector<double>,
                               std::string,
                               std::vector<std::string>>;

public:
  template<phenotype_kind Kind, typename... Args>
  inline static phenotype make(Args&&... args) {
    return phenotype{
        value_t{std::in_place_index<static_cast<std::size_t>(Kind)>,
                std::forward<Args>(args)...}};
  }

  inline phenotype_kind kind() const noexcept {
    return static_cast<phenotype_kind>(value_.index());
  }

  inline allele_t const& scalar() const {
    return get<phenotype_kind::scalar>();
  }

  inline sequence_t const& sequence() const {
    return get<phenotype_kind::sequence>();
  }

  inline std::vector<sequence_t> const& sequences() const {
    return get<phenotype_kind::sequences>();
  }

  inline double real() const {
    return get<phenotype_kind::real>();
  }

  inline std::vector<double> const& reals() const {
    return get<phenotype_kind::reals>();
  }

  inline std::string const& text() const {
    return get<phenotype_kind::text>();
  }

  inline std::vector<std::string> const& texts() const {
    return get<phenotype_kind::texts>();
  }

  std::string to_string() const {
    switch (kind()) {
    case phenotype_kind::scalar:
      return fmt::format("{}", scalar());
    case phenotype_kind::sequence:
      return fmt::format("[{}]", fmt::join(sequence(), ", "));
    case phenotype_kind::sequences:
      return fmt::format("{}", sequences());
    case phenotype_kind::real:
      return fmt::format("{}", real());
    case phenotype_kind::reals:
      return fmt::format("[{}]", fmt::join(reals(), ", "));
    case phenotype_kind::text:
      return text();
    case phenotype_kind::texts:
      return fmt::format("{}", texts());
    }

    return {};
  }

private:
  inline explicit phenotype(value_t value)
      : value_{std::move(value)} {
  }

  template<phenotype_kind Kind>
  inline auto const& get() const {
    return std::get<static_cast<std::size_t>(Kind)>(value_);
  }

private:
  value_t value_;
};

namespace details {

  template<std::ranges::range Genes, typename Express>
  double binary_fraction(Genes const& genes, Express&& express) {
    auto length = static_cast<int>(std::ranges::size(genes));

    double accumulated{0.};
    auto power = length - 1;
    for (auto const& gene : genes) {
      accumulated += express(gene) * std::ldexp(1., power--);
    }

    return accumulated / (std::ldexp(1., length) - 1.);
  }

  template<allele Allele>
  void require_haploid(genotype<Allele> const& target, char const* kind) {
    if (!target.haploid()) {
      throw unsupported_encoding{
          fmt::format("only haploid chromosomes can be decoded for {} "
                      "genotypes",
                      kind)};
    }
  }

} // namespace details

// maps genotypes onto reals in the unit interval, allele sequences or text
template<allele Allele>
class generic_decoder {
public:
  using allele_t = Allele;
  using genotype_t = genotype<allele_t>;
  using phenotype_t = phenotype<allele_t>;

public:
  phenotype_t operator()(genotype_t const& target) const {
    if (target.alphabet().continuous() || target.pmx()) {
      details::require_haploid(target, "continuous and permutation");
      return decode_sequences(target);
    }

    if (target.printable()) {
      details::require_haploid(target, "character");
      return decode_text(target);
    }

    return decode_binary(target);
  }

private:
  static phenotype_t decode_sequences(genotype_t const& target) {
    using sequence_t = typename phenotype_t::sequence_t;

    auto const& genome = target.genome();
    if (genome.size() == 1) {
      auto genes = genome.front().column(0);
      if (genes.size() == 1) {
        return phenotype_t::template make<phenotype_kind::scalar>(genes[0]);
      }

      return phenotype_t::template make<phenotype_kind::sequence>(
          genes.begin(), genes.end());
    }

    std::vector<sequence_t> result;
    result.reserve(genome.size());
    for (auto const& chromo : genome) {
      auto genes = chromo.column(0);
      result.emplace_back(genes.begin(), genes.end());
    }

    return phenotype_t::template make<phenotype_kind::sequences>(
        std::move(result));
  }

  static phenotype_t decode_text(genotype_t const& target) {
    auto const& genome = target.genome();
    if (genome.size() == 1) {
      auto genes = genome.front().column(0);
      return phenotype_t::template make<phenotype_kind::text>(genes.begin(),
                                                              genes.end());
    }

    std::vector<std::string> result;
    result.reserve(genome.size());
    for (auto const& chromo : genome) {
      auto genes = chromo.column(0);
      result.emplace_back(genes.begin(), genes.end());
    }

    return phenotype_t::template make<phenotype_kind::texts>(std::move(result));
  }

  static bool ternary(alphabet<allele_t> const& symbols) {
    if constexpr (std::is_signed_v<allele_t>) {
      return symbols.equals({-1, 0, 1});
    }
    else {
      return false;
    }
  }

  static phenotype_t decode_binary(genotype_t const& target) {
    std::vector<double> result;
    result.reserve(target.chromosome_count());

    if (target.haploid()) {
      if (!target.alphabet().equals({0, 1})) {
        throw unsupported_encoding{
            "haploid chromosomes can only be decoded with alphabet [0, 1]"};
      }

      for (auto const& chromo : target.genome()) {
        result.push_back(details::binary_fraction(
            chromo.column(0), [](allele_t bit) { return bit; }));
      }
    }
    else {
      if (!ternary(target.alphabet())) {
        throw unsupported_encoding{
            "diploid chromosomes can only be decoded with alphabet [-1, 0, 1]"};
      }

      // -1 is recessive and only expressed as 1 when both sets carry it
      for (auto const& chromo : target.genome()) {
        auto dominant = chromo.column(0);
        auto recessive = chromo.column(1);

        std::vector<allele_t> expressed(chromo.length());
        for (std::size_t i{0}; i < chromo.length(); ++i) {
          auto top = std::max(dominant[i], recessive[i]);
          expressed[i] = top < 0 ? -top : top;
        }

        result.push_back(details::binary_fraction(
            expressed, [](allele_t bit) { return bit; }));
      }
    }

    if (result.size() == 1) {
      return phenotype_t::template make<phenotype_kind::real>(result.front());
    }

    return phenotype_t::template make<phenotype_kind::reals>(std::move(result));
  }
};

template<allele Allele>
inline std::ostream& operator<<(std::ostream& stream,
                                phenotype<Allele> const& value) {
  return stream << value.to_string();
}

} // namespace gopt
