#pragma once

#include "genotype.hpp"
#include "statistics.hpp"

#include <algorithm>
#include <cassert>

namespace gopt::mutate {

namespace details {

  template<allele Allele>
  inline Allele other_allele(alphabet<Allele> const& symbols,
                             Allele const& current,
                             std::size_t draw) {
    auto excluded = symbols.index_of(current);
    assert(excluded.has_value());

    return symbols[draw >= *excluded ? draw + 1 : draw];
  }

} // namespace details

// changes single genes, every allele of every gene mutates independently
template<random_source Source>
class point {
public:
  using source_t = Source;

public:
  inline point(source_t& source,
               double probability,
               double sigma,
               stats::counters& counters) noexcept
      : source_{&source}
      , probability_{probability}
      , sigma_{sigma}
      , counters_{&counters} {
  }

  template<allele Allele>
  void operator()(genotype<Allele>& target) const {
    if (probability_ <= 0.) {
      return;
    }

    auto kind = target.encoding();

    // a swap touches two genes
    probabilistic_operation<source_t> mutate{
        *source_,
        kind == encoding::permutation ? probability_ / 2. : probability_};

    for (std::size_t i{0}; i < target.chromosome_count(); ++i) {
      auto& chromo = target.chromosome(i);

      for (std::size_t j{0}; j < chromo.length(); ++j) {
        for (std::size_t set{0}; set < chromo.sets(); ++set) {
          if (mutate()) {
            apply(target.alphabet(), kind, chromo.column(set), j);
          }
        }
      }
    }
  }

private:
  template<allele Allele>
  void apply(alphabet<Allele> const& symbols,
             encoding kind,
             std::span<Allele> genes,
             std::size_t position) const {
    auto& gene = genes[position];

    switch (kind) {
    case encoding::permutation:
      std::swap(gene, genes[source_->index(0, genes.size() - 1)]);
      counters_->add(mutation_count_tag, 2);
      return;

    case encoding::continuous:
      gene = static_cast<Allele>(std::clamp(
          static_cast<double>(gene) + source_->normal(0., sigma_), 0., 1.));
      break;

    case encoding::standard:
      if (symbols.size() == 2) {
        gene = details::other_allele(symbols, gene, 0);
      }
      else {
        gene = details::other_allele(
            symbols, gene, source_->index(0, symbols.size() - 2));
      }
      break;
    }

    counters_->add(mutation_count_tag);
  }

private:
  source_t* source_;
  double probability_;
  double sigma_;
  stats::counters* counters_;
};

// reverses the genes between two random positions of a chromosome set
template<random_source Source>
class inversion {
public:
  using source_t = Source;

public:
  inline inversion(source_t& source,
                   double probability,
                   stats::counters& counters) noexcept
      : source_{&source}
      , probability_{source, probability}
      , counters_{&counters} {
  }

  template<allele Allele>
  void operator()(genotype<Allele>& target) const {
    if (probability_.probability() <= 0.) {
      return;
    }

    for (std::size_t i{0}; i < target.chromosome_count(); ++i) {
      auto& chromo = target.chromosome(i);

      for (std::size_t set{0}; set < chromo.sets(); ++set) {
        if (!probability_()) {
          continue;
        }

        auto genes = chromo.column(set);
        auto j1 = source_->index(0, genes.size() - 1);
        auto j2 = source_->index(0, genes.size() - 1);

        auto [low, high] = std::minmax(j1, j2);
        std::ranges::reverse(genes.subspan(low, high - low + 1));

        counters_->add(inversion_count_tag);
      }
    }
  }

private:
  source_t* source_;
  probabilistic_operation<source_t> probability_;
  stats::counters* counters_;
};

} // namespace gopt::mutate
