#pragma once

#include "crossover.hpp"
#include "selection.hpp"

#include <optional>

namespace gopt::couple {

// separates a diploid genotype into its two haploid gametes
template<allele Allele>
std::pair<genotype<Allele>, genotype<Allele>>
    split(genotype<Allele> const& parent) {
  using chromosome_t = typename genotype<Allele>::chromosome_t;
  using collection_t = typename chromosome_t::collection_t;
  using genome_t = typename genotype<Allele>::genome_t;

  assert(parent.ploidy() == 2);

  genome_t first, second;
  first.reserve(parent.chromosome_count());
  second.reserve(parent.chromosome_count());

  for (auto const& chromo : parent.genome()) {
    auto column0 = chromo.column(0);
    auto column1 = chromo.column(1);

    first.push_back(
        chromosome_t::haploid(collection_t(column0.begin(), column0.end())));
    second.push_back(
        chromosome_t::haploid(collection_t(column1.begin(), column1.end())));
  }

  return {genotype<Allele>{parent.alphabet(), std::move(first)},
          genotype<Allele>{parent.alphabet(), std::move(second)}};
}

// joins maternal and paternal gametes into a diploid genotype
template<allele Allele>
genotype<Allele> fertilize(genotype<Allele> const& maternal,
                           genotype<Allele> const& paternal) {
  using chromosome_t = typename genotype<Allele>::chromosome_t;
  using genome_t = typename genotype<Allele>::genome_t;

  assert(maternal.chromosome_count() == paternal.chromosome_count());

  genome_t genome;
  genome.reserve(maternal.chromosome_count());

  for (std::size_t i{0}; i < maternal.chromosome_count(); ++i) {
    auto mat = maternal.chromosome(i).column(0);
    auto pat = paternal.chromosome(i).column(0);

    auto& chromo = genome.emplace_back(mat.size(), 2);
    std::ranges::copy(mat, chromo.column(0).begin());
    std::ranges::copy(pat, chromo.column(1).begin());
  }

  return genotype<Allele>{maternal.alphabet(), std::move(genome)};
}

// gametes of both parents are crossed over and fertilized one-to-one
template<random_source Source>
class meiosis {
public:
  using source_t = Source;

public:
  inline meiosis(source_t& source,
                 double probability,
                 stats::counters& counters) noexcept
      : crossover_{source, probability, counters} {
  }

  template<allele Allele>
  std::vector<genotype<Allele>> operator()(genotype<Allele> const& mother,
                                           genotype<Allele> const& father,
                                           std::size_t children) const {
    auto [mat1, mat2] = split(mother);
    auto maternal = crossover_(mat1, mat2, children);

    auto [pat1, pat2] = split(father);
    auto paternal = crossover_(pat1, pat2, children);

    std::vector<genotype<Allele>> result;
    result.reserve(children);

    for (std::size_t i{0}; i < children; ++i) {
      result.push_back(fertilize(maternal[i], paternal[i]));
    }

    return result;
  }

private:
  cross::singlepoint<source_t> crossover_;
};

// picks mating pairs and tracks which individuals are already taken
template<random_source Source>
class matchmaker {
public:
  using source_t = Source;

public:
  inline matchmaker(source_t& source,
                    bool monogamous,
                    std::size_t population_size)
      : selection_{source}
      , monogamous_{monogamous}
      , excluded_{population_size} {
  }

  template<allele Allele>
  std::pair<std::size_t, std::size_t>
      operator()(population<Allele> const& population) {
    auto size = population.current_size();

    auto first = selection_(population, excluded_);
    excluded_.insert(first);

    // nobody left to pick, so everybody is available again
    if (excluded_.size() >= size) {
      excluded_.clear();
    }

    auto second = selection_(population, excluded_);

    if (monogamous_) {
      excluded_.insert(second);
    }
    else {
      excluded_.clear();
    }

    if (excluded_.size() >= size) {
      divorce_rate_ = (static_cast<double>(size) -
                       static_cast<double>(excluded_.size())) /
                      static_cast<double>(size);
      excluded_.clear();
    }

    return {first, second};
  }

  // reported only for monogamous mating
  inline std::optional<double> divorce_rate() const noexcept {
    if (!monogamous_) {
      return std::nullopt;
    }

    return divorce_rate_;
  }

private:
  select::roulette<source_t> selection_;
  bool monogamous_;
  exclusion excluded_;
  double divorce_rate_{0.};
};

} // namespace gopt::couple
