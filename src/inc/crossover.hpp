#pragma once

#include "genotype.hpp"
#include "statistics.hpp"

#include <cassert>
#include <utility>

namespace gopt::cross {

namespace details {

  template<allele Allele>
  inline void splice(std::span<Allele const> left,
                     std::span<Allele const> right,
                     std::size_t point,
                     std::span<Allele> first,
                     std::span<Allele> second) {
    std::ranges::copy(left.first(point), first.begin());
    std::ranges::copy(right.subspan(point), first.begin() + point);

    std::ranges::copy(right.first(point), second.begin());
    std::ranges::copy(left.subspan(point), second.begin() + point);
  }

} // namespace details

// each pair of children splits every chromosome at a single random point
template<random_source Source>
class singlepoint {
public:
  using source_t = Source;

public:
  inline singlepoint(source_t& source,
                     double probability,
                     stats::counters& counters) noexcept
      : source_{&source}
      , probability_{source, probability}
      , counters_{&counters} {
  }

  template<allele Allele>
  std::vector<genotype<Allele>> operator()(genotype<Allele> const& parent1,
                                           genotype<Allele> const& parent2,
                                           std::size_t children) const {
    assert(children % 2 == 0);
    assert(parent1.chromosome_count() == parent2.chromosome_count());

    std::vector<genotype<Allele>> result;
    result.reserve(children);

    for (std::size_t n{0}; n < children; n += 2) {
      result.emplace_back(parent1).clear_evaluation();
      result.emplace_back(parent2).clear_evaluation();

      for (std::size_t i{0}; i < parent1.chromosome_count(); ++i) {
        auto const& left = parent1.chromosome(i);
        auto const& right = parent2.chromosome(i);

        auto point = select_point(left.length());
        if (point == left.length()) {
          continue;
        }

        for (std::size_t set{0}; set < left.sets(); ++set) {
          details::splice(left.column(set),
                          right.column(set),
                          point,
                          result[n].chromosome(i).column(set),
                          result[n + 1].chromosome(i).column(set));
        }
      }
    }

    return result;
  }

private:
  // chromosome length means the chromosome is copied without crossing
  inline std::size_t select_point(std::size_t length) const {
    if (length < 2 || !probability_()) {
      return length;
    }

    counters_->add(crossover_count_tag);
    return source_->index(1, length - 1);
  }

private:
  source_t* source_;
  probabilistic_operation<source_t> probability_;
  stats::counters* counters_;
};

// partially matched crossover that keeps every chromosome a permutation
template<random_source Source>
class partially_matched {
public:
  using source_t = Source;

public:
  inline partially_matched(source_t& source,
                           double probability,
                           stats::counters& counters) noexcept
      : source_{&source}
      , probability_{source, probability}
      , counters_{&counters} {
  }

  template<allele Allele>
  std::pair<genotype<Allele>, genotype<Allele>>
      operator()(genotype<Allele> const& parent1,
                 genotype<Allele> const& parent2) const {
    std::pair result{parent1, parent2};

    result.first.clear_evaluation();
    result.second.clear_evaluation();

    for (std::size_t i{0}; i < parent1.chromosome_count(); ++i) {
      if (!probability_()) {
        continue;
      }

      auto first = result.first.chromosome(i).column(0);
      auto second = result.second.chromosome(i).column(0);

      auto length = first.size();
      auto j1 = source_->index(0, length - 1);
      auto j2 = source_->index(0, length - 1);

      auto [low, high] = std::minmax(j1, j2);
      for (auto j = low; j <= high; ++j) {
        exchange(first, second, j);
      }

      counters_->add(crossover_count_tag);
    }

    return result;
  }

private:
  template<typename Allele>
  static void exchange(std::span<Allele> first,
                       std::span<Allele> second,
                       std::size_t position) {
    auto allele1 = first[position];
    auto allele2 = second[position];

    if (allele1 == allele2) {
      return;
    }

    auto displaced1 = std::ranges::find(first, allele2);
    auto displaced2 = std::ranges::find(second, allele1);

    assert(displaced1 != first.end() && displaced2 != second.end());

    *displaced1 = allele1;
    *displaced2 = allele2;

    first[position] = allele2;
    second[position] = allele1;
  }

private:
  source_t* source_;
  probabilistic_operation<source_t> probability_;
  stats::counters* counters_;
};

} // namespace gopt::cross
