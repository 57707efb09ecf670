#pragma once

#include "population.hpp"

#include <cassert>

namespace gopt::select {

// fitness proportionate selection over scaled fitness that skips excluded
// individuals
template<random_source Source>
class roulette {
public:
  using source_t = Source;

public:
  inline explicit roulette(source_t& source) noexcept
      : source_{&source} {
  }

  template<allele Allele>
  std::size_t operator()(population<Allele> const& population,
                         exclusion const& excluded) const {
    auto const& individuals = population.individuals();
    assert(excluded.size() < individuals.size());

    real_fitness_totalizator<double> total{};
    for (std::size_t i{0}; i < individuals.size(); ++i) {
      if (!excluded.contains(i)) {
        total = total.add(get_fitness(individuals[i]));
      }
    }

    auto limit = source_->uniform() * total.sum();

    double partial{0.};
    for (std::size_t i{0}; i < individuals.size(); ++i) {
      if (excluded.contains(i)) {
        continue;
      }

      partial += get_fitness(individuals[i]);
      if (partial >= limit) {
        return i;
      }
    }

    // rounding kept the running sum below the limit
    for (auto i = individuals.size(); i > 0; --i) {
      if (!excluded.contains(i - 1)) {
        return i - 1;
      }
    }

    return individuals.size() - 1;
  }

private:
  template<typename Individual>
  inline static double get_fitness(Individual const& individual) noexcept {
    return individual.evaluation().get(scaled_fitness);
  }

private:
  source_t* source_;
};

} // namespace gopt::select
