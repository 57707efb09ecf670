#pragma once

#include "population.hpp"

#include <numeric>

namespace gopt {
namespace replace {

  // keeps the fittest individuals of the pool in random order
  template<random_source Source>
  class fittest {
  public:
    using source_t = Source;

  public:
    inline explicit fittest(source_t& source) noexcept
        : source_{&source} {
    }

    template<allele Allele>
    std::vector<genotype<Allele>> operator()(std::vector<genotype<Allele>> pool,
                                             std::size_t size) const {
      if (pool.size() == size) {
        return pool;
      }

      std::vector<std::size_t> order(pool.size());
      std::iota(order.begin(), order.end(), std::size_t{});

      std::ranges::stable_sort(order, std::ranges::greater{}, [&pool](auto i) {
        return pool[i].evaluation().raw();
      });

      order.resize(std::min(size, order.size()));
      shuffle(*source_, order);

      std::vector<genotype<Allele>> result;
      result.reserve(order.size());

      for (auto index : order) {
        result.push_back(std::move(pool[index]));
      }

      return result;
    }

  private:
    source_t* source_;
  };

} // namespace replace
} // namespace gopt
