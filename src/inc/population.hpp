#pragma once

#include "genotype.hpp"

#include <algorithm>
#include <vector>

namespace gopt {

template<allele Allele>
class population {
public:
  using allele_t = Allele;
  using individual_t = genotype<allele_t>;
  using collection_t = std::vector<individual_t>;

  using iterator_t = typename collection_t::iterator;
  using const_iterator_t = typename collection_t::const_iterator;

public:
  inline explicit population(std::size_t target_size)
      : target_size_{target_size} {
    individuals_.reserve(target_size_);
  }

  inline void insert(individual_t individual) {
    individuals_.push_back(std::move(individual));
  }

  // replaces all individuals with the survivors of a generation
  inline void replace(collection_t individuals, std::size_t target_size) {
    individuals_ = std::move(individuals);
    target_size_ = target_size;
  }

  inline collection_t& individuals() noexcept {
    return individuals_;
  }

  inline collection_t const& individuals() const noexcept {
    return individuals_;
  }

  inline individual_t const& operator[](std::size_t index) const noexcept {
    return individuals_[index];
  }

  inline std::size_t current_size() const noexcept {
    return individuals_.size();
  }

  // size that the population should reach after the next selection
  inline std::size_t target_size() const noexcept {
    return target_size_;
  }

  inline bool empty() const noexcept {
    return individuals_.empty();
  }

  // first individual with the highest raw fitness
  inline individual_t const& best() const {
    return *std::ranges::max_element(
        individuals_, std::ranges::less{}, [](auto const& i) {
          return i.evaluation().raw();
        });
  }

  inline auto begin() const noexcept {
    return individuals_.begin();
  }

  inline auto end() const noexcept {
    return individuals_.end();
  }

private:
  collection_t individuals_;
  std::size_t target_size_;
};

} // namespace gopt
