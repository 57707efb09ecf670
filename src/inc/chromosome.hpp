#pragma once

#include "alphabet.hpp"

#include <span>

namespace gopt {

// genes of one chromosome; a gene holds one allele per chromosome set
template<allele Allele>
class chromosome {
public:
  using allele_t = Allele;
  using collection_t = std::vector<allele_t>;

public:
  inline chromosome(std::size_t length, std::size_t sets)
      : length_{length}
      , sets_{sets}
      , alleles_(length * sets) {
  }

  inline chromosome(std::size_t length,
                    std::size_t sets,
                    allele_t const& fill)
      : length_{length}
      , sets_{sets}
      , alleles_(length * sets, fill) {
  }

  inline chromosome(std::initializer_list<allele_t> genes)
      : length_{genes.size()}
      , sets_{1}
      , alleles_{genes} {
  }

  // one row per gene, one column per chromosome set
  chromosome(std::initializer_list<std::initializer_list<allele_t>> genes)
      : length_{genes.size()}
      , sets_{genes.size() == 0 ? 0 : genes.begin()->size()} {
    alleles_.resize(length_ * sets_);

    for (std::size_t gene{0}; auto const& row : genes) {
      if (row.size() != sets_) {
        throw configuration_error{
            "all genes of a chromosome need the same number of alleles"};
      }

      for (std::size_t set{0}; auto const& value : row) {
        at(gene, set++) = value;
      }

      ++gene;
    }
  }

  inline static chromosome haploid(collection_t genes) {
    chromosome result(0, 1);
    result.length_ = genes.size();
    result.alleles_ = std::move(genes);
    return result;
  }

  inline std::size_t length() const noexcept {
    return length_;
  }

  inline std::size_t sets() const noexcept {
    return sets_;
  }

  inline allele_t& at(std::size_t gene, std::size_t set) noexcept {
    return alleles_[set * length_ + gene];
  }

  inline allele_t const& at(std::size_t gene, std::size_t set) const noexcept {
    return alleles_[set * length_ + gene];
  }

  inline std::span<allele_t> column(std::size_t set) noexcept {
    return {alleles_.data() + set * length_, length_};
  }

  inline std::span<allele_t const> column(std::size_t set) const noexcept {
    return {alleles_.data() + set * length_, length_};
  }

  inline collection_t const& alleles() const noexcept {
    return alleles_;
  }

  inline bool operator==(chromosome const& other) const = default;

private:
  std::size_t length_;
  std::size_t sets_;
  collection_t alleles_;
};

} // namespace gopt
