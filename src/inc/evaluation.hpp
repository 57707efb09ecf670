#pragma once

#include "genotype.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <thread>
#include <vector>

namespace gopt {

// decodes and evaluates genotypes, either one by one or on a bounded number
// of concurrent tasks
template<allele Allele, typename Phenotype>
class evaluator {
public:
  using allele_t = Allele;
  using genotype_t = genotype<allele_t>;
  using phenotype_t = Phenotype;

  using objective_t = std::function<double(phenotype_t const&)>;
  using decoder_t = std::function<phenotype_t(genotype_t const&)>;

public:
  inline evaluator(objective_t objective, decoder_t decoder, bool parallel)
      : objective_{std::move(objective)}
      , decoder_{std::move(decoder)}
      , parallel_{parallel} {
  }

  inline double operator()(genotype_t const& individual) const {
    return objective_(decoder_(individual));
  }

  void operator()(std::vector<genotype_t>& individuals) const {
    if (parallel_ && individuals.size() > 1) {
      evaluate_parallel(individuals);
    }
    else {
      for (auto& individual : individuals) {
        individual.evaluation().set_raw((*this)(individual));
      }
    }
  }

  inline objective_t const& objective() const noexcept {
    return objective_;
  }

  inline decoder_t const& decoder() const noexcept {
    return decoder_;
  }

  inline bool parallel() const noexcept {
    return parallel_;
  }

private:
  void evaluate_parallel(std::vector<genotype_t>& individuals) const {
    auto workers = std::min<std::size_t>(
        std::max(std::thread::hardware_concurrency(), 1u), individuals.size());

    std::vector<std::future<double>> batch;
    batch.reserve(workers);

    for (std::size_t first{0}; first < individuals.size(); first += workers) {
      auto last = std::min(first + workers, individuals.size());

      batch.clear();
      for (auto i = first; i < last; ++i) {
        batch.push_back(std::async(
            std::launch::async,
            [this](genotype_t const& individual) {
              return (*this)(individual);
            },
            std::cref(individuals[i])));
      }

      // results are collected in order, failures propagate to the caller
      for (auto i = first; i < last; ++i) {
        individuals[i].evaluation().set_raw(batch[i - first].get());
      }
    }
  }

private:
  objective_t objective_;
  decoder_t decoder_;
  bool parallel_;
};

} // namespace gopt
