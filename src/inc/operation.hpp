#pragma once

#include "sampling.hpp"

namespace gopt {

inline bool valid_probability(double probability) noexcept {
  return probability >= 0. && probability <= 1.;
}

template<random_source Source>
class probabilistic_operation {
public:
  using source_t = Source;

public:
  inline probabilistic_operation(source_t& source, double probability) noexcept
      : source_{&source}
      , probability_{probability} {
  }

  inline bool operator()() const {
    if (probability_ <= 0.) {
      return false;
    }

    if (probability_ >= 1.) {
      return true;
    }

    return source_->uniform() < probability_;
  }

  inline double probability() const noexcept {
    return probability_;
  }

private:
  source_t* source_;
  double probability_;
};

struct crossover_count_t {};
struct mutation_count_t {};
struct inversion_count_t {};

inline constexpr crossover_count_t crossover_count_tag{};
inline constexpr mutation_count_t mutation_count_tag{};
inline constexpr inversion_count_t inversion_count_tag{};

} // namespace gopt
