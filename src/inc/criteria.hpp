#pragma once

#include "statistics.hpp"

#include <optional>

namespace gopt {
namespace criteria {

  class generation_limit {
  public:
    inline explicit generation_limit(std::size_t limit)
        : limit_{limit} {
    }

    inline bool operator()(stats::history const& history) const noexcept {
      return history.current().number >= limit_;
    }

  private:
    std::size_t limit_;
  };

  // stops once the best raw fitness reaches the threshold
  class fitness_limit {
  public:
    inline explicit fitness_limit(std::optional<double> threshold) noexcept
        : threshold_{threshold} {
    }

    inline bool operator()(double best) const noexcept {
      return threshold_ && best >= *threshold_;
    }

  private:
    std::optional<double> threshold_;
  };

} // namespace criteria
} // namespace gopt
