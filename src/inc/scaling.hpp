#pragma once

#include "logging.hpp"
#include "population.hpp"
#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace gopt {
namespace scale {

  namespace details {

    using linear_coefficients = std::pair<double, double>;

    // spread is lost in the rounding of the statistics
    inline bool vanishes(double delta, double magnitude) noexcept {
      return !(delta > std::fabs(magnitude) * 8. *
                           std::numeric_limits<double>::epsilon());
    }

    // maximum fitness is pushed towards favg * factor while the scaled
    // minimum stays non-negative
    inline linear_coefficients calculate_linear_coefficients(double factor,
                                                             double fmin,
                                                             double favg,
                                                             double fmax) {
      double a{};
      if (favg <= (fmax + fmin * (factor - 1.)) / factor) {
        auto delta = fmax - favg;
        if (vanishes(delta, fmax)) {
          return {1., 0.};
        }

        a = favg * (factor - 1.) / delta;
      }
      else {
        auto delta = favg - fmin;
        if (vanishes(delta, favg)) {
          return {1., 0.};
        }

        a = favg / delta;
      }

      return {a, favg * (1. - a)};
    }

  } // namespace details

  class linear {
  public:
    inline linear(double factor, stats::generation const& statistics)
        : coefficients_{details::calculate_linear_coefficients(
              factor, statistics.min, statistics.mean, statistics.max)} {
      if (coefficients_ == details::linear_coefficients{1., 0.}) {
        logger()->debug("fitness values do not spread, scaling is disabled "
                        "for generation {}",
                        statistics.number);
      }
    }

    inline double operator()(double raw) const noexcept {
      return std::max(0., coefficients_.first * raw + coefficients_.second);
    }

    template<allele Allele>
    void operator()(std::vector<genotype<Allele>>& individuals) const {
      for (auto& individual : individuals) {
        auto& eval = individual.evaluation();
        eval.set_scaled((*this)(eval.raw()));
      }
    }

    inline details::linear_coefficients const& coefficients() const noexcept {
      return coefficients_;
    }

  private:
    details::linear_coefficients coefficients_;
  };

} // namespace scale
} // namespace gopt
