#pragma once

#include "errors.hpp"

#include <fmt/format.h>

#include <cmath>
#include <concepts>

namespace gopt {

struct raw_fitness_tag {};
struct scaled_fitness_tag {};

inline constexpr raw_fitness_tag raw_fitness{};
inline constexpr scaled_fitness_tag scaled_fitness{};

template<std::floating_point Value>
class real_fitness_totalizator {
public:
  using value_t = Value;

public:
  inline real_fitness_totalizator() = default;

  inline auto add(value_t const& value) const noexcept {
    value_t y = value - correction_;
    value_t t = sum_ + y;
    return real_fitness_totalizator{t, (t - sum_) - y};
  }

  inline value_t const& sum() const noexcept {
    return sum_;
  }

private:
  inline real_fitness_totalizator(value_t const& sum, value_t const& correction)
      : sum_{sum}
      , correction_{correction} {
  }

private:
  value_t sum_{};
  value_t correction_{};
};

namespace details {

  inline double check_fitness(double value, char const* kind) {
    if (std::isnan(value) || value < 0.) {
      throw invalid_fitness{
          fmt::format("{} fitness must be non-negative, got {}", kind, value)};
    }

    return value;
  }

} // namespace details

class evaluation {
public:
  inline evaluation() noexcept = default;

  inline explicit evaluation(double raw)
      : raw_{details::check_fitness(raw, "raw")}
      , scaled_{raw_}
      , evaluated_{true} {
  }

  inline evaluation(double raw, double scaled)
      : raw_{details::check_fitness(raw, "raw")}
      , scaled_{details::check_fitness(scaled, "scaled")}
      , evaluated_{true} {
  }

  // scaled fitness follows raw fitness until it is scaled
  inline void set_raw(double value) {
    raw_ = scaled_ = details::check_fitness(value, "raw");
    evaluated_ = true;
  }

  inline void set_scaled(double value) {
    scaled_ = details::check_fitness(value, "scaled");
  }

  inline double raw() const noexcept {
    return raw_;
  }

  inline double scaled() const noexcept {
    return scaled_;
  }

  inline double get(raw_fitness_tag /*unused*/) const noexcept {
    return raw_;
  }

  inline double get(scaled_fitness_tag /*unused*/) const noexcept {
    return scaled_;
  }

  inline bool evaluated() const noexcept {
    return evaluated_;
  }

private:
  double raw_{};
  double scaled_{};
  bool evaluated_{false};
};

} // namespace gopt
