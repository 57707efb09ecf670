#pragma once

#include <cmath>
#include <concepts>
#include <cstddef>

namespace gopt::util {

template<typename Value>
concept runtime_arithmetic = std::integral<Value> || std::floating_point<Value>;

// rounds half-way values to the nearest even integer
inline std::size_t round_even(double value) noexcept {
  auto whole = std::floor(value);
  auto fraction = value - whole;

  if (fraction > 0.5 || (fraction == 0.5 && std::fmod(whole, 2.0) != 0.0)) {
    whole += 1.0;
  }

  return whole > 0.0 ? static_cast<std::size_t>(whole) : 0;
}

inline std::size_t truncate(double value) noexcept {
  return value > 0.0 ? static_cast<std::size_t>(value) : 0;
}

} // namespace gopt::util
