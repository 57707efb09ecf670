#pragma once

#include "fitness.hpp"
#include "operation.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <optional>
#include <ostream>
#include <ranges>
#include <string>
#include <vector>

namespace gopt {
namespace stats {

  class counters {
  public:
    inline void add(crossover_count_t /*unused*/, std::size_t count = 1) {
      crossovers_ += count;
    }

    inline void add(mutation_count_t /*unused*/, std::size_t count = 1) {
      mutations_ += count;
    }

    inline void add(inversion_count_t /*unused*/, std::size_t count = 1) {
      inversions_ += count;
    }

    inline std::size_t get(crossover_count_t /*unused*/) const noexcept {
      return crossovers_;
    }

    inline std::size_t get(mutation_count_t /*unused*/) const noexcept {
      return mutations_;
    }

    inline std::size_t get(inversion_count_t /*unused*/) const noexcept {
      return inversions_;
    }

    inline void clear() noexcept {
      crossovers_ = mutations_ = inversions_ = 0;
    }

  private:
    std::size_t crossovers_{};
    std::size_t mutations_{};
    std::size_t inversions_{};
  };

  // raw fitness summary of a pool before survivor selection
  struct generation {
    std::size_t number{};
    std::size_t size{};

    double mean{};
    double variance{};
    double min{};
    double max{};

    std::size_t crossovers{};
    std::size_t mutations{};
    std::size_t inversions{};

    std::optional<double> divorce_rate{};
  };

  template<std::ranges::forward_range Values>
    requires std::convertible_to<std::ranges::range_value_t<Values>, double>
  generation summarize(std::size_t number,
                       Values const& values,
                       counters const& operations,
                       std::optional<double> divorce_rate = std::nullopt) {
    generation result{number,
                      0,
                      0.,
                      0.,
                      0.,
                      0.,
                      operations.get(crossover_count_tag),
                      operations.get(mutation_count_tag),
                      operations.get(inversion_count_tag),
                      divorce_rate};

    real_fitness_totalizator<double> total{};
    real_fitness_totalizator<double> squared{};

    for (double value : values) {
      if (result.size == 0) {
        result.min = result.max = value;
      }
      else {
        result.min = std::min(result.min, value);
        result.max = std::max(result.max, value);
      }

      total = total.add(value);
      squared = squared.add(value * value);
      ++result.size;
    }

    if (result.size > 0) {
      auto count = static_cast<double>(result.size);

      // rounding must not push the mean outside the extremes
      result.mean = std::clamp(total.sum() / count, result.min, result.max);
      result.variance =
          std::max(0., squared.sum() / count - result.mean * result.mean);
    }

    return result;
  }

  inline std::string to_string(generation const& value) {
    auto result = fmt::format(
        "generation: {}, size: {}, mean: {}, variance: {}, min: {}, max: {}, "
        "crossovers: {}, mutations: {}, inversions: {}",
        value.number,
        value.size,
        value.mean,
        value.variance,
        value.min,
        value.max,
        value.crossovers,
        value.mutations,
        value.inversions);

    if (value.divorce_rate) {
      result += fmt::format(", divorce rate: {}", *value.divorce_rate);
    }

    return result;
  }

  inline std::ostream& operator<<(std::ostream& stream,
                                  generation const& value) {
    return stream << to_string(value);
  }

  class history {
  public:
    using statistics_t = generation;
    using collection_t = std::vector<statistics_t>;

  public:
    inline auto& next(statistics_t const& statistics) {
      return values_.emplace_back(statistics);
    }

    inline auto& current() noexcept {
      return values_.back();
    }

    inline auto const& current() const noexcept {
      return values_.back();
    }

    inline auto& previous() noexcept {
      return *(values_.rbegin() + 1);
    }

    inline auto const& previous() const noexcept {
      return *(values_.rbegin() + 1);
    }

    // statistics recorded for the given generation
    inline auto const& operator[](std::size_t number) const noexcept {
      return values_[number];
    }

    inline std::size_t size() const noexcept {
      return values_.size();
    }

    inline bool empty() const noexcept {
      return values_.empty();
    }

    inline auto begin() const noexcept {
      return values_.begin();
    }

    inline auto end() const noexcept {
      return values_.end();
    }

  private:
    collection_t values_;
  };

} // namespace stats
} // namespace gopt
