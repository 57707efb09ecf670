#pragma once

#include <concepts>
#include <cstdint>
#include <numeric>
#include <random>
#include <ranges>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gopt {

template<typename Source>
concept random_source = requires(Source& source, std::size_t idx, double v) {
  { source.index(idx, idx) } -> std::convertible_to<std::size_t>;
  { source.uniform() } -> std::convertible_to<double>;
  { source.normal(v, v) } -> std::convertible_to<double>;
};

template<std::uniform_random_bit_generator Engine = std::mt19937_64>
class engine_source {
public:
  using engine_t = Engine;

public:
  inline engine_source()
      : engine_{std::random_device{}()} {
  }

  inline explicit engine_source(std::uint64_t seed)
      : engine_{static_cast<typename engine_t::result_type>(seed)} {
  }

  // uniform index in [min_idx, max_idx]
  inline std::size_t index(std::size_t min_idx, std::size_t max_idx) {
    return std::uniform_int_distribution<std::size_t>{min_idx,
                                                      max_idx}(engine_);
  }

  inline double uniform() {
    return std::uniform_real_distribution<double>{0., 1.}(engine_);
  }

  inline double normal(double mean, double sigma) {
    return std::normal_distribution<double>{mean, sigma}(engine_);
  }

private:
  engine_t engine_;
};

template<random_source Source, std::ranges::random_access_range Range>
void shuffle(Source& source, Range&& range) {
  auto size = static_cast<std::size_t>(std::ranges::size(range));
  auto first = std::ranges::begin(range);

  for (auto i = size; i > 1; --i) {
    auto j = source.index(0, i - 1);
    std::ranges::iter_swap(first + (i - 1), first + j);
  }
}

template<random_source Source>
std::vector<std::size_t> permutation(Source& source, std::size_t size) {
  std::vector<std::size_t> result(size);
  std::iota(result.begin(), result.end(), std::size_t{});

  shuffle(source, result);
  return result;
}

// individuals that cannot be picked as mates
class exclusion {
public:
  inline explicit exclusion(std::size_t capacity) {
    excluded_.reserve(capacity);
  }

  inline bool insert(std::size_t index) {
    return excluded_.insert(index).second;
  }

  inline bool contains(std::size_t index) const {
    return excluded_.contains(index);
  }

  inline void clear() noexcept {
    excluded_.clear();
  }

  inline auto size() const noexcept {
    return excluded_.size();
  }

private:
  std::unordered_set<std::size_t> excluded_;
};

} // namespace gopt
