#pragma once

#include "errors.hpp"
#include "utility.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace gopt {

template<typename Allele>
concept allele = util::runtime_arithmetic<Allele>;

struct unit_interval_t {};

// sentinel for alleles that take any value from [0, 1]
inline constexpr unit_interval_t unit_interval{};

template<allele Allele>
class alphabet {
public:
  using allele_t = Allele;
  using symbols_t = std::vector<allele_t>;

  inline static constexpr std::size_t unbounded =
      std::numeric_limits<std::size_t>::max();

public:
  inline explicit alphabet(symbols_t symbols)
      : symbols_{std::make_shared<symbols_t const>(std::move(symbols))} {
    validate();
  }

  inline alphabet(std::initializer_list<allele_t> symbols)
      : alphabet{symbols_t{symbols}} {
  }

  inline explicit alphabet(std::string_view symbols)
    requires std::same_as<allele_t, char>
      : alphabet{symbols_t{symbols.begin(), symbols.end()}} {
  }

  inline explicit alphabet(unit_interval_t /*unused*/) noexcept
    requires std::floating_point<allele_t>
      : symbols_{std::make_shared<symbols_t const>()}
      , continuous_{true} {
  }

  inline bool continuous() const noexcept {
    return continuous_;
  }

  inline std::size_t size() const noexcept {
    return continuous_ ? unbounded : symbols_->size();
  }

  inline symbols_t const& symbols() const noexcept {
    return *symbols_;
  }

  inline allele_t const& operator[](std::size_t index) const noexcept {
    return (*symbols_)[index];
  }

  inline std::optional<std::size_t> index_of(allele_t const& value) const {
    if (auto it = std::ranges::find(*symbols_, value); it != symbols_->end()) {
      return static_cast<std::size_t>(it - symbols_->begin());
    }

    return std::nullopt;
  }

  inline bool contains(allele_t const& value) const {
    if (continuous_) {
      return value >= allele_t{0} && value <= allele_t{1};
    }

    return index_of(value).has_value();
  }

  // only character alphabets whose every symbol prints can be decoded as text
  inline bool printable() const {
    if constexpr (std::same_as<allele_t, char>) {
      return !continuous_ && std::ranges::all_of(*symbols_, [](char c) {
        return std::isprint(static_cast<unsigned char>(c)) != 0;
      });
    }
    else {
      return false;
    }
  }

  inline bool equals(std::initializer_list<allele_t> symbols) const {
    return !continuous_ && std::ranges::equal(*symbols_, symbols);
  }

  inline bool operator==(alphabet const& other) const {
    return continuous_ == other.continuous_ && *symbols_ == *other.symbols_;
  }

private:
  void validate() const {
    if (symbols_->size() < 2) {
      throw configuration_error{fmt::format(
          "alphabet needs at least two symbols, got {}", symbols_->size())};
    }

    auto sorted = *symbols_;
    std::ranges::sort(sorted);
    if (std::ranges::adjacent_find(sorted) != sorted.end()) {
      throw configuration_error{"alphabet contains duplicate symbols"};
    }
  }

private:
  std::shared_ptr<symbols_t const> symbols_;
  bool continuous_{false};
};

namespace alphabets {

  inline alphabet<char> const& alpha() {
    static alphabet<char> const instance{
        " ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"};
    return instance;
  }

  inline alphabet<char> const& alnum() {
    static alphabet<char> const instance{
        " ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"};
    return instance;
  }

  // everything printable on an american keyboard
  inline alphabet<char> const& keyboard() {
    static alphabet<char> const instance{
        " ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"
        "~`!@#$%^&*()-_=+[{]}\\|;:'\",<.>/?"};
    return instance;
  }

} // namespace alphabets

} // namespace gopt
