#include "optimizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>
#include <string>

namespace poly {

inline double evaluate(gopt::phenotype<int> const& value) {
  constexpr std::array coefficients{70.4499739424963,
                                    -206.190728636476,
                                    214.767969260518,
                                    -95.9080356878612,
                                    16.8808211213239,
                                    0.};

  double result{0.};
  for (auto c : coefficients) {
    result = result * value.real() + c;
  }

  return std::max(0., result);
}

struct observe {
  inline void operator()(gopt::optimizer<int>& ga) const {
    auto best = ga.best();
    auto const& current = ga.history().current();

    spdlog::info("poly {:3}| x: {:8.6f} | best: {:8.6f} | mean: {:8.6f}",
                 current.number,
                 best.phenotype.real(),
                 best.fitness,
                 current.mean);
  }
};

void run() {
  gopt::settings<int> settings{};
  settings.lengths = {32};
  settings.population_size = 30;

  gopt::optimizer<int> ga{evaluate, settings, {}, observe{}};
  ga.run(20, 0.9999);

  std::cout << ga.describe() << std::endl;
}

} // namespace poly

namespace tsp {

inline constexpr std::array<std::array<double, 2>, 8> cities{{{0.1, 0.2},
                                                               {0.8, 0.1},
                                                               {0.9, 0.7},
                                                               {0.4, 0.9},
                                                               {0.2, 0.6},
                                                               {0.5, 0.5},
                                                               {0.7, 0.3},
                                                               {0.3, 0.1}}};

inline double distance(std::vector<int> const& order) {
  double result{0.};
  for (std::size_t i{0}; i < order.size(); ++i) {
    auto const& from = cities[order[i]];
    auto const& to = cities[order[(i + 1) % order.size()]];

    result += std::hypot(to[0] - from[0], to[1] - from[1]);
  }

  return result;
}

void run() {
  gopt::settings<int> settings{};
  settings.lengths = {cities.size()};
  settings.population_size = 40;
  settings.pmx = true;
  settings.parallel = true;

  gopt::optimizer<int> ga{
      [](gopt::phenotype<int> const& value) {
        return 1. / distance(value.sequence());
      },
      settings};

  ga.run(100);

  auto best = ga.best();
  spdlog::info("tsp tour: [{}] | length: {:.4f}",
               fmt::join(best.phenotype.sequence(), ", "),
               distance(best.phenotype.sequence()));
}

} // namespace tsp

namespace password {

void run() {
  std::string const secret{"Hello World"};

  gopt::settings<char> settings{};
  settings.lengths = {secret.size()};
  settings.population_size = 10;
  settings.alleles = gopt::alphabets::alnum();

  gopt::optimizer<char> ga{
      [&secret](gopt::phenotype<char> const& value) {
        auto const& guess = value.text();

        double matches{0.};
        for (std::size_t i{0}; i < secret.size(); ++i) {
          matches += guess[i] == secret[i] ? 1. : 0.;
        }

        return matches / static_cast<double>(secret.size());
      },
      settings};

  ga.run(10000, 1.);

  spdlog::info("password: {} after {} generations",
               ga.best().phenotype.text(),
               ga.generation());
}

} // namespace password

int main() {
  spdlog::set_level(spdlog::level::info);

  poly::run();
  tsp::run();
  password::run();

  return 0;
}
