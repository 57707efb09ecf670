#pragma once

#include "configuration.hpp"
#include "coupling.hpp"
#include "criteria.hpp"
#include "decoder.hpp"
#include "evaluation.hpp"
#include "mutation.hpp"
#include "replacement.hpp"
#include "scaling.hpp"

#include <functional>
#include <optional>
#include <ranges>
#include <string>

namespace gopt {

template<allele Allele, typename Phenotype = phenotype<Allele>>
class optimizer {
public:
  using allele_t = Allele;
  using phenotype_t = Phenotype;
  using genotype_t = genotype<allele_t>;
  using population_t = gopt::population<allele_t>;
  using settings_t = gopt::settings<allele_t>;
  using configuration_t = gopt::configuration<allele_t>;
  using evaluator_t = evaluator<allele_t, phenotype_t>;
  using source_t = engine_source<>;

  using objective_t = typename evaluator_t::objective_t;
  using decoder_t = typename evaluator_t::decoder_t;
  using hook_t = std::function<void(optimizer&)>;

  struct best_fit {
    genotype_t genotype;
    phenotype_t phenotype;
    double fitness;
  };

  // generations between two adaptations of float sigma
  inline static constexpr std::size_t sigma_period = 5;

public:
  optimizer(objective_t objective,
            settings_t const& settings,
            decoder_t decoder = {},
            hook_t hook = {})
      : config_{settings}
      , tuning_{config_.tuning()}
      , source_{create_source(config_.seed())}
      , evaluator_{require_objective(std::move(objective)),
                   resolve_decoder(std::move(decoder)),
                   config_.parallel()}
      , population_{config_.population_size()}
      , hook_{std::move(hook)} {
    initialize();
  }

  // advances the given number of generations, stops as soon as the best
  // individual reaches max_fitness
  void run(std::size_t generations,
           std::optional<double> max_fitness = std::nullopt) {
    criteria::generation_limit limit{generation() + generations};
    criteria::fitness_limit reached{max_fitness};

    while (!limit(history_)) {
      step();
      notify();

      if (auto best = best_fitness(); reached(best)) {
        logger()->info("generation {}: best fitness {} reached limit {}",
                       generation(),
                       best,
                       *max_fitness);
        break;
      }
    }

    logger()->debug("run finished at generation {}, best fitness {}",
                    generation(),
                    best_fitness());
  }

  inline objective_t const& objective() const noexcept {
    return evaluator_.objective();
  }

  inline decoder_t const& decoder() const noexcept {
    return evaluator_.decoder();
  }

  inline stats::history const& history() const noexcept {
    return history_;
  }

  inline std::size_t generation() const noexcept {
    return history_.current().number;
  }

  inline population_t const& population() const noexcept {
    return population_;
  }

  inline bool pmx() const noexcept {
    return config_.pmx();
  }

  inline configuration_t const& configuration() const noexcept {
    return config_;
  }

  inline gopt::tuning& tuning() noexcept {
    return tuning_;
  }

  inline gopt::tuning const& tuning() const noexcept {
    return tuning_;
  }

  best_fit best() const {
    auto const& individual = population_.best();
    return {individual,
            evaluator_.decoder()(individual),
            individual.evaluation().raw()};
  }

  std::string describe() const {
    auto result = fmt::format(
        "\nProblem-specific parameters:\n"
        "chromosomes: {}, chromosome lengths: [{}]\n"
        "\nOptimizer parameters:\n"
        "population size: {}, population growth: {}, overpopulation: {}\n"
        "chromosome sets: {}, crossover probability: {}, mutation "
        "probability: {}, inversion probability: {}, fitness scale: {}\n"
        "monogamous: {}, children: {}, immortal: {}\nparallel: {}\n",
        config_.chromosomes(),
        fmt::join(config_.lengths(), ", "),
        population_.target_size(),
        tuning_.population_growth,
        tuning_.overpopulation,
        config_.chromosome_sets(),
        tuning_.crossover_probability,
        tuning_.mutation_probability,
        tuning_.inversion_probability,
        tuning_.fitness_scale ? fmt::format("{}", *tuning_.fitness_scale)
                              : std::string{"none"},
        config_.monogamous(),
        config_.children(),
        config_.immortal(),
        config_.parallel());

    if (config_.encoding() == encoding::continuous) {
      result += fmt::format("\nParameters for floating point chromosomes:\n"
                            "float sigma: {}, float sigma adaptation: {}\n",
                            tuning_.float_sigma,
                            tuning_.float_sigma_adapt);
    }

    result += fmt::format("\nGenerations computed: {}\n", generation());

    result += fmt::format(
        "\nCurrent population:\n{}\n",
        fmt::join(population_.individuals() |
                      std::views::transform(
                          [](auto const& i) { return i.to_string(); }),
                  "; "));

    if constexpr (requires(phenotype_t const& p) { p.to_string(); }) {
      if (config_.encoding() == encoding::standard) {
        result += fmt::format(
            "Decoded:\n{}\n",
            fmt::join(population_.individuals() |
                          std::views::transform([this](auto const& i) {
                            return evaluator_.decoder()(i).to_string();
                          }),
                      "; "));
      }
    }

    result += fmt::format(
        "\nFitness:\n{}\n",
        fmt::join(population_.individuals() |
                      std::views::transform([](auto const& i) {
                        return i.evaluation().raw();
                      }),
                  "; "));

    result += fmt::format("\nCurrent statistics:\n{}\n",
                          stats::to_string(history_.current()));

    return result;
  }

private:
  static source_t create_source(std::optional<std::uint64_t> const& seed) {
    return seed ? source_t{*seed} : source_t{};
  }

  static objective_t require_objective(objective_t objective) {
    if (!objective) {
      throw configuration_error{"objective function is missing"};
    }

    return objective;
  }

  static decoder_t resolve_decoder(decoder_t decoder) {
    if (decoder) {
      return decoder;
    }

    if constexpr (std::same_as<phenotype_t, gopt::phenotype<allele_t>>) {
      return generic_decoder<allele_t>{};
    }
    else {
      throw configuration_error{
          "decoder is required for user defined phenotypes"};
    }
  }

  void initialize() {
    auto const& alphabet = config_.alphabet();
    auto size = config_.population_size();

    for (std::size_t i{0}; i < size; ++i) {
      population_.insert(genotype_t::random(alphabet,
                                            config_.lengths(),
                                            config_.chromosome_sets(),
                                            config_.pmx(),
                                            source_));
    }

    // every allele is present at every locus of the first generation
    if (config_.encoding() == encoding::standard && !alphabet.printable() &&
        size > alphabet.size()) {
      for (std::size_t k{0}; k < alphabet.size(); ++k) {
        population_.individuals()[k] =
            genotype_t::filled(alphabet,
                               config_.lengths(),
                               config_.chromosome_sets(),
                               alphabet[k]);
      }
    }

    evaluator_(population_.individuals());

    record(0, population_.individuals(), stats::counters{}, divorce_rate({}));
    notify();
  }

  void step() {
    // the hook may have changed the knobs
    gopt::validate(tuning_);

    stats::counters counters{};

    auto target = pool_size();

    couple::matchmaker<source_t> matchmaker{
        source_, config_.monogamous(), population_.current_size()};

    mutate::point<source_t> mutation{source_,
                                     tuning_.mutation_probability,
                                     tuning_.float_sigma,
                                     counters};

    mutate::inversion<source_t> inversion{
        source_, tuning_.inversion_probability, counters};

    std::vector<genotype_t> pool;
    pool.reserve(target + config_.children() + 1);

    while (pool.size() < target) {
      auto [i, j] = matchmaker(population_);

      for (auto& child : reproduce(population_[i], population_[j], counters)) {
        mutation(child);
        inversion(child);

        pool.push_back(std::move(child));
      }
    }

    if (config_.immortal()) {
      pool.push_back(population_.best());
      pool.back().clear_evaluation();
    }

    evaluator_(pool);

    auto number = generation() + 1;
    record(number, pool, counters, divorce_rate(matchmaker.divorce_rate()));

    if (tuning_.fitness_scale) {
      scale::linear{*tuning_.fitness_scale, history_.current()}(pool);
    }

    auto size = std::max<std::size_t>(
        util::round_even(static_cast<double>(population_.target_size()) *
                         tuning_.population_growth),
        1);

    population_.replace(replace::fittest{source_}(std::move(pool), size),
                        size);

    if (config_.encoding() == encoding::continuous) {
      adapt_sigma(number);
    }
  }

  std::vector<genotype_t> reproduce(genotype_t const& parent1,
                                    genotype_t const& parent2,
                                    stats::counters& counters) {
    auto probability = tuning_.crossover_probability;

    if (config_.pmx()) {
      auto [first, second] = cross::partially_matched{
          source_, probability, counters}(parent1, parent2);

      std::vector<genotype_t> children;
      children.reserve(2);
      children.push_back(std::move(first));
      children.push_back(std::move(second));
      return children;
    }

    if (config_.chromosome_sets() == 1) {
      return cross::singlepoint{source_, probability, counters}(
          parent1, parent2, config_.children());
    }

    return couple::meiosis{source_, probability, counters}(
        parent1, parent2, config_.children());
  }

  // the best individual of the previous generation takes one place, a mortal
  // population still breeds at least one pair
  inline std::size_t pool_size() const noexcept {
    auto size = std::max<std::size_t>(
        util::truncate(tuning_.overpopulation *
                       static_cast<double>(population_.target_size()) *
                       tuning_.population_growth),
        1);

    if (config_.immortal()) {
      --size;
    }

    return size;
  }

  void adapt_sigma(std::size_t number) {
    if (number == 0 || number % sigma_period != 0) {
      return;
    }

    if (history_[number].mean > history_[number - sigma_period].mean) {
      tuning_.float_sigma *= tuning_.float_sigma_adapt;
    }
    else {
      tuning_.float_sigma /= tuning_.float_sigma_adapt;
    }

    logger()->trace(
        "generation {}: float sigma {}", number, tuning_.float_sigma);
  }

  inline std::optional<double>
      divorce_rate(std::optional<double> const& rate) const noexcept {
    if (!config_.monogamous()) {
      return std::nullopt;
    }

    return rate.value_or(0.);
  }

  void record(std::size_t number,
              std::vector<genotype_t> const& individuals,
              stats::counters const& counters,
              std::optional<double> divorce) {
    auto fitness = individuals | std::views::transform([](auto const& i) {
                     return i.evaluation().raw();
                   });

    auto const& current =
        history_.next(stats::summarize(number, fitness, counters, divorce));

    logger()->debug("{}", stats::to_string(current));
  }

  inline double best_fitness() const {
    return population_.best().evaluation().raw();
  }

  inline void notify() {
    if (hook_) {
      hook_(*this);
    }
  }

private:
  configuration_t config_;
  gopt::tuning tuning_;
  source_t source_;
  evaluator_t evaluator_;
  population_t population_;
  stats::history history_;
  hook_t hook_;
};

} // namespace gopt
