#include "experiment.hpp"
#include "logger.hpp"
#include <chrono>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace fincalc {

ExperimentConfig::ExperimentConfig()
    : debt_counts{10, 25, 50, 75, 100, 150, 200, 300, 500, 1000},
      seed(42),
      min_principal(1000.0),
      max_principal(10000.0),
      min_rate(0.03),
      max_rate(0.25),
      budget_fraction(0.02) {}

ExperimentRow::ExperimentRow()
    : num_debts(0),
      total_principal(0.0),
      budget(0.0),
      runtime_ms(0.0),
      periods_elapsed(0),
      total_interest_paid(0.0),
      status(SimulationStatus::NotStarted) {}

ExperimentResult::ExperimentResult() : execution_time_ms(0.0) {}

namespace {

void validate_config(const ExperimentConfig& config) {
    if (config.debt_counts.empty()) {
        throw std::invalid_argument("Experiment needs at least one debt count");
    }
    for (size_t count : config.debt_counts) {
        if (count == 0) {
            throw std::invalid_argument("Debt counts must be positive");
        }
    }
    if (config.min_principal < 0.0 || config.min_principal >= config.max_principal) {
        throw std::invalid_argument("Principal range must satisfy 0 <= min < max");
    }
    if (config.min_rate < 0.0 || config.min_rate >= config.max_rate) {
        throw std::invalid_argument("Rate range must satisfy 0 <= min < max");
    }
    if (config.budget_fraction <= 0.0) {
        throw std::invalid_argument("Budget fraction must be positive");
    }
    // Simulator constructors must not throw inside the parallel region
    if (config.simulation.max_periods <= 0 || config.simulation.payoff_threshold < 0.0) {
        throw std::invalid_argument("Invalid simulation settings for experiment");
    }
}

} // anonymous namespace

std::vector<Debt> generate_random_debts(size_t count,
                                        const ExperimentConfig& config,
                                        std::mt19937_64& rng) {
    std::uniform_real_distribution<double> principal_dist(config.min_principal,
                                                          config.max_principal);
    std::uniform_real_distribution<double> rate_dist(config.min_rate, config.max_rate);

    std::vector<Debt> debts;
    debts.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        double principal = principal_dist(rng);
        double rate = rate_dist(rng);
        debts.emplace_back(principal, rate);
    }
    return debts;
}

ExperimentResult run_experiment(const ExperimentConfig& config) {
    validate_config(config);

    ExperimentResult result;
    auto start_time = std::chrono::high_resolution_clock::now();

    // Generate every portfolio up front so the draws do not depend on scheduling
    std::mt19937_64 rng(config.seed);
    std::vector<std::vector<Debt>> portfolios;
    portfolios.reserve(config.debt_counts.size());
    for (size_t count : config.debt_counts) {
        portfolios.push_back(generate_random_debts(count, config, rng));
    }

    result.rows.resize(portfolios.size());
    const long n = static_cast<long>(portfolios.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1)
#endif
    for (long i = 0; i < n; ++i) {
        const std::vector<Debt>& debts = portfolios[static_cast<size_t>(i)];
        ExperimentRow& row = result.rows[static_cast<size_t>(i)];

        row.num_debts = debts.size();
        for (const Debt& d : debts) {
            row.total_principal += d.principal();
        }
        row.budget = row.total_principal * config.budget_fraction;

        auto sim_start = std::chrono::high_resolution_clock::now();
        SimulationResult sim = simulate_repayment(debts, row.budget, config.simulation);
        auto sim_end = std::chrono::high_resolution_clock::now();

        row.runtime_ms = std::chrono::duration<double, std::milli>(sim_end - sim_start).count();
        row.periods_elapsed = sim.periods_elapsed;
        row.total_interest_paid = sim.total_interest_paid;
        row.status = sim.status;
    }

    Logger& logger = Logger::get_instance();
    for (const ExperimentRow& row : result.rows) {
        logger.log_experiment_row(row.num_debts, row.runtime_ms,
                                  row.periods_elapsed, row.total_interest_paid);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    return result;
}

} // namespace fincalc
