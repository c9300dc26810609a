#ifndef FINCALC_EXPERIMENT_HPP
#define FINCALC_EXPERIMENT_HPP

#include "debt_simulator.hpp"
#include <cstdint>
#include <random>
#include <vector>

namespace fincalc {

// Parameters for the randomized simulator performance experiment
struct ExperimentConfig {
    std::vector<size_t> debt_counts;    // One simulation per count
    uint64_t seed;                      // Seed for reproducible portfolios
    double min_principal;               // Principal drawn from [min, max)
    double max_principal;
    double min_rate;                    // Annual rate drawn from [min, max)
    double max_rate;
    double budget_fraction;             // Budget = fraction × total principal
    SimulationConfig simulation;

    ExperimentConfig();
};

// One row per debt count
struct ExperimentRow {
    size_t num_debts;
    double total_principal;
    double budget;
    double runtime_ms;
    int periods_elapsed;
    double total_interest_paid;
    SimulationStatus status;

    ExperimentRow();
};

struct ExperimentResult {
    std::vector<ExperimentRow> rows;
    double execution_time_ms;

    ExperimentResult();
};

// Draw count debts from the configured principal and rate ranges
std::vector<Debt> generate_random_debts(size_t count,
                                        const ExperimentConfig& config,
                                        std::mt19937_64& rng);

// Run the experiment.
// Portfolios are drawn sequentially from one generator, so results are
// reproducible for a seed regardless of thread count. Simulations run in
// parallel when built with OpenMP.
// Throws std::invalid_argument for an empty count list, a zero count,
// inverted ranges or a non-positive budget fraction.
ExperimentResult run_experiment(const ExperimentConfig& config);

} // namespace fincalc

#endif // FINCALC_EXPERIMENT_HPP
