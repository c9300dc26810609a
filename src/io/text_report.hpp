#ifndef FINCALC_TEXT_REPORT_HPP
#define FINCALC_TEXT_REPORT_HPP

#include "../debt_simulator.hpp"
#include "../experiment.hpp"
#include "../savings_goal.hpp"
#include "../strategy_comparison.hpp"
#include <ostream>

namespace fincalc {
namespace io {

// Human-readable summaries for the console
void print_simulation_summary(std::ostream& os, const SimulationResult& result);

void print_savings_summary(std::ostream& os, const SavingsParameters& params,
                           const SavingsEstimate& estimate);

void print_comparison_summary(std::ostream& os, const StrategyComparison& comparison);

void print_experiment_summary(std::ostream& os, const ExperimentResult& result);

} // namespace io
} // namespace fincalc

#endif // FINCALC_TEXT_REPORT_HPP
