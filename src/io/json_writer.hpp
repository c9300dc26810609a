#ifndef FINCALC_IO_JSON_WRITER_HPP
#define FINCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../debt_simulator.hpp"
#include "../experiment.hpp"
#include "../savings_goal.hpp"
#include "../strategy_comparison.hpp"

namespace fincalc {
namespace io {

// Write a SimulationResult: summary fields plus the payoff order as
// {original_principal, original_rate} records
void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool pretty_print = true);

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  bool pretty_print = true);

// Write a savings goal estimate together with its inputs
void write_savings_estimate_json(std::ostream& os, const SavingsParameters& params,
                                 const SavingsEstimate& estimate, bool pretty_print = true);

void write_savings_estimate_json(const std::string& filepath, const SavingsParameters& params,
                                 const SavingsEstimate& estimate, bool pretty_print = true);

void write_comparison_json(std::ostream& os, const StrategyComparison& comparison,
                           bool pretty_print = true);

void write_comparison_json(const std::string& filepath, const StrategyComparison& comparison,
                           bool pretty_print = true);

void write_experiment_json(std::ostream& os, const ExperimentResult& result,
                           bool pretty_print = true);

void write_experiment_json(const std::string& filepath, const ExperimentResult& result,
                           bool pretty_print = true);

} // namespace io
} // namespace fincalc

#endif // FINCALC_IO_JSON_WRITER_HPP
