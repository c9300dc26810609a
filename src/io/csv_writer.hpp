#ifndef FINCALC_CSV_WRITER_HPP
#define FINCALC_CSV_WRITER_HPP

#include "../experiment.hpp"
#include "../strategy_comparison.hpp"
#include <ostream>
#include <string>

namespace fincalc {
namespace io {

// Strategy,Months,TotalInterestPaid,SavingsVsSnowball
// One row per strategy; Snowball's savings column is 0.00
void write_comparison_csv(std::ostream& os, const StrategyComparison& comparison);
void write_comparison_csv(const std::string& filepath, const StrategyComparison& comparison);

// NumDebts,RuntimeMillis,MonthsElapsed,TotalInterestPaid
void write_experiment_csv(std::ostream& os, const ExperimentResult& result);
void write_experiment_csv(const std::string& filepath, const ExperimentResult& result);

// Payoff order of a single run: Position,OriginalPrincipal,OriginalRate
void write_payoff_order_csv(std::ostream& os, const SimulationResult& result);
void write_payoff_order_csv(const std::string& filepath, const SimulationResult& result);

} // namespace io
} // namespace fincalc

#endif // FINCALC_CSV_WRITER_HPP
