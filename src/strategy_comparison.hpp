#ifndef FINCALC_STRATEGY_COMPARISON_HPP
#define FINCALC_STRATEGY_COMPARISON_HPP

#include "debt_simulator.hpp"
#include <vector>

namespace fincalc {

// Avalanche and Snowball run over the same debts
struct StrategyComparison {
    SimulationResult avalanche;
    SimulationResult snowball;

    double interest_savings;    // Snowball interest minus Avalanche interest
    double savings_percent;     // interest_savings relative to Snowball interest
    int period_difference;      // Snowball periods minus Avalanche periods

    StrategyComparison();
};

// Each strategy gets its own simulator, so neither run sees the other's state.
// cascade_excess, reorder_each_period and max_periods are taken from base;
// its strategy is ignored.
StrategyComparison compare_strategies(
    const std::vector<Debt>& debts,
    double budget,
    const SimulationConfig& base = SimulationConfig()
);

StrategyComparison compare_strategies(
    const DebtPortfolio& debts,
    double budget,
    const SimulationConfig& base = SimulationConfig()
);

} // namespace fincalc

#endif // FINCALC_STRATEGY_COMPARISON_HPP
