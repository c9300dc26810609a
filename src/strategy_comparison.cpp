#include "strategy_comparison.hpp"

namespace fincalc {

StrategyComparison::StrategyComparison()
    : interest_savings(0.0), savings_percent(0.0), period_difference(0) {}

StrategyComparison compare_strategies(
    const std::vector<Debt>& debts,
    double budget,
    const SimulationConfig& base)
{
    StrategyComparison comparison;

    SimulationConfig avalanche_config = base;
    avalanche_config.strategy = Strategy::Avalanche;
    comparison.avalanche = simulate_repayment(debts, budget, avalanche_config);

    SimulationConfig snowball_config = base;
    snowball_config.strategy = Strategy::Snowball;
    comparison.snowball = simulate_repayment(debts, budget, snowball_config);

    comparison.interest_savings =
        comparison.snowball.total_interest_paid - comparison.avalanche.total_interest_paid;
    if (comparison.snowball.total_interest_paid > 0.0) {
        comparison.savings_percent =
            comparison.interest_savings / comparison.snowball.total_interest_paid * 100.0;
    }
    comparison.period_difference =
        comparison.snowball.periods_elapsed - comparison.avalanche.periods_elapsed;

    return comparison;
}

StrategyComparison compare_strategies(
    const DebtPortfolio& debts,
    double budget,
    const SimulationConfig& base)
{
    return compare_strategies(debts.debts(), budget, base);
}

} // namespace fincalc
