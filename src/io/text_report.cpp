#include "text_report.hpp"
#include <iomanip>
#include <string>

namespace fincalc {
namespace io {

namespace {

const std::string RULE(55, '=');

void print_payoff_order(std::ostream& os, const SimulationResult& result) {
    for (size_t i = 0; i < result.payoff_order.size(); ++i) {
        os << "  " << (i + 1) << ". " << result.payoff_order[i].to_string() << "\n";
    }
}

} // anonymous namespace

void print_simulation_summary(std::ostream& os, const SimulationResult& result) {
    os << std::fixed << std::setprecision(2);
    os << RULE << "\n";
    os << "Debt Repayment Simulation\n";
    os << RULE << "\n";
    os << "Strategy:            " << strategy_to_string(result.strategy) << "\n";
    os << "Budget per period:   $" << result.budget << "\n";
    os << "Status:              " << status_to_string(result.status) << "\n";
    os << "Periods elapsed:     " << result.periods_elapsed
       << " (" << std::setprecision(1) << result.periods_elapsed / 12.0 << " years)\n";
    os << std::setprecision(2);
    os << "Total interest paid: $" << result.total_interest_paid << "\n";

    if (result.status == SimulationStatus::InsufficientBudget) {
        os << "WARNING: budget does not cover the interest due; "
           << result.remaining_debts << " debt(s) remain ($"
           << result.remaining_principal << ")\n";
    } else if (result.status == SimulationStatus::PeriodLimitReached) {
        os << "WARNING: period limit reached; "
           << result.remaining_debts << " debt(s) remain ($"
           << result.remaining_principal << ")\n";
    }

    os << "\nPayoff order:\n";
    print_payoff_order(os, result);
    os << RULE << "\n";
}

void print_savings_summary(std::ostream& os, const SavingsParameters& params,
                           const SavingsEstimate& estimate) {
    os << std::fixed << std::setprecision(2);
    os << "Savings Goal Calculation:\n";
    os << "  Initial:              $" << params.initial_principal << "\n";
    os << "  Contribution:         $" << params.periodic_contribution << "\n";
    os << "  Interest rate:        " << std::setprecision(1) << params.periodic_rate * 100.0 << "%\n";
    os << std::setprecision(2);
    os << "  Target:               $" << params.target_amount << "\n";
    os << "  Time to reach target: " << format_years_and_months(estimate.time) << "\n";
    os << "  Final balance:        $" << estimate.final_balance << "\n";
}

void print_comparison_summary(std::ostream& os, const StrategyComparison& comparison) {
    os << std::fixed << std::setprecision(2);
    os << RULE << "\n";
    os << "Strategy Comparison\n";
    os << RULE << "\n";
    os << "Avalanche: " << comparison.avalanche.periods_elapsed << " periods, $"
       << comparison.avalanche.total_interest_paid << " interest ("
       << status_to_string(comparison.avalanche.status) << ")\n";
    print_payoff_order(os, comparison.avalanche);
    os << "Snowball:  " << comparison.snowball.periods_elapsed << " periods, $"
       << comparison.snowball.total_interest_paid << " interest ("
       << status_to_string(comparison.snowball.status) << ")\n";
    print_payoff_order(os, comparison.snowball);

    if (comparison.interest_savings > 0.0) {
        os << "Avalanche saves $" << comparison.interest_savings << " ("
           << std::setprecision(1) << comparison.savings_percent << "% less interest)\n";
    } else if (comparison.interest_savings < 0.0) {
        os << "Snowball saves $" << -comparison.interest_savings << "\n";
    } else {
        os << "Both strategies cost the same\n";
    }
    os << RULE << "\n";
}

void print_experiment_summary(std::ostream& os, const ExperimentResult& result) {
    os << std::fixed;
    for (const ExperimentRow& row : result.rows) {
        os << "N=" << row.num_debts << " debts: "
           << std::setprecision(3) << row.runtime_ms << " ms, "
           << row.periods_elapsed << " periods, interest $"
           << std::setprecision(2) << row.total_interest_paid
           << " (" << status_to_string(row.status) << ")\n";
    }
    os << "Total: " << std::setprecision(2) << result.execution_time_ms << " ms\n";
}

} // namespace io
} // namespace fincalc
