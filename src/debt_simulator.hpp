#ifndef FINCALC_DEBT_SIMULATOR_HPP
#define FINCALC_DEBT_SIMULATOR_HPP

#include "debt.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace fincalc {

// Payoff priority ordering
enum class Strategy : uint8_t {
    Avalanche = 0,  // Highest annual rate first
    Snowball = 1    // Lowest current balance first
};

std::string strategy_to_string(Strategy strategy);

// Case-insensitive "avalanche" / "snowball"; throws std::invalid_argument otherwise
Strategy parse_strategy(const std::string& name);

enum class SimulationStatus : uint8_t {
    NotStarted = 0,
    Completed = 1,            // Every debt reached zero
    InsufficientBudget = 2,   // Interest due in a period exceeded the budget
    PeriodLimitReached = 3    // max_periods elapsed with debts still active
};

std::string status_to_string(SimulationStatus status);

// Configuration options for a simulation run
struct SimulationConfig {
    Strategy strategy;
    bool cascade_excess;        // Roll a paid-off target's excess into the next target immediately
    bool reorder_each_period;   // Re-sort active debts at the start of every period
    int max_periods;            // Hard stop (default 1200 = 100 years of months)
    double payoff_threshold;    // Target balance at or below this counts as paid off

    static constexpr int DEFAULT_MAX_PERIODS = 1200;
    static constexpr double DEFAULT_PAYOFF_THRESHOLD = 0.01;

    SimulationConfig();
    explicit SimulationConfig(Strategy s);
};

// Frozen outcome of a simulation run
struct SimulationResult {
    Strategy strategy;
    SimulationStatus status;
    double budget;
    int periods_elapsed;
    double total_interest_paid;
    std::vector<Debt> payoff_order;     // Snapshots in the order debts were paid off
    double remaining_principal;         // Sum over debts still active at the end
    size_t remaining_debts;
    double execution_time_ms;

    bool all_paid_off() const { return status == SimulationStatus::Completed; }

    SimulationResult();
};

// Greedy debt repayment simulator.
//
// The simulator owns deep copies of the debts it is given; the caller's debts
// are never modified. Debts are ordered once at construction by the strategy
// (Avalanche: rate descending, Snowball: principal ascending; ties keep the
// caller's order).
//
// Each period:
//   1. Sum interest over active debts; if it exceeds the budget, stop
//      (InsufficientBudget) without paying anything that period
//   2. Pay exactly the periodic interest on every debt except the target
//      (index 0), taking it out of the budget
//   3. Pay the remaining budget to the target (interest accrues first)
//   4. If the target's balance is at or below the payoff threshold, record a
//      snapshot in payoff order and drop it from the active set
//
// Insufficient budget is a recorded terminal state, not an exception.
class DebtSimulator {
public:
    DebtSimulator(const std::vector<Debt>& debts, double budget,
                  const SimulationConfig& config = SimulationConfig());
    DebtSimulator(const DebtPortfolio& debts, double budget,
                  const SimulationConfig& config = SimulationConfig());

    // Runs to a terminal state. A second call returns the frozen result.
    const SimulationResult& simulate();

    int periods_elapsed() const { return result_.periods_elapsed; }
    double total_interest_paid() const { return result_.total_interest_paid; }
    const std::vector<Debt>& payoff_order() const { return result_.payoff_order; }
    Strategy strategy() const { return config_.strategy; }
    SimulationStatus status() const { return result_.status; }
    double budget() const { return result_.budget; }
    const SimulationConfig& config() const { return config_; }

    // Debts still being repaid, in priority order
    const std::vector<Debt>& active_debts() const { return debts_; }

    const SimulationResult& result() const { return result_; }

private:
    std::vector<Debt> debts_;
    SimulationConfig config_;
    SimulationResult result_;

    void sort_debts();
    // Returns false once the run has reached a terminal state
    bool run_period();
    void record_payoff();
    void cascade(double excess);
};

// Convenience wrapper: construct, simulate and return the result
SimulationResult simulate_repayment(const std::vector<Debt>& debts, double budget,
                                    const SimulationConfig& config = SimulationConfig());

} // namespace fincalc

#endif // FINCALC_DEBT_SIMULATOR_HPP
