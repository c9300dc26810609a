#include "debt_simulator.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace fincalc {

std::string strategy_to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::Avalanche: return "avalanche";
        case Strategy::Snowball: return "snowball";
        default: return "unknown";
    }
}

Strategy parse_strategy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "avalanche") {
        return Strategy::Avalanche;
    }
    if (lower == "snowball") {
        return Strategy::Snowball;
    }
    throw std::invalid_argument("Unknown strategy: " + name + " (expected avalanche or snowball)");
}

std::string status_to_string(SimulationStatus status) {
    switch (status) {
        case SimulationStatus::NotStarted: return "not_started";
        case SimulationStatus::Completed: return "completed";
        case SimulationStatus::InsufficientBudget: return "insufficient_budget";
        case SimulationStatus::PeriodLimitReached: return "period_limit_reached";
        default: return "unknown";
    }
}

// ============================================================================
// SimulationConfig / SimulationResult Implementation
// ============================================================================

SimulationConfig::SimulationConfig()
    : strategy(Strategy::Avalanche),
      cascade_excess(false),
      reorder_each_period(false),
      max_periods(DEFAULT_MAX_PERIODS),
      payoff_threshold(DEFAULT_PAYOFF_THRESHOLD) {}

SimulationConfig::SimulationConfig(Strategy s) : SimulationConfig() {
    strategy = s;
}

SimulationResult::SimulationResult()
    : strategy(Strategy::Avalanche),
      status(SimulationStatus::NotStarted),
      budget(0.0),
      periods_elapsed(0),
      total_interest_paid(0.0),
      remaining_principal(0.0),
      remaining_debts(0),
      execution_time_ms(0.0) {}

// ============================================================================
// DebtSimulator Implementation
// ============================================================================

DebtSimulator::DebtSimulator(const std::vector<Debt>& debts, double budget,
                             const SimulationConfig& config)
    : config_(config)
{
    if (!std::isfinite(budget) || budget < 0.0) {
        throw std::invalid_argument("Budget must be a finite non-negative amount");
    }
    if (config.max_periods <= 0) {
        throw std::invalid_argument("max_periods must be positive");
    }
    if (!(config.payoff_threshold >= 0.0)) {
        throw std::invalid_argument("payoff_threshold must be non-negative");
    }

    // Working copies start from the caller's current balances
    debts_.reserve(debts.size());
    for (const Debt& d : debts) {
        debts_.emplace_back(d.principal(), d.annual_rate(), d.periods_per_year());
    }

    result_.strategy = config.strategy;
    result_.budget = budget;

    sort_debts();
}

DebtSimulator::DebtSimulator(const DebtPortfolio& debts, double budget,
                             const SimulationConfig& config)
    : DebtSimulator(debts.debts(), budget, config) {}

void DebtSimulator::sort_debts() {
    if (config_.strategy == Strategy::Avalanche) {
        std::stable_sort(debts_.begin(), debts_.end(), [](const Debt& a, const Debt& b) {
            return a.annual_rate() > b.annual_rate();
        });
    } else {
        std::stable_sort(debts_.begin(), debts_.end(), [](const Debt& a, const Debt& b) {
            return a.principal() < b.principal();
        });
    }
}

const SimulationResult& DebtSimulator::simulate() {
    if (result_.status != SimulationStatus::NotStarted) {
        return result_;
    }

    Logger& logger = Logger::get_instance();
    const std::string strategy_name = strategy_to_string(config_.strategy);
    logger.log_simulation_start(strategy_name, debts_.size(), result_.budget);

    auto start_time = std::chrono::high_resolution_clock::now();

    while (run_period()) {
    }

    result_.remaining_debts = debts_.size();
    result_.remaining_principal = 0.0;
    for (const Debt& d : debts_) {
        result_.remaining_principal += d.principal();
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result_.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    logger.log_simulation_complete(strategy_name, status_to_string(result_.status),
                                   result_.periods_elapsed, result_.total_interest_paid,
                                   result_.payoff_order.size(), result_.execution_time_ms);
    return result_;
}

bool DebtSimulator::run_period() {
    if (debts_.empty()) {
        result_.status = SimulationStatus::Completed;
        return false;
    }

    if (result_.periods_elapsed >= config_.max_periods) {
        result_.status = SimulationStatus::PeriodLimitReached;
        Logger::get_instance().log_period_limit(config_.max_periods, debts_.size());
        return false;
    }

    // The period counts even if it turns out to be unaffordable
    result_.periods_elapsed++;

    if (config_.reorder_each_period) {
        sort_debts();
    }

    double period_interest = 0.0;
    for (const Debt& d : debts_) {
        period_interest += d.periodic_interest();
    }

    if (result_.budget < period_interest) {
        result_.status = SimulationStatus::InsufficientBudget;
        Logger::get_instance().log_insufficient_budget(
            result_.periods_elapsed, period_interest, result_.budget);
        return false;
    }

    double remaining_budget = result_.budget;

    // Interest-only payments on everything but the target
    for (size_t i = 1; i < debts_.size(); ++i) {
        Debt& d = debts_[i];
        double interest = d.periodic_interest();
        d.apply_payment(interest);
        remaining_budget -= interest;
        result_.total_interest_paid += interest;
    }

    Debt& target = debts_.front();
    result_.total_interest_paid += target.periodic_interest();
    double excess = target.apply_payment(remaining_budget);

    Logger::get_instance().log_period(result_.periods_elapsed, period_interest,
                                      target.principal(), debts_.size());

    if (target.principal() <= config_.payoff_threshold) {
        record_payoff();
        if (config_.cascade_excess) {
            cascade(excess);
        }
    }

    return true;
}

void DebtSimulator::record_payoff() {
    result_.payoff_order.push_back(debts_.front().snapshot());
    debts_.erase(debts_.begin());
}

void DebtSimulator::cascade(double excess) {
    // The next targets have already accrued this period's interest
    while (excess > 0.0 && !debts_.empty()) {
        excess = debts_.front().apply_principal_payment(excess);
        if (debts_.front().principal() > config_.payoff_threshold) {
            break;
        }
        record_payoff();
    }
}

SimulationResult simulate_repayment(const std::vector<Debt>& debts, double budget,
                                    const SimulationConfig& config) {
    DebtSimulator simulator(debts, budget, config);
    return simulator.simulate();
}

} // namespace fincalc
