#ifndef FINCALC_SAVINGS_GOAL_HPP
#define FINCALC_SAVINGS_GOAL_HPP

#include <stdexcept>
#include <string>

namespace fincalc {

// Thrown when the target can never be reached from the given parameters
class UnreachableGoalError : public std::runtime_error {
public:
    explicit UnreachableGoalError(const std::string& message)
        : std::runtime_error(message) {}
};

// Immutable inputs to a savings goal estimate. Time is measured in the
// contribution period (years in the reference scenarios).
struct SavingsParameters {
    double initial_principal;
    double periodic_contribution;
    double periodic_rate;           // e.g. 0.05 for 5% per period
    double target_amount;
    double precision;               // Search tolerance in periods

    static constexpr double DEFAULT_PRECISION = 1.0 / 12.0;

    SavingsParameters();
    SavingsParameters(double initial, double contribution, double rate, double target,
                      double precision_value = DEFAULT_PRECISION);
};

// Result of a time-to-target search
struct SavingsEstimate {
    double time;            // Smallest bracketed time at which the target is met
    double final_balance;   // balance_at(time)
    int iterations;         // Bisection steps taken

    SavingsEstimate();
};

// Savings goal estimator.
//
// balance_at(t) = P(1+r)^t + C((1+r)^t - 1)/r, with C*t for the contribution
// term when r is effectively zero. The balance is non-decreasing in t when
// C >= 0 and r >= 0, which is what makes bisection valid.
class SavingsGoalEstimator {
public:
    static constexpr double RATE_EPSILON = 1e-10;
    static constexpr double MIN_UPPER_BOUND = 100.0;
    static constexpr double MAX_HORIZON = 10000.0;

    // Throws std::invalid_argument if precision is not positive or rate <= -1
    explicit SavingsGoalEstimator(const SavingsParameters& params);
    SavingsGoalEstimator(double initial, double contribution, double rate, double target);

    double balance_at(double time) const;

    // Throws UnreachableGoalError when no growth mechanism can close the gap
    double time_to_reach_target() const;

    // Same search, with the final balance and iteration count
    SavingsEstimate estimate() const;

    const SavingsParameters& parameters() const { return params_; }

private:
    SavingsParameters params_;

    double estimate_upper_bound() const;
};

// "5 years", "5 years and 6 months", "3 months"
std::string format_years_and_months(double years);

} // namespace fincalc

#endif // FINCALC_SAVINGS_GOAL_HPP
