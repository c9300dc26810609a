#include "savings_goal.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cmath>

namespace fincalc {

SavingsParameters::SavingsParameters()
    : initial_principal(0.0),
      periodic_contribution(0.0),
      periodic_rate(0.0),
      target_amount(0.0),
      precision(DEFAULT_PRECISION) {}

SavingsParameters::SavingsParameters(double initial, double contribution, double rate,
                                     double target, double precision_value)
    : initial_principal(initial),
      periodic_contribution(contribution),
      periodic_rate(rate),
      target_amount(target),
      precision(precision_value) {}

SavingsEstimate::SavingsEstimate() : time(0.0), final_balance(0.0), iterations(0) {}

// ============================================================================
// SavingsGoalEstimator Implementation
// ============================================================================

SavingsGoalEstimator::SavingsGoalEstimator(const SavingsParameters& params)
    : params_(params)
{
    if (!(params.precision > 0.0)) {
        throw std::invalid_argument("Precision must be positive");
    }
    if (params.periodic_rate <= -1.0) {
        throw std::invalid_argument("Periodic rate must be greater than -1");
    }
}

SavingsGoalEstimator::SavingsGoalEstimator(double initial, double contribution,
                                           double rate, double target)
    : SavingsGoalEstimator(SavingsParameters(initial, contribution, rate, target)) {}

double SavingsGoalEstimator::balance_at(double time) const {
    if (time <= 0.0) {
        return params_.initial_principal;
    }

    const double rate = params_.periodic_rate;
    double growth = std::pow(1.0 + rate, time);
    double principal_growth = params_.initial_principal * growth;

    double contribution_growth;
    if (std::abs(rate) < RATE_EPSILON) {
        contribution_growth = params_.periodic_contribution * time;
    } else {
        contribution_growth = params_.periodic_contribution * (growth - 1.0) / rate;
    }

    return principal_growth + contribution_growth;
}

double SavingsGoalEstimator::estimate_upper_bound() const {
    const double deficit = params_.target_amount - params_.initial_principal;

    if (params_.periodic_contribution > 0.0) {
        // Time with contributions alone, plus headroom
        return std::max(deficit / params_.periodic_contribution * 1.5, MIN_UPPER_BOUND);
    }

    // Interest only: invert P(1+r)^t = target, with the same headroom
    double t = std::log(params_.target_amount / params_.initial_principal) /
               std::log(1.0 + params_.periodic_rate);
    return std::max(t * 1.5, MIN_UPPER_BOUND);
}

double SavingsGoalEstimator::time_to_reach_target() const {
    return estimate().time;
}

SavingsEstimate SavingsGoalEstimator::estimate() const {
    SavingsEstimate result;

    if (params_.initial_principal >= params_.target_amount) {
        result.final_balance = params_.initial_principal;
        return result;
    }

    if (params_.periodic_contribution <= 0.0 && params_.periodic_rate <= 0.0) {
        throw UnreachableGoalError("Cannot reach target: no contributions and no interest");
    }
    if (params_.periodic_contribution <= 0.0 && params_.initial_principal <= 0.0) {
        throw UnreachableGoalError("Cannot reach target: no contributions and no principal to compound");
    }

    double low = 0.0;
    double high = estimate_upper_bound();

    // Only a negative rate or negative contribution can leave the bound short
    while (!(balance_at(high) >= params_.target_amount)) {
        if (high >= MAX_HORIZON) {
            throw UnreachableGoalError("Cannot reach target within " +
                                       std::to_string(static_cast<int>(MAX_HORIZON)) +
                                       " periods");
        }
        high = std::min(high * 2.0, MAX_HORIZON);
    }

    // Invariant: balance_at(low) < target <= balance_at(high)
    while (high - low > params_.precision) {
        double mid = (low + high) / 2.0;
        // Bracket is already adjacent doubles; precision is finer than representable
        if (mid <= low || mid >= high) {
            break;
        }
        if (balance_at(mid) < params_.target_amount) {
            low = mid;
        } else {
            high = mid;
        }
        ++result.iterations;
    }

    result.time = high;
    result.final_balance = balance_at(high);

    Logger::get_instance().log_estimate_complete(result.time, result.final_balance,
                                                 result.iterations);
    return result;
}

std::string format_years_and_months(double years) {
    int whole_years = static_cast<int>(years);
    int months = static_cast<int>(std::lround((years - whole_years) * 12.0));

    if (months >= 12) {
        whole_years++;
        months = 0;
    }

    if (whole_years == 0) {
        return std::to_string(months) + " months";
    }
    if (months == 0) {
        return std::to_string(whole_years) + " years";
    }
    return std::to_string(whole_years) + " years and " + std::to_string(months) + " months";
}

} // namespace fincalc
