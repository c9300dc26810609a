#ifndef FINCALC_DEBT_HPP
#define FINCALC_DEBT_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace fincalc {

// Debt: one loan-like obligation with a current balance and a fixed annual rate.
// The original principal and rate are kept as an immutable snapshot for reporting.
class Debt {
public:
    // Balances at or below this are treated as exactly zero
    static constexpr double PAID_OFF_TOLERANCE = 1e-9;
    static constexpr int DEFAULT_PERIODS_PER_YEAR = 12;

    Debt(double principal, double annual_rate,
         int periods_per_year = DEFAULT_PERIODS_PER_YEAR);

    // Interest accrued over one period on the current balance
    double periodic_interest() const;

    // Accrue one period of interest into the principal, then apply the payment.
    // Returns the unused part of the payment when it clears the balance, else 0.
    double apply_payment(double amount);

    // Reduce the principal without accruing interest first.
    // Returns the unused part of the payment when it clears the balance, else 0.
    double apply_principal_payment(double amount);

    bool is_paid_off() const;

    double principal() const { return principal_; }
    double annual_rate() const { return annual_rate_; }
    double original_principal() const { return original_principal_; }
    double original_rate() const { return original_rate_; }
    int periods_per_year() const { return periods_per_year_; }

    // Fresh debt built from the original principal and rate
    Debt snapshot() const;

    std::string to_string() const;

    // Identity is the original principal and rate
    bool operator==(const Debt& other) const;
    bool operator!=(const Debt& other) const { return !(*this == other); }

private:
    double principal_;
    double annual_rate_;
    double original_principal_;
    double original_rate_;
    int periods_per_year_;
};

// DebtPortfolio: ordered collection of debts as supplied by the caller
class DebtPortfolio {
public:
    void add(const Debt& debt);
    void add(Debt&& debt);

    const Debt& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    const std::vector<Debt>& debts() const { return debts_; }

    double total_principal() const;

    void reserve(size_t count);
    void clear();

    // CSV with header "principal,annual_rate"
    static DebtPortfolio load_from_csv(const std::string& filepath);
    static DebtPortfolio load_from_csv(std::istream& is);

private:
    std::vector<Debt> debts_;
};

} // namespace fincalc

#endif // FINCALC_DEBT_HPP
