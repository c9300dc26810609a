#include "debt.hpp"
#include "io/csv_reader.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace fincalc {

Debt::Debt(double principal, double annual_rate, int periods_per_year)
    : principal_(principal),
      annual_rate_(annual_rate),
      original_principal_(principal),
      original_rate_(annual_rate),
      periods_per_year_(periods_per_year) {
    if (periods_per_year <= 0) {
        throw std::invalid_argument("periods_per_year must be positive");
    }
}

double Debt::periodic_interest() const {
    return principal_ * (annual_rate_ / static_cast<double>(periods_per_year_));
}

double Debt::apply_payment(double amount) {
    // Interest is computed on the pre-payment balance
    principal_ += periodic_interest();

    if (amount >= principal_) {
        double excess = amount - principal_;
        principal_ = 0.0;
        return excess;
    }
    principal_ -= amount;
    return 0.0;
}

double Debt::apply_principal_payment(double amount) {
    if (amount >= principal_) {
        double excess = amount - principal_;
        principal_ = 0.0;
        return excess;
    }
    principal_ -= amount;
    return 0.0;
}

bool Debt::is_paid_off() const {
    return principal_ <= PAID_OFF_TOLERANCE;
}

Debt Debt::snapshot() const {
    return Debt(original_principal_, original_rate_, periods_per_year_);
}

std::string Debt::to_string() const {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "Debt[Principal: $%.2f, Rate: %.2f%%]",
                  original_principal_, original_rate_ * 100.0);
    return std::string(buf);
}

bool Debt::operator==(const Debt& other) const {
    return original_principal_ == other.original_principal_ &&
           original_rate_ == other.original_rate_;
}

// ============================================================================
// DebtPortfolio Implementation
// ============================================================================

void DebtPortfolio::add(const Debt& debt) {
    debts_.push_back(debt);
}

void DebtPortfolio::add(Debt&& debt) {
    debts_.push_back(std::move(debt));
}

const Debt& DebtPortfolio::get(size_t index) const {
    if (index >= debts_.size()) {
        throw std::out_of_range("Debt index out of range");
    }
    return debts_[index];
}

size_t DebtPortfolio::size() const {
    return debts_.size();
}

bool DebtPortfolio::empty() const {
    return debts_.empty();
}

double DebtPortfolio::total_principal() const {
    double total = 0.0;
    for (const auto& d : debts_) {
        total += d.principal();
    }
    return total;
}

void DebtPortfolio::reserve(size_t count) {
    debts_.reserve(count);
}

void DebtPortfolio::clear() {
    debts_.clear();
}

DebtPortfolio DebtPortfolio::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

DebtPortfolio DebtPortfolio::load_from_csv(std::istream& is) {
    DebtPortfolio portfolio;
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return portfolio;
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.size() < 2) {
            continue;
        }

        double principal;
        double rate;
        try {
            principal = std::stod(row[0]);
            rate = std::stod(row[1]);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid debt on line " +
                                     std::to_string(reader.line_number()) +
                                     ": " + row[0] + "," + row[1]);
        }

        if (principal < 0.0 || rate < 0.0) {
            throw std::invalid_argument("Negative principal or rate on line " +
                                        std::to_string(reader.line_number()));
        }

        portfolio.add(Debt(principal, rate));
    }

    return portfolio;
}

} // namespace fincalc
