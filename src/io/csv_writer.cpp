#include "csv_writer.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace fincalc {
namespace io {

namespace {

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

} // anonymous namespace

void write_comparison_csv(std::ostream& os, const StrategyComparison& comparison) {
    os << std::fixed << std::setprecision(2);
    os << "Strategy,Months,TotalInterestPaid,SavingsVsSnowball\n";
    os << "Avalanche," << comparison.avalanche.periods_elapsed << ","
       << comparison.avalanche.total_interest_paid << ","
       << comparison.interest_savings << "\n";
    os << "Snowball," << comparison.snowball.periods_elapsed << ","
       << comparison.snowball.total_interest_paid << ",0.00\n";
}

void write_comparison_csv(const std::string& filepath, const StrategyComparison& comparison) {
    std::ofstream file = open_output(filepath);
    write_comparison_csv(file, comparison);
}

void write_experiment_csv(std::ostream& os, const ExperimentResult& result) {
    os << "NumDebts,RuntimeMillis,MonthsElapsed,TotalInterestPaid\n";
    for (const ExperimentRow& row : result.rows) {
        os << row.num_debts << ","
           << std::fixed << std::setprecision(3) << row.runtime_ms << ","
           << row.periods_elapsed << ","
           << std::setprecision(2) << row.total_interest_paid << "\n";
    }
}

void write_experiment_csv(const std::string& filepath, const ExperimentResult& result) {
    std::ofstream file = open_output(filepath);
    write_experiment_csv(file, result);
}

void write_payoff_order_csv(std::ostream& os, const SimulationResult& result) {
    os << "Position,OriginalPrincipal,OriginalRate\n";
    for (size_t i = 0; i < result.payoff_order.size(); ++i) {
        const Debt& d = result.payoff_order[i];
        os << (i + 1) << ","
           << std::fixed << std::setprecision(2) << d.original_principal() << ","
           << std::setprecision(4) << d.original_rate() << "\n";
    }
}

void write_payoff_order_csv(const std::string& filepath, const SimulationResult& result) {
    std::ofstream file = open_output(filepath);
    write_payoff_order_csv(file, result);
}

} // namespace io
} // namespace fincalc
