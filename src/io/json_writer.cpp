#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace fincalc {
namespace io {

namespace {

struct Layout {
    std::string indent;
    std::string newline;
    std::string space;

    explicit Layout(bool pretty)
        : indent(pretty ? "  " : ""),
          newline(pretty ? "\n" : ""),
          space(pretty ? " " : "") {}

    std::string pad(int depth) const {
        std::string out;
        for (int i = 0; i < depth; ++i) {
            out += indent;
        }
        return out;
    }
};

// Writes the members of a simulation result (no surrounding braces)
void write_simulation_members(std::ostream& os, const SimulationResult& result,
                              const Layout& l, int depth) {
    const std::string p = l.pad(depth);

    os << p << "\"strategy\":" << l.space << "\"" << strategy_to_string(result.strategy) << "\"," << l.newline;
    os << p << "\"status\":" << l.space << "\"" << status_to_string(result.status) << "\"," << l.newline;
    os << p << "\"budget\":" << l.space << result.budget << "," << l.newline;
    os << p << "\"periods_elapsed\":" << l.space << result.periods_elapsed << "," << l.newline;
    os << p << "\"total_interest_paid\":" << l.space << result.total_interest_paid << "," << l.newline;
    os << p << "\"remaining_debts\":" << l.space << result.remaining_debts << "," << l.newline;
    os << p << "\"remaining_principal\":" << l.space << result.remaining_principal << "," << l.newline;

    os << p << "\"payoff_order\":" << l.space << "[";
    for (size_t i = 0; i < result.payoff_order.size(); ++i) {
        const Debt& d = result.payoff_order[i];
        if (i > 0) {
            os << ",";
        }
        os << l.newline << l.pad(depth + 1) << "{"
           << "\"original_principal\":" << l.space << d.original_principal() << ","
           << l.space << "\"original_rate\":" << l.space << d.original_rate() << "}";
    }
    if (!result.payoff_order.empty()) {
        os << l.newline << p;
    }
    os << "]" << l.newline;
}

template <typename Writer>
void write_to_file(const std::string& filepath, Writer&& writer) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    writer(file);
}

} // anonymous namespace

void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool pretty_print) {
    const Layout l(pretty_print);
    os << std::fixed << std::setprecision(6);

    os << "{" << l.newline;
    write_simulation_members(os, result, l, 1);
    os << "}" << l.newline;
}

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  bool pretty_print) {
    write_to_file(filepath, [&](std::ostream& os) {
        write_simulation_result_json(os, result, pretty_print);
    });
}

void write_savings_estimate_json(std::ostream& os, const SavingsParameters& params,
                                 const SavingsEstimate& estimate, bool pretty_print) {
    const Layout l(pretty_print);
    const std::string p1 = l.pad(1);
    const std::string p2 = l.pad(2);
    os << std::fixed << std::setprecision(6);

    os << "{" << l.newline;
    os << p1 << "\"parameters\":" << l.space << "{" << l.newline;
    os << p2 << "\"initial_principal\":" << l.space << params.initial_principal << "," << l.newline;
    os << p2 << "\"periodic_contribution\":" << l.space << params.periodic_contribution << "," << l.newline;
    os << p2 << "\"periodic_rate\":" << l.space << params.periodic_rate << "," << l.newline;
    os << p2 << "\"target_amount\":" << l.space << params.target_amount << "," << l.newline;
    os << p2 << "\"precision\":" << l.space << params.precision << l.newline;
    os << p1 << "}," << l.newline;
    os << p1 << "\"time\":" << l.space << estimate.time << "," << l.newline;
    os << p1 << "\"formatted_time\":" << l.space << "\"" << format_years_and_months(estimate.time) << "\"," << l.newline;
    os << p1 << "\"final_balance\":" << l.space << estimate.final_balance << "," << l.newline;
    os << p1 << "\"iterations\":" << l.space << estimate.iterations << l.newline;
    os << "}" << l.newline;
}

void write_savings_estimate_json(const std::string& filepath, const SavingsParameters& params,
                                 const SavingsEstimate& estimate, bool pretty_print) {
    write_to_file(filepath, [&](std::ostream& os) {
        write_savings_estimate_json(os, params, estimate, pretty_print);
    });
}

void write_comparison_json(std::ostream& os, const StrategyComparison& comparison,
                           bool pretty_print) {
    const Layout l(pretty_print);
    const std::string p1 = l.pad(1);
    os << std::fixed << std::setprecision(6);

    os << "{" << l.newline;
    os << p1 << "\"avalanche\":" << l.space << "{" << l.newline;
    write_simulation_members(os, comparison.avalanche, l, 2);
    os << p1 << "}," << l.newline;
    os << p1 << "\"snowball\":" << l.space << "{" << l.newline;
    write_simulation_members(os, comparison.snowball, l, 2);
    os << p1 << "}," << l.newline;
    os << p1 << "\"interest_savings\":" << l.space << comparison.interest_savings << "," << l.newline;
    os << p1 << "\"savings_percent\":" << l.space << comparison.savings_percent << "," << l.newline;
    os << p1 << "\"period_difference\":" << l.space << comparison.period_difference << l.newline;
    os << "}" << l.newline;
}

void write_comparison_json(const std::string& filepath, const StrategyComparison& comparison,
                           bool pretty_print) {
    write_to_file(filepath, [&](std::ostream& os) {
        write_comparison_json(os, comparison, pretty_print);
    });
}

void write_experiment_json(std::ostream& os, const ExperimentResult& result,
                           bool pretty_print) {
    const Layout l(pretty_print);
    const std::string p1 = l.pad(1);
    const std::string p2 = l.pad(2);
    os << std::fixed << std::setprecision(6);

    os << "{" << l.newline;
    os << p1 << "\"execution_time_ms\":" << l.space << std::setprecision(2)
       << result.execution_time_ms << "," << l.newline;
    os << std::setprecision(6);
    os << p1 << "\"rows\":" << l.space << "[";
    for (size_t i = 0; i < result.rows.size(); ++i) {
        const ExperimentRow& row = result.rows[i];
        if (i > 0) {
            os << ",";
        }
        os << l.newline << p2 << "{"
           << "\"num_debts\":" << l.space << row.num_debts << "," << l.space
           << "\"total_principal\":" << l.space << row.total_principal << "," << l.space
           << "\"budget\":" << l.space << row.budget << "," << l.space
           << "\"runtime_ms\":" << l.space << row.runtime_ms << "," << l.space
           << "\"periods_elapsed\":" << l.space << row.periods_elapsed << "," << l.space
           << "\"total_interest_paid\":" << l.space << row.total_interest_paid << "," << l.space
           << "\"status\":" << l.space << "\"" << status_to_string(row.status) << "\"}";
    }
    if (!result.rows.empty()) {
        os << l.newline << p1;
    }
    os << "]" << l.newline;
    os << "}" << l.newline;
}

void write_experiment_json(const std::string& filepath, const ExperimentResult& result,
                           bool pretty_print) {
    write_to_file(filepath, [&](std::ostream& os) {
        write_experiment_json(os, result, pretty_print);
    });
}

} // namespace io
} // namespace fincalc
