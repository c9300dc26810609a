#include <cmath>
#include <iostream>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "config.hpp"
#include "debt.hpp"
#include "debt_simulator.hpp"
#include "experiment.hpp"
#include "logger.hpp"
#include "savings_goal.hpp"
#include "strategy_comparison.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/text_report.hpp"

namespace {

struct CLIArgs {
    std::string command;
    std::string config_path;
    std::string debts_path;
    std::vector<fincalc::Debt> debts;          // From repeated --debt P:R
    std::optional<double> budget;
    std::optional<std::string> strategy;
    bool cascade_excess = false;
    bool reorder = false;
    std::optional<int> max_periods;
    // Savings goal
    std::optional<double> initial;
    std::optional<double> contribution;
    std::optional<double> rate;
    std::optional<double> target;
    std::optional<double> precision;
    // Experiment
    std::vector<size_t> counts;
    std::optional<uint64_t> seed;
    // Output
    std::string output_path;
    std::string csv_path;
    std::string parquet_path;
    std::string log_level;
    std::string log_file;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "FinCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  simulate                    Simulate debt repayment with one strategy\n";
    std::cerr << "  compare                     Compare avalanche and snowball on the same debts\n";
    std::cerr << "  savings                     Estimate time to reach a savings target\n";
    std::cerr << "  experiment                  Randomized simulator performance experiment\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON configuration file\n";
    std::cerr << "  --debts <path>              CSV file with principal,annual_rate columns\n";
    std::cerr << "  --debt <principal:rate>     Add one debt (repeatable), e.g. 5000:0.18\n\n";
    std::cerr << "Simulation options:\n";
    std::cerr << "  --budget <amount>           Payment budget per period\n";
    std::cerr << "  --strategy <name>           avalanche (default) or snowball\n";
    std::cerr << "  --cascade-excess            Roll a paid-off debt's excess into the next debt\n";
    std::cerr << "  --reorder                   Re-sort debts by strategy every period\n";
    std::cerr << "  --max-periods <n>           Stop after n periods (default: 1200)\n\n";
    std::cerr << "Savings options:\n";
    std::cerr << "  --initial <amount>          Starting balance (default: 0)\n";
    std::cerr << "  --contribution <amount>     Contribution per period (default: 0)\n";
    std::cerr << "  --rate <rate>               Interest rate per period (default: 0)\n";
    std::cerr << "  --target <amount>           Savings target\n";
    std::cerr << "  --precision <periods>       Search tolerance (default: 1/12)\n\n";
    std::cerr << "Experiment options:\n";
    std::cerr << "  --counts <n1,n2,...>        Debt counts to simulate\n";
    std::cerr << "  --seed <value>              Random seed (default: 42)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --csv <path>                CSV export (compare, experiment, simulate)\n";
    std::cerr << "  --parquet <path>            Parquet export (experiment)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN (default) or ERROR\n";
    std::cerr << "  --log-file <path>           Append log records to a file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program_name << " simulate --debt 5000:0.18 --debt 8000:0.06 \\\n";
    std::cerr << "      --debt 3000:0.04 --budget 500\n";
    std::cerr << "  " << program_name << " savings --contribution 1000 --rate 0.05 --target 10000\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

fincalc::Debt parse_debt_arg(const std::string& value) {
    size_t sep = value.find(':');
    if (sep == std::string::npos) {
        throw std::invalid_argument("expected principal:rate");
    }
    double principal = std::stod(value.substr(0, sep));
    double rate = std::stod(value.substr(sep + 1));
    if (principal < 0.0 || rate < 0.0) {
        throw std::invalid_argument("principal and rate must be non-negative");
    }
    return fincalc::Debt(principal, rate);
}

std::vector<size_t> parse_counts(const std::string& value) {
    std::vector<size_t> counts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty() || item[0] == '-') {
            throw std::invalid_argument("counts must be positive integers");
        }
        counts.push_back(static_cast<size_t>(std::stoul(item)));
    }
    return counts;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    int i = 1;
    if (argc > 1 && argv[1][0] != '-') {
        args.command = argv[1];
        i = 2;
    }

    for (; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && has_value) {
                args.config_path = argv[++i];
            } else if (arg == "--debts" && has_value) {
                args.debts_path = argv[++i];
            } else if (arg == "--debt" && has_value) {
                args.debts.push_back(parse_debt_arg(argv[++i]));
            } else if (arg == "--budget" && has_value) {
                args.budget = std::stod(argv[++i]);
            } else if (arg == "--strategy" && has_value) {
                args.strategy = argv[++i];
            } else if (arg == "--cascade-excess") {
                args.cascade_excess = true;
            } else if (arg == "--reorder") {
                args.reorder = true;
            } else if (arg == "--max-periods" && has_value) {
                args.max_periods = std::stoi(argv[++i]);
            } else if (arg == "--initial" && has_value) {
                args.initial = std::stod(argv[++i]);
            } else if (arg == "--contribution" && has_value) {
                args.contribution = std::stod(argv[++i]);
            } else if (arg == "--rate" && has_value) {
                args.rate = std::stod(argv[++i]);
            } else if (arg == "--target" && has_value) {
                args.target = std::stod(argv[++i]);
            } else if (arg == "--precision" && has_value) {
                args.precision = std::stod(argv[++i]);
            } else if (arg == "--counts" && has_value) {
                args.counts = parse_counts(argv[++i]);
            } else if (arg == "--seed" && has_value) {
                args.seed = std::stoull(argv[++i]);
            } else if (arg == "--output" && has_value) {
                args.output_path = argv[++i];
            } else if (arg == "--csv" && has_value) {
                args.csv_path = argv[++i];
            } else if (arg == "--parquet" && has_value) {
                args.parquet_path = argv[++i];
            } else if (arg == "--log-level" && has_value) {
                args.log_level = argv[++i];
            } else if (arg == "--log-file" && has_value) {
                args.log_file = argv[++i];
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: Invalid value for " << arg << ": " << argv[i] << " (" << e.what() << ")\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.command != "simulate" && args.command != "compare" &&
        args.command != "savings" && args.command != "experiment") {
        std::cerr << "Error: Unknown command: " << (args.command.empty() ? "(none)" : args.command) << "\n";
        valid = false;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (!args.debts_path.empty() && !file_exists(args.debts_path)) {
        std::cerr << "Error: Debts file not found: " << args.debts_path << "\n";
        valid = false;
    }

    if (args.budget && !(std::isfinite(*args.budget) && *args.budget >= 0)) {
        std::cerr << "Error: --budget must be a non-negative number\n";
        valid = false;
    }

    if (args.max_periods && *args.max_periods <= 0) {
        std::cerr << "Error: --max-periods must be positive\n";
        valid = false;
    }

    if (args.precision && *args.precision <= 0) {
        std::cerr << "Error: --precision must be positive\n";
        valid = false;
    }

    if (!args.log_level.empty() && args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

// Command line values override the config file
fincalc::RunConfig build_run_config(const CLIArgs& args) {
    fincalc::RunConfig config;
    config.logging.min_level = fincalc::LogLevel::WARN;

    if (!args.config_path.empty()) {
        std::cerr << "Loading config: " << args.config_path << "\n";
        config = fincalc::parse_config_from_file(args.config_path);
    }

    config.debts.insert(config.debts.end(), args.debts.begin(), args.debts.end());
    if (!args.debts_path.empty()) {
        config.debts_file = args.debts_path;
    }
    if (args.budget) config.budget = *args.budget;
    if (args.strategy) config.simulation.strategy = fincalc::parse_strategy(*args.strategy);
    if (args.cascade_excess) config.simulation.cascade_excess = true;
    if (args.reorder) config.simulation.reorder_each_period = true;
    if (args.max_periods) config.simulation.max_periods = *args.max_periods;

    if (args.initial || args.contribution || args.rate || args.target || args.precision) {
        if (!args.target && !config.savings) {
            throw std::invalid_argument("--target is required for savings");
        }
        fincalc::SavingsParameters params = config.savings.value_or(fincalc::SavingsParameters());
        if (args.initial) params.initial_principal = *args.initial;
        if (args.contribution) params.periodic_contribution = *args.contribution;
        if (args.rate) params.periodic_rate = *args.rate;
        if (args.target) params.target_amount = *args.target;
        if (args.precision) params.precision = *args.precision;
        config.savings = params;
    }

    if (!args.counts.empty()) config.experiment.debt_counts = args.counts;
    if (args.seed) config.experiment.seed = *args.seed;
    config.experiment.simulation = config.simulation;

    if (!args.log_level.empty()) {
        config.logging.min_level = fincalc::string_to_level(args.log_level);
    }
    if (!args.log_file.empty()) {
        config.logging.enable_file = true;
        config.logging.log_file_path = args.log_file;
    }

    return config;
}

std::vector<fincalc::Debt> require_debts(const fincalc::RunConfig& config) {
    std::vector<fincalc::Debt> debts = fincalc::collect_debts(config);
    if (debts.empty()) {
        throw std::invalid_argument("No debts given (use --debt, --debts or a config file)");
    }
    if (!config.budget) {
        throw std::invalid_argument("--budget is required");
    }
    return debts;
}

int run_simulate(const CLIArgs& args, const fincalc::RunConfig& config) {
    std::vector<fincalc::Debt> debts = require_debts(config);

    fincalc::DebtSimulator simulator(debts, *config.budget, config.simulation);
    const fincalc::SimulationResult& result = simulator.simulate();

    fincalc::io::print_simulation_summary(std::cerr, result);

    if (!args.csv_path.empty()) {
        fincalc::io::write_payoff_order_csv(args.csv_path, result);
        std::cerr << "Payoff order written to: " << args.csv_path << "\n";
    }
    if (args.output_path.empty()) {
        fincalc::io::write_simulation_result_json(std::cout, result);
    } else {
        fincalc::io::write_simulation_result_json(args.output_path, result);
        std::cerr << "Output written to: " << args.output_path << "\n";
    }
    return 0;
}

int run_compare(const CLIArgs& args, const fincalc::RunConfig& config) {
    std::vector<fincalc::Debt> debts = require_debts(config);

    fincalc::StrategyComparison comparison =
        fincalc::compare_strategies(debts, *config.budget, config.simulation);

    fincalc::io::print_comparison_summary(std::cerr, comparison);

    if (!args.csv_path.empty()) {
        fincalc::io::write_comparison_csv(args.csv_path, comparison);
        std::cerr << "Strategy comparison written to: " << args.csv_path << "\n";
    }
    if (args.output_path.empty()) {
        fincalc::io::write_comparison_json(std::cout, comparison);
    } else {
        fincalc::io::write_comparison_json(args.output_path, comparison);
        std::cerr << "Output written to: " << args.output_path << "\n";
    }
    return 0;
}

int run_savings(const CLIArgs& args, const fincalc::RunConfig& config) {
    if (!config.savings) {
        throw std::invalid_argument("--target is required for savings");
    }
    const fincalc::SavingsParameters& params = *config.savings;

    fincalc::SavingsGoalEstimator estimator(params);
    fincalc::SavingsEstimate estimate = estimator.estimate();

    fincalc::io::print_savings_summary(std::cerr, params, estimate);

    if (args.output_path.empty()) {
        fincalc::io::write_savings_estimate_json(std::cout, params, estimate);
    } else {
        fincalc::io::write_savings_estimate_json(args.output_path, params, estimate);
        std::cerr << "Output written to: " << args.output_path << "\n";
    }
    return 0;
}

int run_experiment_command(const CLIArgs& args, const fincalc::RunConfig& config) {
    std::cerr << "Running experiment over " << config.experiment.debt_counts.size()
              << " portfolio sizes (seed " << config.experiment.seed << ")...\n";

    fincalc::ExperimentResult result = fincalc::run_experiment(config.experiment);

    fincalc::io::print_experiment_summary(std::cerr, result);

    if (!args.csv_path.empty()) {
        fincalc::io::write_experiment_csv(args.csv_path, result);
        std::cerr << "Experiment data written to: " << args.csv_path << "\n";
    }
    if (!args.parquet_path.empty()) {
        fincalc::ParquetWriter::write_experiment(result, args.parquet_path);
        std::cerr << "Experiment data written to: " << args.parquet_path << "\n";
    }
    if (args.output_path.empty()) {
        fincalc::io::write_experiment_json(std::cout, result);
    } else {
        fincalc::io::write_experiment_json(args.output_path, result);
        std::cerr << "Output written to: " << args.output_path << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    fincalc::Logger& logger = fincalc::Logger::get_instance();

    try {
        fincalc::RunConfig config = build_run_config(args);
        logger.configure(config.logging);

        if (args.command == "simulate") {
            return run_simulate(args, config);
        }
        if (args.command == "compare") {
            return run_compare(args, config);
        }
        if (args.command == "savings") {
            return run_savings(args, config);
        }
        return run_experiment_command(args, config);
    } catch (const fincalc::UnreachableGoalError& e) {
        logger.log_error("savings", e.what());
        std::cerr << "Error: Unreachable goal: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        logger.log_error(args.command, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
