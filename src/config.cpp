#include "config.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace fincalc {

namespace {

double require_number(const json& obj, const std::string& key, const std::string& where) {
    if (!obj.contains(key)) {
        throw ConfigParseError(where + ": missing required field: " + key);
    }
    if (!obj[key].is_number()) {
        throw ConfigParseError(where + "." + key + " must be a number");
    }
    return obj[key].get<double>();
}

double optional_number(const json& obj, const std::string& key, const std::string& where,
                       double fallback) {
    if (!obj.contains(key)) {
        return fallback;
    }
    if (!obj[key].is_number()) {
        throw ConfigParseError(where + "." + key + " must be a number");
    }
    return obj[key].get<double>();
}

bool optional_bool(const json& obj, const std::string& key, const std::string& where,
                   bool fallback) {
    if (!obj.contains(key)) {
        return fallback;
    }
    if (!obj[key].is_boolean()) {
        throw ConfigParseError(where + "." + key + " must be true or false");
    }
    return obj[key].get<bool>();
}

std::string optional_string(const json& obj, const std::string& key, const std::string& where,
                            const std::string& fallback) {
    if (!obj.contains(key)) {
        return fallback;
    }
    if (!obj[key].is_string()) {
        throw ConfigParseError(where + "." + key + " must be a string");
    }
    return obj[key].get<std::string>();
}

void parse_debts(const json& j, RunConfig& config) {
    if (!j.is_array()) {
        throw ConfigParseError("debts must be an array");
    }
    for (size_t i = 0; i < j.size(); ++i) {
        const std::string where = "debts[" + std::to_string(i) + "]";
        double principal = require_number(j[i], "principal", where);
        double rate = require_number(j[i], "annual_rate", where);
        if (principal < 0.0 || rate < 0.0) {
            throw ConfigParseError(where + ": principal and annual_rate must be non-negative");
        }
        config.debts.emplace_back(principal, rate);
    }
}

void parse_simulation(const json& j, SimulationConfig& sim) {
    const std::string where = "simulation";
    if (j.contains("strategy")) {
        try {
            sim.strategy = parse_strategy(optional_string(j, "strategy", where, ""));
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError(where + ".strategy: " + e.what());
        }
    }
    sim.cascade_excess = optional_bool(j, "cascade_excess", where, sim.cascade_excess);
    sim.reorder_each_period = optional_bool(j, "reorder_each_period", where, sim.reorder_each_period);

    if (j.contains("max_periods")) {
        const json& value = j["max_periods"];
        if (!value.is_number_integer() || value.get<int64_t>() < 1 ||
            value.get<int64_t>() > std::numeric_limits<int>::max()) {
            throw ConfigParseError(where + ".max_periods must be an integer between 1 and " +
                                   std::to_string(std::numeric_limits<int>::max()));
        }
        sim.max_periods = static_cast<int>(value.get<int64_t>());
    }

    sim.payoff_threshold = optional_number(j, "payoff_threshold", where, sim.payoff_threshold);
    if (sim.payoff_threshold < 0.0) {
        throw ConfigParseError(where + ".payoff_threshold must be non-negative");
    }
}

SavingsParameters parse_savings(const json& j) {
    const std::string where = "savings";
    SavingsParameters params;
    params.initial_principal = optional_number(j, "initial", where, 0.0);
    params.periodic_contribution = optional_number(j, "contribution", where, 0.0);
    params.periodic_rate = optional_number(j, "rate", where, 0.0);
    params.target_amount = require_number(j, "target", where);
    params.precision = optional_number(j, "precision", where, SavingsParameters::DEFAULT_PRECISION);
    if (params.precision <= 0.0) {
        throw ConfigParseError(where + ".precision must be positive");
    }
    return params;
}

void parse_experiment(const json& j, ExperimentConfig& exp) {
    const std::string where = "experiment";
    if (j.contains("counts")) {
        if (!j["counts"].is_array() || j["counts"].empty()) {
            throw ConfigParseError(where + ".counts must be a non-empty array");
        }
        exp.debt_counts.clear();
        for (const auto& c : j["counts"]) {
            if (!c.is_number_unsigned() || c.get<size_t>() == 0) {
                throw ConfigParseError(where + ".counts entries must be positive integers");
            }
            exp.debt_counts.push_back(c.get<size_t>());
        }
    }
    if (j.contains("seed")) {
        if (!j["seed"].is_number_unsigned()) {
            throw ConfigParseError(where + ".seed must be a non-negative integer");
        }
        exp.seed = j["seed"].get<uint64_t>();
    }
    exp.budget_fraction = optional_number(j, "budget_fraction", where, exp.budget_fraction);
    if (exp.budget_fraction <= 0.0) {
        throw ConfigParseError(where + ".budget_fraction must be positive");
    }
}

void parse_logging(const json& j, LoggerConfig& logging) {
    const std::string where = "logging";
    std::string level = optional_string(j, "level", where, level_to_string(logging.min_level));
    if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
        throw ConfigParseError(where + ".level must be one of DEBUG, INFO, WARN, ERROR");
    }
    logging.min_level = string_to_level(level);
    logging.enable_json = optional_bool(j, "json", where, logging.enable_json);
    logging.enable_console = optional_bool(j, "console", where, logging.enable_console);
    if (j.contains("file")) {
        logging.log_file_path = optional_string(j, "file", where, logging.log_file_path);
        logging.enable_file = true;
    }
}

} // anonymous namespace

std::string resolve_relative_path(const std::string& path, const std::string& base_dir) {
    fs::path p(path);

    if (p.is_absolute() || base_dir.empty()) {
        return path;
    }

    fs::path resolved = fs::path(base_dir) / p;
    return resolved.string();
}

RunConfig parse_config_from_string(const std::string& json_string, const std::string& base_dir) {
    RunConfig config;

    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::exception& e) {
        throw ConfigParseError("Failed to parse JSON: " + std::string(e.what()));
    }

    if (!j.is_object()) {
        throw ConfigParseError("Configuration root must be a JSON object");
    }

    try {
        if (j.contains("debts")) {
            parse_debts(j["debts"], config);
        }

        if (j.contains("debts_file")) {
            config.debts_file = resolve_relative_path(
                optional_string(j, "debts_file", "config", ""), base_dir);
        }

        if (j.contains("budget")) {
            double budget = optional_number(j, "budget", "config", 0.0);
            if (budget < 0.0) {
                throw ConfigParseError("budget must be non-negative");
            }
            config.budget = budget;
        }

        if (j.contains("simulation")) {
            parse_simulation(j["simulation"], config.simulation);
        }

        if (j.contains("savings")) {
            config.savings = parse_savings(j["savings"]);
        }

        if (j.contains("experiment")) {
            parse_experiment(j["experiment"], config.experiment);
        }
        config.experiment.simulation = config.simulation;

        if (j.contains("logging")) {
            parse_logging(j["logging"], config.logging);
            if (config.logging.enable_file) {
                config.logging.log_file_path =
                    resolve_relative_path(config.logging.log_file_path, base_dir);
            }
        }
    } catch (const json::exception& e) {
        throw ConfigParseError("Invalid configuration value: " + std::string(e.what()));
    }

    return config;
}

RunConfig parse_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_config_from_string(buffer.str(), fs::path(file_path).parent_path().string());
}

std::vector<Debt> collect_debts(const RunConfig& config) {
    std::vector<Debt> debts = config.debts;
    if (!config.debts_file.empty()) {
        DebtPortfolio loaded = DebtPortfolio::load_from_csv(config.debts_file);
        debts.insert(debts.end(), loaded.debts().begin(), loaded.debts().end());
    }
    return debts;
}

} // namespace fincalc
