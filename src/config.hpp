#ifndef FINCALC_CONFIG_HPP
#define FINCALC_CONFIG_HPP

#include "debt.hpp"
#include "debt_simulator.hpp"
#include "experiment.hpp"
#include "logger.hpp"
#include "savings_goal.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fincalc {

/**
 * @brief Exception thrown when a config file cannot be read or is invalid
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Everything a run can be configured with
 *
 * Sections missing from the file keep their defaults; optional values stay empty.
 */
struct RunConfig {
    std::vector<Debt> debts;                 ///< Inline "debts" entries
    std::string debts_file;                  ///< CSV path, resolved against the config directory
    std::optional<double> budget;            ///< Periodic repayment budget
    SimulationConfig simulation;             ///< "simulation" section
    std::optional<SavingsParameters> savings;///< "savings" section, when present
    ExperimentConfig experiment;             ///< "experiment" section
    LoggerConfig logging;                    ///< "logging" section
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed configuration
 * @throws ConfigParseError if the file cannot be read, the JSON is invalid,
 *         or a value has the wrong type or range
 */
RunConfig parse_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @param base_dir Directory relative paths are resolved against (empty = as given)
 * @throws ConfigParseError on invalid JSON or values
 */
RunConfig parse_config_from_string(const std::string& json_string,
                                   const std::string& base_dir = "");

/**
 * @brief Resolves a path relative to the directory of a config file
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& base_dir);

/**
 * @brief Inline debts followed by those loaded from debts_file
 */
std::vector<Debt> collect_debts(const RunConfig& config);

} // namespace fincalc

#endif // FINCALC_CONFIG_HPP
