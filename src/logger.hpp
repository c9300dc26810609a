/**
 * @file logger.hpp
 * @brief Structured event logging for FinCalc runs
 *
 * One process-wide Logger writes one line per event, either as a flat JSON
 * object of string values or as "timestamp [LEVEL] message {k=v, ...}".
 * Lines go to stderr, to an append-mode file, or both.
 *
 * Simulator, estimator and experiment code call the event helpers below
 * rather than formatting messages themselves.
 */

#ifndef FINCALC_LOGGER_HPP
#define FINCALC_LOGGER_HPP

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace fincalc {

/**
 * @brief Log severity, lowest first
 */
enum class LogLevel {
    DEBUG,   ///< Per-period state and intermediate values
    INFO,    ///< Run start/end and results
    WARN,    ///< Early termination and other non-fatal conditions
    ERROR    ///< Failures surfaced to the caller
};

/// "DEBUG", "INFO", "WARN" or "ERROR"
std::string level_to_string(LogLevel level);

/// Inverse of level_to_string; unrecognised names give INFO
LogLevel string_to_level(const std::string& name);

using LogFields = std::map<std::string, std::string>;

/**
 * @brief Where and how log lines are written
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Events below this level are dropped
    bool enable_console;             ///< Write to stderr
    bool enable_file;                ///< Append to log_file_path
    std::string log_file_path;
    bool enable_json;                ///< JSON lines instead of plain text

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("fincalc.log"),
          enable_json(true) {}
};

/**
 * @brief Process-wide structured logger
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "fincalc.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *   logger.log_simulation_start("avalanche", 3, 500.0);
 *   @endcode
 *
 * Event helpers may be called from concurrent simulations. configure() is
 * not meant to race with them.
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Replace the configuration
     *
     * Closes any open log file and, when file output is enabled, opens the
     * new path in append mode. A file that cannot be opened is reported on
     * stderr and file output stays off.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a debt repayment simulation
     *
     * @param strategy Strategy name
     * @param debt_count Number of debts in the simulation
     * @param budget Periodic budget
     */
    void log_simulation_start(const std::string& strategy, size_t debt_count, double budget);

    /// One simulated period (DEBUG)
    void log_period(int period, double period_interest, double target_principal,
                    size_t active_debts);

    /**
     * @brief Log a simulation halted because interest exceeded the budget
     *
     * @param period Period at which the run halted
     * @param required_interest Interest due across active debts that period
     * @param budget Periodic budget
     */
    void log_insufficient_budget(int period, double required_interest, double budget);

    void log_period_limit(int max_periods, size_t remaining_debts);

    void log_simulation_complete(const std::string& strategy, const std::string& status,
                                 int periods, double total_interest,
                                 size_t debts_paid_off, double execution_time_ms);

    /**
     * @brief Log a completed savings goal search
     *
     * @param time Time at which the target is met
     * @param final_balance Balance at that time
     * @param iterations Bisection steps taken
     */
    void log_estimate_complete(double time, double final_balance, int iterations);

    void log_experiment_row(size_t num_debts, double runtime_ms, int periods,
                            double total_interest);

    /// ERROR event tagged with the component that raised it
    void log_error(const std::string& component, const std::string& error_message);

    /// WARN event tagged with the component that raised it
    void log_warning(const std::string& component, const std::string& warning_message);

    void flush();

    bool is_enabled(LogLevel level) const { return level >= config_.min_level; }

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;   // Null unless file output is on
    std::mutex mutex_;                             // Guards both sinks

    void emit(LogLevel level, const std::string& message, LogFields fields);

    static std::string timestamp();
    static std::string to_json(const LogFields& fields);
    static std::string to_text(LogLevel level, const std::string& message, const LogFields& fields);
    static std::string escape(const std::string& raw);
};

} // namespace fincalc

#endif // FINCALC_LOGGER_HPP
