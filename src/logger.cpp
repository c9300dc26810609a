/**
 * @file logger.cpp
 * @brief Logger sinks, formatting and event helpers
 */

#include "logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>

namespace fincalc {

std::string level_to_string(LogLevel level) {
    static const char* const NAMES[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    int index = static_cast<int>(level);
    return (index >= 0 && index < 4) ? NAMES[index] : "UNKNOWN";
}

LogLevel string_to_level(const std::string& name) {
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR}) {
        if (name == level_to_string(level)) {
            return level;
        }
    }
    return LogLevel::INFO;
}

Logger& Logger::get_instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : config_() {}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (!config_.enable_file) {
        return;
    }
    file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
    if (!*file_stream_) {
        std::cerr << "Warning: cannot append to log file " << config_.log_file_path << std::endl;
        file_stream_.reset();
    }
}

// ============================================================================
// Simulation events
// ============================================================================

void Logger::log_simulation_start(const std::string& strategy, size_t debt_count, double budget) {
    emit(LogLevel::INFO, "Starting debt repayment simulation", {
        {"event", "simulation_start"},
        {"strategy", strategy},
        {"debt_count", std::to_string(debt_count)},
        {"budget", std::to_string(budget)},
    });
}

void Logger::log_period(int period, double period_interest, double target_principal,
                        size_t active_debts) {
    // Called once per period; skip building the fields when filtered
    if (!is_enabled(LogLevel::DEBUG)) {
        return;
    }
    emit(LogLevel::DEBUG, "Period simulated", {
        {"event", "period"},
        {"period", std::to_string(period)},
        {"period_interest", std::to_string(period_interest)},
        {"target_principal", std::to_string(target_principal)},
        {"active_debts", std::to_string(active_debts)},
    });
}

void Logger::log_insufficient_budget(int period, double required_interest, double budget) {
    emit(LogLevel::WARN, "Budget insufficient to cover interest", {
        {"event", "insufficient_budget"},
        {"period", std::to_string(period)},
        {"required_interest", std::to_string(required_interest)},
        {"budget", std::to_string(budget)},
    });
}

void Logger::log_period_limit(int max_periods, size_t remaining_debts) {
    emit(LogLevel::WARN, "Simulation stopped at period limit", {
        {"event", "period_limit"},
        {"max_periods", std::to_string(max_periods)},
        {"remaining_debts", std::to_string(remaining_debts)},
    });
}

void Logger::log_simulation_complete(const std::string& strategy, const std::string& status,
                                     int periods, double total_interest,
                                     size_t debts_paid_off, double execution_time_ms) {
    emit(LogLevel::INFO, "Simulation completed", {
        {"event", "simulation_complete"},
        {"strategy", strategy},
        {"status", status},
        {"periods", std::to_string(periods)},
        {"total_interest", std::to_string(total_interest)},
        {"debts_paid_off", std::to_string(debts_paid_off)},
        {"execution_time_ms", std::to_string(execution_time_ms)},
    });
}

// ============================================================================
// Estimator and experiment events
// ============================================================================

void Logger::log_estimate_complete(double time, double final_balance, int iterations) {
    emit(LogLevel::INFO, "Savings goal estimated", {
        {"event", "estimate_complete"},
        {"time", std::to_string(time)},
        {"final_balance", std::to_string(final_balance)},
        {"iterations", std::to_string(iterations)},
    });
}

void Logger::log_experiment_row(size_t num_debts, double runtime_ms, int periods,
                                double total_interest) {
    emit(LogLevel::INFO, "Experiment row", {
        {"event", "experiment_row"},
        {"num_debts", std::to_string(num_debts)},
        {"runtime_ms", std::to_string(runtime_ms)},
        {"periods", std::to_string(periods)},
        {"total_interest", std::to_string(total_interest)},
    });
}

void Logger::log_error(const std::string& component, const std::string& error_message) {
    emit(LogLevel::ERROR, error_message, {
        {"event", "error"},
        {"component", component},
        {"error_message", error_message},
    });
}

void Logger::log_warning(const std::string& component, const std::string& warning_message) {
    emit(LogLevel::WARN, warning_message, {
        {"event", "warning"},
        {"component", component},
        {"warning", warning_message},
    });
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
    if (file_stream_) {
        file_stream_->flush();
    }
}

// ============================================================================
// Formatting
// ============================================================================

void Logger::emit(LogLevel level, const std::string& message, LogFields fields) {
    if (!is_enabled(level)) {
        return;
    }

    std::string line;
    if (config_.enable_json) {
        fields["timestamp"] = timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        line = to_json(fields);
    } else {
        line = to_text(level, message, fields);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (file_stream_) {
        *file_stream_ << line << '\n';
    }
}

std::string Logger::timestamp() {
    using std::chrono::system_clock;
    system_clock::time_point now = system_clock::now();
    std::time_t seconds = system_clock::to_time_t(now);
    long millis = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
    char stamp[40];
    std::snprintf(stamp, sizeof(stamp), "%s.%03ld", date, millis);
    return stamp;
}

std::string Logger::to_json(const LogFields& fields) {
    std::string out = "{";
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        if (it != fields.begin()) {
            out += ',';
        }
        out += '"' + escape(it->first) + "\":\"" + escape(it->second) + '"';
    }
    out += '}';
    return out;
}

std::string Logger::to_text(LogLevel level, const std::string& message, const LogFields& fields) {
    std::ostringstream oss;
    oss << timestamp() << " [" << level_to_string(level) << "] " << message;
    if (fields.empty()) {
        return oss.str();
    }

    const char* separator = " {";
    for (const auto& [key, value] : fields) {
        oss << separator << key << '=' << value;
        separator = ", ";
    }
    oss << '}';
    return oss.str();
}

std::string Logger::escape(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char code[8];
                    std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned char>(c));
                    out += code;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

} // namespace fincalc
