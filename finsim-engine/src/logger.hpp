/**
 * @file logger.hpp
 * @brief Structured logging for simulation runs with JSON output
 *
 * The Logger provides structured logging with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text lines
 * - Context tracking (trial index, simulated year, engine phase)
 * - Thread-safe writes so parallel trials never interleave lines
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef FINSIM_LOGGER_HPP
#define FINSIM_LOGGER_HPP

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace finsim {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Trial boundaries, phase amounts, fired events
    INFO,    ///< Run start and completion
    WARN,    ///< Non-fatal issues (stranded cash)
    ERROR    ///< Failed trials
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Where in a run a log event happened
 */
struct SimulationContext {
    size_t trial_index;      ///< Trial being simulated
    int year;                ///< Simulated calendar year (0 when not inside a year)
    std::string phase;       ///< Engine phase (events, balance, pretax, tax, distribute, grow, evolve)

    SimulationContext()
        : trial_index(0), year(0), phase("") {}

    explicit SimulationContext(size_t trial, int y = 0, const std::string& p = "")
        : trial_index(trial), year(y), phase(p) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs (opened in append mode)
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("finsim.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "finsim.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   logger.log_trial_start(SimulationContext(17));
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a Monte Carlo run
     *
     * @param trials Number of trials requested
     * @param seed Base seed
     * @param start_year First simulated year
     * @param duration Years per trial
     * @param threads Worker threads used
     */
    void log_run_start(size_t trials, uint64_t seed, int start_year, int duration, int threads);

    /**
     * @brief Log the end of a Monte Carlo run
     */
    void log_run_complete(size_t successful, size_t failed, size_t cancelled, double execution_time_ms);

    void log_trial_start(const SimulationContext& ctx);

    void log_trial_complete(const SimulationContext& ctx, double stranded_cash, double execution_time_ms);

    /**
     * @brief Log a trial aborted by a SimulationError
     *
     * @param ctx Context with the failing year
     * @param error_message Error message
     */
    void log_trial_failed(const SimulationContext& ctx, const std::string& error_message);

    /**
     * @brief Log the cash position at the end of an engine phase (DEBUG)
     *
     * @param ctx Context naming the phase
     * @param amounts Named amounts of the phase (e.g. "available_cash")
     */
    void log_phase(const SimulationContext& ctx, const std::map<std::string, double>& amounts);

    void log_event_fired(const SimulationContext& ctx, const std::string& event_name, size_t action_count);

    /**
     * @brief Log a timed override that ran out and was restored
     */
    void log_override_expired(const SimulationContext& ctx, const std::string& target, const std::string& field);

    /**
     * @brief Log positive cash that no asset could take (WARN)
     */
    void log_stranded_cash(const SimulationContext& ctx, double amount);

    void log_warning(const SimulationContext& ctx, const std::string& warning_message);

    void log_error(const SimulationContext& ctx, const std::string& error_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    /**
     * @brief Set minimum log level
     */
    void set_min_level(LogLevel level);

    LogLevel get_min_level() const;

    /**
     * @brief True when messages at `level` would be written
     */
    bool is_enabled(LogLevel level) const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> context_fields(const std::string& event, const SimulationContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace finsim

#endif // FINSIM_LOGGER_HPP
