/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace finsim {

namespace {

std::string format_amount(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_run_start(size_t trials, uint64_t seed, int start_year, int duration, int threads) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_start";
    fields["trials"] = std::to_string(trials);
    fields["seed"] = std::to_string(seed);
    fields["start_year"] = std::to_string(start_year);
    fields["duration"] = std::to_string(duration);
    fields["threads"] = std::to_string(threads);

    log(LogLevel::INFO, "Starting Monte Carlo run", fields);
}

void Logger::log_run_complete(size_t successful, size_t failed, size_t cancelled, double execution_time_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "run_complete";
    fields["successful"] = std::to_string(successful);
    fields["failed"] = std::to_string(failed);
    fields["cancelled"] = std::to_string(cancelled);
    fields["execution_time_ms"] = std::to_string(execution_time_ms);

    size_t attempted = successful + failed;
    fields["throughput_trials_per_sec"] = std::to_string(
        execution_time_ms > 0 ? (attempted * 1000.0 / execution_time_ms) : 0
    );

    log(failed > 0 ? LogLevel::WARN : LogLevel::INFO, "Monte Carlo run completed", fields);
}

void Logger::log_trial_start(const SimulationContext& ctx) {
    log(LogLevel::DEBUG, "Starting trial", context_fields("trial_start", ctx));
}

void Logger::log_trial_complete(const SimulationContext& ctx, double stranded_cash, double execution_time_ms) {
    auto fields = context_fields("trial_complete", ctx);
    fields["stranded_cash"] = format_amount(stranded_cash);
    fields["execution_time_ms"] = std::to_string(execution_time_ms);

    log(LogLevel::DEBUG, "Trial completed", fields);
}

void Logger::log_trial_failed(const SimulationContext& ctx, const std::string& error_message) {
    auto fields = context_fields("trial_failed", ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Trial failed", fields);
}

void Logger::log_phase(const SimulationContext& ctx, const std::map<std::string, double>& amounts) {
    if (!is_enabled(LogLevel::DEBUG)) {
        return;
    }
    auto fields = context_fields("phase", ctx);
    for (const auto& [key, value] : amounts) {
        fields[key] = format_amount(value);
    }

    log(LogLevel::DEBUG, "Phase " + ctx.phase + " done", fields);
}

void Logger::log_event_fired(const SimulationContext& ctx, const std::string& event_name, size_t action_count) {
    auto fields = context_fields("event_fired", ctx);
    fields["event_name"] = event_name;
    fields["actions"] = std::to_string(action_count);

    log(LogLevel::DEBUG, "Event fired", fields);
}

void Logger::log_override_expired(const SimulationContext& ctx, const std::string& target, const std::string& field) {
    auto fields = context_fields("override_expired", ctx);
    fields["target"] = target;
    fields["field"] = field;

    log(LogLevel::DEBUG, "Override expired", fields);
}

void Logger::log_stranded_cash(const SimulationContext& ctx, double amount) {
    auto fields = context_fields("stranded_cash", ctx);
    fields["amount"] = format_amount(amount);

    log(LogLevel::WARN, "Cash could not be deposited in any asset", fields);
}

void Logger::log_warning(const SimulationContext& ctx, const std::string& warning_message) {
    auto fields = context_fields("warning", ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const SimulationContext& ctx, const std::string& error_message) {
    auto fields = context_fields("error", ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Simulation error", fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

bool Logger::is_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= config_.min_level &&
           (config_.enable_console || (file_stream_ && file_stream_->is_open()));
}

std::map<std::string, std::string> Logger::context_fields(
    const std::string& event,
    const SimulationContext& ctx
) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["trial"] = std::to_string(ctx.trial_index);
    if (ctx.year != 0) {
        fields["year"] = std::to_string(ctx.year);
    }
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
    return fields;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    // Escape control characters
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

// Caller holds mutex_
void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace finsim
