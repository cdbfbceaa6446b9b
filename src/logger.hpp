/**
 * @file logger.hpp
 * @brief Structured logging for the projection shell with JSON output
 *
 * The Logger provides structured logging for the CLI and the projection
 * session:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain text lines
 * - Console (stderr) and append-mode file sinks
 * - Per-month detail at DEBUG level
 *
 * The projection engine itself never logs; only its callers do.
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef PAYCALC_LOGGER_HPP
#define PAYCALC_LOGGER_HPP

#include "budget.hpp"
#include "projection.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace paycalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-month payroll figures
    INFO,    ///< Budget loaded, projection start/end
    WARN,    ///< Non-fatal issues
    ERROR    ///< Failures
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
 * @brief Parse log level from string (INFO for unknown values)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Where a log event originates
 */
struct LogContext {
    std::string component;           ///< "cli", "session", ...
    std::string source;              ///< Budget file path or other input identifier

    LogContext() = default;
    LogContext(const std::string& comp, const std::string& src)
        : component(comp), source(src) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("paycalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   LogContext ctx("cli", "orcamento.json");
 *   logger.log_budget_loaded(ctx, budget);
 *   logger.log_projection_complete(ctx, projection, elapsed_ms);
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
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a successfully loaded and validated budget
     */
    void log_budget_loaded(const LogContext& ctx, const Budget& budget);

    /**
     * @brief Log the start of a projection run
     */
    void log_projection_start(const LogContext& ctx, const Configuration& config,
                              const YearMonth& start, int months);

    /**
     * @brief Log one projected month (DEBUG)
     */
    void log_month_projected(const LogContext& ctx, const ProjectionSnapshot& snapshot);

    /**
     * @brief Log a completed projection run, one DEBUG event per month first
     */
    void log_projection_complete(const LogContext& ctx, const Projection& projection,
                                 double elapsed_ms);

    /**
     * @brief Log error with context
     */
    void log_error(const LogContext& ctx, const std::string& error_message);

    /**
     * @brief Log warning message
     */
    void log_warning(const LogContext& ctx, const std::string& warning_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

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
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

/**
 * @brief Format a currency amount with two decimals (no locale)
 */
std::string format_amount(double amount);

} // namespace paycalc

#endif // PAYCALC_LOGGER_HPP
