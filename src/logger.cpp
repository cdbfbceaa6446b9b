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

namespace paycalc {

std::string format_amount(double amount) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << amount;
    return oss.str();
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    flush();
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_budget_loaded(const LogContext& ctx, const Budget& budget) {
    std::map<std::string, std::string> fields;
    fields["event"] = "budget_loaded";
    fields["component"] = ctx.component;
    fields["source"] = ctx.source;
    fields["region"] = budget.configuration.holiday_region;
    fields["base_salary"] = format_amount(budget.configuration.base_salary);
    fields["average_productivity"] = format_amount(budget.configuration.average_productivity);
    fields["fixed_expense_count"] = std::to_string(budget.fixed_expenses.size());
    fields["installment_count"] = std::to_string(budget.installments.size());

    log(LogLevel::INFO, "Budget loaded", fields);
}

void Logger::log_projection_start(const LogContext& ctx, const Configuration& config,
                                  const YearMonth& start, int months) {
    std::map<std::string, std::string> fields;
    fields["event"] = "projection_start";
    fields["component"] = ctx.component;
    fields["source"] = ctx.source;
    fields["region"] = config.holiday_region;
    fields["start_month"] = start.to_string();
    fields["months"] = std::to_string(months);

    log(LogLevel::INFO, "Starting projection", fields);
}

void Logger::log_month_projected(const LogContext& ctx, const ProjectionSnapshot& snapshot) {
    if (LogLevel::DEBUG < config_.min_level) {
        return;
    }

    const MonthlyPayroll& p = snapshot.payroll;
    std::map<std::string, std::string> fields;
    fields["event"] = "month_projected";
    fields["component"] = ctx.component;
    fields["month"] = snapshot.month.to_string();
    fields["workdays"] = std::to_string(p.workdays);
    fields["rest_days"] = std::to_string(p.rest_days);
    fields["dsr"] = format_amount(p.dsr);
    fields["gross_salary"] = format_amount(p.gross_salary);
    fields["inss"] = format_amount(p.inss);
    fields["irrf"] = format_amount(p.irrf);
    fields["net_income"] = format_amount(p.net_income);
    fields["installment_total"] = format_amount(snapshot.installment_total);
    fields["free_balance"] = format_amount(snapshot.free_balance);

    if (!snapshot.ended_installments.empty()) {
        std::ostringstream ended;
        for (size_t i = 0; i < snapshot.ended_installments.size(); ++i) {
            if (i > 0) ended << ",";
            ended << snapshot.ended_installments[i];
        }
        fields["ended_installments"] = ended.str();
    }

    log(LogLevel::DEBUG, "Month projected", fields);
}

void Logger::log_projection_complete(const LogContext& ctx, const Projection& projection,
                                     double elapsed_ms) {
    for (const auto& snapshot : projection) {
        log_month_projected(ctx, snapshot);
    }

    std::map<std::string, std::string> fields;
    fields["event"] = "projection_complete";
    fields["component"] = ctx.component;
    fields["source"] = ctx.source;
    fields["months"] = std::to_string(projection.size());
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    if (!projection.empty()) {
        fields["first_month"] = projection[0].month.to_string();
        fields["last_month"] = projection[projection.size() - 1].month.to_string();
        fields["first_free_balance"] = format_amount(projection[0].free_balance);
    }

    log(LogLevel::INFO, "Projection completed", fields);
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["component"] = ctx.component;
    fields["source"] = ctx.source;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Projection error", fields);
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["component"] = ctx.component;
    fields["source"] = ctx.source;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
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
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace paycalc
