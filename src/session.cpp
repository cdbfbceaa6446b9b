#include "session.hpp"
#include "budget_loader.hpp"
#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <utility>

namespace paycalc {

ProjectionSession::ProjectionSession(std::string budget_path,
                                     const HolidayProvider& holidays,
                                     PayrollTables tables,
                                     ProjectionOptions options)
    : budget_path_(std::move(budget_path)),
      holidays_(holidays),
      tables_(std::move(tables)),
      options_(options),
      successful_reloads_(0) {}

bool ProjectionSession::reload(const YearMonth& start) {
    Logger& logger = Logger::get_instance();
    const LogContext ctx("session", budget_path_);

    try {
        auto budget = std::make_unique<const Budget>(parse_budget_from_file(budget_path_));
        logger.log_budget_loaded(ctx, *budget);

        if (budget->configuration.investment_goal_percentage > 0.0) {
            logger.log_warning(ctx, "meta_investimento_percentual only sets the investment target; "
                                    "it is not deducted from the free balance");
        }

        logger.log_projection_start(ctx, budget->configuration, start, options_.months);
        auto started = std::chrono::steady_clock::now();

        auto projection = std::make_unique<const Projection>(
            project(*budget, start, holidays_, tables_, options_));

        double elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        logger.log_projection_complete(ctx, *projection, elapsed_ms);

        budget_ = std::move(budget);
        projection_ = std::move(projection);
        last_error_.clear();
        ++successful_reloads_;
        return true;
    } catch (const std::exception& e) {
        // Keep the previous projection; the caller shows last_error()
        last_error_ = e.what();
        logger.log_error(ctx, last_error_);
        return false;
    }
}

const Projection& ProjectionSession::projection() const {
    if (!projection_) {
        throw std::logic_error("No projection available: reload() has not succeeded");
    }
    return *projection_;
}

const Budget& ProjectionSession::budget() const {
    if (!budget_) {
        throw std::logic_error("No budget available: reload() has not succeeded");
    }
    return *budget_;
}

YearMonth ProjectionSession::current_month() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    return YearMonth(tm_buf.tm_year + 1900, tm_buf.tm_mon + 1);
}

} // namespace paycalc
