#ifndef PAYCALC_SESSION_HPP
#define PAYCALC_SESSION_HPP

#include "budget.hpp"
#include "holidays.hpp"
#include "payroll.hpp"
#include "projection.hpp"
#include <memory>
#include <string>

namespace paycalc {

/**
 * @brief Reloadable projection bound to a budget file
 *
 * Each reload() re-reads the budget file, re-runs the projection and, on
 * success, replaces the held result wholesale. On failure the previous
 * result stays in place and the error message is kept for display.
 *
 * Usage Example:
 *   @code
 *   BrazilHolidayProvider holidays;
 *   ProjectionSession session("orcamento.json", holidays);
 *   if (!session.reload(ProjectionSession::current_month())) {
 *       std::cerr << session.last_error() << "\n";
 *   }
 *   @endcode
 */
class ProjectionSession {
public:
    /**
     * @param budget_path Budget JSON file read on every reload
     * @param holidays Holiday provider; must outlive the session
     * @param tables Withholding tables
     * @param options Projection horizon
     */
    ProjectionSession(std::string budget_path,
                      const HolidayProvider& holidays,
                      PayrollTables tables = PayrollTables(),
                      ProjectionOptions options = ProjectionOptions());

    /**
     * @brief Reload the budget file and re-project from a start month
     *
     * @return true if a new projection replaced the previous one
     */
    bool reload(const YearMonth& start);

    bool has_projection() const { return projection_ != nullptr; }

    /**
     * @throws std::logic_error if no reload has succeeded yet
     */
    const Projection& projection() const;
    const Budget& budget() const;

    const std::string& budget_path() const { return budget_path_; }
    const std::string& last_error() const { return last_error_; }
    size_t successful_reloads() const { return successful_reloads_; }

    /**
     * @brief Month of the local wall clock; the engine itself never reads it
     */
    static YearMonth current_month();

private:
    std::string budget_path_;
    const HolidayProvider& holidays_;
    PayrollTables tables_;
    ProjectionOptions options_;

    std::unique_ptr<const Budget> budget_;
    std::unique_ptr<const Projection> projection_;
    std::string last_error_;
    size_t successful_reloads_;
};

} // namespace paycalc

#endif // PAYCALC_SESSION_HPP
