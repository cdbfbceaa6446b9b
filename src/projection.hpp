#ifndef PAYCALC_PROJECTION_HPP
#define PAYCALC_PROJECTION_HPP

#include "budget.hpp"
#include "holidays.hpp"
#include "payroll.hpp"
#include "year_month.hpp"
#include <string>
#include <vector>

namespace paycalc {

// One projected month
struct ProjectionSnapshot {
    YearMonth month;
    MonthlyPayroll payroll;
    double fixed_total;             // Sum of all fixed expenses
    double installment_total;       // Sum of installments active this month
    double total_expenses;          // fixed_total + installment_total
    double free_balance;            // payroll.net_income - total_expenses
    double investment_target;       // payroll.net_income * goal percentage (display only)
    std::vector<std::string> active_installments;
    std::vector<std::string> ended_installments;    // Active last month, not this month

    ProjectionSnapshot();

    bool operator==(const ProjectionSnapshot& other) const;
};

// Ordered, immutable series of snapshots (chronological, gap-free)
class Projection {
public:
    using const_iterator = std::vector<ProjectionSnapshot>::const_iterator;

    Projection();
    explicit Projection(std::vector<ProjectionSnapshot>&& snapshots);

    const std::vector<ProjectionSnapshot>& snapshots() const { return snapshots_; }
    const ProjectionSnapshot& at(size_t index) const;
    const ProjectionSnapshot& operator[](size_t index) const { return snapshots_[index]; }

    size_t size() const { return snapshots_.size(); }
    bool empty() const { return snapshots_.empty(); }

    const_iterator begin() const { return snapshots_.begin(); }
    const_iterator end() const { return snapshots_.end(); }

    bool operator==(const Projection& other) const;

private:
    std::vector<ProjectionSnapshot> snapshots_;
};

// Options for a projection run
struct ProjectionOptions {
    int months;                     // Horizon length (default 12)

    ProjectionOptions();
    explicit ProjectionOptions(int horizon);
};

// Sum of the amounts of every fixed expense
double fixed_expense_total(const std::vector<FixedExpense>& fixed_expenses);

// Sum of the amounts of the installments active in a month
double active_installment_total(const std::vector<Installment>& installments,
                                const YearMonth& month);

// Project the household budget over consecutive months starting at `start`.
//
// For each month:
//   1. Compute the payslip (PayrollCalculator::compute_month)
//   2. Sum fixed expenses (every month)
//   3. Sum installments active in the month (start <= month <= end)
//   4. free balance = net income - (fixed + installments)
//
// Inputs are validated before the first month is computed. Any failure
// aborts the whole run: no partial series is ever returned. The start month
// is an explicit parameter; the wall clock is never read.
//
// Throws InvalidInputError, MalformedInstallmentError, InvalidRegionError,
// InvalidMonthError.
Projection project(
    const Configuration& config,
    const std::vector<FixedExpense>& fixed_expenses,
    const std::vector<Installment>& installments,
    const YearMonth& start,
    const HolidayProvider& holidays,
    const PayrollTables& tables = PayrollTables(),
    const ProjectionOptions& options = ProjectionOptions()
);

// Convenience overload for a loaded budget
Projection project(
    const Budget& budget,
    const YearMonth& start,
    const HolidayProvider& holidays,
    const PayrollTables& tables = PayrollTables(),
    const ProjectionOptions& options = ProjectionOptions()
);

} // namespace paycalc

#endif // PAYCALC_PROJECTION_HPP
