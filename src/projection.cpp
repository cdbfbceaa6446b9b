#include "projection.hpp"
#include "errors.hpp"
#include <stdexcept>
#include <utility>

namespace paycalc {

// ============================================================================
// ProjectionSnapshot / Projection Implementation
// ============================================================================

ProjectionSnapshot::ProjectionSnapshot()
    : month(), payroll(), fixed_total(0.0), installment_total(0.0),
      total_expenses(0.0), free_balance(0.0), investment_target(0.0) {}

bool ProjectionSnapshot::operator==(const ProjectionSnapshot& other) const {
    return month == other.month &&
           payroll == other.payroll &&
           fixed_total == other.fixed_total &&
           installment_total == other.installment_total &&
           total_expenses == other.total_expenses &&
           free_balance == other.free_balance &&
           investment_target == other.investment_target &&
           active_installments == other.active_installments &&
           ended_installments == other.ended_installments;
}

Projection::Projection() = default;

Projection::Projection(std::vector<ProjectionSnapshot>&& snapshots)
    : snapshots_(std::move(snapshots)) {}

const ProjectionSnapshot& Projection::at(size_t index) const {
    if (index >= snapshots_.size()) {
        throw std::out_of_range("Snapshot index " + std::to_string(index) +
                                " out of range (size " + std::to_string(snapshots_.size()) + ")");
    }
    return snapshots_[index];
}

bool Projection::operator==(const Projection& other) const {
    return snapshots_ == other.snapshots_;
}

ProjectionOptions::ProjectionOptions() : months(12) {}

ProjectionOptions::ProjectionOptions(int horizon) : months(horizon) {}

// ============================================================================
// Projection Implementation
// ============================================================================

double fixed_expense_total(const std::vector<FixedExpense>& fixed_expenses) {
    double total = 0.0;
    for (const auto& expense : fixed_expenses) {
        total += expense.amount;
    }
    return total;
}

double active_installment_total(const std::vector<Installment>& installments,
                                const YearMonth& month) {
    double total = 0.0;
    for (const auto& installment : installments) {
        if (installment.is_active(month)) {
            total += installment.amount;
        }
    }
    return total;
}

Projection project(
    const Configuration& config,
    const std::vector<FixedExpense>& fixed_expenses,
    const std::vector<Installment>& installments,
    const YearMonth& start,
    const HolidayProvider& holidays,
    const PayrollTables& tables,
    const ProjectionOptions& options)
{
    // Validate inputs up front so a bad installment never reaches a month
    if (options.months < 1) {
        throw InvalidInputError("projection horizon must be at least one month");
    }
    config.validate();
    for (const auto& expense : fixed_expenses) {
        expense.validate();
    }
    for (const auto& installment : installments) {
        installment.validate();
    }

    const PayrollCalculator calculator(holidays, tables);
    const double fixed_total = fixed_expense_total(fixed_expenses);

    std::vector<ProjectionSnapshot> snapshots;
    snapshots.reserve(static_cast<size_t>(options.months));

    // Per installment: active in the previous month
    std::vector<bool> was_active(installments.size(), false);

    YearMonth month = start;
    for (int i = 0; i < options.months; ++i, month = month.next()) {
        ProjectionSnapshot snapshot;
        snapshot.month = month;
        snapshot.payroll = calculator.compute_month(month.year(), month.month(), config);
        snapshot.fixed_total = fixed_total;

        snapshot.installment_total = active_installment_total(installments, month);
        for (size_t k = 0; k < installments.size(); ++k) {
            const bool active = installments[k].is_active(month);
            if (active) {
                snapshot.active_installments.push_back(installments[k].name);
            } else if (was_active[k]) {
                snapshot.ended_installments.push_back(installments[k].name);
            }
            was_active[k] = active;
        }

        snapshot.total_expenses = snapshot.fixed_total + snapshot.installment_total;
        snapshot.free_balance = snapshot.payroll.net_income - snapshot.total_expenses;
        snapshot.investment_target = snapshot.payroll.net_income * config.investment_goal_percentage;

        snapshots.push_back(std::move(snapshot));
    }

    return Projection(std::move(snapshots));
}

Projection project(
    const Budget& budget,
    const YearMonth& start,
    const HolidayProvider& holidays,
    const PayrollTables& tables,
    const ProjectionOptions& options)
{
    return project(budget.configuration, budget.fixed_expenses, budget.installments,
                   start, holidays, tables, options);
}

} // namespace paycalc
