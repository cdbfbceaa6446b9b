#include "budget.hpp"
#include "errors.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace paycalc {

// ============================================================================
// Configuration Implementation
// ============================================================================

Configuration::Configuration()
    : base_salary(0.0),
      average_productivity(0.0),
      investment_goal_percentage(0.0),
      holiday_region(),
      daily_transport_allowance(0.0),
      daily_meal_allowance(0.0) {}

Configuration::Configuration(double salary, double productivity, double goal_pct,
                             std::string region, double vt, double va)
    : base_salary(salary),
      average_productivity(productivity),
      investment_goal_percentage(goal_pct),
      holiday_region(std::move(region)),
      daily_transport_allowance(vt),
      daily_meal_allowance(va) {}

bool Configuration::operator==(const Configuration& other) const {
    return base_salary == other.base_salary &&
           average_productivity == other.average_productivity &&
           investment_goal_percentage == other.investment_goal_percentage &&
           holiday_region == other.holiday_region &&
           daily_transport_allowance == other.daily_transport_allowance &&
           daily_meal_allowance == other.daily_meal_allowance;
}

void Configuration::validate() const {
    if (!std::isfinite(base_salary) || !std::isfinite(average_productivity) ||
        !std::isfinite(investment_goal_percentage) ||
        !std::isfinite(daily_transport_allowance) || !std::isfinite(daily_meal_allowance)) {
        throw InvalidInputError("configuration amounts must be finite numbers");
    }
    if (base_salary <= 0.0) {
        throw InvalidInputError("base salary must be positive");
    }
    if (average_productivity < 0.0) {
        throw InvalidInputError("average productivity must be non-negative");
    }
    if (investment_goal_percentage < 0.0 || investment_goal_percentage > 1.0) {
        throw InvalidInputError("investment goal percentage must be between 0.0 and 1.0");
    }
    if (holiday_region.empty()) {
        throw InvalidInputError("holiday region must not be empty");
    }
    if (daily_transport_allowance < 0.0 || daily_meal_allowance < 0.0) {
        throw InvalidInputError("daily allowances must be non-negative");
    }
}

// ============================================================================
// FixedExpense Implementation
// ============================================================================

FixedExpense::FixedExpense() : name(), amount(0.0), category() {}

FixedExpense::FixedExpense(std::string n, double a, std::string c)
    : name(std::move(n)), amount(a), category(std::move(c)) {}

void FixedExpense::validate() const {
    if (!std::isfinite(amount)) {
        throw InvalidInputError("fixed expense '" + name + "' amount must be a finite number");
    }
    if (amount < 0.0) {
        throw InvalidInputError("fixed expense '" + name + "' has a negative amount");
    }
}

bool FixedExpense::operator==(const FixedExpense& other) const {
    return name == other.name && amount == other.amount && category == other.category;
}

// ============================================================================
// Installment Implementation
// ============================================================================

Installment::Installment() : name(), amount(0.0), start(), end() {}

Installment::Installment(std::string n, double a, const YearMonth& s, const YearMonth& e)
    : name(std::move(n)), amount(a), start(s), end(e) {}

Installment Installment::from_strings(const std::string& name, double amount,
                                      const std::string& start, const std::string& end) {
    YearMonth start_month;
    YearMonth end_month;
    try {
        start_month = YearMonth::parse(start);
        end_month = YearMonth::parse(end);
    } catch (const std::invalid_argument& e) {
        throw MalformedInstallmentError(name, e.what());
    }

    Installment installment(name, amount, start_month, end_month);
    installment.validate();
    return installment;
}

bool Installment::is_active(const YearMonth& month) const {
    return start <= month && month <= end;
}

void Installment::validate() const {
    if (end < start) {
        throw MalformedInstallmentError(name, "start " + start.to_string() +
                                              " is after end " + end.to_string());
    }
    if (!std::isfinite(amount)) {
        throw MalformedInstallmentError(name, "amount must be a finite number");
    }
    if (amount < 0.0) {
        throw MalformedInstallmentError(name, "amount must be non-negative");
    }
}

bool Installment::operator==(const Installment& other) const {
    return name == other.name && amount == other.amount &&
           start == other.start && end == other.end;
}

// ============================================================================
// Budget Implementation
// ============================================================================

void Budget::validate() const {
    configuration.validate();

    for (const auto& expense : fixed_expenses) {
        expense.validate();
    }

    for (const auto& installment : installments) {
        installment.validate();
    }
}

} // namespace paycalc
