#ifndef PAYCALC_BUDGET_HPP
#define PAYCALC_BUDGET_HPP

#include "year_month.hpp"
#include <string>
#include <vector>

namespace paycalc {

// Household configuration. Immutable for the duration of a projection run.
struct Configuration {
    double base_salary;                 // Salario base (> 0)
    double average_productivity;        // Produtividade media (>= 0)
    double investment_goal_percentage;  // Meta de investimento (0.0-1.0), display only
    std::string holiday_region;         // State abbreviation for holiday lookup
    double daily_transport_allowance;   // Vale-transporte per benefit day
    double daily_meal_allowance;        // Vale-alimentacao per benefit day

    Configuration();
    Configuration(double salary, double productivity, double goal_pct, std::string region,
                  double vt = 0.0, double va = 0.0);

    bool operator==(const Configuration& other) const;

    // Throws InvalidInputError on out-of-range values
    void validate() const;
};

// Expense charged every projected month
struct FixedExpense {
    std::string name;
    double amount;
    std::string category;

    FixedExpense();
    FixedExpense(std::string n, double a, std::string c);

    // Throws InvalidInputError for a negative or non-finite amount
    void validate() const;

    bool operator==(const FixedExpense& other) const;
};

// Monthly obligation active from start to end, both inclusive
struct Installment {
    std::string name;
    double amount;      // Per-installment amount
    YearMonth start;
    YearMonth end;

    Installment();
    Installment(std::string n, double a, const YearMonth& s, const YearMonth& e);

    // Build from "YYYY-MM" strings; throws MalformedInstallmentError
    static Installment from_strings(const std::string& name, double amount,
                                    const std::string& start, const std::string& end);

    bool is_active(const YearMonth& month) const;

    // Throws MalformedInstallmentError if start > end or amount < 0
    void validate() const;

    bool operator==(const Installment& other) const;
};

// Everything a projection run needs from the budget file
struct Budget {
    Configuration configuration;
    std::vector<FixedExpense> fixed_expenses;
    std::vector<Installment> installments;

    // Validates configuration, expenses and installments in that order
    void validate() const;
};

} // namespace paycalc

#endif // PAYCALC_BUDGET_HPP
