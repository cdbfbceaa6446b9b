#ifndef PAYCALC_PAYROLL_HPP
#define PAYCALC_PAYROLL_HPP

#include "budget.hpp"
#include "calendar.hpp"
#include "holidays.hpp"
#include "tax_table.hpp"

namespace paycalc {

// Payslip for one month, with every intermediate figure kept for auditing
struct MonthlyPayroll {
    int workdays;               // Dias uteis (Mon-Sat, not holiday)
    int rest_days;              // Dias de descanso (Sundays + holidays)
    int benefit_days;           // Mon-Fri workdays, basis for VT/VA
    double dsr;                 // Descanso semanal remunerado on productivity
    double gross_salary;        // base + productivity + DSR
    double inss;                // Social-security withholding on gross
    double irrf;                // Income-tax withholding on gross - INSS
    double net_salary;          // gross - INSS - IRRF
    double benefits;            // (VT + VA) * benefit_days, untaxed
    double net_income;          // net_salary + benefits

    MonthlyPayroll();

    bool operator==(const MonthlyPayroll& other) const;
};

// The two withholding tables a payroll run applies. Distinct instances, never
// shared between the INSS and IRRF steps.
struct PayrollTables {
    TaxTable inss;
    TaxTable irrf;

    // 2024 INSS and IRRF tables
    PayrollTables();
    PayrollTables(TaxTable inss_table, TaxTable irrf_table);
};

// Gross-to-net calculator for a single month.
//
// Steps:
//   1. Classify the month (workdays, rest days)
//   2. DSR = (productivity / workdays) * rest_days
//   3. Gross = base salary + productivity + DSR
//   4. INSS on gross
//   5. IRRF on gross - INSS
//   6. Net = gross - INSS - IRRF; net income adds untaxed VT/VA benefits
class PayrollCalculator {
public:
    // The provider must outlive the calculator
    explicit PayrollCalculator(const HolidayProvider& holidays,
                               PayrollTables tables = PayrollTables());

    // Throws InvalidRegionError (unknown region) or InvalidMonthError
    // (month out of range, or no workdays in the month)
    MonthlyPayroll compute_month(int year, int month, const Configuration& config) const;

    // Steps 2-6 with explicit day counts; throws InvalidInputError if
    // workdays <= 0 or rest_days < 0
    MonthlyPayroll compute_payslip(const Configuration& config, int workdays, int rest_days,
                                   int benefit_days = 0) const;

    const PayrollTables& tables() const { return tables_; }

private:
    const HolidayProvider& holidays_;
    PayrollTables tables_;
};

} // namespace paycalc

#endif // PAYCALC_PAYROLL_HPP
