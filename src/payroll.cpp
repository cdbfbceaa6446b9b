#include "payroll.hpp"
#include "errors.hpp"
#include <utility>

namespace paycalc {

MonthlyPayroll::MonthlyPayroll()
    : workdays(0), rest_days(0), benefit_days(0),
      dsr(0.0), gross_salary(0.0), inss(0.0), irrf(0.0),
      net_salary(0.0), benefits(0.0), net_income(0.0) {}

bool MonthlyPayroll::operator==(const MonthlyPayroll& other) const {
    return workdays == other.workdays &&
           rest_days == other.rest_days &&
           benefit_days == other.benefit_days &&
           dsr == other.dsr &&
           gross_salary == other.gross_salary &&
           inss == other.inss &&
           irrf == other.irrf &&
           net_salary == other.net_salary &&
           benefits == other.benefits &&
           net_income == other.net_income;
}

PayrollTables::PayrollTables()
    : inss(TaxTable::inss_2024()), irrf(TaxTable::irrf_2024()) {}

PayrollTables::PayrollTables(TaxTable inss_table, TaxTable irrf_table)
    : inss(std::move(inss_table)), irrf(std::move(irrf_table)) {}

PayrollCalculator::PayrollCalculator(const HolidayProvider& holidays, PayrollTables tables)
    : holidays_(holidays), tables_(std::move(tables)) {}

MonthlyPayroll PayrollCalculator::compute_month(int year, int month,
                                                const Configuration& config) const {
    MonthClassification days = classify_month(year, month, config.holiday_region, holidays_);

    if (days.workdays == 0) {
        throw InvalidMonthError(YearMonth(year, month).to_string(),
                                "no workdays in month, DSR is undefined");
    }

    return compute_payslip(config, days.workdays, days.rest_days, days.benefit_days);
}

MonthlyPayroll PayrollCalculator::compute_payslip(const Configuration& config, int workdays,
                                                  int rest_days, int benefit_days) const {
    if (workdays <= 0) {
        throw InvalidInputError("workdays must be positive to compute DSR");
    }
    if (rest_days < 0 || benefit_days < 0) {
        throw InvalidInputError("day counts must be non-negative");
    }

    MonthlyPayroll payroll;
    payroll.workdays = workdays;
    payroll.rest_days = rest_days;
    payroll.benefit_days = benefit_days;

    payroll.dsr = (config.average_productivity / workdays) * rest_days;
    payroll.gross_salary = config.base_salary + config.average_productivity + payroll.dsr;

    payroll.inss = tables_.inss.withhold(payroll.gross_salary);

    // No dependants are deducted from the IRRF base
    const double irrf_base = payroll.gross_salary - payroll.inss;
    payroll.irrf = tables_.irrf.withhold(irrf_base);

    payroll.net_salary = payroll.gross_salary - payroll.inss - payroll.irrf;

    payroll.benefits = (config.daily_transport_allowance + config.daily_meal_allowance) * benefit_days;
    payroll.net_income = payroll.net_salary + payroll.benefits;

    return payroll;
}

} // namespace paycalc
