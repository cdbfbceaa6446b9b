#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "errors.hpp"
#include "payroll.hpp"
#include "test_helpers.hpp"

using namespace paycalc;
using paycalc::testing::FakeHolidayProvider;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Payslip from explicit day counts
// ============================================================================

TEST_CASE("Payslip with DSR in the 12% INSS bracket", "[payroll]") {
    FakeHolidayProvider holidays;
    PayrollCalculator calc(holidays);
    Configuration config(2000.00, 500.00, 0.0, "XX");

    MonthlyPayroll p = calc.compute_payslip(config, 20, 10);

    REQUIRE_THAT(p.dsr, WithinAbs(250.00, 1e-9));
    REQUIRE_THAT(p.gross_salary, WithinAbs(2750.00, 1e-9));
    REQUIRE_THAT(p.inss, WithinAbs(228.82, 1e-9));
    REQUIRE_THAT(p.irrf, WithinAbs(19.6485, 1e-9));
    REQUIRE_THAT(p.net_salary, WithinAbs(2501.5315, 1e-9));
    REQUIRE(p.benefits == 0.0);
    REQUIRE(p.net_income == p.net_salary);
}

TEST_CASE("Zero productivity yields zero DSR", "[payroll][boundary]") {
    FakeHolidayProvider holidays;
    PayrollCalculator calc(holidays);
    Configuration config(1412.00, 0.0, 0.0, "XX");

    MonthlyPayroll p = calc.compute_payslip(config, 26, 5);

    REQUIRE(p.dsr == 0.0);
    REQUIRE(p.gross_salary == 1412.00);
    REQUIRE_THAT(p.inss, WithinAbs(105.90, 1e-9));
    REQUIRE(p.irrf == 0.0);
    REQUIRE_THAT(p.net_salary, WithinAbs(1306.10, 1e-9));
}

TEST_CASE("High salary hits the INSS ceiling", "[payroll][boundary]") {
    FakeHolidayProvider holidays;
    PayrollCalculator calc(holidays);
    Configuration config(10000.00, 0.0, 0.0, "XX");

    MonthlyPayroll p = calc.compute_payslip(config, 26, 5);

    REQUIRE_THAT(p.inss, WithinAbs(908.8628, 1e-9));
    REQUIRE_THAT(p.irrf, WithinAbs(9091.1372 * 0.275 - 896.00, 1e-9));
}

TEST_CASE("Payslip identities hold", "[payroll]") {
    FakeHolidayProvider holidays;
    PayrollCalculator calc(holidays);
    Configuration config(3100.00, 875.50, 0.0, "XX", 12.0, 35.0);

    MonthlyPayroll p = calc.compute_payslip(config, 24, 7, 20);

    REQUIRE_THAT(p.gross_salary, WithinAbs(3100.00 + 875.50 + p.dsr, 1e-9));
    REQUIRE_THAT(p.net_salary, WithinAbs(p.gross_salary - p.inss - p.irrf, 1e-9));
    REQUIRE_THAT(p.benefits, WithinAbs(47.0 * 20, 1e-9));
    REQUIRE_THAT(p.net_income, WithinAbs(p.net_salary + p.benefits, 1e-9));
    REQUIRE(p.inss >= 0.0);
    REQUIRE(p.irrf >= 0.0);
}

TEST_CASE("compute_payslip rejects invalid day counts", "[payroll][error]") {
    FakeHolidayProvider holidays;
    PayrollCalculator calc(holidays);
    Configuration config(2000.00, 500.00, 0.0, "XX");

    REQUIRE_THROWS_AS(calc.compute_payslip(config, 0, 31), InvalidInputError);
    REQUIRE_THROWS_AS(calc.compute_payslip(config, -1, 5), InvalidInputError);
    REQUIRE_THROWS_AS(calc.compute_payslip(config, 20, -1), InvalidInputError);
    REQUIRE_THROWS_AS(calc.compute_payslip(config, 20, 10, -2), InvalidInputError);
}

// ============================================================================
// Payslip for a calendar month
// ============================================================================

TEST_CASE("March 2024 payslip in Sao Paulo", "[payroll][calendar]") {
    BrazilHolidayProvider holidays;
    PayrollCalculator calc(holidays);
    Configuration config(2772.00, 542.40, 0.10, "SP");

    MonthlyPayroll p = calc.compute_month(2024, 3, config);

    REQUIRE(p.workdays == 25);
    REQUIRE(p.rest_days == 6);
    REQUIRE_THAT(p.dsr, WithinAbs(130.176, 1e-9));
    REQUIRE_THAT(p.gross_salary, WithinAbs(3444.576, 1e-9));
    REQUIRE_THAT(p.inss, WithinAbs(312.16912, 1e-9));
    REQUIRE_THAT(p.irrf, WithinAbs(88.421032, 1e-9));
    REQUIRE_THAT(p.net_salary, WithinAbs(3043.985848, 1e-9));
}

TEST_CASE("Benefits follow benefit days", "[payroll][calendar]") {
    BrazilHolidayProvider holidays;
    PayrollCalculator calc(holidays);
    Configuration config(2772.00, 0.0, 0.0, "SP", 10.00, 30.00);

    MonthlyPayroll p = calc.compute_month(2024, 7, config);

    REQUIRE(p.benefit_days == 22);
    REQUIRE_THAT(p.benefits, WithinAbs(880.00, 1e-9));
    REQUIRE_THAT(p.net_income, WithinAbs(p.net_salary + 880.00, 1e-9));
}

TEST_CASE("Month without workdays throws InvalidMonthError", "[payroll][error]") {
    FakeHolidayProvider holidays;
    holidays.add_whole_month(2024, 5);
    PayrollCalculator calc(holidays);
    Configuration config(2000.00, 500.00, 0.0, "XX");

    REQUIRE_THROWS_AS(calc.compute_month(2024, 5, config), InvalidMonthError);
    REQUIRE_NOTHROW(calc.compute_month(2024, 6, config));

    try {
        calc.compute_month(2024, 5, config);
    } catch (const InvalidMonthError& e) {
        REQUIRE(e.month_id() == "2024-05");
    }
}

TEST_CASE("Unknown region propagates InvalidRegionError", "[payroll][error]") {
    BrazilHolidayProvider holidays;
    PayrollCalculator calc(holidays);
    Configuration config(2000.00, 500.00, 0.0, "XX");

    REQUIRE_THROWS_AS(calc.compute_month(2024, 7, config), InvalidRegionError);
}

TEST_CASE("Custom tables replace the 2024 tables", "[payroll]") {
    FakeHolidayProvider holidays;
    PayrollTables tables(
        TaxTable("Flat INSS", {TaxBracket(std::nullopt, 0.10, 0.0)}),
        TaxTable("Flat IRRF", {TaxBracket(std::nullopt, 0.20, 0.0)}));
    PayrollCalculator calc(holidays, tables);
    Configuration config(1000.00, 0.0, 0.0, "XX");

    MonthlyPayroll p = calc.compute_payslip(config, 26, 5);

    REQUIRE_THAT(p.inss, WithinAbs(100.0, 1e-9));
    REQUIRE_THAT(p.irrf, WithinAbs(180.0, 1e-9));
    REQUIRE_THAT(p.net_salary, WithinAbs(720.0, 1e-9));
    REQUIRE(calc.tables().inss.name() == "Flat INSS");
}

TEST_CASE("Default tables are the 2024 tables", "[payroll]") {
    PayrollTables tables;
    REQUIRE(tables.inss.brackets() == TaxTable::inss_2024().brackets());
    REQUIRE(tables.irrf.brackets() == TaxTable::irrf_2024().brackets());
}
