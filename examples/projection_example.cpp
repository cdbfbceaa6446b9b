/**
 * @file projection_example.cpp
 * @brief Example projecting a household budget with the library API
 *
 * Builds a budget in code, projects six months for Sao Paulo and prints
 * the payslip and balance for each month. Log lines go to stderr as JSON.
 */

#include "../src/errors.hpp"
#include "../src/holidays.hpp"
#include "../src/logger.hpp"
#include "../src/projection.hpp"
#include <chrono>
#include <iostream>

using namespace paycalc;

int main() {
    LoggerConfig log_config;
    log_config.min_level = LogLevel::DEBUG;  // Include one line per month
    log_config.enable_json = true;
    Logger& logger = Logger::get_instance();
    logger.configure(log_config);

    BrazilHolidayProvider holidays;
    LogContext ctx("example", "in-memory budget");
    YearMonth start(2024, 3);

    try {
        Budget budget;
        budget.configuration = Configuration(2772.00, 542.40, 0.10, "SP", 8.80, 25.00);
        budget.fixed_expenses.emplace_back("Aluguel", 1200.00, "Moradia");
        budget.fixed_expenses.emplace_back("Internet", 100.00, "Servicos");
        budget.installments.push_back(Installment::from_strings("Notebook", 300.00, "2024-01", "2024-04"));
        budget.installments.push_back(Installment::from_strings("Sofa", 150.00, "2024-04", "2024-06"));

        logger.log_budget_loaded(ctx, budget);
        logger.log_projection_start(ctx, budget.configuration, start, 6);

        auto started = std::chrono::steady_clock::now();
        Projection projection = project(budget, start, holidays, PayrollTables(), ProjectionOptions(6));
        double elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        logger.log_projection_complete(ctx, projection, elapsed_ms);

        for (const auto& s : projection) {
            std::cout << s.month.to_string()
                      << "  gross " << format_amount(s.payroll.gross_salary)
                      << "  INSS " << format_amount(s.payroll.inss)
                      << "  IRRF " << format_amount(s.payroll.irrf)
                      << "  net income " << format_amount(s.payroll.net_income)
                      << "  free " << format_amount(s.free_balance) << "\n";
        }
    } catch (const PayCalcError& e) {
        logger.log_error(ctx, e.what());
        return 1;
    }

    logger.flush();
    return 0;
}
