#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "holidays.hpp"
#include "logger.hpp"
#include "payroll.hpp"
#include "projection.hpp"
#include "session.hpp"
#include "tax_table.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

struct CLIArgs {
    std::string budget_path = "orcamento.json";
    std::string start_month;        // Empty: current month
    int months = 12;
    std::string inss_table_path;
    std::string irrf_table_path;
    std::string output_path;
    std::string log_level = "INFO";
    std::string log_file;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "PayCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --budget <path>             JSON budget file (default: orcamento.json)\n";
    std::cerr << "  --inss-table <path>         CSV override for the INSS table\n";
    std::cerr << "  --irrf-table <path>         CSV override for the IRRF table\n\n";
    std::cerr << "Projection options:\n";
    std::cerr << "  --start <YYYY-MM>           First projected month (default: current month)\n";
    std::cerr << "  --months <count>            Number of months to project (default: 12)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file, or .parquet when built with Arrow\n";
    std::cerr << "                              (default: JSON on stdout)\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to a file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Tax table CSV format:\n";
    std::cerr << "  upper_bound,rate,deduction   (leave upper_bound empty on the top bracket)\n";
    std::cerr << "  ceiling,<value>              (optional contribution cap)\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --budget orcamento.json --start 2024-07 \\\n";
    std::cerr << "      --output projecao.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (str.length() < suffix.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--budget" && i + 1 < argc) {
            args.budget_path = argv[++i];
        } else if (arg == "--start" && i + 1 < argc) {
            args.start_month = argv[++i];
        } else if (arg == "--months" && i + 1 < argc) {
            const std::string value = argv[++i];
            size_t consumed = 0;
            try {
                args.months = std::stoi(value, &consumed);
            } catch (const std::logic_error&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != value.size()) {
                std::cerr << "Error: --months expects an integer, got: " << value << "\n\n";
                return false;
            }
        } else if (arg == "--inss-table" && i + 1 < argc) {
            args.inss_table_path = argv[++i];
        } else if (arg == "--irrf-table" && i + 1 < argc) {
            args.irrf_table_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (!file_exists(args.budget_path)) {
        std::cerr << "Error: Budget file not found: " << args.budget_path << "\n";
        valid = false;
    }

    if (!args.start_month.empty()) {
        try {
            paycalc::YearMonth::parse(args.start_month);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: --start " << e.what() << "\n";
            valid = false;
        }
    }

    if (args.months < 1) {
        std::cerr << "Error: --months must be at least 1\n";
        valid = false;
    }

    if (!args.inss_table_path.empty() && !file_exists(args.inss_table_path)) {
        std::cerr << "Error: INSS table file not found: " << args.inss_table_path << "\n";
        valid = false;
    }

    if (!args.irrf_table_path.empty() && !file_exists(args.irrf_table_path)) {
        std::cerr << "Error: IRRF table file not found: " << args.irrf_table_path << "\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    if (ends_with(args.output_path, ".parquet") && !paycalc::ParquetWriter::available()) {
        std::cerr << "Error: Parquet output requires a build with Apache Arrow\n";
        valid = false;
    }

    return valid;
}

void print_summary(const paycalc::Projection& projection) {
    using paycalc::format_amount;

    std::cerr << "\n"
              << std::left << std::setw(9) << "Month"
              << std::right << std::setw(6) << "Work"
              << std::setw(6) << "Rest"
              << std::setw(11) << "DSR"
              << std::setw(12) << "Gross"
              << std::setw(10) << "INSS"
              << std::setw(10) << "IRRF"
              << std::setw(12) << "Net income"
              << std::setw(12) << "Expenses"
              << std::setw(12) << "Free"
              << "  Installments\n";

    for (const auto& s : projection) {
        std::ostringstream names;
        for (size_t i = 0; i < s.active_installments.size(); ++i) {
            if (i > 0) names << ", ";
            names << s.active_installments[i];
        }
        std::string free_balance = format_amount(s.free_balance);
        if (!s.ended_installments.empty()) {
            free_balance += "*";  // An installment ended last month
        }

        std::cerr << std::left << std::setw(9) << s.month.to_string()
                  << std::right << std::setw(6) << s.payroll.workdays
                  << std::setw(6) << s.payroll.rest_days
                  << std::setw(11) << format_amount(s.payroll.dsr)
                  << std::setw(12) << format_amount(s.payroll.gross_salary)
                  << std::setw(10) << format_amount(s.payroll.inss)
                  << std::setw(10) << format_amount(s.payroll.irrf)
                  << std::setw(12) << format_amount(s.payroll.net_income)
                  << std::setw(12) << format_amount(s.total_expenses)
                  << std::setw(12) << free_balance
                  << "  " << (s.active_installments.empty() ? "-" : names.str()) << "\n";
    }

    if (!projection.empty()) {
        const auto& current = projection[0];
        std::cerr << "\nCurrent month " << current.month.to_string() << ":\n";
        std::cerr << "  Net income:        " << format_amount(current.payroll.net_income) << "\n";
        std::cerr << "  Total expenses:    " << format_amount(current.total_expenses) << "\n";
        std::cerr << "  Investment target: " << format_amount(current.investment_target) << "\n";
        std::cerr << "  Free balance:      " << format_amount(current.free_balance) << "\n";
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    paycalc::LoggerConfig log_config;
    log_config.min_level = paycalc::string_to_level(args.log_level);
    log_config.enable_json = false;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    paycalc::Logger::get_instance().configure(log_config);

    try {
        paycalc::PayrollTables tables;
        if (!args.inss_table_path.empty()) {
            std::cerr << "Loading INSS table from " << args.inss_table_path << "..." << std::flush;
            tables.inss = paycalc::TaxTable::load_from_csv("INSS", args.inss_table_path);
            std::cerr << " " << tables.inss.brackets().size() << " brackets\n";
        }
        if (!args.irrf_table_path.empty()) {
            std::cerr << "Loading IRRF table from " << args.irrf_table_path << "..." << std::flush;
            tables.irrf = paycalc::TaxTable::load_from_csv("IRRF", args.irrf_table_path);
            std::cerr << " " << tables.irrf.brackets().size() << " brackets\n";
        }

        paycalc::YearMonth start = args.start_month.empty()
            ? paycalc::ProjectionSession::current_month()
            : paycalc::YearMonth::parse(args.start_month);

        paycalc::BrazilHolidayProvider holidays;
        paycalc::ProjectionSession session(args.budget_path, holidays, tables,
                                           paycalc::ProjectionOptions(args.months));

        if (!session.reload(start)) {
            std::cerr << "Error: " << session.last_error() << "\n";
            return 1;
        }

        const paycalc::Projection& projection = session.projection();
        print_summary(projection);

        if (args.output_path.empty()) {
            paycalc::io::write_projection_json(std::cout, projection);
        } else if (ends_with(args.output_path, ".parquet")) {
            paycalc::ParquetWriter::write_projection(projection, args.output_path);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        } else {
            paycalc::io::write_projection_json(args.output_path, projection);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        paycalc::Logger::get_instance().flush();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
