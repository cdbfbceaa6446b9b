/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include "logger.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace paycalc;
using paycalc::testing::FakeHolidayProvider;
using json = nlohmann::json;

namespace {

std::string log_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

// Route the singleton to a fresh file only
void configure_file_logger(const std::string& path, LogLevel level, bool json_format = true) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    config.enable_json = json_format;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

void reset_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

Budget sample_budget() {
    Budget budget;
    budget.configuration = Configuration(2772.00, 542.40, 0.1, "XX");
    budget.fixed_expenses.emplace_back("Aluguel", 1200.00, "Moradia");
    budget.installments.emplace_back("Notebook", 300.00, YearMonth(2024, 1), YearMonth(2024, 2));
    return budget;
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "paycalc.log");
    }

    SECTION("Level conversion") {
        REQUIRE(level_to_string(LogLevel::DEBUG) == "DEBUG");
        REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");
        REQUIRE(string_to_level("WARN") == LogLevel::WARN);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
    }

    SECTION("Amount formatting") {
        REQUIRE(format_amount(1234.5) == "1234.50");
        REQUIRE(format_amount(0.0) == "0.00");
        REQUIRE(format_amount(-12.5) == "-12.50");
    }
}

TEST_CASE("Logger writes JSON lines with event fields", "[logger]") {
    const std::string path = log_path("paycalc_test_events.log");
    configure_file_logger(path, LogLevel::INFO);

    Logger& logger = Logger::get_instance();
    LogContext ctx("test", "orcamento.json");
    logger.log_budget_loaded(ctx, sample_budget());
    logger.log_error(ctx, "Invalid holiday region: 'ZZ'");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);

    json loaded = json::parse(lines[0]);
    REQUIRE(loaded["event"].get<std::string>() == "budget_loaded");
    REQUIRE(loaded["level"].get<std::string>() == "INFO");
    REQUIRE(loaded["source"].get<std::string>() == "orcamento.json");
    REQUIRE(loaded["base_salary"].get<std::string>() == "2772.00");
    REQUIRE(loaded["installment_count"].get<std::string>() == "1");
    REQUIRE(loaded.contains("timestamp"));

    json error = json::parse(lines[1]);
    REQUIRE(error["event"].get<std::string>() == "error");
    REQUIRE(error["level"].get<std::string>() == "ERROR");
    REQUIRE(error["error_message"].get<std::string>() == "Invalid holiday region: 'ZZ'");

    reset_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger filters by level", "[logger]") {
    const std::string path = log_path("paycalc_test_levels.log");
    FakeHolidayProvider holidays;
    Budget budget = sample_budget();
    Projection projection = project(budget, YearMonth(2024, 1), holidays, PayrollTables(),
                                    ProjectionOptions(3));
    LogContext ctx("test", "orcamento.json");

    SECTION("INFO hides per-month lines") {
        configure_file_logger(path, LogLevel::INFO);
        Logger::get_instance().log_projection_complete(ctx, projection, 1.5);

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        json done = json::parse(lines[0]);
        REQUIRE(done["event"].get<std::string>() == "projection_complete");
        REQUIRE(done["months"].get<std::string>() == "3");
        REQUIRE(done["first_month"].get<std::string>() == "2024-01");
        REQUIRE(done["last_month"].get<std::string>() == "2024-03");
    }

    SECTION("DEBUG includes one line per month") {
        configure_file_logger(path, LogLevel::DEBUG);
        Logger::get_instance().log_projection_complete(ctx, projection, 1.5);

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 4);
        REQUIRE(json::parse(lines[0])["event"].get<std::string>() == "month_projected");
        REQUIRE(json::parse(lines[2])["month"].get<std::string>() == "2024-03");
        REQUIRE(json::parse(lines[2])["ended_installments"].get<std::string>() == "Notebook");
    }

    SECTION("ERROR suppresses warnings") {
        configure_file_logger(path, LogLevel::ERROR);
        Logger::get_instance().log_warning(ctx, "ignored");
        Logger::get_instance().log_error(ctx, "kept");

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        REQUIRE(json::parse(lines[0])["error_message"].get<std::string>() == "kept");
    }

    reset_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger plain text format", "[logger]") {
    const std::string path = log_path("paycalc_test_plain.log");
    configure_file_logger(path, LogLevel::INFO, false);

    Logger::get_instance().log_projection_start(LogContext("cli", "orcamento.json"),
                                                Configuration(2000.0, 0.0, 0.0, "SP"),
                                                YearMonth(2024, 7), 12);

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[INFO] Starting projection") != std::string::npos);
    REQUIRE(lines[0].find("start_month=2024-07") != std::string::npos);
    REQUIRE(lines[0].find("months=12") != std::string::npos);

    reset_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger escapes quotes in JSON values", "[logger]") {
    const std::string path = log_path("paycalc_test_escape.log");
    configure_file_logger(path, LogLevel::INFO);

    Logger::get_instance().log_error(LogContext("test", "a\"b.json"), "line1\nline2");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    json entry = json::parse(lines[0]);
    REQUIRE(entry["source"].get<std::string>() == "a\"b.json");
    REQUIRE(entry["error_message"].get<std::string>() == "line1\nline2");

    reset_logger();
    std::filesystem::remove(path);
}
