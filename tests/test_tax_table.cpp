#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <limits>
#include <sstream>
#include "errors.hpp"
#include "tax_table.hpp"

using namespace paycalc;
using Catch::Matchers::WithinAbs;

// ============================================================================
// INSS 2024
// ============================================================================

TEST_CASE("INSS 2024 brackets", "[tax][inss]") {
    TaxTable inss = TaxTable::inss_2024();

    REQUIRE_THAT(inss.withhold(1000.00), WithinAbs(75.00, 1e-9));
    REQUIRE_THAT(inss.withhold(2000.00), WithinAbs(158.82, 1e-9));
    REQUIRE_THAT(inss.withhold(3444.576), WithinAbs(312.16912, 1e-9));
    REQUIRE_THAT(inss.withhold(5000.00), WithinAbs(518.82, 1e-9));
}

TEST_CASE("INSS bracket bounds are inclusive", "[tax][inss][boundary]") {
    TaxTable inss = TaxTable::inss_2024();

    REQUIRE_THAT(inss.withhold(1412.00), WithinAbs(105.90, 1e-9));
    REQUIRE(inss.bracket_for(1412.00).rate == 0.075);
    REQUIRE(inss.bracket_for(1412.01).rate == 0.09);

    // The deduction constants keep the tax continuous across a bound
    REQUIRE_THAT(inss.withhold(1412.01), WithinAbs(105.9009, 1e-9));
    REQUIRE_THAT(inss.withhold(2666.68), WithinAbs(inss.withhold(2666.69), 0.01));
}

TEST_CASE("INSS contribution is capped at the ceiling", "[tax][inss][boundary]") {
    TaxTable inss = TaxTable::inss_2024();
    const double capped = 7786.02 * 0.14 - 181.18;

    REQUIRE(inss.ceiling().has_value());
    REQUIRE_THAT(inss.withhold(7786.02), WithinAbs(capped, 1e-9));
    REQUIRE_THAT(inss.withhold(10000.00), WithinAbs(capped, 1e-9));
    REQUIRE_THAT(inss.withhold(50000.00), WithinAbs(capped, 1e-9));
}

// ============================================================================
// IRRF 2024
// ============================================================================

TEST_CASE("IRRF 2024 brackets", "[tax][irrf]") {
    TaxTable irrf = TaxTable::irrf_2024();

    REQUIRE_THAT(irrf.withhold(2200.00), WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(irrf.withhold(2500.00), WithinAbs(18.06, 1e-9));
    REQUIRE_THAT(irrf.withhold(3132.40688), WithinAbs(88.421032, 1e-9));
    REQUIRE_THAT(irrf.withhold(4000.00), WithinAbs(237.23, 1e-9));
    REQUIRE_THAT(irrf.withhold(10000.00), WithinAbs(1854.00, 1e-9));
}

TEST_CASE("IRRF exempt band", "[tax][irrf][boundary]") {
    TaxTable irrf = TaxTable::irrf_2024();

    REQUIRE(irrf.withhold(2259.20) == 0.0);
    REQUIRE(irrf.withhold(2259.21) >= 0.0);
    REQUIRE_THAT(irrf.withhold(2826.65), WithinAbs(42.55875, 1e-9));
    REQUIRE_FALSE(irrf.ceiling().has_value());
}

TEST_CASE("Withholding is zero for non-positive bases", "[tax][boundary]") {
    TaxTable inss = TaxTable::inss_2024();
    TaxTable irrf = TaxTable::irrf_2024();

    REQUIRE(inss.withhold(0.0) == 0.0);
    REQUIRE(inss.withhold(-100.0) == 0.0);
    REQUIRE(irrf.withhold(0.0) == 0.0);
    REQUIRE(withhold(-1.0, irrf) == 0.0);
}

TEST_CASE("Withholding is non-negative and monotonic", "[tax]") {
    TaxTable inss = TaxTable::inss_2024();
    TaxTable irrf = TaxTable::irrf_2024();

    double prev_inss = 0.0;
    double prev_irrf = 0.0;
    for (double base = 0.0; base <= 12000.0; base += 25.0) {
        double i = inss.withhold(base);
        double r = irrf.withhold(base);
        REQUIRE(i >= 0.0);
        REQUIRE(r >= 0.0);
        REQUIRE(i >= prev_inss - 0.01);
        REQUIRE(r >= prev_irrf - 0.01);
        prev_inss = i;
        prev_irrf = r;
    }
}

TEST_CASE("Free withhold function matches the member", "[tax]") {
    TaxTable inss = TaxTable::inss_2024();
    REQUIRE(withhold(3000.00, inss) == inss.withhold(3000.00));
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("TaxTable rejects malformed tables", "[tax][error]") {
    SECTION("Empty table") {
        REQUIRE_THROWS_AS(TaxTable("T", {}), InvalidInputError);
    }

    SECTION("Top bracket with a bound") {
        REQUIRE_THROWS_AS(TaxTable("T", {TaxBracket(1000.0, 0.1, 0.0)}), InvalidInputError);
    }

    SECTION("Unbounded bracket below the top") {
        REQUIRE_THROWS_AS(TaxTable("T", {
            TaxBracket(std::nullopt, 0.1, 0.0),
            TaxBracket(std::nullopt, 0.2, 0.0),
        }), InvalidInputError);
    }

    SECTION("Descending bounds") {
        REQUIRE_THROWS_AS(TaxTable("T", {
            TaxBracket(2000.0, 0.1, 0.0),
            TaxBracket(1000.0, 0.2, 0.0),
            TaxBracket(std::nullopt, 0.3, 0.0),
        }), InvalidInputError);
    }

    SECTION("Rate out of range") {
        REQUIRE_THROWS_AS(TaxTable("T", {TaxBracket(std::nullopt, 1.5, 0.0)}), InvalidInputError);
        REQUIRE_THROWS_AS(TaxTable("T", {TaxBracket(std::nullopt, -0.1, 0.0)}), InvalidInputError);
    }

    SECTION("Negative deduction") {
        REQUIRE_THROWS_AS(TaxTable("T", {TaxBracket(std::nullopt, 0.1, -5.0)}), InvalidInputError);
    }

    SECTION("Non-positive ceiling") {
        REQUIRE_THROWS_AS(TaxTable("T", {TaxBracket(std::nullopt, 0.1, 0.0)}, 0.0),
                          InvalidInputError);
    }
}

TEST_CASE("Single-bracket table", "[tax]") {
    TaxTable flat("Flat", {TaxBracket(std::nullopt, 0.1, 0.0)});

    REQUIRE_THAT(flat.withhold(1234.0), WithinAbs(123.4, 1e-9));
    REQUIRE(flat.brackets().size() == 1);
    REQUIRE(flat.name() == "Flat");
}

// ============================================================================
// CSV loading
// ============================================================================

TEST_CASE("TaxTable loads from CSV", "[tax][csv]") {
    std::istringstream csv(
        "# INSS 2024\n"
        "upper_bound,rate,deduction\n"
        "1412.00,0.075,0\n"
        "2666.68,0.09,21.18\n"
        "4000.03,0.12,101.18\n"
        ",0.14,181.18\n"
        "ceiling,7786.02\n");

    TaxTable loaded = TaxTable::load_from_csv("INSS", csv);
    TaxTable builtin = TaxTable::inss_2024();

    REQUIRE(loaded.brackets() == builtin.brackets());
    REQUIRE(loaded.ceiling() == builtin.ceiling());
    REQUIRE(loaded.name() == "INSS");
    REQUIRE(loaded.withhold(10000.0) == builtin.withhold(10000.0));
}

TEST_CASE("TaxTable CSV without ceiling", "[tax][csv]") {
    std::istringstream csv(
        "upper_bound,rate,deduction\n"
        "1000,0,0\n"
        ",0.2,200\n");

    TaxTable table = TaxTable::load_from_csv("Custom", csv);

    REQUIRE(table.brackets().size() == 2);
    REQUIRE_FALSE(table.ceiling().has_value());
    REQUIRE(table.withhold(900.0) == 0.0);
    REQUIRE_THAT(table.withhold(2000.0), WithinAbs(200.0, 1e-9));
}

TEST_CASE("TaxTable CSV errors", "[tax][csv][error]") {
    SECTION("Non-numeric rate") {
        std::istringstream csv("1000,abc,0\n,0.2,0\n");
        REQUIRE_THROWS_AS(TaxTable::load_from_csv("T", csv), InvalidInputError);
    }

    SECTION("Missing columns") {
        std::istringstream csv("1000,0.1\n");
        REQUIRE_THROWS_AS(TaxTable::load_from_csv("T", csv), InvalidInputError);
    }

    SECTION("Bounded top bracket") {
        std::istringstream csv("1000,0.1,0\n2000,0.2,0\n");
        REQUIRE_THROWS_AS(TaxTable::load_from_csv("T", csv), InvalidInputError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(TaxTable::load_from_csv("T", "/nonexistent/table.csv"), std::runtime_error);
    }
}

TEST_CASE("TaxTable rejects non-finite values", "[tax][error]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    SECTION("Built in code") {
        REQUIRE_THROWS_AS(TaxTable("T", {TaxBracket(std::nullopt, nan, 0.0)}), InvalidInputError);
        REQUIRE_THROWS_AS(TaxTable("T", {TaxBracket(std::nullopt, 0.1, inf)}), InvalidInputError);
        REQUIRE_THROWS_AS(TaxTable("T", {TaxBracket(nan, 0.1, 0.0),
                                         TaxBracket(std::nullopt, 0.2, 0.0)}), InvalidInputError);
        REQUIRE_THROWS_AS(TaxTable("T", {TaxBracket(std::nullopt, 0.1, 0.0)}, inf),
                          InvalidInputError);
    }

    SECTION("NaN rate in CSV") {
        std::istringstream csv("1000,nan,0\n,0.2,0\n");
        REQUIRE_THROWS_AS(TaxTable::load_from_csv("T", csv), InvalidInputError);
    }

    SECTION("Infinite deduction in CSV") {
        std::istringstream csv("1000,0.1,inf\n,0.2,0\n");
        REQUIRE_THROWS_AS(TaxTable::load_from_csv("T", csv), InvalidInputError);
    }

    SECTION("Infinite ceiling in CSV") {
        std::istringstream csv(",0.1,0\nceiling,infinity\n");
        REQUIRE_THROWS_AS(TaxTable::load_from_csv("T", csv), InvalidInputError);
    }
}
