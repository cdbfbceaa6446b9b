#include "tax_table.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace paycalc {

// ============================================================================
// TaxBracket Implementation
// ============================================================================

TaxBracket::TaxBracket() : upper_bound(std::nullopt), rate(0.0), deduction(0.0) {}

TaxBracket::TaxBracket(std::optional<double> upper, double r, double ded)
    : upper_bound(upper), rate(r), deduction(ded) {}

bool TaxBracket::operator==(const TaxBracket& other) const {
    return upper_bound == other.upper_bound &&
           rate == other.rate &&
           deduction == other.deduction;
}

// ============================================================================
// TaxTable Implementation
// ============================================================================

TaxTable::TaxTable(std::string name, std::vector<TaxBracket> brackets,
                   std::optional<double> ceiling)
    : name_(std::move(name)), brackets_(std::move(brackets)), ceiling_(ceiling)
{
    validate();
}

void TaxTable::validate() const {
    if (brackets_.empty()) {
        throw InvalidInputError("tax table '" + name_ + "' has no brackets");
    }

    for (size_t i = 0; i < brackets_.size(); ++i) {
        const TaxBracket& b = brackets_[i];
        const bool is_top = (i + 1 == brackets_.size());

        if (!std::isfinite(b.rate) || !std::isfinite(b.deduction) ||
            (b.upper_bound && !std::isfinite(*b.upper_bound))) {
            throw InvalidInputError("tax table '" + name_ + "' bracket " + std::to_string(i + 1) +
                                    " values must be finite numbers");
        }
        if (b.rate < 0.0 || b.rate > 1.0) {
            throw InvalidInputError("tax table '" + name_ + "' bracket " + std::to_string(i + 1) +
                                    " rate must be between 0.0 and 1.0");
        }
        if (b.deduction < 0.0) {
            throw InvalidInputError("tax table '" + name_ + "' bracket " + std::to_string(i + 1) +
                                    " deduction must be non-negative");
        }
        if (is_top) {
            if (b.upper_bound) {
                throw InvalidInputError("tax table '" + name_ + "' top bracket must be unbounded");
            }
            continue;
        }
        if (!b.upper_bound) {
            throw InvalidInputError("tax table '" + name_ + "' bracket " + std::to_string(i + 1) +
                                    " is unbounded but is not the top bracket");
        }
        if (*b.upper_bound <= 0.0) {
            throw InvalidInputError("tax table '" + name_ + "' upper bounds must be positive");
        }
        if (i > 0 && *b.upper_bound <= *brackets_[i - 1].upper_bound) {
            throw InvalidInputError("tax table '" + name_ + "' upper bounds must be strictly ascending");
        }
    }

    if (ceiling_ && (!std::isfinite(*ceiling_) || *ceiling_ <= 0.0)) {
        throw InvalidInputError("tax table '" + name_ + "' ceiling must be a positive finite number");
    }
}

const TaxBracket& TaxTable::bracket_for(double base_amount) const {
    for (const auto& bracket : brackets_) {
        if (!bracket.upper_bound || base_amount <= *bracket.upper_bound) {
            return bracket;
        }
    }
    // validate() guarantees an unbounded top bracket
    return brackets_.back();
}

double TaxTable::withhold(double base_amount) const {
    if (base_amount <= 0.0) {
        return 0.0;
    }

    double base = base_amount;
    if (ceiling_) {
        base = std::min(base, *ceiling_);
    }

    const TaxBracket& bracket = bracket_for(base);
    return std::max(0.0, base * bracket.rate - bracket.deduction);
}

TaxTable TaxTable::inss_2024() {
    return TaxTable("INSS 2024", {
        TaxBracket(1412.00, 0.075, 0.00),
        TaxBracket(2666.68, 0.09, 21.18),
        TaxBracket(4000.03, 0.12, 101.18),
        TaxBracket(std::nullopt, 0.14, 181.18),
    }, 7786.02);
}

TaxTable TaxTable::irrf_2024() {
    return TaxTable("IRRF 2024", {
        TaxBracket(2259.20, 0.0, 0.00),
        TaxBracket(2826.65, 0.075, 169.44),
        TaxBracket(3751.05, 0.15, 381.44),
        TaxBracket(4664.68, 0.225, 662.77),
        TaxBracket(std::nullopt, 0.275, 896.00),
    });
}

TaxTable TaxTable::load_from_csv(const std::string& name, const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open tax table file: " + filepath);
    }
    return load_from_csv(name, file);
}

TaxTable TaxTable::load_from_csv(const std::string& name, std::istream& is) {
    CsvReader reader(is);
    std::vector<TaxBracket> brackets;
    std::optional<double> ceiling;

    auto parse_number = [&](const std::string& cell) {
        try {
            size_t consumed = 0;
            double value = std::stod(cell, &consumed);
            if (consumed != cell.size() || !std::isfinite(value)) {
                throw std::invalid_argument(cell);
            }
            return value;
        } catch (const std::logic_error&) {
            throw InvalidInputError("tax table '" + name + "' line " +
                                    std::to_string(reader.line_number()) +
                                    ": not a number: '" + cell + "'");
        }
    };

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row[0] == "upper_bound") {
            continue;  // Header
        }
        if (row[0] == "ceiling") {
            if (row.size() < 2) {
                throw InvalidInputError("tax table '" + name + "' ceiling row needs a value");
            }
            ceiling = parse_number(row[1]);
            continue;
        }
        if (row.size() < 3) {
            throw InvalidInputError("tax table '" + name + "' requires columns: upper_bound,rate,deduction");
        }

        std::optional<double> upper;
        if (!row[0].empty()) {
            upper = parse_number(row[0]);
        }
        brackets.emplace_back(upper, parse_number(row[1]), parse_number(row[2]));
    }

    return TaxTable(name, std::move(brackets), ceiling);
}

double withhold(double base_amount, const TaxTable& table) {
    return table.withhold(base_amount);
}

} // namespace paycalc
