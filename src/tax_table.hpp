#ifndef PAYCALC_TAX_TABLE_HPP
#define PAYCALC_TAX_TABLE_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace paycalc {

// One band of a progressive table.
// Withholding inside the band is base * rate - deduction, where the
// deduction linearizes the progressive sum of the lower bands.
struct TaxBracket {
    std::optional<double> upper_bound;  // Inclusive; empty for the top bracket
    double rate;                        // Marginal rate (0.0-1.0)
    double deduction;                   // Deduction constant

    TaxBracket();
    TaxBracket(std::optional<double> upper, double r, double ded);

    bool operator==(const TaxBracket& other) const;
};

// Progressive withholding table (INSS, IRRF).
//
// Brackets are ordered ascending by upper bound, contiguous, and the last one
// is unbounded. An optional ceiling clamps the base before evaluation (the
// INSS contribution cap).
class TaxTable {
public:
    // Throws InvalidInputError if the brackets break the invariants above
    TaxTable(std::string name, std::vector<TaxBracket> brackets,
             std::optional<double> ceiling = std::nullopt);

    // Withheld amount for a base; never negative, 0 for base <= 0
    double withhold(double base_amount) const;

    // First bracket whose upper bound is >= base (the top bracket otherwise)
    const TaxBracket& bracket_for(double base_amount) const;

    const std::string& name() const { return name_; }
    const std::vector<TaxBracket>& brackets() const { return brackets_; }
    const std::optional<double>& ceiling() const { return ceiling_; }

    // 2024 INSS employee table (7.5%, 9%, 12%, 14%; cap 7786.02)
    static TaxTable inss_2024();

    // 2024 IRRF monthly table (exempt up to 2259.20, then 7.5% to 27.5%)
    static TaxTable irrf_2024();

    // Load from CSV with columns upper_bound,rate,deduction. The top bracket
    // leaves upper_bound empty; an optional "ceiling,<value>" row sets the cap.
    static TaxTable load_from_csv(const std::string& name, const std::string& filepath);
    static TaxTable load_from_csv(const std::string& name, std::istream& is);

private:
    std::string name_;
    std::vector<TaxBracket> brackets_;
    std::optional<double> ceiling_;

    void validate() const;
};

// Free-function form of TaxTable::withhold
double withhold(double base_amount, const TaxTable& table);

} // namespace paycalc

#endif // PAYCALC_TAX_TABLE_HPP
