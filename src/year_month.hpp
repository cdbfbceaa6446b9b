#ifndef PAYCALC_YEAR_MONTH_HPP
#define PAYCALC_YEAR_MONTH_HPP

#include <cstdint>
#include <string>

namespace paycalc {

// Python-style numbering: Monday = 0 ... Sunday = 6
enum class Weekday : uint8_t {
    Monday = 0,
    Tuesday = 1,
    Wednesday = 2,
    Thursday = 3,
    Friday = 4,
    Saturday = 5,
    Sunday = 6
};

bool is_leap_year(int year);

// Number of days in a month; month must be in [1,12]
int days_in_month(int year, int month);

// Calendar date (proleptic Gregorian)
struct Date {
    int year;
    int month;
    int day;

    Date();
    Date(int y, int m, int d);

    Weekday weekday() const;

    // "YYYY-MM-DD"
    std::string to_string() const;

    bool operator==(const Date& other) const;
    bool operator!=(const Date& other) const;
    bool operator<(const Date& other) const;
};

// Month identifier compared in calendar order, never as text
class YearMonth {
public:
    YearMonth();
    YearMonth(int year, int month);

    // Parse "YYYY-MM"; throws std::invalid_argument on anything else
    static YearMonth parse(const std::string& text);

    int year() const { return year_; }
    int month() const { return month_; }

    int days() const;

    // Rolls December over into January of the following year
    YearMonth next() const;
    YearMonth plus_months(int count) const;

    std::string to_string() const;

    bool operator==(const YearMonth& other) const;
    bool operator!=(const YearMonth& other) const;
    bool operator<(const YearMonth& other) const;
    bool operator<=(const YearMonth& other) const;
    bool operator>(const YearMonth& other) const;
    bool operator>=(const YearMonth& other) const;

private:
    int year_;
    int month_;
};

} // namespace paycalc

#endif // PAYCALC_YEAR_MONTH_HPP
