#include "year_month.hpp"
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace paycalc {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int days_in_month(int year, int month) {
    static constexpr std::array<int, 12> DAYS = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    if (month < 1 || month > 12) {
        throw std::out_of_range("Month " + std::to_string(month) + " must be between 1 and 12");
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

// ============================================================================
// Date Implementation
// ============================================================================

Date::Date() : year(1970), month(1), day(1) {}

Date::Date(int y, int m, int d) : year(y), month(m), day(d) {
    if (d < 1 || d > days_in_month(y, m)) {
        throw std::out_of_range("Day " + std::to_string(d) + " is not valid for " +
                                std::to_string(y) + "-" + std::to_string(m));
    }
}

Weekday Date::weekday() const {
    // Sakamoto's method, 0 = Sunday
    static constexpr std::array<int, 12> OFFSETS = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
    int y = month < 3 ? year - 1 : year;
    int dow = (y + y / 4 - y / 100 + y / 400 + OFFSETS[month - 1] + day) % 7;
    return static_cast<Weekday>((dow + 6) % 7);
}

std::string Date::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-"
        << std::setw(2) << month << "-" << std::setw(2) << day;
    return oss.str();
}

bool Date::operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool Date::operator!=(const Date& other) const {
    return !(*this == other);
}

bool Date::operator<(const Date& other) const {
    if (year != other.year) return year < other.year;
    if (month != other.month) return month < other.month;
    return day < other.day;
}

// ============================================================================
// YearMonth Implementation
// ============================================================================

YearMonth::YearMonth() : year_(1970), month_(1) {}

YearMonth::YearMonth(int year, int month) : year_(year), month_(month) {
    if (month < 1 || month > 12) {
        throw std::out_of_range("Month " + std::to_string(month) + " must be between 1 and 12");
    }
}

YearMonth YearMonth::parse(const std::string& text) {
    // Exactly four digits, a dash, two digits
    if (text.size() != 7 || text[4] != '-') {
        throw std::invalid_argument("Expected YYYY-MM, got '" + text + "'");
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Expected YYYY-MM, got '" + text + "'");
        }
    }

    int year = std::stoi(text.substr(0, 4));
    int month = std::stoi(text.substr(5, 2));
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Month out of range in '" + text + "'");
    }
    return YearMonth(year, month);
}

int YearMonth::days() const {
    return days_in_month(year_, month_);
}

YearMonth YearMonth::next() const {
    return plus_months(1);
}

YearMonth YearMonth::plus_months(int count) const {
    int index = year_ * 12 + (month_ - 1) + count;
    return YearMonth(index / 12, index % 12 + 1);
}

std::string YearMonth::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year_ << "-" << std::setw(2) << month_;
    return oss.str();
}

bool YearMonth::operator==(const YearMonth& other) const {
    return year_ == other.year_ && month_ == other.month_;
}

bool YearMonth::operator!=(const YearMonth& other) const {
    return !(*this == other);
}

bool YearMonth::operator<(const YearMonth& other) const {
    if (year_ != other.year_) return year_ < other.year_;
    return month_ < other.month_;
}

bool YearMonth::operator<=(const YearMonth& other) const {
    return !(other < *this);
}

bool YearMonth::operator>(const YearMonth& other) const {
    return other < *this;
}

bool YearMonth::operator>=(const YearMonth& other) const {
    return !(*this < other);
}

} // namespace paycalc
