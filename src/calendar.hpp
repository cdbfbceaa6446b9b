#ifndef PAYCALC_CALENDAR_HPP
#define PAYCALC_CALENDAR_HPP

#include "holidays.hpp"
#include <string>

namespace paycalc {

// Day counts for one calendar month
struct MonthClassification {
    int workdays;       // Monday-Saturday, not a holiday
    int rest_days;      // Sundays and holidays
    int benefit_days;   // Monday-Friday, not a holiday (VT/VA days)

    MonthClassification();
    MonthClassification(int work, int rest, int benefit);

    int total_days() const { return workdays + rest_days; }
};

// Classify every day of a month as Workday or Rest Day.
//
// A day is a Rest Day iff it is a Sunday or a holiday returned by the
// provider for (year, region). Saturdays are Workdays unless they are
// holidays. Benefit days are the Workdays that fall Monday-Friday.
//
// Throws InvalidMonthError if month is outside [1,12]; InvalidRegionError
// from the provider propagates unchanged.
MonthClassification classify_month(
    int year,
    int month,
    const std::string& region,
    const HolidayProvider& holidays
);

} // namespace paycalc

#endif // PAYCALC_CALENDAR_HPP
