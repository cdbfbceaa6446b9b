#include "calendar.hpp"
#include "errors.hpp"

namespace paycalc {

MonthClassification::MonthClassification() : workdays(0), rest_days(0), benefit_days(0) {}

MonthClassification::MonthClassification(int work, int rest, int benefit)
    : workdays(work), rest_days(rest), benefit_days(benefit) {}

MonthClassification classify_month(
    int year,
    int month,
    const std::string& region,
    const HolidayProvider& holidays)
{
    if (month < 1 || month > 12) {
        throw InvalidMonthError(std::to_string(year) + "-" + std::to_string(month),
                                "month must be between 1 and 12");
    }

    const std::set<Date> holiday_set = holidays.holidays_for(year, region);
    const int month_days = days_in_month(year, month);

    MonthClassification result;
    for (int day = 1; day <= month_days; ++day) {
        Date date(year, month, day);
        Weekday weekday = date.weekday();

        bool is_sunday = (weekday == Weekday::Sunday);
        bool is_holiday = holiday_set.count(date) > 0;

        if (is_sunday || is_holiday) {
            result.rest_days++;
        } else {
            result.workdays++;
            if (weekday != Weekday::Saturday) {
                result.benefit_days++;
            }
        }
    }

    return result;
}

} // namespace paycalc
