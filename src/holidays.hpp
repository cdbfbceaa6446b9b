#ifndef PAYCALC_HOLIDAYS_HPP
#define PAYCALC_HOLIDAYS_HPP

#include "year_month.hpp"
#include <set>
#include <string>
#include <vector>

namespace paycalc {

/**
 * @brief Holiday lookup capability used by the calendar classifier
 *
 * Implementations return the non-working holidays of one year for one
 * region and throw InvalidRegionError for a region they do not know.
 * Tests swap in a fixed set to stay deterministic across years.
 */
class HolidayProvider {
public:
    virtual ~HolidayProvider() = default;

    /**
     * @brief Non-working holidays of a year for a region
     *
     * @param year Calendar year
     * @param region Region code (e.g. "SP")
     * @return Set of holiday dates
     * @throws InvalidRegionError if the region is not recognized
     */
    virtual std::set<Date> holidays_for(int year, const std::string& region) const = 0;
};

// Easter Sunday for a Gregorian year
Date easter_sunday(int year);

// Brazilian public holidays: national holidays plus the state holidays of
// each of the 26 states and the Federal District. Region codes are the
// two-letter state abbreviations, matched case-insensitively.
class BrazilHolidayProvider : public HolidayProvider {
public:
    std::set<Date> holidays_for(int year, const std::string& region) const override;

    static bool supports(const std::string& region);
    static std::vector<std::string> supported_regions();
};

} // namespace paycalc

#endif // PAYCALC_HOLIDAYS_HPP
