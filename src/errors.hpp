#ifndef PAYCALC_ERRORS_HPP
#define PAYCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace paycalc {

/**
 * @brief Base exception for every failure raised by the projection pipeline
 */
class PayCalcError : public std::runtime_error {
public:
    explicit PayCalcError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when the holiday provider does not know a region code
 */
class InvalidRegionError : public PayCalcError {
public:
    explicit InvalidRegionError(const std::string& region)
        : PayCalcError("Invalid holiday region: '" + region + "'"), region_(region) {}

    const std::string& region() const { return region_; }

private:
    std::string region_;
};

/**
 * @brief Raised when a month cannot be projected (out of range, or no workdays)
 */
class InvalidMonthError : public PayCalcError {
public:
    InvalidMonthError(const std::string& month_id, const std::string& reason)
        : PayCalcError("Invalid month " + month_id + ": " + reason), month_id_(month_id) {}

    const std::string& month_id() const { return month_id_; }

private:
    std::string month_id_;
};

/**
 * @brief Raised when an installment has an unparseable or inverted window
 */
class MalformedInstallmentError : public PayCalcError {
public:
    MalformedInstallmentError(const std::string& name, const std::string& reason)
        : PayCalcError("Malformed installment '" + name + "': " + reason), name_(name) {}

    const std::string& installment_name() const { return name_; }

private:
    std::string name_;
};

/**
 * @brief Raised for invalid numeric inputs (negative amounts, broken tax tables)
 */
class InvalidInputError : public PayCalcError {
public:
    explicit InvalidInputError(const std::string& message)
        : PayCalcError("Invalid input: " + message) {}
};

/**
 * @brief Raised when a budget file cannot be read or has the wrong shape
 */
class ConfigParseError : public PayCalcError {
public:
    explicit ConfigParseError(const std::string& message)
        : PayCalcError(message) {}
};

} // namespace paycalc

#endif // PAYCALC_ERRORS_HPP
