#ifndef PAYCALC_IO_JSON_WRITER_HPP
#define PAYCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../projection.hpp"

namespace paycalc {
namespace io {

// Write a Projection to JSON.
// Output: {"month_count": N, "months": [{"month": "YYYY-MM", "payroll": {...}, ...}]}
// Amounts are written in fixed notation with six decimals.
void write_projection_json(std::ostream& os, const Projection& projection,
                           bool pretty_print = true);

// Write a Projection to a JSON file
void write_projection_json(const std::string& filepath, const Projection& projection,
                           bool pretty_print = true);

} // namespace io
} // namespace paycalc

#endif // PAYCALC_IO_JSON_WRITER_HPP
