#ifndef PAYCALC_PARQUET_WRITER_HPP
#define PAYCALC_PARQUET_WRITER_HPP

#include "../projection.hpp"
#include <string>

namespace paycalc {

class ParquetWriter {
public:
    /**
     * Write a projection to a Parquet file, one row per month.
     *
     * Output schema:
     *   - month: utf8 ("YYYY-MM")
     *   - workdays, rest_days, benefit_days: int32
     *   - dsr, gross_salary, inss, irrf, net_salary, benefits, net_income: float64
     *   - fixed_total, installment_total, total_expenses, free_balance,
     *     investment_target: float64
     *   - active_installments: int32 (count)
     *
     * @param projection Projection to write
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the file cannot be written, or if the
     *         build has no Apache Arrow support
     */
    static void write_projection(const Projection& projection, const std::string& filepath);

    // True when built with Apache Arrow
    static bool available();
};

} // namespace paycalc

#endif // PAYCALC_PARQUET_WRITER_HPP
