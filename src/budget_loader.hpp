#ifndef PAYCALC_BUDGET_LOADER_HPP
#define PAYCALC_BUDGET_LOADER_HPP

#include "budget.hpp"
#include <string>

namespace paycalc {

/**
 * @brief Parses a budget from a JSON file
 *
 * Expected layout:
 *   @code
 *   {
 *     "configuracao": {
 *       "salario_base": 2772.00,
 *       "produtividade_media": 542.40,
 *       "meta_investimento_percentual": 0.20,
 *       "estado_feriados": "SP",
 *       "valor_diario_vt": 12.00,
 *       "valor_diario_va": 30.00
 *     },
 *     "gastos_fixos": [{"nome": "Aluguel", "valor": 1200.00, "categoria": "Moradia"}],
 *     "parcelamentos": [{"nome": "TV", "valor_parcela": 250.00, "inicio": "2024-11", "fim": "2025-02"}]
 *   }
 *   @endcode
 *
 * Currency fields accept JSON numbers or numeric strings. The VT/VA fields
 * are optional and default to 0.
 *
 * @param file_path Path to the JSON budget file
 * @return Validated budget
 * @throws ConfigParseError if the file cannot be read or the JSON is malformed
 * @throws InvalidInputError if a value is out of range
 * @throws MalformedInstallmentError if an installment window is invalid
 */
Budget parse_budget_from_file(const std::string& file_path);

/**
 * @brief Parses a budget from a JSON string
 *
 * @param json_string JSON budget document
 * @return Validated budget
 * @throws ConfigParseError, InvalidInputError, MalformedInstallmentError
 */
Budget parse_budget_from_string(const std::string& json_string);

} // namespace paycalc

#endif // PAYCALC_BUDGET_LOADER_HPP
