#include "budget_loader.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace paycalc {

namespace {

const json& require_field(const json& object, const std::string& key, const std::string& where) {
    if (!object.is_object() || !object.contains(key)) {
        throw ConfigParseError("Missing required field: " + where + "." + key);
    }
    return object.at(key);
}

std::string get_string(const json& object, const std::string& key, const std::string& where) {
    const json& value = require_field(object, key, where);
    if (!value.is_string()) {
        throw ConfigParseError("Field " + where + "." + key + " must be a string");
    }
    return value.get<std::string>();
}

double to_amount(const json& value, const std::string& path) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        try {
            size_t consumed = 0;
            double amount = std::stod(text, &consumed);
            if (consumed == text.size() && std::isfinite(amount)) {
                return amount;
            }
        } catch (const std::logic_error&) {
            // Reported below
        }
        throw ConfigParseError("Field " + path + " is not a number: '" + text + "'");
    }
    throw ConfigParseError("Field " + path + " must be a number");
}

double get_amount(const json& object, const std::string& key, const std::string& where) {
    return to_amount(require_field(object, key, where), where + "." + key);
}

double get_optional_amount(const json& object, const std::string& key, const std::string& where,
                           double fallback) {
    if (!object.contains(key) || object.at(key).is_null()) {
        return fallback;
    }
    return to_amount(object.at(key), where + "." + key);
}

const json& get_array(const json& root, const std::string& key) {
    const json& value = require_field(root, key, "budget");
    if (!value.is_array()) {
        throw ConfigParseError("Field budget." + key + " must be an array");
    }
    return value;
}

Configuration parse_configuration(const json& root) {
    const json& c = require_field(root, "configuracao", "budget");
    const std::string where = "configuracao";

    Configuration config(
        get_amount(c, "salario_base", where),
        get_amount(c, "produtividade_media", where),
        get_amount(c, "meta_investimento_percentual", where),
        get_string(c, "estado_feriados", where),
        get_optional_amount(c, "valor_diario_vt", where, 0.0),
        get_optional_amount(c, "valor_diario_va", where, 0.0)
    );
    config.validate();
    return config;
}

} // anonymous namespace

Budget parse_budget_from_string(const std::string& json_string) {
    json root;
    try {
        root = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigParseError("Failed to parse budget JSON: " + std::string(e.what()));
    }

    Budget budget;
    budget.configuration = parse_configuration(root);

    const json& expenses = get_array(root, "gastos_fixos");
    for (size_t i = 0; i < expenses.size(); ++i) {
        const std::string where = "gastos_fixos[" + std::to_string(i) + "]";
        const json& e = expenses[i];
        budget.fixed_expenses.emplace_back(
            get_string(e, "nome", where),
            get_amount(e, "valor", where),
            get_string(e, "categoria", where)
        );
    }

    const json& installments = get_array(root, "parcelamentos");
    for (size_t i = 0; i < installments.size(); ++i) {
        const std::string where = "parcelamentos[" + std::to_string(i) + "]";
        const json& p = installments[i];
        budget.installments.push_back(Installment::from_strings(
            get_string(p, "nome", where),
            get_amount(p, "valor_parcela", where),
            get_string(p, "inicio", where),
            get_string(p, "fim", where)
        ));
    }

    budget.validate();
    return budget;
}

Budget parse_budget_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open budget file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_budget_from_string(buffer.str());
}

} // namespace paycalc
