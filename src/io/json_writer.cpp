#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace paycalc {
namespace io {

namespace {

std::string quote(const std::string& str) {
    std::ostringstream oss;
    oss << '"';
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

void write_names(std::ostream& os, const std::vector<std::string>& names, const std::string& space) {
    os << "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) os << "," << space;
        os << quote(names[i]);
    }
    os << "]";
}

} // anonymous namespace

void write_projection_json(std::ostream& os, const Projection& projection,
                           bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";
    const std::string i2 = indent + indent;
    const std::string i3 = i2 + indent;
    const std::string i4 = i3 + indent;

    os << std::fixed << std::setprecision(6);

    os << "{" << newline;
    os << indent << "\"month_count\":" << space << projection.size() << "," << newline;
    os << indent << "\"months\":" << space << "[";

    for (size_t i = 0; i < projection.size(); ++i) {
        const ProjectionSnapshot& s = projection[i];
        const MonthlyPayroll& p = s.payroll;

        os << (i > 0 ? "," : "") << newline << i2 << "{" << newline;
        os << i3 << "\"month\":" << space << quote(s.month.to_string()) << "," << newline;

        // Payroll section
        os << i3 << "\"payroll\":" << space << "{" << newline;
        os << i4 << "\"workdays\":" << space << p.workdays << "," << newline;
        os << i4 << "\"rest_days\":" << space << p.rest_days << "," << newline;
        os << i4 << "\"benefit_days\":" << space << p.benefit_days << "," << newline;
        os << i4 << "\"dsr\":" << space << p.dsr << "," << newline;
        os << i4 << "\"gross_salary\":" << space << p.gross_salary << "," << newline;
        os << i4 << "\"inss\":" << space << p.inss << "," << newline;
        os << i4 << "\"irrf\":" << space << p.irrf << "," << newline;
        os << i4 << "\"net_salary\":" << space << p.net_salary << "," << newline;
        os << i4 << "\"benefits\":" << space << p.benefits << "," << newline;
        os << i4 << "\"net_income\":" << space << p.net_income << newline;
        os << i3 << "}," << newline;

        os << i3 << "\"fixed_total\":" << space << s.fixed_total << "," << newline;
        os << i3 << "\"installment_total\":" << space << s.installment_total << "," << newline;
        os << i3 << "\"total_expenses\":" << space << s.total_expenses << "," << newline;
        os << i3 << "\"free_balance\":" << space << s.free_balance << "," << newline;
        os << i3 << "\"investment_target\":" << space << s.investment_target << "," << newline;
        os << i3 << "\"active_installments\":" << space;
        write_names(os, s.active_installments, space);
        os << "," << newline;
        os << i3 << "\"ended_installments\":" << space;
        write_names(os, s.ended_installments, space);
        os << newline;
        os << i2 << "}";
    }

    if (!projection.empty()) {
        os << newline << indent;
    }
    os << "]" << newline;
    os << "}" << newline;
}

void write_projection_json(const std::string& filepath, const Projection& projection,
                           bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_projection_json(file, projection, pretty_print);
}

} // namespace io
} // namespace paycalc
