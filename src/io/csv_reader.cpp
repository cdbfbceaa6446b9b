#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace paycalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    while (std::getline(is_, line)) {
        ++line_number_;
        std::string trimmed = trim(line);
        if (!trimmed.empty() && trimmed[0] == '#') {
            continue;
        }

        std::stringstream ss(trimmed);
        std::string cell;
        while (std::getline(ss, cell, delimiter_)) {
            row.push_back(trim(cell));
        }
        // "a,b," has an empty trailing cell that getline drops
        if (!trimmed.empty() && trimmed.back() == delimiter_) {
            row.emplace_back();
        }
        break;
    }

    return row;
}

bool CsvReader::has_more() {
    return is_.good() && is_.peek() != std::char_traits<char>::eof();
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace paycalc
