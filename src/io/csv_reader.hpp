#ifndef PAYCALC_CSV_READER_HPP
#define PAYCALC_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace paycalc {

// Line-oriented CSV reader for small override tables.
// Cells are trimmed; lines starting with '#' are skipped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next non-comment row; empty vector for a blank line or end of input
    std::vector<std::string> read_row();
    bool has_more();

    // 1-based number of the last line returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    static std::string trim(const std::string& s);
};

} // namespace paycalc

#endif // PAYCALC_CSV_READER_HPP
