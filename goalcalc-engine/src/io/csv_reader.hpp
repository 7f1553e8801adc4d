#ifndef GOALCALC_CSV_READER_HPP
#define GOALCALC_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace goalcalc {

// Line-oriented CSV reader for goal, account and assumption files.
// Cells are trimmed; blank lines and lines starting with '#' are skipped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more();

    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    void skip_ignorable_lines();
    static std::string trim(const std::string& s);
};

} // namespace goalcalc

#endif // GOALCALC_CSV_READER_HPP
