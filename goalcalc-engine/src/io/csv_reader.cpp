#include "csv_reader.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace goalcalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    skip_ignorable_lines();
    if (!std::getline(is_, line)) {
        return row;
    }
    ++line_number_;

    // Tolerate CRLF files
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::stringstream ss(line);
    std::string cell;

    while (std::getline(ss, cell, delimiter_)) {
        row.push_back(trim(cell));
    }
    // Trailing delimiter means a trailing empty cell
    if (!line.empty() && line.back() == delimiter_) {
        row.emplace_back();
    }

    return row;
}

bool CsvReader::has_more() {
    skip_ignorable_lines();
    return is_.good() && is_.peek() != EOF;
}

void CsvReader::skip_ignorable_lines() {
    while (is_.good()) {
        int next = is_.peek();
        if (next == '#') {
            std::string ignored;
            std::getline(is_, ignored);
            ++line_number_;
        } else if (next == '\n' || next == '\r') {
            is_.get();
            if (next == '\n') {
                ++line_number_;
            }
        } else {
            break;
        }
    }
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

} // namespace goalcalc
