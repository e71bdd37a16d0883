#include "csv_reader.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>

namespace finsim {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter) {}

bool CsvReader::fetch_line() {
    if (has_pending_) {
        return true;
    }
    std::string line;
    while (std::getline(is_, line)) {
        ++line_number_;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        pending_ = trimmed;
        has_pending_ = true;
        return true;
    }
    return false;
}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    if (!fetch_line()) {
        return row;
    }
    has_pending_ = false;

    std::stringstream ss(pending_);
    std::string cell;
    while (std::getline(ss, cell, delimiter_)) {
        row.push_back(trim(cell));
    }
    return row;
}

bool CsvReader::has_more() {
    return fetch_line();
}

double CsvReader::parse_double(const std::string& cell, size_t line) {
    std::string lowered = cell;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "inf" || lowered == "infinity") {
        return std::numeric_limits<double>::infinity();
    }
    try {
        size_t consumed = 0;
        double value = std::stod(cell, &consumed);
        if (consumed != cell.size()) {
            throw std::invalid_argument(cell);
        }
        return value;
    } catch (const std::exception&) {
        throw ConfigurationError("Line " + std::to_string(line) +
                                 ": expected a number but got '" + cell + "'");
    }
}

int CsvReader::parse_int(const std::string& cell, size_t line) {
    try {
        size_t consumed = 0;
        int value = std::stoi(cell, &consumed);
        if (consumed != cell.size()) {
            throw std::invalid_argument(cell);
        }
        return value;
    } catch (const std::exception&) {
        throw ConfigurationError("Line " + std::to_string(line) +
                                 ": expected an integer but got '" + cell + "'");
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

} // namespace finsim
