#ifndef FINSIM_CSV_READER_HPP
#define FINSIM_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace finsim {

// Line-oriented reader for the reference-data CSV files.
// Blank lines and lines starting with '#' are skipped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Returns an empty row once the stream is exhausted
    std::vector<std::string> read_row();
    bool has_more();

    // 1-based line number of the last row returned
    size_t line_number() const { return line_number_; }

    static double parse_double(const std::string& cell, size_t line);
    static int parse_int(const std::string& cell, size_t line);

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_ = 0;
    std::string pending_;
    bool has_pending_ = false;

    bool fetch_line();
    static std::string trim(const std::string& s);
};

} // namespace finsim

#endif // FINSIM_CSV_READER_HPP
