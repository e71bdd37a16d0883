#include "historical_returns.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <numeric>
#include <utility>

using json = nlohmann::json;

namespace finsim {

namespace {

constexpr int kDefaultFirstYear = 1974;

const std::vector<double> kStockReturns = {
    -0.2590, 0.3700, 0.2383, -0.0698, 0.0651, 0.1852, 0.3174, -0.0470, 0.2042, 0.2234,
    0.0615, 0.3124, 0.1849, 0.0581, 0.1654, 0.3148, -0.0306, 0.3023, 0.0749, 0.0997,
    0.0133, 0.3720, 0.2268, 0.3310, 0.2834, 0.2089, -0.0903, -0.1185, -0.2197, 0.2836,
    0.1074, 0.0483, 0.1561, 0.0548, -0.3655, 0.2594, 0.1482, 0.0210, 0.1589, 0.3215,
    0.1352, 0.0138, 0.1177, 0.2161, -0.0423, 0.3121, 0.1802, 0.2847, -0.1801, 0.2606,
};

const std::vector<double> kBondReturns = {
    0.0199, 0.0361, 0.1598, 0.0129, -0.0078, 0.0067, -0.0299, 0.0820, 0.3281, 0.0320,
    0.1373, 0.2571, 0.2428, -0.0496, 0.0822, 0.1769, 0.0624, 0.1500, 0.0936, 0.1421,
    -0.0804, 0.2348, 0.0143, 0.0994, 0.1492, -0.0825, 0.1666, 0.0557, 0.1512, 0.0038,
    0.0449, 0.0287, 0.0196, 0.1021, 0.2010, -0.1112, 0.0846, 0.1604, 0.0297, -0.0910,
    0.1075, 0.0128, 0.0069, 0.0280, -0.0002, 0.0964, 0.1133, -0.0442, -0.1783, 0.0388,
};

const std::vector<double> kCashReturns = {
    0.0784, 0.0599, 0.0497, 0.0513, 0.0693, 0.0994, 0.1122, 0.1430, 0.1101, 0.0845,
    0.0961, 0.0749, 0.0604, 0.0572, 0.0645, 0.0811, 0.0755, 0.0561, 0.0341, 0.0298,
    0.0399, 0.0552, 0.0502, 0.0505, 0.0473, 0.0451, 0.0576, 0.0367, 0.0166, 0.0103,
    0.0123, 0.0301, 0.0468, 0.0464, 0.0159, 0.0014, 0.0013, 0.0003, 0.0005, 0.0007,
    0.0005, 0.0021, 0.0051, 0.0139, 0.0237, 0.0155, 0.0009, 0.0006, 0.0202, 0.0507,
};

} // anonymous namespace

// ============================================================================
// ReturnSeries Implementation
// ============================================================================

double ReturnSeries::mean() const {
    if (annual_returns.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(annual_returns.begin(), annual_returns.end(), 0.0);
    return sum / static_cast<double>(annual_returns.size());
}

double ReturnSeries::std_dev() const {
    if (annual_returns.size() < 2) {
        return 0.0;
    }
    double m = mean();
    double sum_sq_diff = 0.0;
    for (double r : annual_returns) {
        sum_sq_diff += (r - m) * (r - m);
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(annual_returns.size()));
}

// ============================================================================
// HistoricalReturns Implementation
// ============================================================================

void HistoricalReturns::add(ReturnSeries series) {
    if (series.category.empty()) {
        throw ConfigurationError("Return series must have a category name");
    }
    if (series.annual_returns.empty()) {
        throw ConfigurationError("Return series '" + series.category + "' is empty");
    }
    for (double r : series.annual_returns) {
        if (!std::isfinite(r) || r < -1.0) {
            throw ConfigurationError("Return series '" + series.category +
                                     "' contains an invalid return: " + std::to_string(r));
        }
    }
    std::string key = series.category;
    series_[key] = std::make_shared<const ReturnSeries>(std::move(series));
}

bool HistoricalReturns::has_category(const std::string& category) const {
    return series_.find(category) != series_.end();
}

std::vector<std::string> HistoricalReturns::categories() const {
    std::vector<std::string> names;
    names.reserve(series_.size());
    for (const auto& entry : series_) {
        names.push_back(entry.first);
    }
    return names;
}

std::shared_ptr<const ReturnSeries> HistoricalReturns::get(const std::string& category) const {
    auto it = series_.find(category);
    if (it == series_.end()) {
        throw ConfigurationError("Unknown growth category: '" + category + "'");
    }
    return it->second;
}

HistoricalReturns HistoricalReturns::defaults() {
    HistoricalReturns returns;
    returns.set_version("us-annual-1974-2023");
    returns.add(ReturnSeries{"stocks", kDefaultFirstYear, kStockReturns});
    returns.add(ReturnSeries{"bonds", kDefaultFirstYear, kBondReturns});
    returns.add(ReturnSeries{"cash", kDefaultFirstYear, kCashReturns});
    return returns;
}

HistoricalReturns HistoricalReturns::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open historical returns file: " + filepath);
    }
    return load_from_csv(file);
}

HistoricalReturns HistoricalReturns::load_from_csv(std::istream& is) {
    CsvReader reader(is);

    // category -> (year, return), sorted by year once everything is read
    std::map<std::string, std::vector<std::pair<int, double>>> rows_by_category;
    bool first_row = true;

    while (reader.has_more()) {
        auto row = reader.read_row();
        size_t line = reader.line_number();

        if (first_row) {
            first_row = false;
            if (!row.empty() && row[0] == "category") {
                continue;
            }
        }

        if (row.size() < 3) {
            throw ConfigurationError("Historical returns CSV line " + std::to_string(line) +
                                     " requires columns: category,year,return");
        }
        int year = CsvReader::parse_int(row[1], line);
        double value = CsvReader::parse_double(row[2], line);
        rows_by_category[row[0]].emplace_back(year, value);
    }

    HistoricalReturns returns;
    for (auto& entry : rows_by_category) {
        auto& rows = entry.second;
        std::sort(rows.begin(), rows.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
        for (size_t i = 1; i < rows.size(); ++i) {
            if (rows[i].first == rows[i - 1].first) {
                throw ConfigurationError("Duplicate year " + std::to_string(rows[i].first) +
                                         " in return series '" + entry.first + "'");
            }
        }

        ReturnSeries series;
        series.category = entry.first;
        series.first_year = rows.front().first;
        series.annual_returns.reserve(rows.size());
        for (const auto& row : rows) {
            series.annual_returns.push_back(row.second);
        }
        returns.add(std::move(series));
    }
    return returns;
}

HistoricalReturns HistoricalReturns::load_from_json(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("Invalid historical returns JSON: ") + e.what());
    }

    if (!j.contains("series") || !j["series"].is_object()) {
        throw ConfigurationError("Historical returns JSON missing required object: series");
    }

    HistoricalReturns returns;
    if (j.contains("version") && j["version"].is_string()) {
        returns.set_version(j["version"].get<std::string>());
    }

    for (auto it = j["series"].begin(); it != j["series"].end(); ++it) {
        const json& entry = it.value();
        if (!entry.contains("returns") || !entry["returns"].is_array()) {
            throw ConfigurationError("Series '" + it.key() + "' missing 'returns' array");
        }
        ReturnSeries series;
        series.category = it.key();
        series.first_year = entry.value("first_year", 0);
        try {
            series.annual_returns = entry["returns"].get<std::vector<double>>();
        } catch (const json::type_error& e) {
            throw ConfigurationError("Series '" + it.key() + "' has non-numeric returns: " + e.what());
        }
        returns.add(std::move(series));
    }
    return returns;
}

} // namespace finsim
