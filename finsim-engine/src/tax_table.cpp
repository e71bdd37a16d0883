#include "tax_table.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>

using json = nlohmann::json;

namespace finsim {

namespace {

constexpr double kUnbounded = std::numeric_limits<double>::infinity();

std::vector<TaxBracket> parse_json_brackets(const json& j, const std::string& name) {
    if (!j.is_array()) {
        throw ConfigurationError("Tax schedule '" + name + "' must be an array of brackets");
    }
    std::vector<TaxBracket> brackets;
    for (const auto& entry : j) {
        if (!entry.contains("rate") || !entry["rate"].is_number()) {
            throw ConfigurationError("Bracket in '" + name + "' is missing a numeric 'rate'");
        }
        double limit = kUnbounded;
        if (entry.contains("up_to") && !entry["up_to"].is_null()) {
            if (!entry["up_to"].is_number()) {
                throw ConfigurationError("Bracket 'up_to' in '" + name + "' must be a number or null");
            }
            limit = entry["up_to"].get<double>();
        }
        brackets.emplace_back(limit, entry["rate"].get<double>());
    }
    return brackets;
}

} // anonymous namespace

// ============================================================================
// TaxSchedule Implementation
// ============================================================================

TaxSchedule::TaxSchedule(std::vector<TaxBracket> brackets)
    : brackets_(std::move(brackets)) {
    double previous = 0.0;
    for (const auto& bracket : brackets_) {
        if (bracket.rate < 0.0 || bracket.rate > 1.0) {
            throw ConfigurationError("Tax rate must be between 0.0 and 1.0, got " +
                                     std::to_string(bracket.rate));
        }
        if (!(bracket.upper_limit > previous)) {
            throw ConfigurationError("Tax bracket limits must be positive and strictly increasing");
        }
        previous = bracket.upper_limit;
    }
    if (!brackets_.empty() && !std::isinf(brackets_.back().upper_limit)) {
        throw ConfigurationError("Top tax bracket must be unbounded");
    }
}

double TaxSchedule::liability(double income) const {
    if (income <= 0.0) {
        return 0.0;
    }

    double tax = 0.0;
    double lower = 0.0;
    for (const auto& bracket : brackets_) {
        double taxable_in_bracket = std::min(income, bracket.upper_limit) - lower;
        if (taxable_in_bracket > 0.0) {
            tax += taxable_in_bracket * bracket.rate;
        }
        if (income <= bracket.upper_limit) {
            break;
        }
        lower = bracket.upper_limit;
    }
    return tax;
}

double TaxSchedule::marginal_rate(double income) const {
    for (const auto& bracket : brackets_) {
        if (income < bracket.upper_limit) {
            return bracket.rate;
        }
    }
    return brackets_.empty() ? 0.0 : brackets_.back().rate;
}

// ============================================================================
// TaxTable Implementation
// ============================================================================

void TaxTable::set_federal(TaxSchedule schedule) {
    federal_ = std::move(schedule);
}

void TaxTable::set_state(const std::string& jurisdiction, TaxSchedule schedule) {
    if (jurisdiction.empty() || jurisdiction == FEDERAL_KEY) {
        throw ConfigurationError("Invalid jurisdiction name: '" + jurisdiction + "'");
    }
    states_[jurisdiction] = std::move(schedule);
}

bool TaxTable::has_jurisdiction(const std::string& jurisdiction) const {
    return states_.find(jurisdiction) != states_.end();
}

std::vector<std::string> TaxTable::jurisdictions() const {
    std::vector<std::string> names;
    names.reserve(states_.size());
    for (const auto& entry : states_) {
        names.push_back(entry.first);
    }
    return names;
}

const TaxSchedule& TaxTable::state(const std::string& jurisdiction) const {
    auto it = states_.find(jurisdiction);
    if (it == states_.end()) {
        throw ConfigurationError("Unknown tax jurisdiction: '" + jurisdiction + "'");
    }
    return it->second;
}

double TaxTable::federal_tax(double income) const {
    return federal_.liability(income);
}

double TaxTable::state_tax(double income, const std::string& jurisdiction) const {
    return state(jurisdiction).liability(income);
}

double TaxTable::total_tax(double income, const std::string& jurisdiction) const {
    return federal_tax(income) + state_tax(income, jurisdiction);
}

TaxTable TaxTable::defaults() {
    TaxTable table;
    table.set_version("us-2023");

    table.set_federal(TaxSchedule({
        {11000.0, 0.10},
        {44725.0, 0.12},
        {95375.0, 0.22},
        {182100.0, 0.24},
        {231250.0, 0.32},
        {578125.0, 0.35},
        {kUnbounded, 0.37},
    }));

    // Flat-rate states
    table.set_state("MA", TaxSchedule({{kUnbounded, 0.05}}));
    table.set_state("PA", TaxSchedule({{kUnbounded, 0.0307}}));
    table.set_state("MI", TaxSchedule({{kUnbounded, 0.0425}}));

    table.set_state("CA", TaxSchedule({
        {9325.0, 0.01},
        {22107.0, 0.02},
        {34892.0, 0.04},
        {48435.0, 0.06},
        {61214.0, 0.08},
        {312686.0, 0.093},
        {375221.0, 0.103},
        {625369.0, 0.113},
        {kUnbounded, 0.123},
    }));

    table.set_state("OH", TaxSchedule({
        {25000.0, 0.0},
        {44250.0, 0.02765},
        {88450.0, 0.03226},
        {110650.0, 0.03688},
        {kUnbounded, 0.0399},
    }));

    // No state income tax
    for (const char* state : {"AK", "FL", "NH", "NV", "SD", "TN", "TX", "WA", "WY"}) {
        table.set_state(state, TaxSchedule());
    }

    return table;
}

TaxTable TaxTable::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open tax table file: " + filepath);
    }
    return load_from_csv(file);
}

TaxTable TaxTable::load_from_csv(std::istream& is) {
    CsvReader reader(is);

    // Brackets grouped by jurisdiction, kept in file order
    std::vector<std::pair<std::string, std::vector<TaxBracket>>> groups;
    bool first_row = true;

    while (reader.has_more()) {
        auto row = reader.read_row();
        size_t line = reader.line_number();

        if (first_row) {
            first_row = false;
            if (!row.empty() && row[0] == "jurisdiction") {
                continue;
            }
        }

        if (row.size() < 3) {
            throw ConfigurationError("Tax table CSV line " + std::to_string(line) +
                                     " requires columns: jurisdiction,upper_limit,rate");
        }

        double limit = CsvReader::parse_double(row[1], line);
        double rate = CsvReader::parse_double(row[2], line);

        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& g) { return g.first == row[0]; });
        if (it == groups.end()) {
            groups.emplace_back(row[0], std::vector<TaxBracket>());
            it = std::prev(groups.end());
        }
        // "<state>,inf,0" declares a state without income tax
        if (!(std::isinf(limit) && rate == 0.0 && it->second.empty() && row[0] != FEDERAL_KEY)) {
            it->second.emplace_back(limit, rate);
        }
    }

    TaxTable table;
    bool has_federal = false;
    for (auto& group : groups) {
        if (group.first == FEDERAL_KEY) {
            table.set_federal(TaxSchedule(std::move(group.second)));
            has_federal = true;
        } else {
            table.set_state(group.first, TaxSchedule(std::move(group.second)));
        }
    }
    if (!has_federal) {
        throw ConfigurationError("Tax table CSV has no FEDERAL schedule");
    }
    return table;
}

TaxTable TaxTable::load_from_json(std::istream& is) {
    std::string content((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    return load_from_json(content);
}

TaxTable TaxTable::load_from_json(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("Invalid tax table JSON: ") + e.what());
    }

    if (!j.contains("federal")) {
        throw ConfigurationError("Tax table JSON missing required field: federal");
    }

    TaxTable table;
    if (j.contains("version") && j["version"].is_string()) {
        table.set_version(j["version"].get<std::string>());
    }
    table.set_federal(TaxSchedule(parse_json_brackets(j["federal"], FEDERAL_KEY)));

    if (j.contains("states")) {
        if (!j["states"].is_object()) {
            throw ConfigurationError("Tax table JSON 'states' must be an object");
        }
        for (auto it = j["states"].begin(); it != j["states"].end(); ++it) {
            table.set_state(it.key(), TaxSchedule(parse_json_brackets(it.value(), it.key())));
        }
    }
    return table;
}

} // namespace finsim
