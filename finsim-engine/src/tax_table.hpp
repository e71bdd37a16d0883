#ifndef FINSIM_TAX_TABLE_HPP
#define FINSIM_TAX_TABLE_HPP

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace finsim {

// One marginal bracket: `rate` applies to income up to `upper_limit`.
// The top bracket of a schedule has an infinite upper limit.
struct TaxBracket {
    double upper_limit;
    double rate;            // Fraction, e.g. 0.22 for 22%

    TaxBracket(double limit, double r) : upper_limit(limit), rate(r) {}
};

// Progressive schedule for one jurisdiction.
// An empty schedule taxes nothing (states without income tax).
class TaxSchedule {
public:
    TaxSchedule() = default;

    // Brackets must have strictly increasing limits, rates in [0, 1]
    // and an unbounded last bracket; throws ConfigurationError otherwise.
    explicit TaxSchedule(std::vector<TaxBracket> brackets);

    // Sum of bracket_width x bracket_rate over the brackets below `income`,
    // plus the marginal rate on the remainder
    double liability(double income) const;

    // Marginal rate applying to the next unit of income
    double marginal_rate(double income) const;

    const std::vector<TaxBracket>& brackets() const { return brackets_; }
    bool empty() const { return brackets_.empty(); }

private:
    std::vector<TaxBracket> brackets_;
};

// Versioned federal + state income-tax reference table
class TaxTable {
public:
    static constexpr const char* FEDERAL_KEY = "FEDERAL";

    TaxTable() = default;

    void set_federal(TaxSchedule schedule);
    void set_state(const std::string& jurisdiction, TaxSchedule schedule);

    bool has_jurisdiction(const std::string& jurisdiction) const;
    std::vector<std::string> jurisdictions() const;

    const TaxSchedule& federal() const { return federal_; }

    // Throws ConfigurationError for unknown jurisdictions
    const TaxSchedule& state(const std::string& jurisdiction) const;

    double federal_tax(double income) const;
    double state_tax(double income, const std::string& jurisdiction) const;

    // Federal plus state liability
    double total_tax(double income, const std::string& jurisdiction) const;

    const std::string& version() const { return version_; }
    void set_version(const std::string& version) { version_ = version; }

    // 2023 US federal brackets and a set of state schedules
    static TaxTable defaults();

    // CSV columns: jurisdiction,upper_limit,rate (one row per bracket,
    // "FEDERAL" for the federal schedule, "inf" for the open bracket)
    static TaxTable load_from_csv(const std::string& filepath);
    static TaxTable load_from_csv(std::istream& is);

    // {"version": "...", "federal": [{"up_to": 11000, "rate": 0.10}, ...],
    //  "states": {"MA": [{"up_to": null, "rate": 0.05}], "TX": []}}
    static TaxTable load_from_json(const std::string& json_string);
    static TaxTable load_from_json(std::istream& is);

private:
    std::string version_;
    TaxSchedule federal_;
    std::map<std::string, TaxSchedule> states_;
};

} // namespace finsim

#endif // FINSIM_TAX_TABLE_HPP
