#ifndef FINSIM_HISTORICAL_RETURNS_HPP
#define FINSIM_HISTORICAL_RETURNS_HPP

#include <istream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace finsim {

// Annual returns for one growth category, ordered by calendar year
struct ReturnSeries {
    std::string category;
    int first_year;
    std::vector<double> annual_returns;     // 0.07 = +7%

    double mean() const;
    double std_dev() const;
};

// Registry of historical return series keyed by growth category.
// Series are immutable once registered and shared by every sampler.
class HistoricalReturns {
public:
    HistoricalReturns() = default;

    // Replaces an existing series of the same category.
    // Throws ConfigurationError for empty series or returns below -100%.
    void add(ReturnSeries series);

    bool has_category(const std::string& category) const;
    std::vector<std::string> categories() const;

    // Throws ConfigurationError for unknown categories
    std::shared_ptr<const ReturnSeries> get(const std::string& category) const;

    size_t size() const { return series_.size(); }

    const std::string& version() const { return version_; }
    void set_version(const std::string& version) { version_ = version; }

    // US annual total returns 1974-2023: "stocks" (large-cap equities),
    // "bonds" (10-year Treasury) and "cash" (3-month T-bill)
    static HistoricalReturns defaults();

    // CSV columns: category,year,return
    static HistoricalReturns load_from_csv(const std::string& filepath);
    static HistoricalReturns load_from_csv(std::istream& is);

    // {"version": "...", "series": {"stocks": {"first_year": 1974, "returns": [...]}}}
    static HistoricalReturns load_from_json(const std::string& json_string);

private:
    std::string version_;
    std::map<std::string, std::shared_ptr<const ReturnSeries>> series_;
};

} // namespace finsim

#endif // FINSIM_HISTORICAL_RETURNS_HPP
