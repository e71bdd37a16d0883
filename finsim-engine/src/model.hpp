#ifndef FINSIM_MODEL_HPP
#define FINSIM_MODEL_HPP

#include "action.hpp"
#include "asset.hpp"
#include "growth_sampler.hpp"
#include "historical_returns.hpp"
#include "portfolio.hpp"
#include "tax_table.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace finsim {

// Immutable, versioned reference tables shared by every trial
struct ReferenceData {
    std::shared_ptr<const TaxTable> tax_table;
    std::shared_ptr<const HistoricalReturns> returns;

    ReferenceData(TaxTable taxes, HistoricalReturns historical);

    static ReferenceData defaults();
};

struct RevenueSpec {
    std::string name;
    double initial_value = 0.0;
    double growth_rate = 0.0;       // Annual raise; 0 for fixed revenue
    std::string jurisdiction;       // Empty = untaxed
};

struct ExpenseSpec {
    std::string name;
    double initial_value = 0.0;
    double inflation_rate = 0.0;
};

struct AssetSpec {
    std::string name;
    double initial_value = 0.0;
    GrowthRule growth;
    std::optional<double> cap_value;
    std::optional<double> cap_deposit;
    TaxTreatment tax_treatment = TaxTreatment::None;
};

struct PortfolioSpec {
    std::string name;
    std::vector<std::pair<std::string, double>> allocations;   // asset name, weight
    RebalancePolicy rebalance = RebalancePolicy::Annual;
};

// Calendar year or offset from the simulation start year
struct EventTrigger {
    enum class Kind : uint8_t { Absolute, Relative };

    Kind kind;
    int year;

    static EventTrigger absolute(int calendar_year) { return EventTrigger{Kind::Absolute, calendar_year}; }
    static EventTrigger relative(int offset) { return EventTrigger{Kind::Relative, offset}; }

    int resolve(int start_year) const {
        return kind == Kind::Absolute ? year : start_year + year;
    }
};

struct EventSpec {
    std::string name;
    EventTrigger trigger;
    std::vector<Action> actions;
};

enum class ShortfallPolicy : uint8_t {
    Borrow = 0,                 // Every deficit goes to the debt account
    WithdrawThenBorrow = 1      // Sell liquid assets in declared order first
};

struct ModelConfig {
    int start_year;
    int duration;
    std::optional<std::string> debt_asset;      // Asset allowed to go negative
    std::optional<std::string> fallback_asset;  // Sink for cash no capped asset can take
    ShortfallPolicy shortfall_policy;

    // Starts in the current calendar year, 30 years, implicit debt account
    ModelConfig();
    ModelConfig(int start, int years);
};

struct ModelDefinition {
    ModelConfig config;
    std::vector<RevenueSpec> revenues;
    std::vector<ExpenseSpec> expenses;
    std::vector<AssetSpec> assets;
    std::vector<PortfolioSpec> portfolios;
    std::vector<EventSpec> events;
};

// Validated, immutable description of one household's finances.
// Trials never mutate it; each trial builds its own objects from it.
class FinancialModel {
public:
    static constexpr const char* IMPLICIT_DEBT_NAME = "Debt";

    // Throws ConfigurationError for any invalid combination
    explicit FinancialModel(ModelDefinition definition,
                            ReferenceData reference = ReferenceData::defaults());

    const ModelConfig& config() const { return definition_.config; }
    int start_year() const { return definition_.config.start_year; }
    int duration() const { return definition_.config.duration; }
    int end_year() const { return start_year() + duration(); }    // Exclusive

    const std::vector<RevenueSpec>& revenues() const { return definition_.revenues; }
    const std::vector<ExpenseSpec>& expenses() const { return definition_.expenses; }
    const std::vector<AssetSpec>& assets() const { return definition_.assets; }
    const std::vector<PortfolioSpec>& portfolios() const { return definition_.portfolios; }
    const std::vector<EventSpec>& events() const { return definition_.events; }

    const ReferenceData& reference() const { return reference_; }
    const TaxTable& tax_table() const { return *reference_.tax_table; }
    const HistoricalReturns& historical_returns() const { return *reference_.returns; }

    bool has_implicit_debt() const { return !definition_.config.debt_asset.has_value(); }
    std::string debt_asset_name() const;

    // Flows first, then assets (including an implicit debt account)
    std::vector<std::string> object_names() const;

    // True when at least one asset samples historical returns
    bool is_stochastic() const;

private:
    ModelDefinition definition_;
    ReferenceData reference_;

    void validate() const;
    void validate_flows() const;
    void validate_assets() const;
    void validate_portfolios() const;
    void validate_events() const;
};

} // namespace finsim

#endif // FINSIM_MODEL_HPP
