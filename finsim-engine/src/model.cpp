#include "model.hpp"
#include "errors.hpp"
#include "flow.hpp"
#include <cmath>
#include <ctime>
#include <map>
#include <set>

namespace finsim {

namespace {

constexpr int kDefaultDuration = 30;

int current_calendar_year() {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    return tm_buf.tm_year + 1900;
}

void require_non_negative(double value, const std::string& what) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ConfigurationError(what + " must be zero or positive");
    }
}

void require_rate(double rate, const std::string& what) {
    if (!std::isfinite(rate) || rate < -1.0) {
        throw ConfigurationError(what + " must be a finite value >= -1.0");
    }
}

} // anonymous namespace

// ============================================================================
// ReferenceData / ModelConfig
// ============================================================================

ReferenceData::ReferenceData(TaxTable taxes, HistoricalReturns historical)
    : tax_table(std::make_shared<const TaxTable>(std::move(taxes))),
      returns(std::make_shared<const HistoricalReturns>(std::move(historical))) {}

ReferenceData ReferenceData::defaults() {
    return ReferenceData(TaxTable::defaults(), HistoricalReturns::defaults());
}

ModelConfig::ModelConfig()
    : ModelConfig(current_calendar_year(), kDefaultDuration) {}

ModelConfig::ModelConfig(int start, int years)
    : start_year(start),
      duration(years),
      shortfall_policy(ShortfallPolicy::Borrow) {}

// ============================================================================
// FinancialModel
// ============================================================================

FinancialModel::FinancialModel(ModelDefinition definition, ReferenceData reference)
    : definition_(std::move(definition)), reference_(std::move(reference)) {
    if (!reference_.tax_table || !reference_.returns) {
        throw ConfigurationError("Reference data is incomplete");
    }
    validate();
}

std::string FinancialModel::debt_asset_name() const {
    return definition_.config.debt_asset.value_or(IMPLICIT_DEBT_NAME);
}

std::vector<std::string> FinancialModel::object_names() const {
    std::vector<std::string> names;
    for (const auto& revenue : definition_.revenues) names.push_back(revenue.name);
    for (const auto& expense : definition_.expenses) names.push_back(expense.name);
    for (const auto& asset : definition_.assets) names.push_back(asset.name);
    if (has_implicit_debt()) {
        names.push_back(IMPLICIT_DEBT_NAME);
    }
    return names;
}

bool FinancialModel::is_stochastic() const {
    for (const auto& asset : definition_.assets) {
        if (asset.growth.is_stochastic()) {
            return true;
        }
    }
    return false;
}

void FinancialModel::validate() const {
    const ModelConfig& config = definition_.config;
    if (config.duration < 1) {
        throw ConfigurationError("Simulation duration must be at least 1 year");
    }

    std::set<std::string> names;
    for (const auto& name : object_names()) {
        if (name.empty()) {
            throw ConfigurationError("Flows and assets must have a name");
        }
        if (!names.insert(name).second) {
            throw ConfigurationError("Duplicate object name: '" + name + "'");
        }
    }

    validate_flows();
    validate_assets();
    validate_portfolios();
    validate_events();
}

void FinancialModel::validate_flows() const {
    const TaxTable& taxes = tax_table();
    for (const auto& revenue : definition_.revenues) {
        require_non_negative(revenue.initial_value, "Base value of '" + revenue.name + "'");
        require_rate(revenue.growth_rate, "Growth rate of '" + revenue.name + "'");
        if (!revenue.jurisdiction.empty() && !taxes.has_jurisdiction(revenue.jurisdiction)) {
            throw ConfigurationError("Unknown tax jurisdiction '" + revenue.jurisdiction +
                                     "' for revenue '" + revenue.name + "'");
        }
    }
    for (const auto& expense : definition_.expenses) {
        require_non_negative(expense.initial_value, "Base value of '" + expense.name + "'");
        require_rate(expense.inflation_rate, "Inflation rate of '" + expense.name + "'");
    }
}

void FinancialModel::validate_assets() const {
    const ModelConfig& config = definition_.config;
    const HistoricalReturns& returns = historical_returns();

    const AssetSpec* debt = nullptr;
    const AssetSpec* fallback = nullptr;

    for (const auto& asset : definition_.assets) {
        bool is_debt = config.debt_asset && *config.debt_asset == asset.name;
        if (!is_debt) {
            require_non_negative(asset.initial_value, "Initial value of '" + asset.name + "'");
        }
        if (asset.cap_value) {
            require_non_negative(*asset.cap_value, "cap_value of '" + asset.name + "'");
        }
        if (asset.cap_deposit) {
            require_non_negative(*asset.cap_deposit, "cap_deposit of '" + asset.name + "'");
        }
        validate_growth_rule(asset.growth, returns);

        if (is_debt) debt = &asset;
        if (config.fallback_asset && *config.fallback_asset == asset.name) fallback = &asset;
    }

    if (config.debt_asset) {
        if (!debt) {
            throw ConfigurationError("Debt asset '" + *config.debt_asset + "' is not a model asset");
        }
        if (debt->tax_treatment == TaxTreatment::PreTax) {
            throw ConfigurationError("Debt asset '" + debt->name + "' cannot be pre-tax");
        }
    }
    if (config.fallback_asset) {
        if (!fallback) {
            throw ConfigurationError("Fallback asset '" + *config.fallback_asset +
                                     "' is not a model asset");
        }
        if (fallback->tax_treatment == TaxTreatment::PreTax) {
            throw ConfigurationError("Fallback asset '" + fallback->name + "' cannot be pre-tax");
        }
        if (fallback->cap_value) {
            throw ConfigurationError("Fallback asset '" + fallback->name + "' cannot have a cap_value");
        }
    }
}

void FinancialModel::validate_portfolios() const {
    std::map<std::string, const AssetSpec*> assets_by_name;
    for (const auto& asset : definition_.assets) {
        assets_by_name[asset.name] = &asset;
    }
    std::set<std::string> portfolio_names;
    std::set<std::string> assigned;

    for (const auto& portfolio : definition_.portfolios) {
        if (portfolio.name.empty() || !portfolio_names.insert(portfolio.name).second) {
            throw ConfigurationError("Portfolio names must be unique and non-empty");
        }
        if (portfolio.allocations.empty()) {
            throw ConfigurationError("Portfolio '" + portfolio.name + "' has no assets");
        }

        double total_allocation = 0.0;
        size_t pretax_count = 0;
        for (const auto& entry : portfolio.allocations) {
            auto it = assets_by_name.find(entry.first);
            if (it == assets_by_name.end()) {
                throw ConfigurationError("Portfolio '" + portfolio.name +
                                         "' references unknown asset '" + entry.first + "'");
            }
            if (!assigned.insert(entry.first).second) {
                throw ConfigurationError("Asset '" + entry.first +
                                         "' belongs to more than one portfolio");
            }
            if (entry.first == debt_asset_name()) {
                throw ConfigurationError("Debt asset '" + entry.first +
                                         "' cannot belong to a portfolio");
            }
            if (entry.second < 0.0 || entry.second > 1.0) {
                throw ConfigurationError("Allocation of '" + entry.first +
                                         "' must be between 0.0 and 1.0");
            }
            if (it->second->tax_treatment == TaxTreatment::PreTax) {
                ++pretax_count;
            }
            total_allocation += entry.second;
        }

        if (std::fabs(total_allocation - 1.0) > Portfolio::ALLOCATION_TOLERANCE) {
            throw ConfigurationError("Total allocation of portfolio '" + portfolio.name + "' is " +
                                     std::to_string(total_allocation) + " but must sum to 1");
        }
        if (pretax_count != 0 && pretax_count != portfolio.allocations.size()) {
            throw ConfigurationError("Portfolio '" + portfolio.name +
                                     "' mixes pre-tax and post-tax assets");
        }
    }
}

void FinancialModel::validate_events() const {
    std::set<std::string> flow_names;
    for (const auto& revenue : definition_.revenues) flow_names.insert(revenue.name);
    for (const auto& expense : definition_.expenses) flow_names.insert(expense.name);

    std::set<std::string> asset_names;
    for (const auto& asset : definition_.assets) asset_names.insert(asset.name);
    if (has_implicit_debt()) asset_names.insert(IMPLICIT_DEBT_NAME);

    const int first = start_year();
    const int last = end_year();

    for (const auto& event : definition_.events) {
        int year = event.trigger.resolve(first);
        if (year < first || year >= last) {
            throw ConfigurationError("Event '" + event.name + "' triggers in " +
                                     std::to_string(year) + ", outside the simulation range [" +
                                     std::to_string(first) + ", " + std::to_string(last) + ")");
        }
        if (event.actions.empty()) {
            throw ConfigurationError("Event '" + event.name + "' has no actions");
        }

        for (const auto& action : event.actions) {
            const std::string where = "Action " + action.describe() + " of event '" + event.name + "'";
            bool is_flow = flow_names.count(action.target) > 0;
            bool is_asset = asset_names.count(action.target) > 0;

            if (!is_flow && !is_asset) {
                throw ConfigurationError(where + " targets unknown object '" + action.target + "'");
            }
            if (is_flow && !TaxableFlow::accepts(action.op)) {
                throw ConfigurationError(where + " is not supported by flow '" + action.target + "'");
            }
            if (action.duration && *action.duration < 1) {
                throw ConfigurationError(where + " has a duration below 1 year");
            }

            bool is_debt = action.target == debt_asset_name();
            if (const auto* set = std::get_if<SetBaseValue>(&action.op)) {
                if (!is_debt) require_non_negative(set->value, where + " base_value");
            } else if (const auto* rate = std::get_if<SetGrowthRate>(&action.op)) {
                require_rate(rate->rate, where + " rate");
            } else if (const auto* withdrawal = std::get_if<Withdraw>(&action.op)) {
                require_non_negative(withdrawal->amount, where + " amount");
            } else if (const auto* cap = std::get_if<SetCapValue>(&action.op)) {
                if (cap->cap) require_non_negative(*cap->cap, where + " cap_value");
                if (cap->cap && definition_.config.fallback_asset &&
                    *definition_.config.fallback_asset == action.target) {
                    throw ConfigurationError(where + " would cap fallback asset '" +
                                             action.target + "'");
                }
            } else if (const auto* cap_dep = std::get_if<SetCapDeposit>(&action.op)) {
                if (cap_dep->cap) require_non_negative(*cap_dep->cap, where + " cap_deposit");
            }
        }
    }
}

} // namespace finsim
