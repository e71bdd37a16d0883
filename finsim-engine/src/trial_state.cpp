#include "trial_state.hpp"
#include "errors.hpp"
#include <map>

namespace finsim {

TrialState::TrialState(const FinancialModel& model, size_t trial_index, uint64_t base_seed)
    : trial_index_(trial_index),
      start_year_(model.start_year()),
      end_year_(model.end_year()),
      scheduler_(model.start_year(), model.duration()) {
    for (const auto& spec : model.revenues()) {
        revenues_.push_back(std::make_unique<TaxableFlow>(
            FlowKind::Revenue, spec.name, spec.initial_value, spec.growth_rate, spec.jurisdiction));
    }
    for (const auto& spec : model.expenses()) {
        expenses_.push_back(std::make_unique<TaxableFlow>(
            FlowKind::Expense, spec.name, spec.initial_value, spec.inflation_rate));
    }

    const std::string debt_name = model.debt_asset_name();
    const auto& asset_specs = model.assets();
    for (size_t i = 0; i < asset_specs.size(); ++i) {
        const AssetSpec& spec = asset_specs[i];
        uint64_t seed = derive_seed(base_seed, trial_index, i);
        assets_.push_back(std::make_unique<Asset>(
            spec.name, spec.initial_value,
            make_sampler(spec.growth, model.historical_returns(), seed),
            spec.cap_value, spec.cap_deposit, spec.tax_treatment,
            spec.name == debt_name));
    }
    if (model.has_implicit_debt()) {
        assets_.push_back(std::make_unique<Asset>(
            FinancialModel::IMPLICIT_DEBT_NAME, 0.0,
            std::make_unique<FixedGrowthSampler>(0.0),
            std::nullopt, std::nullopt, TaxTreatment::None, true));
        implicit_debt_ = true;
    }

    debt_ = find_asset(debt_name);
    if (model.config().fallback_asset) {
        fallback_ = find_asset(*model.config().fallback_asset);
    }
    if (!debt_) {
        throw ConfigurationError("Debt asset '" + debt_name + "' is missing from the trial state");
    }

    for (const auto& spec : model.portfolios()) {
        std::vector<Portfolio::Member> members;
        for (const auto& [asset_name, allocation] : spec.allocations) {
            members.push_back(Portfolio::Member{find_asset(asset_name), allocation});
        }
        portfolios_.emplace_back(spec.name, std::move(members), spec.rebalance);
    }

    scheduler_.schedule(model.events());
    build_sinks();
}

void TrialState::build_sinks() {
    std::map<const Asset*, Portfolio*> owner;
    for (auto& portfolio : portfolios_) {
        for (const auto& member : portfolio.members()) {
            owner[member.asset] = &portfolio;
        }
    }

    std::map<const Portfolio*, bool> placed;
    for (const auto& asset : assets_) {
        if (implicit_debt_ && asset.get() == debt_) {
            continue;
        }
        if (!asset->is_pretax() && asset.get() != debt_) {
            liquid_assets_.push_back(asset.get());
        }

        DepositSink sink;
        auto it = owner.find(asset.get());
        if (it != owner.end()) {
            if (placed[it->second]) {
                continue;
            }
            placed[it->second] = true;
            sink.portfolio = it->second;
        } else {
            sink.asset = asset.get();
        }

        bool pretax = sink.portfolio ? sink.portfolio->is_pretax() : sink.asset->is_pretax();
        (pretax ? pretax_sinks_ : taxed_sinks_).push_back(sink);
    }
}

Adjustable* TrialState::find_target(const std::string& name) {
    if (TaxableFlow* flow = find_flow(name)) {
        return flow;
    }
    return find_asset(name);
}

Asset* TrialState::find_asset(const std::string& name) {
    for (auto& asset : assets_) {
        if (asset->name() == name) {
            return asset.get();
        }
    }
    return nullptr;
}

TaxableFlow* TrialState::find_flow(const std::string& name) {
    for (auto& flow : revenues_) {
        if (flow->name() == name) return flow.get();
    }
    for (auto& flow : expenses_) {
        if (flow->name() == name) return flow.get();
    }
    return nullptr;
}

} // namespace finsim
