#ifndef FINSIM_TRIAL_STATE_HPP
#define FINSIM_TRIAL_STATE_HPP

#include "asset.hpp"
#include "event_scheduler.hpp"
#include "flow.hpp"
#include "model.hpp"
#include "portfolio.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace finsim {

// Where phase 2 or phase 4 can put cash: a standalone asset or a portfolio
struct DepositSink {
    Asset* asset = nullptr;
    Portfolio* portfolio = nullptr;

    const std::string& name() const { return portfolio ? portfolio->name() : asset->name(); }
    double deposit(double amount) { return portfolio ? portfolio->deposit(amount) : asset->deposit(amount); }
};

// Fresh, trial-owned copy of every flow, asset, portfolio and event of a
// model. Growth samplers are bound to seeds derived from (base_seed,
// trial_index, asset index), so the state depends only on those inputs.
class TrialState {
public:
    TrialState(const FinancialModel& model, size_t trial_index, uint64_t base_seed);

    TrialState(const TrialState&) = delete;
    TrialState& operator=(const TrialState&) = delete;

    size_t trial_index() const { return trial_index_; }
    int start_year() const { return start_year_; }
    int end_year() const { return end_year_; }

    const std::vector<std::unique_ptr<TaxableFlow>>& revenues() const { return revenues_; }
    const std::vector<std::unique_ptr<TaxableFlow>>& expenses() const { return expenses_; }
    // Declared order; an implicit debt account comes last
    const std::vector<std::unique_ptr<Asset>>& assets() const { return assets_; }
    std::vector<Portfolio>& portfolios() { return portfolios_; }
    const std::vector<Portfolio>& portfolios() const { return portfolios_; }

    EventScheduler& scheduler() { return scheduler_; }
    const EventScheduler& scheduler() const { return scheduler_; }

    Asset& debt() { return *debt_; }
    const Asset& debt() const { return *debt_; }
    bool has_implicit_debt() const { return implicit_debt_; }
    Asset* fallback() { return fallback_; }

    // Pre-tax sinks for phase 2, post-tax sinks for phase 4 (declared order,
    // a portfolio at the position of its first member, no implicit debt)
    std::vector<DepositSink>& pretax_sinks() { return pretax_sinks_; }
    std::vector<DepositSink>& taxed_sinks() { return taxed_sinks_; }

    // Non pre-tax, non-debt assets in declared order
    const std::vector<Asset*>& liquid_assets() const { return liquid_assets_; }

    // nullptr when no object has this name
    Adjustable* find_target(const std::string& name);
    Asset* find_asset(const std::string& name);
    TaxableFlow* find_flow(const std::string& name);

private:
    size_t trial_index_;
    int start_year_;
    int end_year_;

    std::vector<std::unique_ptr<TaxableFlow>> revenues_;
    std::vector<std::unique_ptr<TaxableFlow>> expenses_;
    std::vector<std::unique_ptr<Asset>> assets_;
    std::vector<Portfolio> portfolios_;
    EventScheduler scheduler_;

    Asset* debt_ = nullptr;
    Asset* fallback_ = nullptr;
    bool implicit_debt_ = false;

    std::vector<DepositSink> pretax_sinks_;
    std::vector<DepositSink> taxed_sinks_;
    std::vector<Asset*> liquid_assets_;

    void build_sinks();
};

} // namespace finsim

#endif // FINSIM_TRIAL_STATE_HPP
