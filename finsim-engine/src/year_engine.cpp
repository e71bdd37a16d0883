#include "year_engine.hpp"
#include "errors.hpp"
#include <algorithm>
#include <map>
#include <utility>

namespace finsim {

namespace {

// Amounts below this are rounding noise, not cash
constexpr double kCashEpsilon = 1e-9;

} // anonymous namespace

YearEngine::YearEngine(TrialState& state, const TaxTable& tax_table,
                       ShortfallPolicy policy, Logger* logger)
    : state_(state),
      tax_table_(tax_table),
      policy_(policy),
      logger_(logger),
      next_year_(state.start_year()) {}

YearReport YearEngine::advance_year(int year) {
    const size_t trial = state_.trial_index();
    if (year != next_year_) {
        throw SimulationError("Years must advance sequentially; expected " +
                              std::to_string(next_year_) + ", got " + std::to_string(year),
                              trial, year);
    }
    if (year >= state_.end_year()) {
        throw SimulationError("Year is past the end of the simulation", trial, year);
    }

    report_ = YearReport();
    report_.year = year;
    cash_ = 0.0;

    try {
        for (const auto& asset : state_.assets()) {
            asset->begin_year();
        }
        fire_events(year);
        balance_cash_flow();
        log_phase(year, "balance");
        invest_pretax();
        log_phase(year, "pretax");
        tax_revenues();
        log_phase(year, "tax");
        distribute_cash(year);
        log_phase(year, "distribute");
        grow_assets(year);
        log_phase(year, "grow");
        evolve_flows();
        log_phase(year, "evolve");
    } catch (const SimulationError&) {
        throw;
    } catch (const std::exception& e) {
        throw SimulationError(e.what(), trial, year);
    }

    ++next_year_;
    total_stranded_ += report_.stranded_cash;
    return report_;
}

// ============================================================================
// Phase 0: overrides and events
// ============================================================================

void YearEngine::fire_events(int year) {
    auto restore = [&](Adjustable& object) {
        for (const auto& field : object.restore_expired(year)) {
            if (logger_) {
                logger_->log_override_expired(SimulationContext(state_.trial_index(), year, "events"),
                                              object.name(), field);
            }
        }
    };
    for (const auto& flow : state_.revenues()) restore(*flow);
    for (const auto& flow : state_.expenses()) restore(*flow);
    for (const auto& asset : state_.assets()) restore(*asset);

    auto fired = state_.scheduler().fire(year,
        [&](const ScheduledEvent& event, const Action& action) {
            execute_action(event, action, year);
        });

    for (const ScheduledEvent* event : fired) {
        report_.events_fired.push_back(event->name);
        if (logger_) {
            logger_->log_event_fired(SimulationContext(state_.trial_index(), year, "events"),
                                     event->name, event->actions.size());
        }
    }
}

void YearEngine::execute_action(const ScheduledEvent& event, const Action& action, int year) {
    Adjustable* target = state_.find_target(action.target);
    if (!target) {
        throw SimulationError("Event '" + event.name + "' targets unknown object '" +
                              action.target + "'", state_.trial_index(), year);
    }
    if (!target->supports(action.op)) {
        throw SimulationError("Event '" + event.name + "': '" + action.target +
                              "' does not support " + action_name(action.op),
                              state_.trial_index(), year);
    }

    // Withdrawals spend money; whatever the asset cannot fund is owed this year
    if (const auto* withdrawal = std::get_if<Withdraw>(&action.op)) {
        Asset* asset = state_.find_asset(action.target);
        if (!asset) {
            throw SimulationError("Withdraw target '" + action.target + "' is not an asset",
                                  state_.trial_index(), year);
        }
        double withdrawn = asset->withdraw(withdrawal->amount);
        report_.withdrawn += withdrawn;
        cash_ -= withdrawal->amount - withdrawn;
        return;
    }

    target->apply_action(action.op, year, is_one_off(action.op) ? std::nullopt : action.duration);
}

// ============================================================================
// Phases 1-3: cash flow, pre-tax deposits, tax
// ============================================================================

void YearEngine::balance_cash_flow() {
    for (const auto& revenue : state_.revenues()) {
        report_.gross_revenue += revenue->current_value();
    }
    for (const auto& expense : state_.expenses()) {
        report_.expenses += expense->current_value();
    }

    cash_ += report_.gross_revenue - report_.expenses;
    if (cash_ < 0.0) {
        cover_shortfall(-cash_);
        cash_ = 0.0;
    }
}

void YearEngine::invest_pretax() {
    for (auto& sink : state_.pretax_sinks()) {
        if (cash_ <= kCashEpsilon) {
            break;
        }
        double deposited = sink.deposit(cash_);
        cash_ -= deposited;
        report_.pretax_deposits += deposited;
    }
}

void YearEngine::tax_revenues() {
    // Taxable revenue per jurisdiction, in declaration order
    std::vector<std::pair<std::string, double>> by_jurisdiction;
    double taxable_revenue = 0.0;
    for (const auto& revenue : state_.revenues()) {
        if (!revenue->is_taxable()) {
            continue;
        }
        auto it = std::find_if(by_jurisdiction.begin(), by_jurisdiction.end(),
            [&](const auto& entry) { return entry.first == revenue->jurisdiction(); });
        if (it == by_jurisdiction.end()) {
            by_jurisdiction.emplace_back(revenue->jurisdiction(), revenue->current_value());
        } else {
            it->second += revenue->current_value();
        }
        taxable_revenue += revenue->current_value();
    }

    report_.taxable_income = std::max(0.0, taxable_revenue - report_.pretax_deposits);
    if (report_.taxable_income <= 0.0) {
        return;
    }

    double tax = tax_table_.federal_tax(report_.taxable_income);
    for (const auto& [jurisdiction, revenue] : by_jurisdiction) {
        double share = revenue / taxable_revenue;
        tax += tax_table_.state_tax(report_.taxable_income * share, jurisdiction);
    }
    report_.tax = tax;

    cash_ -= tax;
    if (cash_ < 0.0) {
        cover_shortfall(-cash_);
        cash_ = 0.0;
    }
}

// ============================================================================
// Phase 4: debt repayment and post-tax deposits
// ============================================================================

void YearEngine::distribute_cash(int year) {
    Asset& debt = state_.debt();
    if (cash_ > kCashEpsilon && debt.current_value() < 0.0) {
        double repayment = std::min(cash_, -debt.current_value());
        debt.deposit_uncapped(repayment);
        cash_ -= repayment;
        report_.repaid = repayment;
    }

    for (auto& sink : state_.taxed_sinks()) {
        if (cash_ <= kCashEpsilon) {
            break;
        }
        double deposited = sink.deposit(cash_);
        cash_ -= deposited;
        report_.invested += deposited;
    }

    if (cash_ > kCashEpsilon) {
        if (Asset* fallback = state_.fallback()) {
            fallback->deposit_uncapped(cash_);
            report_.invested += cash_;
        } else {
            report_.stranded_cash = cash_;
            if (logger_) {
                logger_->log_stranded_cash(SimulationContext(state_.trial_index(), year, "distribute"),
                                           cash_);
            }
        }
    }
    cash_ = 0.0;
}

// ============================================================================
// Phases 5-6: growth and evolution
// ============================================================================

void YearEngine::grow_assets(int year) {
    for (const auto& asset : state_.assets()) {
        asset->grow();
    }
    for (auto& portfolio : state_.portfolios()) {
        if (portfolio.rebalance_policy() == RebalancePolicy::Annual) {
            portfolio.rebalance();
        }
    }
    for (const auto& asset : state_.assets()) {
        if (!asset->allows_negative() && asset->current_value() < -kCashEpsilon) {
            throw SimulationError("Asset '" + asset->name() + "' has a negative balance of " +
                                  std::to_string(asset->current_value()),
                                  state_.trial_index(), year);
        }
        asset->record_year();
    }
}

void YearEngine::evolve_flows() {
    for (const auto& revenue : state_.revenues()) {
        revenue->evolve();
    }
    for (const auto& expense : state_.expenses()) {
        expense->evolve();
    }
}

void YearEngine::cover_shortfall(double amount) {
    double remaining = amount;
    if (policy_ == ShortfallPolicy::WithdrawThenBorrow) {
        for (Asset* asset : state_.liquid_assets()) {
            if (remaining <= kCashEpsilon) {
                break;
            }
            double withdrawn = asset->withdraw(remaining);
            remaining -= withdrawn;
            report_.withdrawn += withdrawn;
        }
    }
    if (remaining > kCashEpsilon) {
        state_.debt().borrow(remaining);
        report_.borrowed += remaining;
    }
}

void YearEngine::log_phase(int year, const std::string& phase) const {
    if (!logger_ || !logger_->is_enabled(LogLevel::DEBUG)) {
        return;
    }
    std::map<std::string, double> amounts;
    amounts["available_cash"] = cash_;
    amounts["debt"] = state_.debt().current_value();
    if (phase == "balance") {
        amounts["gross_revenue"] = report_.gross_revenue;
        amounts["expenses"] = report_.expenses;
    } else if (phase == "pretax") {
        amounts["pretax_deposits"] = report_.pretax_deposits;
    } else if (phase == "tax") {
        amounts["taxable_income"] = report_.taxable_income;
        amounts["tax"] = report_.tax;
    } else if (phase == "distribute") {
        amounts["invested"] = report_.invested;
        amounts["repaid"] = report_.repaid;
    }
    logger_->log_phase(SimulationContext(state_.trial_index(), year, phase), amounts);
}

} // namespace finsim
