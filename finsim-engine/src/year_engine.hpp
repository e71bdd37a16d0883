#ifndef FINSIM_YEAR_ENGINE_HPP
#define FINSIM_YEAR_ENGINE_HPP

#include "logger.hpp"
#include "model.hpp"
#include "tax_table.hpp"
#include "trial_state.hpp"
#include <string>
#include <vector>

namespace finsim {

// Cash movements of one simulated year
struct YearReport {
    int year = 0;
    double gross_revenue = 0.0;
    double expenses = 0.0;
    double pretax_deposits = 0.0;
    double taxable_income = 0.0;    // Taxable revenue minus pre-tax deposits, floored at 0
    double tax = 0.0;
    double borrowed = 0.0;          // Added to the debt account
    double repaid = 0.0;            // Debt paid down from positive cash
    double withdrawn = 0.0;         // Taken out of assets (events and shortfall liquidation)
    double invested = 0.0;          // Post-tax deposits, fallback included
    double stranded_cash = 0.0;     // Positive cash no asset could take
    std::vector<std::string> events_fired;
};

// Advances one trial's state by exactly one year per call.
//
// Every call runs, in this order:
//   0. restore expired overrides, then fire the year's events
//   1. balance revenues against expenses; a deficit goes to the shortfall policy
//   2. deposit into pre-tax assets
//   3. tax (taxable revenue - pre-tax deposits)
//   4. repay debt, then deposit into the remaining assets in declared order
//   5. grow every asset, rebalance portfolios, record asset histories
//   6. evolve revenues and expenses (recording the value used this year)
class YearEngine {
public:
    YearEngine(TrialState& state, const TaxTable& tax_table,
               ShortfallPolicy policy = ShortfallPolicy::Borrow,
               Logger* logger = nullptr);

    // Years must be consecutive, starting at the state's start year.
    // Any failure is raised as SimulationError carrying the trial and year.
    YearReport advance_year(int year);

    int next_year() const { return next_year_; }
    double total_stranded_cash() const { return total_stranded_; }

private:
    TrialState& state_;
    const TaxTable& tax_table_;
    ShortfallPolicy policy_;
    Logger* logger_;
    int next_year_;
    double total_stranded_ = 0.0;

    // Working values of the year being advanced
    YearReport report_;
    double cash_ = 0.0;

    void fire_events(int year);
    void execute_action(const ScheduledEvent& event, const Action& action, int year);
    void balance_cash_flow();
    void invest_pretax();
    void tax_revenues();
    void distribute_cash(int year);
    void grow_assets(int year);
    void evolve_flows();

    // Funds `amount` through the shortfall policy
    void cover_shortfall(double amount);

    void log_phase(int year, const std::string& phase) const;
};

} // namespace finsim

#endif // FINSIM_YEAR_ENGINE_HPP
