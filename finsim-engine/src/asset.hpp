#ifndef FINSIM_ASSET_HPP
#define FINSIM_ASSET_HPP

#include "action.hpp"
#include "growth_sampler.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finsim {

enum class TaxTreatment : uint8_t {
    None = 0,
    TaxableOnGrowth = 1,    // Gains tracked for taxation on withdrawal
    PreTax = 2              // Deposits reduce taxable income in the deposit year
};

std::string tax_treatment_to_string(TaxTreatment treatment);

// Store of value with an attached growth strategy and tax treatment.
// Only an asset constructed with allows_negative (the debt account) may hold
// a negative balance.
class Asset : public Adjustable {
public:
    Asset(std::string name,
          double initial_value,
          std::unique_ptr<GrowthSampler> growth,
          std::optional<double> cap_value = std::nullopt,
          std::optional<double> cap_deposit = std::nullopt,
          TaxTreatment tax_treatment = TaxTreatment::None,
          bool allows_negative = false);

    Asset(const Asset&) = delete;
    Asset& operator=(const Asset&) = delete;

    const std::string& name() const override { return name_; }
    double current_value() const { return value_; }
    std::optional<double> cap_value() const { return cap_value_; }
    std::optional<double> cap_deposit() const { return cap_deposit_; }
    TaxTreatment tax_treatment() const { return tax_treatment_; }
    bool is_pretax() const { return tax_treatment_ == TaxTreatment::PreTax; }
    bool allows_negative() const { return allows_negative_; }
    bool is_capped() const { return cap_value_.has_value() || cap_deposit_.has_value(); }

    // Cost basis: deposits minus the basis share of withdrawals
    double contributions() const { return contributions_; }
    // Sum of all growth applied so far
    double accumulated_growth() const { return accumulated_growth_; }
    // Gain that would be realised by selling everything now
    double unrealized_gain() const { return value_ - contributions_; }

    double deposited_this_year() const { return deposited_this_year_; }
    double last_growth_rate() const { return last_rate_; }
    const GrowthSampler& growth() const { return *growth_; }

    // End-of-year balances of completed years
    const std::vector<double>& history() const { return history_; }

    // Starts a new year's deposit allowance
    void begin_year();

    // How much deposit() would accept right now
    double deposit_room() const;

    // Adds up to min(amount, cap_deposit left this year, cap_value - value).
    // Returns the amount deposited.
    double deposit(double amount);

    // Adds `amount` ignoring both caps (fallback sink and debt repayment)
    double deposit_uncapped(double amount);

    // Removes up to the positive balance; returns the amount withdrawn
    double withdraw(double amount);

    // Debt account only: lowers the balance by `amount`, below zero if needed
    void borrow(double amount);

    // value *= 1 + next_rate(); returns the rate applied
    double grow();

    // Sets the balance for a rebalancing transfer (not counted as a deposit)
    void rebalance_to(double target);

    // Appends the current balance to history
    void record_year();

    bool supports(const ActionOp& op) const override;

    // AddToBaseValue and Withdraw are one-off. SetBaseValue, growth rate
    // and caps honour `duration`; an expired SetBaseValue puts back the
    // balance held before it.
    void apply_action(const ActionOp& op, int year, std::optional<int> duration) override;
    std::vector<std::string> restore_expired(int year) override;

private:
    enum class Field : uint8_t { Value, Growth, CapValue, CapDeposit };

    struct PendingRestore {
        int year;
        Field field;
        std::optional<double> prior_cap;    // Prior balance for Field::Value
        std::unique_ptr<GrowthSampler> prior_growth;
    };

    std::string name_;
    double value_;
    std::unique_ptr<GrowthSampler> growth_;
    std::optional<double> cap_value_;
    std::optional<double> cap_deposit_;
    TaxTreatment tax_treatment_;
    bool allows_negative_;

    double contributions_;
    double accumulated_growth_ = 0.0;
    double deposited_this_year_ = 0.0;
    double last_rate_ = 0.0;
    std::vector<double> history_;
    std::vector<PendingRestore> restores_;

    void set_balance(double target);
    void remember(Field field, int year, std::optional<int> duration,
                  std::optional<double> prior_cap,
                  std::unique_ptr<GrowthSampler> prior_growth = nullptr);
    static void validate_cap(const std::optional<double>& cap, const std::string& what);
};

} // namespace finsim

#endif // FINSIM_ASSET_HPP
