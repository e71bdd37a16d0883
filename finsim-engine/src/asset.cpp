#include "asset.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace finsim {

std::string tax_treatment_to_string(TaxTreatment treatment) {
    switch (treatment) {
        case TaxTreatment::None: return "none";
        case TaxTreatment::TaxableOnGrowth: return "taxable_on_growth";
        case TaxTreatment::PreTax: return "pretax";
        default: return "unknown";
    }
}

Asset::Asset(std::string name,
             double initial_value,
             std::unique_ptr<GrowthSampler> growth,
             std::optional<double> cap_value,
             std::optional<double> cap_deposit,
             TaxTreatment tax_treatment,
             bool allows_negative)
    : name_(std::move(name)),
      value_(initial_value),
      growth_(std::move(growth)),
      cap_value_(cap_value),
      cap_deposit_(cap_deposit),
      tax_treatment_(tax_treatment),
      allows_negative_(allows_negative),
      contributions_(std::max(initial_value, 0.0)) {
    if (name_.empty()) {
        throw ConfigurationError("Asset name must not be empty");
    }
    if (!growth_) {
        throw ConfigurationError("Asset '" + name_ + "' has no growth rule");
    }
    if (!std::isfinite(value_) || (value_ < 0.0 && !allows_negative_)) {
        throw ConfigurationError("Initial value of '" + name_ + "' must be zero or positive");
    }
    validate_cap(cap_value_, "cap_value of '" + name_ + "'");
    validate_cap(cap_deposit_, "cap_deposit of '" + name_ + "'");
}

void Asset::validate_cap(const std::optional<double>& cap, const std::string& what) {
    if (cap && (!std::isfinite(*cap) || *cap < 0.0)) {
        throw ConfigurationError(what + " must be a finite value >= 0");
    }
}

void Asset::begin_year() {
    deposited_this_year_ = 0.0;
}

double Asset::deposit_room() const {
    double room = std::numeric_limits<double>::infinity();
    if (cap_value_) {
        room = std::min(room, std::max(0.0, *cap_value_ - value_));
    }
    if (cap_deposit_) {
        room = std::min(room, std::max(0.0, *cap_deposit_ - deposited_this_year_));
    }
    return room;
}

double Asset::deposit(double amount) {
    if (amount < 0.0) {
        throw std::invalid_argument("Cannot deposit a negative amount into '" + name_ + "'");
    }
    double deposited = std::min(amount, deposit_room());
    if (deposited <= 0.0) {
        return 0.0;
    }
    value_ += deposited;
    contributions_ += deposited;
    deposited_this_year_ += deposited;
    return deposited;
}

double Asset::deposit_uncapped(double amount) {
    if (amount < 0.0) {
        throw std::invalid_argument("Cannot deposit a negative amount into '" + name_ + "'");
    }
    value_ += amount;
    contributions_ += amount;
    deposited_this_year_ += amount;
    return amount;
}

double Asset::withdraw(double amount) {
    if (amount < 0.0) {
        throw std::invalid_argument("Cannot withdraw a negative amount from '" + name_ + "'");
    }
    double available = std::max(0.0, value_);
    double withdrawn = std::min(amount, available);
    if (withdrawn <= 0.0) {
        return 0.0;
    }
    // Basis leaves in proportion to the share of the balance sold
    contributions_ *= (available - withdrawn) / available;
    value_ -= withdrawn;
    return withdrawn;
}

void Asset::borrow(double amount) {
    if (!allows_negative_) {
        throw std::logic_error("Asset '" + name_ + "' is not a debt account");
    }
    if (amount < 0.0) {
        throw std::invalid_argument("Cannot borrow a negative amount on '" + name_ + "'");
    }
    value_ -= amount;
}

double Asset::grow() {
    last_rate_ = growth_->next_rate();
    double growth = value_ * last_rate_;
    value_ += growth;
    accumulated_growth_ += growth;
    return last_rate_;
}

void Asset::set_balance(double target) {
    if (target < 0.0 && !allows_negative_) {
        throw std::invalid_argument("Balance of '" + name_ + "' must be zero or positive");
    }
    if (target >= value_) {
        contributions_ += target - value_;
    } else if (value_ > 0.0) {
        contributions_ *= std::max(0.0, target) / value_;
    }
    value_ = target;
}

void Asset::rebalance_to(double target) {
    set_balance(target);
}

void Asset::record_year() {
    history_.push_back(value_);
}

bool Asset::supports(const ActionOp& /* op */) const {
    // Every operation in the vocabulary applies to assets
    return true;
}

void Asset::apply_action(const ActionOp& op, int year, std::optional<int> duration) {
    if (const auto* set = std::get_if<SetBaseValue>(&op)) {
        double prior = value_;
        set_balance(set->value);
        remember(Field::Value, year, duration, prior);
    } else if (const auto* add = std::get_if<AddToBaseValue>(&op)) {
        set_balance(value_ + add->amount);
    } else if (const auto* withdrawal = std::get_if<Withdraw>(&op)) {
        withdraw(withdrawal->amount);
    } else if (const auto* rate = std::get_if<SetGrowthRate>(&op)) {
        auto replacement = std::make_unique<FixedGrowthSampler>(rate->rate);
        remember(Field::Growth, year, duration, std::nullopt, std::move(growth_));
        growth_ = std::move(replacement);
    } else if (const auto* cap = std::get_if<SetCapValue>(&op)) {
        validate_cap(cap->cap, "cap_value of '" + name_ + "'");
        remember(Field::CapValue, year, duration, cap_value_);
        cap_value_ = cap->cap;
    } else if (const auto* cap_dep = std::get_if<SetCapDeposit>(&op)) {
        validate_cap(cap_dep->cap, "cap_deposit of '" + name_ + "'");
        remember(Field::CapDeposit, year, duration, cap_deposit_);
        cap_deposit_ = cap_dep->cap;
    }
}

void Asset::remember(Field field, int year, std::optional<int> duration,
                     std::optional<double> prior_cap,
                     std::unique_ptr<GrowthSampler> prior_growth) {
    if (!duration) {
        return;
    }
    if (auto expiry = expiry_year(year, *duration)) {
        restores_.push_back(PendingRestore{*expiry, field, prior_cap, std::move(prior_growth)});
    }
}

std::vector<std::string> Asset::restore_expired(int year) {
    std::vector<std::string> restored;
    for (auto it = restores_.rbegin(); it != restores_.rend(); ++it) {
        if (it->year != year) {
            continue;
        }
        switch (it->field) {
            case Field::Value:
                set_balance(*it->prior_cap);
                restored.push_back("base_value");
                break;
            case Field::Growth:
                growth_ = std::move(it->prior_growth);
                restored.push_back("growth_rate");
                break;
            case Field::CapValue:
                cap_value_ = it->prior_cap;
                restored.push_back("cap_value");
                break;
            case Field::CapDeposit:
                cap_deposit_ = it->prior_cap;
                restored.push_back("cap_deposit");
                break;
        }
    }
    restores_.erase(std::remove_if(restores_.begin(), restores_.end(),
                                   [year](const PendingRestore& p) { return p.year == year; }),
                    restores_.end());
    return restored;
}

} // namespace finsim
