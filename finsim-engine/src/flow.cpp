#include "flow.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace finsim {

std::string flow_kind_to_string(FlowKind kind) {
    switch (kind) {
        case FlowKind::Revenue: return "revenue";
        case FlowKind::Expense: return "expense";
        default: return "unknown";
    }
}

TaxableFlow::TaxableFlow(FlowKind kind, std::string name, double initial_value,
                         double evolution_rate, std::string jurisdiction)
    : kind_(kind),
      name_(std::move(name)),
      value_(initial_value),
      rate_(evolution_rate),
      jurisdiction_(std::move(jurisdiction)) {
    if (name_.empty()) {
        throw ConfigurationError("Flow name must not be empty");
    }
    if (!std::isfinite(value_) || value_ < 0.0) {
        throw ConfigurationError("Base value of '" + name_ + "' must be zero or positive");
    }
    if (!std::isfinite(rate_) || rate_ < -1.0) {
        throw ConfigurationError("Evolution rate of '" + name_ + "' must be >= -1.0");
    }
    if (kind_ == FlowKind::Expense && !jurisdiction_.empty()) {
        throw ConfigurationError("Expense '" + name_ + "' cannot have a tax jurisdiction");
    }
}

void TaxableFlow::evolve() {
    history_.push_back(value_);
    value_ *= 1.0 + rate_;
}

double TaxableFlow::compute_tax(double gross_income, const TaxTable& table) const {
    if (!is_taxable()) {
        return 0.0;
    }
    return table.total_tax(gross_income, jurisdiction_);
}

bool TaxableFlow::accepts(const ActionOp& op) {
    return std::holds_alternative<SetBaseValue>(op) ||
           std::holds_alternative<AddToBaseValue>(op) ||
           std::holds_alternative<SetGrowthRate>(op);
}

void TaxableFlow::remember(Field field, double prior, int year, std::optional<int> duration) {
    if (!duration) {
        return;
    }
    if (auto expiry = expiry_year(year, *duration)) {
        restores_.push_back(PendingRestore{*expiry, field, prior});
    }
}

void TaxableFlow::apply_action(const ActionOp& op, int year, std::optional<int> duration) {
    if (const auto* set = std::get_if<SetBaseValue>(&op)) {
        if (set->value < 0.0) {
            throw std::invalid_argument("Base value of '" + name_ + "' must be zero or positive");
        }
        remember(Field::Value, value_, year, duration);
        value_ = set->value;
    } else if (const auto* add = std::get_if<AddToBaseValue>(&op)) {
        if (value_ + add->amount < 0.0) {
            throw std::invalid_argument("Adding " + std::to_string(add->amount) + " to '" +
                                        name_ + "' would make it negative");
        }
        value_ += add->amount;
    } else if (const auto* rate = std::get_if<SetGrowthRate>(&op)) {
        if (rate->rate < -1.0) {
            throw std::invalid_argument("Evolution rate of '" + name_ + "' must be >= -1.0");
        }
        remember(Field::Rate, rate_, year, duration);
        rate_ = rate->rate;
    } else {
        throw std::invalid_argument("Flow '" + name_ + "' does not support action '" +
                                    action_name(op) + "'");
    }
}

std::vector<std::string> TaxableFlow::restore_expired(int year) {
    std::vector<std::string> restored;
    // Newest first: overrides expiring together unwind to the oldest prior value
    for (auto it = restores_.rbegin(); it != restores_.rend(); ++it) {
        const PendingRestore& pending = *it;
        if (pending.year != year) {
            continue;
        }
        if (pending.field == Field::Value) {
            value_ = pending.prior;
            restored.push_back("base_value");
        } else {
            rate_ = pending.prior;
            restored.push_back("evolution_rate");
        }
    }
    restores_.erase(std::remove_if(restores_.begin(), restores_.end(),
                                   [year](const PendingRestore& p) { return p.year == year; }),
                    restores_.end());
    return restored;
}

} // namespace finsim
