#include "portfolio.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace finsim {

namespace {

constexpr double kCashEpsilon = 1e-9;

} // anonymous namespace

Portfolio::Portfolio(std::string name, std::vector<Member> members, RebalancePolicy policy)
    : name_(std::move(name)), members_(std::move(members)), policy_(policy) {
    if (members_.empty()) {
        throw ConfigurationError("Portfolio '" + name_ + "' has no assets");
    }

    double total_allocation = 0.0;
    for (const auto& member : members_) {
        if (member.asset == nullptr) {
            throw ConfigurationError("Portfolio '" + name_ + "' has a null asset");
        }
        if (member.allocation < 0.0 || member.allocation > 1.0) {
            throw ConfigurationError("Allocation of '" + member.asset->name() +
                                     "' must be between 0.0 and 1.0");
        }
        if (member.asset->allows_negative()) {
            throw ConfigurationError("Debt account '" + member.asset->name() +
                                     "' cannot belong to portfolio '" + name_ + "'");
        }
        total_allocation += member.allocation;
    }

    if (std::fabs(total_allocation - 1.0) > ALLOCATION_TOLERANCE) {
        throw ConfigurationError("Total allocation of portfolio '" + name_ + "' is " +
                                 std::to_string(total_allocation) + " but must sum to 1");
    }
}

bool Portfolio::is_pretax() const {
    for (const auto& member : members_) {
        if (!member.asset->is_pretax()) {
            return false;
        }
    }
    return true;
}

bool Portfolio::contains(const Asset* asset) const {
    for (const auto& member : members_) {
        if (member.asset == asset) {
            return true;
        }
    }
    return false;
}

double Portfolio::total_value() const {
    double total = 0.0;
    for (const auto& member : members_) {
        total += member.asset->current_value();
    }
    return total;
}

std::vector<double> Portfolio::current_weights() const {
    std::vector<double> weights(members_.size(), 0.0);
    double total = total_value();
    if (total <= 0.0) {
        return weights;
    }
    for (size_t i = 0; i < members_.size(); ++i) {
        weights[i] = members_[i].asset->current_value() / total;
    }
    return weights;
}

double Portfolio::deposit(double amount) {
    double remaining = amount;

    // Each pass either fills at least one member or places everything,
    // so members_.size() passes are enough
    for (size_t pass = 0; pass < members_.size() && remaining > kCashEpsilon; ++pass) {
        double open_weight = 0.0;
        size_t open_count = 0;
        for (const auto& member : members_) {
            if (member.asset->deposit_room() > kCashEpsilon) {
                open_weight += member.allocation;
                ++open_count;
            }
        }
        if (open_count == 0) {
            break;
        }

        double placed = 0.0;
        for (const auto& member : members_) {
            if (member.asset->deposit_room() <= kCashEpsilon) {
                continue;
            }
            // Zero-weight members only receive cash when nothing else is open
            double share = open_weight > 0.0
                ? remaining * member.allocation / open_weight
                : remaining / static_cast<double>(open_count);
            placed += member.asset->deposit(share);
        }
        remaining -= placed;
        if (placed <= kCashEpsilon) {
            break;
        }
    }

    return amount - std::max(remaining, 0.0);
}

void Portfolio::rebalance() {
    double total = total_value();
    if (total <= 0.0) {
        return;
    }
    for (auto& member : members_) {
        member.asset->rebalance_to(total * member.allocation);
    }
}

} // namespace finsim
