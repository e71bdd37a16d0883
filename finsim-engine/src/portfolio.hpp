#ifndef FINSIM_PORTFOLIO_HPP
#define FINSIM_PORTFOLIO_HPP

#include "asset.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace finsim {

enum class RebalancePolicy : uint8_t {
    Annual = 0,     // Restore target weights after every growth phase
    Never = 1       // Let weights drift
};

// Allocation-weighted group of assets owned elsewhere (by the trial state)
class Portfolio {
public:
    static constexpr double ALLOCATION_TOLERANCE = 1e-6;

    struct Member {
        Asset* asset;
        double allocation;
    };

    // Allocations must be in [0, 1] and sum to 1.0 within ALLOCATION_TOLERANCE;
    // throws ConfigurationError otherwise
    Portfolio(std::string name, std::vector<Member> members,
              RebalancePolicy policy = RebalancePolicy::Annual);

    const std::string& name() const { return name_; }
    const std::vector<Member>& members() const { return members_; }
    RebalancePolicy rebalance_policy() const { return policy_; }

    // True when every member is a pre-tax asset
    bool is_pretax() const;
    bool contains(const Asset* asset) const;

    double total_value() const;

    // Weight of each member in the current total (0 when the total is 0)
    std::vector<double> current_weights() const;

    // Splits `amount` pro-rata by allocation; what capped members cannot take
    // is offered to members that still have room. Returns the amount deposited.
    double deposit(double amount);

    // Zero-sum transfer restoring target allocations exactly
    void rebalance();

private:
    std::string name_;
    std::vector<Member> members_;
    RebalancePolicy policy_;
};

} // namespace finsim

#endif // FINSIM_PORTFOLIO_HPP
