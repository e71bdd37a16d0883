#ifndef FINSIM_ACTION_HPP
#define FINSIM_ACTION_HPP

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace finsim {

// Closed vocabulary of parameter mutations an event can apply
struct SetBaseValue {
    double value;
};

struct AddToBaseValue {
    double amount;          // May be negative, the result must stay >= 0
};

struct SetGrowthRate {
    double rate;            // Flows: evolution rate; assets: fixed growth rate
};

struct SetCapValue {
    std::optional<double> cap;      // nullopt removes the cap
};

struct SetCapDeposit {
    std::optional<double> cap;
};

struct Withdraw {
    double amount;          // Assets only; unfunded remainder goes to the shortfall policy
};

using ActionOp = std::variant<SetBaseValue, AddToBaseValue, SetGrowthRate,
                              SetCapValue, SetCapDeposit, Withdraw>;

// Operation name as accepted by Action::from_params
std::string action_name(const ActionOp& op);

// One-off operations take effect once and ignore any duration
bool is_one_off(const ActionOp& op);

// Year in which an override applied in `year` lapses, or nullopt when
// `year + duration` is past the representable range (never restored)
std::optional<int> expiry_year(int year, int duration);

struct Action {
    std::string target;                 // Name of a flow or asset
    ActionOp op;
    std::optional<int> duration;        // Years the mutation persists; nullopt = permanent

    Action(std::string target_name, ActionOp operation,
           std::optional<int> years = std::nullopt);

    // Builds an action from an operation name and named parameters:
    //   update_base_value  {base_value}     add_to_base_value {amount}
    //   update_growth_rate {rate}           update_cap_value  {cap_value}
    //   update_cap_deposit {cap_deposit}    withdraw          {amount}
    // A "duration" parameter may be passed in `params` instead of `years`.
    // Throws ConfigurationError for unknown operations or parameters.
    static Action from_params(const std::string& target,
                              const std::string& action,
                              const std::map<std::string, double>& params,
                              std::optional<int> years = std::nullopt);

    std::string describe() const;
};

// Capability implemented by every flow and asset so events can mutate them
// without knowing their concrete type.
class Adjustable {
public:
    virtual ~Adjustable() = default;

    virtual const std::string& name() const = 0;

    virtual bool supports(const ActionOp& op) const = 0;

    // Applies `op` fired at the start of `year`. With a duration `d`, the prior
    // state is restored at the start of year + d.
    virtual void apply_action(const ActionOp& op, int year, std::optional<int> duration) = 0;

    // Restores every mutation expiring at `year`; returns the restored fields
    virtual std::vector<std::string> restore_expired(int year) = 0;
};

} // namespace finsim

#endif // FINSIM_ACTION_HPP
