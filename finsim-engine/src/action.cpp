#include "action.hpp"
#include "errors.hpp"
#include <cmath>
#include <limits>
#include <set>
#include <sstream>
#include <utility>

namespace finsim {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Cap parameters use a negative or infinite value to mean "no cap"
std::optional<double> to_cap(double value) {
    if (value < 0.0 || std::isinf(value)) {
        return std::nullopt;
    }
    return value;
}

double require_param(const std::map<std::string, double>& params,
                     const std::string& key,
                     const std::string& action) {
    auto it = params.find(key);
    if (it == params.end()) {
        throw ConfigurationError("Invalid parameters for action '" + action +
                                 "': missing '" + key + "'");
    }
    return it->second;
}

void check_no_extra_params(const std::map<std::string, double>& params,
                           const std::set<std::string>& allowed,
                           const std::string& action) {
    for (const auto& entry : params) {
        if (entry.first != "duration" && allowed.find(entry.first) == allowed.end()) {
            throw ConfigurationError("Invalid parameters for action '" + action +
                                     "': unexpected '" + entry.first + "'");
        }
    }
}

} // anonymous namespace

std::string action_name(const ActionOp& op) {
    return std::visit(overloaded{
        [](const SetBaseValue&) { return std::string("update_base_value"); },
        [](const AddToBaseValue&) { return std::string("add_to_base_value"); },
        [](const SetGrowthRate&) { return std::string("update_growth_rate"); },
        [](const SetCapValue&) { return std::string("update_cap_value"); },
        [](const SetCapDeposit&) { return std::string("update_cap_deposit"); },
        [](const Withdraw&) { return std::string("withdraw"); },
    }, op);
}

bool is_one_off(const ActionOp& op) {
    return std::holds_alternative<AddToBaseValue>(op) || std::holds_alternative<Withdraw>(op);
}

std::optional<int> expiry_year(int year, int duration) {
    if (year > 0 && duration > std::numeric_limits<int>::max() - year) {
        return std::nullopt;
    }
    return year + duration;
}

Action::Action(std::string target_name, ActionOp operation, std::optional<int> years)
    : target(std::move(target_name)), op(std::move(operation)), duration(years) {}

Action Action::from_params(const std::string& target,
                           const std::string& action,
                           const std::map<std::string, double>& params,
                           std::optional<int> years) {
    if (target.empty()) {
        throw ConfigurationError("Action '" + action + "' has no target");
    }

    auto duration_it = params.find("duration");
    if (duration_it != params.end()) {
        if (years) {
            throw ConfigurationError("Invalid parameters for action '" + action +
                                     "': duration given twice");
        }
        double requested = duration_it->second;
        if (!std::isfinite(requested) || requested != std::floor(requested) ||
            requested < 1.0 || requested > std::numeric_limits<int>::max()) {
            throw ConfigurationError("Action duration must be a whole number of years between 1 and " +
                                     std::to_string(std::numeric_limits<int>::max()));
        }
        years = static_cast<int>(requested);
    }
    if (years && *years < 1) {
        throw ConfigurationError("Action duration must be at least 1 year");
    }

    if (action == "update_base_value") {
        check_no_extra_params(params, {"base_value"}, action);
        return Action(target, SetBaseValue{require_param(params, "base_value", action)}, years);
    }
    if (action == "add_to_base_value") {
        check_no_extra_params(params, {"amount"}, action);
        return Action(target, AddToBaseValue{require_param(params, "amount", action)}, years);
    }
    if (action == "update_growth_rate") {
        check_no_extra_params(params, {"rate"}, action);
        return Action(target, SetGrowthRate{require_param(params, "rate", action)}, years);
    }
    if (action == "update_cap_value") {
        check_no_extra_params(params, {"cap_value"}, action);
        return Action(target, SetCapValue{to_cap(require_param(params, "cap_value", action))}, years);
    }
    if (action == "update_cap_deposit") {
        check_no_extra_params(params, {"cap_deposit"}, action);
        return Action(target, SetCapDeposit{to_cap(require_param(params, "cap_deposit", action))}, years);
    }
    if (action == "withdraw") {
        check_no_extra_params(params, {"amount"}, action);
        return Action(target, Withdraw{require_param(params, "amount", action)}, years);
    }

    throw ConfigurationError("Target '" + target + "' has no action '" + action + "'");
}

std::string Action::describe() const {
    std::ostringstream oss;
    oss << action_name(op) << "(" << target;
    std::visit(overloaded{
        [&](const SetBaseValue& a) { oss << ", base_value=" << a.value; },
        [&](const AddToBaseValue& a) { oss << ", amount=" << a.amount; },
        [&](const SetGrowthRate& a) { oss << ", rate=" << a.rate; },
        [&](const SetCapValue& a) {
            oss << ", cap_value=";
            if (a.cap) oss << *a.cap; else oss << "none";
        },
        [&](const SetCapDeposit& a) {
            oss << ", cap_deposit=";
            if (a.cap) oss << *a.cap; else oss << "none";
        },
        [&](const Withdraw& a) { oss << ", amount=" << a.amount; },
    }, op);
    if (duration) {
        oss << ", duration=" << *duration;
    }
    oss << ")";
    return oss.str();
}

} // namespace finsim
