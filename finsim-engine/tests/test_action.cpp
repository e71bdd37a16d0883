#include <catch2/catch.hpp>
#include <limits>
#include "action.hpp"
#include "errors.hpp"

using namespace finsim;

TEST_CASE("Action::from_params builds every operation", "[action]") {
    auto set = Action::from_params("salary", "update_base_value", {{"base_value", 0.0}});
    REQUIRE(std::holds_alternative<SetBaseValue>(set.op));
    REQUIRE(std::get<SetBaseValue>(set.op).value == 0.0);
    REQUIRE_FALSE(set.duration.has_value());

    auto add = Action::from_params("salary", "add_to_base_value", {{"amount", 5000.0}});
    REQUIRE(std::get<AddToBaseValue>(add.op).amount == 5000.0);

    auto rate = Action::from_params("stocks", "update_growth_rate", {{"rate", 0.02}}, 3);
    REQUIRE(std::get<SetGrowthRate>(rate.op).rate == 0.02);
    REQUIRE(rate.duration == 3);

    auto cap = Action::from_params("ira", "update_cap_value", {{"cap_value", 7000.0}});
    REQUIRE(std::get<SetCapValue>(cap.op).cap == 7000.0);

    auto cap_dep = Action::from_params("401k", "update_cap_deposit", {{"cap_deposit", 23000.0}});
    REQUIRE(std::get<SetCapDeposit>(cap_dep.op).cap == 23000.0);

    auto withdraw = Action::from_params("cash", "withdraw", {{"amount", 30000.0}});
    REQUIRE(std::get<Withdraw>(withdraw.op).amount == 30000.0);
}

TEST_CASE("Duration may be passed as a parameter", "[action]") {
    auto action = Action::from_params("salary", "update_base_value",
                                      {{"base_value", 0.0}, {"duration", 100.0}});
    REQUIRE(action.duration == 100);
    REQUIRE(action.describe() == "update_base_value(salary, base_value=0, duration=100)");
}

TEST_CASE("Largest duration parameter is accepted", "[action]") {
    auto action = Action::from_params("salary", "update_base_value",
                                      {{"base_value", 0.0},
                                       {"duration", static_cast<double>(std::numeric_limits<int>::max())}});
    REQUIRE(action.duration == std::numeric_limits<int>::max());
}

TEST_CASE("Expiry year saturates instead of overflowing", "[action]") {
    REQUIRE(expiry_year(2024, 3) == 2027);
    REQUIRE_FALSE(expiry_year(2024, std::numeric_limits<int>::max()).has_value());
    REQUIRE(expiry_year(0, std::numeric_limits<int>::max()) == std::numeric_limits<int>::max());
}

TEST_CASE("Infinite or negative caps remove the cap", "[action]") {
    auto removed = Action::from_params("ira", "update_cap_value",
                                       {{"cap_value", std::numeric_limits<double>::infinity()}});
    REQUIRE_FALSE(std::get<SetCapValue>(removed.op).cap.has_value());

    auto negative = Action::from_params("ira", "update_cap_deposit", {{"cap_deposit", -1.0}});
    REQUIRE_FALSE(std::get<SetCapDeposit>(negative.op).cap.has_value());
    REQUIRE(negative.describe() == "update_cap_deposit(ira, cap_deposit=none)");
}

TEST_CASE("Malformed actions throw ConfigurationError", "[action][error]") {
    SECTION("unknown operation") {
        REQUIRE_THROWS_AS(Action::from_params("salary", "explode", {}), ConfigurationError);
    }
    SECTION("missing parameter") {
        REQUIRE_THROWS_AS(Action::from_params("salary", "update_base_value", {}), ConfigurationError);
    }
    SECTION("unexpected parameter") {
        REQUIRE_THROWS_AS(Action::from_params("salary", "update_growth_rate",
                                              {{"rate", 0.1}, {"base_value", 1.0}}),
                          ConfigurationError);
    }
    SECTION("duration given twice") {
        REQUIRE_THROWS_AS(Action::from_params("salary", "update_growth_rate",
                                              {{"rate", 0.1}, {"duration", 2.0}}, 2),
                          ConfigurationError);
    }
    SECTION("duration below one year") {
        REQUIRE_THROWS_AS(Action::from_params("salary", "update_growth_rate", {{"rate", 0.1}}, 0),
                          ConfigurationError);
    }
    SECTION("duration parameter outside the int range") {
        REQUIRE_THROWS_AS(Action::from_params("salary", "update_base_value",
                                              {{"base_value", 0.0}, {"duration", 1e12}}),
                          ConfigurationError);
        REQUIRE_THROWS_AS(Action::from_params("salary", "update_base_value",
                                              {{"base_value", 0.0},
                                               {"duration", std::numeric_limits<double>::quiet_NaN()}}),
                          ConfigurationError);
        REQUIRE_THROWS_AS(Action::from_params("salary", "update_base_value",
                                              {{"base_value", 0.0}, {"duration", 0.5}}),
                          ConfigurationError);
    }
    SECTION("no target") {
        REQUIRE_THROWS_AS(Action::from_params("", "withdraw", {{"amount", 1.0}}), ConfigurationError);
    }
}

TEST_CASE("Operation names and one-off classification", "[action]") {
    REQUIRE(action_name(SetBaseValue{1.0}) == "update_base_value");
    REQUIRE(action_name(Withdraw{1.0}) == "withdraw");

    REQUIRE(is_one_off(Withdraw{1.0}));
    REQUIRE(is_one_off(AddToBaseValue{1.0}));
    REQUIRE_FALSE(is_one_off(SetBaseValue{1.0}));
    REQUIRE_FALSE(is_one_off(SetGrowthRate{0.0}));
    REQUIRE_FALSE(is_one_off(SetCapValue{std::nullopt}));
}
