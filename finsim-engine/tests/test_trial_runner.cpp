#include <catch2/catch.hpp>
#include <stdexcept>
#include "trial_runner.hpp"
#include "errors.hpp"

using namespace finsim;
using Catch::Matchers::WithinAbs;

namespace {

// 20-year household with a historical equity account
FinancialModel stochastic_model() {
    ModelDefinition def;
    def.config = ModelConfig(2024, 20);
    def.revenues.push_back(RevenueSpec{"salary", 90000.0, 0.02, "MA"});
    def.expenses.push_back(ExpenseSpec{"living", 40000.0, 0.03});

    AssetSpec stocks;
    stocks.name = "stocks";
    stocks.initial_value = 10000.0;
    stocks.growth = GrowthRule::historical("stocks");
    def.assets.push_back(stocks);

    AssetSpec cash;
    cash.name = "cash";
    cash.growth = GrowthRule::fixed(0.01);
    def.assets.push_back(cash);
    return FinancialModel(def);
}

} // anonymous namespace

TEST_CASE("Trial produces one value per year for every object", "[trial]") {
    FinancialModel model = stochastic_model();
    TrialRunner runner(model);

    TrialResult result = runner.run_trial(0, 42);

    REQUIRE(result.trial_index == 0);
    REQUIRE(result.histories.size() == 5);    // salary, living, stocks, cash, Debt
    for (const auto& [name, history] : result.histories) {
        INFO(name);
        REQUIRE(history.size() == 20);
    }
    REQUIRE(result.history("salary")[0] == 90000.0);
    REQUIRE(result.year_reports.empty());
    REQUIRE_THROWS_AS(result.history("yacht"), std::out_of_range);
}

TEST_CASE("Same seed and trial index reproduce the trial", "[trial][seed]") {
    FinancialModel model = stochastic_model();
    TrialRunner runner(model);

    TrialResult first = runner.run_trial(7, 1234);
    TrialResult second = runner.run_trial(7, 1234);

    REQUIRE(first.histories == second.histories);
}

TEST_CASE("Different trials draw different returns", "[trial][seed]") {
    FinancialModel model = stochastic_model();
    TrialRunner runner(model);

    TrialResult a = runner.run_trial(0, 1234);
    TrialResult b = runner.run_trial(1, 1234);
    TrialResult c = runner.run_trial(0, 99);

    REQUIRE(a.history("stocks") != b.history("stocks"));
    REQUIRE(a.history("stocks") != c.history("stocks"));
    // Deterministic objects do not depend on the draw
    REQUIRE(a.history("salary") == b.history("salary"));
}

TEST_CASE("Year reports are collected on request", "[trial]") {
    FinancialModel model = stochastic_model();
    TrialRunner runner(model, nullptr, true);

    TrialResult result = runner.run_trial(0, 42);

    REQUIRE(result.year_reports.size() == 20);
    REQUIRE(result.year_reports.front().year == 2024);
    REQUIRE(result.year_reports.back().year == 2043);
    REQUIRE_THAT(result.year_reports.front().gross_revenue, WithinAbs(90000.0, 1e-9));
}

TEST_CASE("Failing trial raises SimulationError", "[trial][error]") {
    ModelDefinition def;
    def.config = ModelConfig(2024, 5);
    AssetSpec cash;
    cash.name = "cash";
    cash.initial_value = 1000.0;
    cash.growth = GrowthRule::fixed(0.0);
    def.assets.push_back(cash);
    // Dropping the balance below zero is only legal on the debt account
    def.events.push_back(EventSpec{"overdraw", EventTrigger::relative(2),
                                   {Action("cash", AddToBaseValue{-5000.0})}});
    FinancialModel model(def);
    TrialRunner runner(model);

    try {
        runner.run_trial(4, 42);
        FAIL("trial should have failed");
    } catch (const SimulationError& e) {
        REQUIRE(e.trial_index() == 4);
        REQUIRE(e.year() == 2026);
    }
}
