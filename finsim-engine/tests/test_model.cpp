#include <catch2/catch.hpp>
#include "model.hpp"
#include "errors.hpp"
#include <limits>

using namespace finsim;

namespace {

ModelDefinition basic_definition() {
    ModelDefinition def;
    def.config = ModelConfig(2024, 10);
    def.revenues.push_back(RevenueSpec{"salary", 70000.0, 0.0, "MA"});
    def.expenses.push_back(ExpenseSpec{"housing", 20000.0, 0.02});
    AssetSpec cash;
    cash.name = "cash";
    cash.initial_value = 1000.0;
    cash.growth = GrowthRule::fixed(0.01);
    cash.cap_value = 50000.0;
    def.assets.push_back(cash);
    return def;
}

AssetSpec asset_spec(const std::string& name, TaxTreatment treatment = TaxTreatment::None) {
    AssetSpec spec;
    spec.name = name;
    spec.growth = GrowthRule::fixed(0.05);
    spec.tax_treatment = treatment;
    return spec;
}

} // anonymous namespace

// ============================================================================
// Valid Models
// ============================================================================

TEST_CASE("Basic model validates", "[model]") {
    FinancialModel model(basic_definition());

    REQUIRE(model.start_year() == 2024);
    REQUIRE(model.duration() == 10);
    REQUIRE(model.end_year() == 2034);
    REQUIRE(model.has_implicit_debt());
    REQUIRE(model.debt_asset_name() == "Debt");
    REQUIRE(model.object_names() == std::vector<std::string>{"salary", "housing", "cash", "Debt"});
    REQUIRE_FALSE(model.is_stochastic());
    REQUIRE(model.tax_table().version() == "us-2023");
}

TEST_CASE("Default ModelConfig spans 30 years", "[model]") {
    ModelConfig config;
    REQUIRE(config.duration == 30);
    REQUIRE(config.start_year > 2000);
    REQUIRE(config.shortfall_policy == ShortfallPolicy::Borrow);
    REQUIRE_FALSE(config.debt_asset.has_value());
}

TEST_CASE("Named debt asset replaces the implicit one", "[model]") {
    auto def = basic_definition();
    def.config.debt_asset = "cash";
    FinancialModel model(def);

    REQUIRE_FALSE(model.has_implicit_debt());
    REQUIRE(model.debt_asset_name() == "cash");
    REQUIRE(model.object_names() == std::vector<std::string>{"salary", "housing", "cash"});
}

TEST_CASE("Historical growth makes a model stochastic", "[model]") {
    auto def = basic_definition();
    AssetSpec stocks = asset_spec("stocks");
    stocks.growth = GrowthRule::historical("stocks");
    def.assets.push_back(stocks);

    REQUIRE(FinancialModel(def).is_stochastic());
}

// ============================================================================
// Invalid Models
// ============================================================================

TEST_CASE("Unknown jurisdiction fails at construction", "[model][error]") {
    auto def = basic_definition();
    def.revenues[0].jurisdiction = "ZZ";
    REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
}

TEST_CASE("Unknown growth category fails at construction", "[model][error]") {
    auto def = basic_definition();
    def.assets[0].growth = GrowthRule::historical("gold");
    REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
}

TEST_CASE("Names must be unique and non-empty", "[model][error]") {
    SECTION("duplicate") {
        auto def = basic_definition();
        def.expenses.push_back(ExpenseSpec{"salary", 100.0, 0.0});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("clash with the implicit debt account") {
        auto def = basic_definition();
        def.assets.push_back(asset_spec("Debt"));
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("empty") {
        auto def = basic_definition();
        def.expenses.push_back(ExpenseSpec{"", 100.0, 0.0});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
}

TEST_CASE("Negative values and rates are rejected", "[model][error]") {
    SECTION("revenue") {
        auto def = basic_definition();
        def.revenues[0].initial_value = -1.0;
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("inflation") {
        auto def = basic_definition();
        def.expenses[0].inflation_rate = -1.5;
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("asset value outside the debt account") {
        auto def = basic_definition();
        def.assets[0].initial_value = -500.0;
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
        def.config.debt_asset = "cash";
        REQUIRE_NOTHROW(FinancialModel(def));
    }
    SECTION("duration") {
        auto def = basic_definition();
        def.config.duration = 0;
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
}

TEST_CASE("Debt and fallback assets must exist and be post-tax", "[model][error]") {
    auto def = basic_definition();
    def.assets.push_back(asset_spec("401k", TaxTreatment::PreTax));

    SECTION("missing debt asset") {
        def.config.debt_asset = "loan";
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("pre-tax debt asset") {
        def.config.debt_asset = "401k";
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("missing fallback asset") {
        def.config.fallback_asset = "mattress";
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("pre-tax fallback asset") {
        def.config.fallback_asset = "401k";
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
}

TEST_CASE("Fallback asset cannot carry a cap_value", "[model][error]") {
    auto def = basic_definition();
    AssetSpec savings = asset_spec("savings");
    savings.cap_deposit = 1000.0;
    def.assets.push_back(savings);

    SECTION("uncapped fallback with a yearly deposit limit") {
        def.config.fallback_asset = "savings";
        REQUIRE_NOTHROW(FinancialModel(def));
    }
    SECTION("capped fallback") {
        def.config.fallback_asset = "cash";
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("event capping the fallback") {
        def.config.fallback_asset = "savings";
        def.events.push_back(EventSpec{"cap", EventTrigger::relative(2),
                                       {Action("savings", SetCapValue{20000.0})}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("event removing a cap from the fallback") {
        def.config.fallback_asset = "savings";
        def.events.push_back(EventSpec{"uncap", EventTrigger::relative(2),
                                       {Action("savings", SetCapValue{std::nullopt})}});
        REQUIRE_NOTHROW(FinancialModel(def));
    }
}

TEST_CASE("Portfolio validation", "[model][portfolio][error]") {
    auto def = basic_definition();
    def.assets.push_back(asset_spec("stocks"));
    def.assets.push_back(asset_spec("bonds"));
    def.assets.push_back(asset_spec("ira", TaxTreatment::PreTax));

    SECTION("valid") {
        def.portfolios.push_back(PortfolioSpec{"mix", {{"stocks", 0.6}, {"bonds", 0.4}}});
        REQUIRE_NOTHROW(FinancialModel(def));
    }
    SECTION("allocations not summing to 1") {
        def.portfolios.push_back(PortfolioSpec{"mix", {{"stocks", 0.6}, {"bonds", 0.3}}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("unknown member") {
        def.portfolios.push_back(PortfolioSpec{"mix", {{"stocks", 0.5}, {"gold", 0.5}}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("asset in two portfolios") {
        def.portfolios.push_back(PortfolioSpec{"a", {{"stocks", 1.0}}});
        def.portfolios.push_back(PortfolioSpec{"b", {{"stocks", 0.5}, {"bonds", 0.5}}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("mixed pre-tax and post-tax") {
        def.portfolios.push_back(PortfolioSpec{"mix", {{"stocks", 0.5}, {"ira", 0.5}}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("debt account as member") {
        def.config.debt_asset = "bonds";
        def.portfolios.push_back(PortfolioSpec{"mix", {{"stocks", 0.5}, {"bonds", 0.5}}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
}

TEST_CASE("Event validation", "[model][event][error]") {
    auto def = basic_definition();

    SECTION("trigger inside the range") {
        def.events.push_back(EventSpec{"retire", EventTrigger::absolute(2033),
                                       {Action("salary", SetBaseValue{0.0})}});
        def.events.push_back(EventSpec{"raise", EventTrigger::relative(0),
                                       {Action("salary", AddToBaseValue{1000.0})}});
        REQUIRE_NOTHROW(FinancialModel(def));
    }
    SECTION("trigger after the last year") {
        def.events.push_back(EventSpec{"retire", EventTrigger::absolute(2034),
                                       {Action("salary", SetBaseValue{0.0})}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("trigger before the first year") {
        def.events.push_back(EventSpec{"early", EventTrigger::relative(-1),
                                       {Action("salary", SetBaseValue{0.0})}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("unknown target") {
        def.events.push_back(EventSpec{"bonus", EventTrigger::relative(1),
                                       {Action("bonus", SetBaseValue{1.0})}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("operation the target does not support") {
        def.events.push_back(EventSpec{"cap", EventTrigger::relative(1),
                                       {Action("salary", SetCapValue{10.0})}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("negative base value") {
        def.events.push_back(EventSpec{"bad", EventTrigger::relative(1),
                                       {Action("cash", SetBaseValue{-10.0})}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
    SECTION("implicit debt is a valid target") {
        def.events.push_back(EventSpec{"mortgage", EventTrigger::relative(1),
                                       {Action("Debt", SetBaseValue{-200000.0}),
                                        Action("Debt", SetGrowthRate{0.04})}});
        REQUIRE_NOTHROW(FinancialModel(def));
    }
    SECTION("longest representable duration") {
        def.events.push_back(EventSpec{"forever", EventTrigger::relative(1),
                                       {Action("salary", SetBaseValue{0.0},
                                               std::numeric_limits<int>::max())}});
        REQUIRE_NOTHROW(FinancialModel(def));
    }
    SECTION("event without actions") {
        def.events.push_back(EventSpec{"nothing", EventTrigger::relative(1), {}});
        REQUIRE_THROWS_AS(FinancialModel(def), ConfigurationError);
    }
}
