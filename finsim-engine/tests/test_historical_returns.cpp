#include <catch2/catch.hpp>
#include <sstream>
#include "historical_returns.hpp"
#include "errors.hpp"

using namespace finsim;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

TEST_CASE("Default historical returns cover 1974-2023", "[returns]") {
    HistoricalReturns returns = HistoricalReturns::defaults();

    REQUIRE(returns.version() == "us-annual-1974-2023");
    REQUIRE(returns.size() == 3);
    for (const char* category : {"stocks", "bonds", "cash"}) {
        REQUIRE(returns.has_category(category));
        auto series = returns.get(category);
        REQUIRE(series->first_year == 1974);
        REQUIRE(series->annual_returns.size() == 50);
    }
}

TEST_CASE("Default stock returns are riskier than cash", "[returns]") {
    HistoricalReturns returns = HistoricalReturns::defaults();

    auto stocks = returns.get("stocks");
    auto cash = returns.get("cash");
    REQUIRE(stocks->mean() > cash->mean());
    REQUIRE(stocks->std_dev() > cash->std_dev());
    REQUIRE(cash->std_dev() > 0.0);
}

TEST_CASE("ReturnSeries statistics", "[returns]") {
    ReturnSeries series{"test", 2000, {0.1, -0.1, 0.2, 0.0}};

    REQUIRE_THAT(series.mean(), WithinAbs(0.05, 1e-12));
    // Population std dev of {0.05, -0.15, 0.15, -0.05} deviations
    REQUIRE_THAT(series.std_dev(), WithinRel(0.1118033988749895, 1e-9));
}

TEST_CASE("Unknown growth category throws ConfigurationError", "[returns][error]") {
    HistoricalReturns returns = HistoricalReturns::defaults();

    REQUIRE_FALSE(returns.has_category("crypto"));
    REQUIRE_THROWS_AS(returns.get("crypto"), ConfigurationError);
}

TEST_CASE("Invalid return series are rejected", "[returns][error]") {
    HistoricalReturns returns;

    REQUIRE_THROWS_AS(returns.add(ReturnSeries{"", 2000, {0.1}}), ConfigurationError);
    REQUIRE_THROWS_AS(returns.add(ReturnSeries{"empty", 2000, {}}), ConfigurationError);
    REQUIRE_THROWS_AS(returns.add(ReturnSeries{"wipeout", 2000, {0.1, -1.5}}), ConfigurationError);
}

TEST_CASE("Historical returns load from CSV sorted by year", "[returns][csv]") {
    std::istringstream csv(
        "category,year,return\n"
        "equity,2002,0.30\n"
        "equity,2000,0.10\n"
        "equity,2001,-0.20\n"
        "gilts,2000,0.04\n");

    HistoricalReturns returns = HistoricalReturns::load_from_csv(csv);

    REQUIRE(returns.size() == 2);
    auto equity = returns.get("equity");
    REQUIRE(equity->first_year == 2000);
    REQUIRE(equity->annual_returns.size() == 3);
    REQUIRE_THAT(equity->annual_returns[0], WithinRel(0.10, 1e-12));
    REQUIRE_THAT(equity->annual_returns[1], WithinRel(-0.20, 1e-12));
    REQUIRE_THAT(equity->annual_returns[2], WithinRel(0.30, 1e-12));
}

TEST_CASE("Historical returns CSV rejects duplicate years", "[returns][csv][error]") {
    std::istringstream csv("equity,2000,0.10\nequity,2000,0.20\n");
    REQUIRE_THROWS_AS(HistoricalReturns::load_from_csv(csv), ConfigurationError);
}

TEST_CASE("Historical returns load from JSON", "[returns][json]") {
    const std::string json = R"({
        "version": "custom",
        "series": {"equity": {"first_year": 1990, "returns": [0.1, 0.2, -0.05]}}
    })";

    HistoricalReturns returns = HistoricalReturns::load_from_json(json);

    REQUIRE(returns.version() == "custom");
    auto equity = returns.get("equity");
    REQUIRE(equity->first_year == 1990);
    REQUIRE(equity->annual_returns.size() == 3);
}

TEST_CASE("Historical returns JSON errors", "[returns][json][error]") {
    REQUIRE_THROWS_AS(HistoricalReturns::load_from_json("[1, 2"), ConfigurationError);
    REQUIRE_THROWS_AS(HistoricalReturns::load_from_json(R"({"version": "x"})"), ConfigurationError);
    REQUIRE_THROWS_AS(HistoricalReturns::load_from_json(R"({"series": {"a": {"returns": ["x"]}}})"),
                      ConfigurationError);
}
