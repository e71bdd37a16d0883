#include <catch2/catch.hpp>
#include "monte_carlo.hpp"
#include "errors.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

using namespace finsim;
using Catch::Matchers::WithinAbs;

namespace {

AssetSpec equity(double initial) {
    AssetSpec stocks;
    stocks.name = "stocks";
    stocks.initial_value = initial;
    stocks.growth = GrowthRule::historical("stocks");
    return stocks;
}

// Saver putting 20000 a year into historical stocks for 30 years
FinancialModel saver_model() {
    ModelDefinition def;
    def.config = ModelConfig(2024, 30);
    def.revenues.push_back(RevenueSpec{"salary", 80000.0, 0.02, "MA"});
    def.expenses.push_back(ExpenseSpec{"living", 40000.0, 0.02});
    def.assets.push_back(equity(50000.0));
    return FinancialModel(def);
}

// Spends the whole equity balance in the second year; trials with a losing
// first year cannot cover it and fail
FinancialModel fragile_model() {
    ModelDefinition def;
    def.config = ModelConfig(2024, 5);
    def.assets.push_back(equity(10000.0));
    def.events.push_back(EventSpec{"spend", EventTrigger::relative(1),
                                   {Action("stocks", AddToBaseValue{-10000.0})}});
    return FinancialModel(def);
}

// Keeps the console quiet while trials fail on purpose
class QuietLogger {
public:
    QuietLogger() {
        LoggerConfig config;
        config.enable_console = false;
        Logger::get_instance().configure(config);
    }
    ~QuietLogger() {
        Logger::get_instance().configure(LoggerConfig());
    }
};

// Plain-text WARN and above into a temporary file
class WarningLog {
public:
    WarningLog()
        : path_((std::filesystem::temp_directory_path() / "finsim_test_montecarlo.log").string()) {
        std::filesystem::remove(path_);
        LoggerConfig config;
        config.min_level = LogLevel::WARN;
        config.enable_console = false;
        config.enable_file = true;
        config.enable_json = false;
        config.log_file_path = path_;
        Logger::get_instance().configure(config);
    }
    ~WarningLog() {
        Logger::get_instance().configure(LoggerConfig());
        std::filesystem::remove(path_);
    }

    std::vector<std::string> lines() const {
        Logger::get_instance().flush();
        std::vector<std::string> result;
        std::ifstream file(path_);
        std::string line;
        while (std::getline(file, line)) {
            result.push_back(line);
        }
        return result;
    }

private:
    std::string path_;
};

SimulationConfig trials(size_t count, uint64_t seed = 42) {
    SimulationConfig config;
    config.number_of_simulations = count;
    config.seed = seed;
    return config;
}

} // anonymous namespace

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("Runner rejects invalid run settings", "[montecarlo][error]") {
    FinancialModel model = saver_model();

    REQUIRE_THROWS_AS(MonteCarloRunner(model, trials(0)), ConfigurationError);

    SimulationConfig negative_threads = trials(10);
    negative_threads.max_threads = -1;
    REQUIRE_THROWS_AS(MonteCarloRunner(model, negative_threads), ConfigurationError);
}

// ============================================================================
// Runs
// ============================================================================

TEST_CASE("Stochastic model spreads final balances", "[montecarlo]") {
    QuietLogger quiet;
    FinancialModel model = saver_model();
    MonteCarloRunner runner(model, trials(1000));

    SimulationResult result = runner.run();

    REQUIRE(result.is_complete());
    REQUIRE(result.successful_count() == 1000);
    REQUIRE(result.failures().empty());
    REQUIRE(result.cancelled().empty());

    HistoryBands bands = result.aggregate("stocks");
    REQUIRE(bands.size() == 30);
    REQUIRE(bands.std_dev.back() > 0.0);
    REQUIRE(bands.p10.back() < bands.p50.back());
    REQUIRE(bands.p50.back() < bands.p90.back());

    // Flows do not depend on returns
    HistoryBands salary = result.aggregate("salary");
    REQUIRE_THAT(salary.std_dev.back(), WithinAbs(0.0, 1e-9));
}

TEST_CASE("Same seed reproduces every trial regardless of threads", "[montecarlo][seed]") {
    QuietLogger quiet;
    FinancialModel model = saver_model();

    SimulationConfig single = trials(64, 2024);
    single.max_threads = 1;
    SimulationConfig multi = trials(64, 2024);
    multi.max_threads = 4;

    SimulationResult a = MonteCarloRunner(model, single).run();
    SimulationResult b = MonteCarloRunner(model, multi).run();

    for (size_t i = 0; i < 64; ++i) {
        REQUIRE(a.history("stocks", i) == b.history("stocks", i));
    }

    SimulationResult c = MonteCarloRunner(model, trials(64, 7)).run();
    REQUIRE(a.final_values("stocks") != c.final_values("stocks"));
}

TEST_CASE("Failed trials do not stop the others", "[montecarlo][error]") {
    QuietLogger quiet;
    FinancialModel model = fragile_model();
    MonteCarloRunner runner(model, trials(300));

    SimulationResult result = runner.run();

    REQUIRE_FALSE(result.failures().empty());
    REQUIRE(result.successful_count() > 0);
    REQUIRE(result.successful_count() + result.failures().size() == 300);
    REQUIRE(result.cancelled().empty());

    std::set<size_t> failed;
    for (const auto& failure : result.failures()) {
        REQUIRE(failure.year == 2025);
        REQUIRE_FALSE(failure.message.empty());
        REQUIRE_FALSE(result.has_trial(failure.trial_index));
        failed.insert(failure.trial_index);
    }
    REQUIRE(failed.size() == result.failures().size());
}

TEST_CASE("fail_fast cancels the remaining trials", "[montecarlo][cancel]") {
    QuietLogger quiet;
    FinancialModel model = fragile_model();
    SimulationConfig config = trials(2000);
    config.fail_fast = true;
    config.max_threads = 1;
    MonteCarloRunner runner(model, config);

    SimulationResult result = runner.run();

    REQUIRE(runner.cancel_requested());
    REQUIRE(result.failures().size() == 1);
    REQUIRE_FALSE(result.cancelled().empty());
    REQUIRE(result.successful_count() + result.failures().size() + result.cancelled().size() == 2000);
}

TEST_CASE("Cancellation from the progress callback keeps partial results", "[montecarlo][cancel]") {
    QuietLogger quiet;
    FinancialModel model = saver_model();
    SimulationConfig config = trials(2000);
    config.max_threads = 1;
    MonteCarloRunner runner(model, config);

    size_t last_total = 0;
    runner.set_progress_callback([&](size_t finished, size_t total) {
        last_total = total;
        if (finished == 10) {
            runner.request_cancel();
        }
    });

    SimulationResult result = runner.run();

    REQUIRE(last_total == 2000);
    REQUIRE_FALSE(result.is_complete());
    REQUIRE(result.successful_count() == 10);
    REQUIRE(result.cancelled().size() == 1990);
    REQUIRE(result.value("salary", 0, 2024) == 80000.0);

    // Cancellation is sticky
    SimulationResult again = runner.run();
    REQUIRE(again.successful_count() == 0);
    REQUIRE(again.cancelled().size() == 2000);
}

TEST_CASE("A cancelled run logs a warning", "[montecarlo][cancel]") {
    WarningLog log;
    FinancialModel model = saver_model();
    SimulationConfig config = trials(50);
    config.max_threads = 1;
    MonteCarloRunner runner(model, config);
    runner.set_progress_callback([&](size_t finished, size_t) {
        if (finished == 5) {
            runner.request_cancel();
        }
    });

    SimulationResult result = runner.run();
    REQUIRE(result.cancelled().size() == 45);

    auto lines = log.lines();
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[WARN] Run cancelled, 45 of 50 trials not started") != std::string::npos);
}

TEST_CASE("A complete run logs no warning", "[montecarlo]") {
    WarningLog log;
    FinancialModel model = saver_model();
    SimulationResult result = MonteCarloRunner(model, trials(8)).run();

    REQUIRE(result.is_complete());
    REQUIRE(log.lines().empty());
}

TEST_CASE("Progress reaches the trial count", "[montecarlo]") {
    QuietLogger quiet;
    FinancialModel model = saver_model();
    MonteCarloRunner runner(model, trials(50));

    std::atomic<size_t> calls{0};
    size_t last = 0;
    runner.set_progress_callback([&](size_t finished, size_t) {
        ++calls;
        last = finished;
    });
    runner.run();

    REQUIRE(calls.load() == 50);
    REQUIRE(last == 50);
}
