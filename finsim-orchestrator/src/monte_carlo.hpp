/**
 * @file monte_carlo.hpp
 * @brief Runs independent trials of a model and collects their histories
 *
 * Trials share nothing mutable: each builds its own objects and samplers
 * from (seed, trial index), so they run in any order on any thread and
 * still reproduce exactly.
 */

#ifndef FINSIM_MONTE_CARLO_HPP
#define FINSIM_MONTE_CARLO_HPP

#include "logger.hpp"
#include "model.hpp"
#include "simulation_result.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

namespace finsim {

/**
 * @brief Run-level settings
 */
struct SimulationConfig {
    size_t number_of_simulations;   ///< Trials to run
    uint64_t seed;                  ///< Base seed; trial seeds derive from it
    int max_threads;                ///< 0 = OpenMP default
    bool collect_year_reports;      ///< Keep each trial's YearReports
    bool fail_fast;                 ///< Cancel remaining trials after the first failure

    SimulationConfig()
        : number_of_simulations(1000),
          seed(42),
          max_threads(0),
          collect_year_reports(false),
          fail_fast(false) {}
};

/**
 * @brief Monte Carlo orchestrator
 *
 * Usage Example:
 *   @code
 *   FinancialModel model(definition);
 *   SimulationConfig config;
 *   config.number_of_simulations = 5000;
 *
 *   MonteCarloRunner runner(model, config);
 *   SimulationResult result = runner.run();
 *   HistoryBands bands = result.aggregate("stocks");
 *   @endcode
 */
class MonteCarloRunner {
public:
    /**
     * @brief Called after each finished trial with (finished, total)
     *
     * Invoked under a lock, possibly from a worker thread. Must not throw.
     */
    using ProgressCallback = std::function<void(size_t, size_t)>;

    /**
     * @throws ConfigurationError if number_of_simulations is 0 or max_threads < 0
     */
    MonteCarloRunner(const FinancialModel& model, SimulationConfig config = SimulationConfig());

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    /**
     * @brief Runs every trial not cancelled
     *
     * A failing trial is recorded in the result and never stops the others
     * (unless fail_fast is set). A cancelled runner stays cancelled.
     */
    SimulationResult run();

    /**
     * @brief Stops starting new trials; running trials finish normally
     *
     * Safe to call from any thread, including the progress callback.
     */
    void request_cancel() { cancel_requested_.store(true); }
    bool cancel_requested() const { return cancel_requested_.load(); }

    const SimulationConfig& config() const { return config_; }

private:
    const FinancialModel& model_;
    SimulationConfig config_;
    ProgressCallback progress_callback_;
    std::atomic<bool> cancel_requested_{false};
    std::mutex progress_mutex_;

    int thread_count() const;
};

} // namespace finsim

#endif // FINSIM_MONTE_CARLO_HPP
