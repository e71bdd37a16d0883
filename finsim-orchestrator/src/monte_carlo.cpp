/**
 * @file monte_carlo.cpp
 * @brief Parallel trial execution with partial results
 */

#include "monte_carlo.hpp"
#include "errors.hpp"
#include "trial_runner.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace finsim {

MonteCarloRunner::MonteCarloRunner(const FinancialModel& model, SimulationConfig config)
    : model_(model), config_(config) {
    if (config_.number_of_simulations == 0) {
        throw ConfigurationError("number_of_simulations must be at least 1");
    }
    if (config_.max_threads < 0) {
        throw ConfigurationError("max_threads must be zero or positive");
    }
}

int MonteCarloRunner::thread_count() const {
#ifdef HAVE_OPENMP
    return config_.max_threads > 0 ? config_.max_threads : omp_get_max_threads();
#else
    return 1;
#endif
}

SimulationResult MonteCarloRunner::run() {
    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();

    const size_t total = config_.number_of_simulations;
    const int threads = thread_count();
    logger.log_run_start(total, config_.seed, model_.start_year(), model_.duration(), threads);

    TrialRunner runner(model_, &logger, config_.collect_year_reports);

    // One slot per trial; each worker writes only its own slot
    std::vector<std::optional<TrialResult>> outcomes(total);
    std::vector<std::optional<TrialFailure>> failures(total);
    std::vector<char> started(total, 0);
    size_t finished = 0;

    auto run_one = [&](size_t i) {
        if (cancel_requested_.load()) {
            return;
        }
        started[i] = 1;
        try {
            outcomes[i] = runner.run_trial(i, config_.seed);
        } catch (const SimulationError& e) {
            failures[i] = TrialFailure{i, e.year(), e.detail()};
            logger.log_trial_failed(SimulationContext(i, e.year()), e.detail());
        } catch (const std::exception& e) {
            // Not raised by the engine's own checks
            failures[i] = TrialFailure{i, 0, e.what()};
            logger.log_error(SimulationContext(i), e.what());
        }
        if (failures[i] && config_.fail_fast) {
            request_cancel();
        }

        std::lock_guard<std::mutex> lock(progress_mutex_);
        ++finished;
        if (progress_callback_) {
            progress_callback_(finished, total);
        }
    };

#ifdef HAVE_OPENMP
    // Parallelize the trial loop; dynamic scheduling evens out trials that
    // fail early
    const long long count = static_cast<long long>(total);
    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (long long i = 0; i < count; ++i) {
        run_one(static_cast<size_t>(i));
    }
#else
    // Single-threaded fallback when OpenMP not available
    for (size_t i = 0; i < total; ++i) {
        run_one(i);
    }
#endif

    SimulationResult result(model_.start_year(), model_.duration(), total);
    for (size_t i = 0; i < total; ++i) {
        if (!started[i]) {
            result.add_cancelled(i);
        } else if (outcomes[i]) {
            result.add_trial(std::move(*outcomes[i]));
        } else if (failures[i]) {
            result.add_failure(std::move(*failures[i]));
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.set_execution_time_ms(std::chrono::duration<double, std::milli>(end_time - start_time).count());

    if (!result.cancelled().empty()) {
        logger.log_warning(SimulationContext(),
                           "Run cancelled, " + std::to_string(result.cancelled().size()) +
                           " of " + std::to_string(total) + " trials not started");
    }
    logger.log_run_complete(result.successful_count(), result.failures().size(),
                            result.cancelled().size(), result.execution_time_ms());
    logger.flush();
    return result;
}

} // namespace finsim
