/**
 * @file simulation_result.hpp
 * @brief Per-object, per-trial, per-year histories of a Monte Carlo run
 */

#ifndef FINSIM_SIMULATION_RESULT_HPP
#define FINSIM_SIMULATION_RESULT_HPP

#include "trial_runner.hpp"
#include <map>
#include <string>
#include <vector>

namespace finsim {

/**
 * @brief A trial aborted by an error; other trials are unaffected
 */
struct TrialFailure {
    size_t trial_index;     ///< Trial that failed
    int year;               ///< Simulated year of the failure (0 if before the first year)
    std::string message;    ///< Cause
};

/**
 * @brief Cross-trial statistics of one object, one entry per simulated year
 */
struct HistoryBands {
    std::string object;
    int start_year = 0;
    size_t trial_count = 0;             ///< Successful trials aggregated
    std::vector<double> mean;
    std::vector<double> std_dev;        ///< Population standard deviation
    std::vector<double> p10;
    std::vector<double> p50;
    std::vector<double> p90;

    size_t size() const { return mean.size(); }
};

/**
 * @brief Results of a Monte Carlo run, keyed by (object, trial, year)
 *
 * Only successful trials hold histories. Failed trials are listed with
 * their cause, trials skipped by cancellation by index.
 */
class SimulationResult {
public:
    SimulationResult(int start_year, int duration, size_t requested_trials);

    void add_trial(TrialResult trial);
    void add_failure(TrialFailure failure);
    void add_cancelled(size_t trial_index);
    void set_execution_time_ms(double ms) { execution_time_ms_ = ms; }

    int start_year() const { return start_year_; }
    int duration() const { return duration_; }
    size_t requested_trials() const { return requested_trials_; }

    size_t successful_count() const { return trials_.size(); }
    const std::vector<TrialFailure>& failures() const { return failures_; }
    const std::vector<size_t>& cancelled() const { return cancelled_; }
    double execution_time_ms() const { return execution_time_ms_; }

    /**
     * @brief True when every requested trial succeeded
     */
    bool is_complete() const { return trials_.size() == requested_trials_; }

    bool has_trial(size_t trial_index) const { return trials_.count(trial_index) > 0; }

    /**
     * @brief Indices of successful trials in ascending order
     */
    std::vector<size_t> trial_indices() const;

    /**
     * @brief Names of the objects with histories
     */
    std::vector<std::string> object_names() const;

    /**
     * @brief Full result of one successful trial
     *
     * @throws std::out_of_range if the trial did not succeed
     */
    const TrialResult& trial(size_t trial_index) const;

    /**
     * @brief Yearly values of `object` in one trial, ordered by year
     *
     * @throws std::out_of_range for an unknown object or trial
     */
    const std::vector<double>& history(const std::string& object, size_t trial_index) const;

    /**
     * @brief Value of `object` in calendar `year` of one trial
     *
     * @throws std::out_of_range if the year is outside the simulation
     */
    double value(const std::string& object, size_t trial_index, int year) const;

    /**
     * @brief Last-year value of `object` for each successful trial, by trial index
     */
    std::vector<double> final_values(const std::string& object) const;

    /**
     * @brief Mean, standard deviation and P10/P50/P90 bands across trials
     *
     * @throws std::out_of_range for an unknown object
     */
    HistoryBands aggregate(const std::string& object) const;

private:
    int start_year_;
    int duration_;
    size_t requested_trials_;
    std::map<size_t, TrialResult> trials_;
    std::vector<TrialFailure> failures_;
    std::vector<size_t> cancelled_;
    double execution_time_ms_ = 0.0;
};

} // namespace finsim

#endif // FINSIM_SIMULATION_RESULT_HPP
