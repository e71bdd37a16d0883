/**
 * @file simulation_result.cpp
 * @brief Result queries and cross-trial statistics
 */

#include "simulation_result.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace finsim {

// ============================================================================
// Statistics Helper Functions
// ============================================================================

namespace {

// Calculate mean of a vector
double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

// Calculate standard deviation (population std dev)
double calculate_std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

// Percentile (0-100) using linear interpolation; values sorted ascending
double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

} // anonymous namespace

// ============================================================================
// SimulationResult Implementation
// ============================================================================

SimulationResult::SimulationResult(int start_year, int duration, size_t requested_trials)
    : start_year_(start_year), duration_(duration), requested_trials_(requested_trials) {}

void SimulationResult::add_trial(TrialResult trial) {
    size_t index = trial.trial_index;
    trials_[index] = std::move(trial);
}

void SimulationResult::add_failure(TrialFailure failure) {
    failures_.push_back(std::move(failure));
}

void SimulationResult::add_cancelled(size_t trial_index) {
    cancelled_.push_back(trial_index);
}

std::vector<size_t> SimulationResult::trial_indices() const {
    std::vector<size_t> indices;
    indices.reserve(trials_.size());
    for (const auto& [index, trial] : trials_) {
        indices.push_back(index);
    }
    return indices;
}

std::vector<std::string> SimulationResult::object_names() const {
    std::vector<std::string> names;
    if (trials_.empty()) {
        return names;
    }
    for (const auto& [name, values] : trials_.begin()->second.histories) {
        names.push_back(name);
    }
    return names;
}

const TrialResult& SimulationResult::trial(size_t trial_index) const {
    auto it = trials_.find(trial_index);
    if (it == trials_.end()) {
        throw std::out_of_range("Trial " + std::to_string(trial_index) + " has no result");
    }
    return it->second;
}

const std::vector<double>& SimulationResult::history(const std::string& object, size_t trial_index) const {
    return trial(trial_index).history(object);
}

double SimulationResult::value(const std::string& object, size_t trial_index, int year) const {
    const auto& values = history(object, trial_index);
    if (year < start_year_ || year - start_year_ >= static_cast<int>(values.size())) {
        throw std::out_of_range("Year " + std::to_string(year) + " is outside the simulation");
    }
    return values[static_cast<size_t>(year - start_year_)];
}

std::vector<double> SimulationResult::final_values(const std::string& object) const {
    std::vector<double> values;
    values.reserve(trials_.size());
    for (const auto& [index, trial] : trials_) {
        const auto& series = trial.history(object);
        if (!series.empty()) {
            values.push_back(series.back());
        }
    }
    return values;
}

HistoryBands SimulationResult::aggregate(const std::string& object) const {
    HistoryBands bands;
    bands.object = object;
    bands.start_year = start_year_;
    bands.trial_count = trials_.size();
    if (trials_.empty()) {
        return bands;
    }

    std::vector<const std::vector<double>*> series;
    series.reserve(trials_.size());
    size_t years = 0;
    for (const auto& [index, trial] : trials_) {
        series.push_back(&trial.history(object));
        years = std::max(years, series.back()->size());
    }

    std::vector<double> column;
    column.reserve(series.size());
    for (size_t y = 0; y < years; ++y) {
        column.clear();
        for (const auto* values : series) {
            if (y < values->size()) {
                column.push_back((*values)[y]);
            }
        }

        double mean = calculate_mean(column);
        bands.mean.push_back(mean);
        bands.std_dev.push_back(calculate_std_dev(column, mean));

        std::sort(column.begin(), column.end());
        bands.p10.push_back(calculate_percentile(column, 10.0));
        bands.p50.push_back(calculate_percentile(column, 50.0));
        bands.p90.push_back(calculate_percentile(column, 90.0));
    }
    return bands;
}

} // namespace finsim
