#ifndef FINSIM_TRIAL_RUNNER_HPP
#define FINSIM_TRIAL_RUNNER_HPP

#include "logger.hpp"
#include "model.hpp"
#include "year_engine.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace finsim {

// Outcome of one trial: per-object yearly values, in model year order
struct TrialResult {
    size_t trial_index = 0;
    // Object name -> one value per simulated year (flows: value used during
    // the year; assets: end-of-year balance)
    std::map<std::string, std::vector<double>> histories;
    double stranded_cash = 0.0;
    std::vector<YearReport> year_reports;   // Empty unless requested

    const std::vector<double>& history(const std::string& object) const;
};

// Runs a model from a fresh copy of its objects for `duration` consecutive years.
// Stateless between calls, so one runner may serve many threads.
class TrialRunner {
public:
    explicit TrialRunner(const FinancialModel& model, Logger* logger = nullptr,
                         bool collect_year_reports = false);

    // Throws SimulationError if the trial fails
    TrialResult run_trial(size_t trial_index, uint64_t base_seed) const;

    const FinancialModel& model() const { return model_; }

private:
    const FinancialModel& model_;
    Logger* logger_;
    bool collect_year_reports_;
};

} // namespace finsim

#endif // FINSIM_TRIAL_RUNNER_HPP
