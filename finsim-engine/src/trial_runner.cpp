#include "trial_runner.hpp"
#include "errors.hpp"
#include "trial_state.hpp"
#include <chrono>
#include <stdexcept>

namespace finsim {

const std::vector<double>& TrialResult::history(const std::string& object) const {
    auto it = histories.find(object);
    if (it == histories.end()) {
        throw std::out_of_range("No history for object '" + object + "'");
    }
    return it->second;
}

TrialRunner::TrialRunner(const FinancialModel& model, Logger* logger, bool collect_year_reports)
    : model_(model), logger_(logger), collect_year_reports_(collect_year_reports) {}

TrialResult TrialRunner::run_trial(size_t trial_index, uint64_t base_seed) const {
    auto start_time = std::chrono::high_resolution_clock::now();
    if (logger_) {
        logger_->log_trial_start(SimulationContext(trial_index));
    }

    TrialState state(model_, trial_index, base_seed);
    YearEngine engine(state, model_.tax_table(), model_.config().shortfall_policy, logger_);

    TrialResult result;
    result.trial_index = trial_index;
    if (collect_year_reports_) {
        result.year_reports.reserve(static_cast<size_t>(model_.duration()));
    }

    for (int year = model_.start_year(); year < model_.end_year(); ++year) {
        YearReport report = engine.advance_year(year);
        if (collect_year_reports_) {
            result.year_reports.push_back(std::move(report));
        }
    }

    for (const auto& flow : state.revenues()) result.histories[flow->name()] = flow->history();
    for (const auto& flow : state.expenses()) result.histories[flow->name()] = flow->history();
    for (const auto& asset : state.assets()) result.histories[asset->name()] = asset->history();
    result.stranded_cash = engine.total_stranded_cash();

    if (logger_) {
        auto end_time = std::chrono::high_resolution_clock::now();
        double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        logger_->log_trial_complete(SimulationContext(trial_index), result.stranded_cash, elapsed_ms);
    }
    return result;
}

} // namespace finsim
