#ifndef FINSIM_ERRORS_HPP
#define FINSIM_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace finsim {

/**
 * @brief Base exception for all finsim errors
 */
class FinsimError : public std::runtime_error {
public:
    explicit FinsimError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a model, reference table or run configuration is invalid
 *
 * Always thrown before any trial starts.
 */
class ConfigurationError : public FinsimError {
public:
    explicit ConfigurationError(const std::string& message)
        : FinsimError("Configuration error: " + message) {}
};

/**
 * @brief Raised inside a trial; fatal to that trial only
 */
class SimulationError : public FinsimError {
public:
    SimulationError(const std::string& message, size_t trial_index, int year)
        : FinsimError("Simulation error (trial " + std::to_string(trial_index) +
                      ", year " + std::to_string(year) + "): " + message),
          detail_(message), trial_index_(trial_index), year_(year) {}

    const std::string& detail() const { return detail_; }
    size_t trial_index() const { return trial_index_; }
    int year() const { return year_; }

private:
    std::string detail_;
    size_t trial_index_;
    int year_;
};

} // namespace finsim

#endif // FINSIM_ERRORS_HPP
