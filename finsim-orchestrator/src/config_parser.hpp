#ifndef FINSIM_ORCHESTRATOR_CONFIG_PARSER_HPP
#define FINSIM_ORCHESTRATOR_CONFIG_PARSER_HPP

#include "logger.hpp"
#include "model.hpp"
#include "monte_carlo.hpp"
#include <stdexcept>
#include <string>

namespace finsim {
namespace orchestrator {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Everything a run reads from its JSON configuration
 *
 * @code
 * {
 *   "simulation": {"number_of_simulations": 1000, "seed": 42, "max_threads": 0,
 *                  "collect_year_reports": false, "fail_fast": false},
 *   "logging": {"level": "INFO", "console": true, "file": "${LOG_DIR}/finsim.log",
 *               "json": true},
 *   "reference_data": {"tax_table": "taxes.csv", "historical_returns": "returns.json"}
 * }
 * @endcode
 */
struct RunConfig {
    SimulationConfig simulation;
    LoggerConfig logging;
    std::string tax_table_path;             ///< Empty = built-in table
    std::string historical_returns_path;    ///< Empty = built-in series
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative reference data and log file paths resolve against the
 * directory of the configuration file.
 *
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws ConfigurationError if a value is out of range
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * @throws ConfigParseError if JSON is invalid
 * @throws ConfigurationError if a value is out of range
 */
RunConfig parse_run_config_from_string(const std::string& json_string);

/**
 * @brief Loads the reference tables named by a run configuration
 *
 * Files ending in ".json" use the JSON loaders, anything else the CSV ones.
 */
ReferenceData load_reference_data(const RunConfig& config);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace orchestrator
} // namespace finsim

#endif // FINSIM_ORCHESTRATOR_CONFIG_PARSER_HPP
