#include "config_parser.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace finsim {
namespace orchestrator {

namespace {

bool has_json_extension(const std::string& path) {
    return fs::path(path).extension() == ".json";
}

std::string read_reference_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open reference data file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

LogLevel parse_level(const std::string& name) {
    if (name != "DEBUG" && name != "INFO" && name != "WARN" && name != "ERROR") {
        throw ConfigurationError("Unknown log level '" + name + "'");
    }
    return string_to_level(name);
}

// Seeds may be numbers or strings (so they can come from the environment)
uint64_t parse_seed(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_string()) {
        std::string text = expand_environment_variables(value.get<std::string>());
        if (text.empty() || !std::all_of(text.begin(), text.end(),
                                          [](unsigned char c) { return std::isdigit(c); })) {
            throw ConfigurationError("seed must be a non-negative integer, got '" + text + "'");
        }
        try {
            return std::stoull(text);
        } catch (const std::out_of_range&) {
            throw ConfigurationError("seed is out of range: " + text);
        }
    }
    throw ConfigurationError("seed must be a non-negative integer");
}

// Sections are optional but must be objects when present
const json* find_section(const json& root, const std::string& name) {
    auto it = root.find(name);
    if (it == root.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigParseError("Section '" + name + "' must be a JSON object");
    }
    return &*it;
}

void parse_simulation(const json& j, SimulationConfig& config) {
    if (j.contains("number_of_simulations")) {
        const json& n = j["number_of_simulations"];
        if (!n.is_number_integer() || n.get<long long>() < 1) {
            throw ConfigurationError("number_of_simulations must be a positive integer");
        }
        config.number_of_simulations = n.get<size_t>();
    }
    if (j.contains("seed")) {
        config.seed = parse_seed(j["seed"]);
    }
    if (j.contains("max_threads")) {
        const json& t = j["max_threads"];
        if (!t.is_number_integer() || t.get<long long>() < 0) {
            throw ConfigurationError("max_threads must be zero or a positive integer");
        }
        config.max_threads = t.get<int>();
    }
    if (j.contains("collect_year_reports")) {
        config.collect_year_reports = j["collect_year_reports"].get<bool>();
    }
    if (j.contains("fail_fast")) {
        config.fail_fast = j["fail_fast"].get<bool>();
    }
}

void parse_logging(const json& j, LoggerConfig& config) {
    if (j.contains("level")) {
        config.min_level = parse_level(j["level"].get<std::string>());
    }
    if (j.contains("console")) {
        config.enable_console = j["console"].get<bool>();
    }
    if (j.contains("file")) {
        config.enable_file = true;
        config.log_file_path = expand_environment_variables(j["file"].get<std::string>());
    }
    if (j.contains("json")) {
        config.enable_json = j["json"].get<bool>();
    }
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated variable reference in '" + value + "'");
            }
            pos++; // Skip '}'
        }

        // A lone '$' stays as is
        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

RunConfig parse_run_config_from_string(const std::string& json_string) {
    RunConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Configuration must be a JSON object");
        }

        if (const json* simulation = find_section(j, "simulation")) {
            parse_simulation(*simulation, config.simulation);
        }
        if (const json* logging = find_section(j, "logging")) {
            parse_logging(*logging, config.logging);
        }
        if (const json* reference = find_section(j, "reference_data")) {
            const json& ref = *reference;
            if (ref.contains("tax_table")) {
                config.tax_table_path = expand_environment_variables(ref["tax_table"].get<std::string>());
            }
            if (ref.contains("historical_returns")) {
                config.historical_returns_path =
                    expand_environment_variables(ref["historical_returns"].get<std::string>());
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    RunConfig config = parse_run_config_from_string(buffer.str());

    if (!config.tax_table_path.empty()) {
        config.tax_table_path = resolve_relative_path(config.tax_table_path, file_path);
    }
    if (!config.historical_returns_path.empty()) {
        config.historical_returns_path = resolve_relative_path(config.historical_returns_path, file_path);
    }
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

ReferenceData load_reference_data(const RunConfig& config) {
    TaxTable taxes = TaxTable::defaults();
    if (!config.tax_table_path.empty()) {
        if (has_json_extension(config.tax_table_path)) {
            taxes = TaxTable::load_from_json(read_reference_file(config.tax_table_path));
        } else {
            taxes = TaxTable::load_from_csv(config.tax_table_path);
        }
    }

    HistoricalReturns returns = HistoricalReturns::defaults();
    if (!config.historical_returns_path.empty()) {
        if (has_json_extension(config.historical_returns_path)) {
            returns = HistoricalReturns::load_from_json(read_reference_file(config.historical_returns_path));
        } else {
            returns = HistoricalReturns::load_from_csv(config.historical_returns_path);
        }
    }

    return ReferenceData(std::move(taxes), std::move(returns));
}

} // namespace orchestrator
} // namespace finsim
