#include "config_parser.hpp"
#include "forecast_errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace forecast {

namespace {

// Largest integer a double holds exactly
constexpr double MAX_COUNT = 9007199254740992.0;

// Longest accepted unit timeout or grace period (one day)
constexpr std::chrono::milliseconds MAX_DURATION(86400000);

// Numbers may be given literally or as strings, e.g. "${FORECAST_WORKERS}"
double get_number(const json& section, const std::string& key) {
    const json& value = section.at(key);
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        std::string expanded = expand_environment_variables(value.get<std::string>());
        try {
            size_t used = 0;
            double parsed = std::stod(expanded, &used);
            if (used == expanded.size()) {
                return parsed;
            }
        } catch (const std::logic_error&) {
            // falls through to the error below
        }
        throw ConfigParseError("Key '" + key + "' is not a number: '" + expanded + "'");
    }
    throw ConfigParseError("Key '" + key + "' must be a number");
}

size_t get_count(const json& section, const std::string& key) {
    double value = get_number(section, key);
    if (!(value >= 0.0 && value <= MAX_COUNT) || value != std::floor(value)) {
        throw ConfigParseError("Key '" + key + "' must be a non-negative integer");
    }
    return static_cast<size_t>(value);
}

bool get_flag(const json& section, const std::string& key) {
    const json& value = section.at(key);
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        std::string expanded = expand_environment_variables(value.get<std::string>());
        if (expanded == "true" || expanded == "1") return true;
        if (expanded == "false" || expanded == "0") return false;
        throw ConfigParseError("Key '" + key + "' is not a boolean: '" + expanded + "'");
    }
    throw ConfigParseError("Key '" + key + "' must be a boolean");
}

std::string get_text(const json& section, const std::string& key) {
    return expand_environment_variables(section.at(key).get<std::string>());
}

void parse_coordinator(const json& j, CoordinatorConfig& config) {
    if (j.contains("max_workers")) {
        config.max_workers = get_count(j, "max_workers");
    }
    if (j.contains("unit_timeout_ms")) {
        config.unit_timeout = std::chrono::milliseconds(get_count(j, "unit_timeout_ms"));
    }
    if (j.contains("cancel_grace_ms")) {
        config.cancel_grace = std::chrono::milliseconds(get_count(j, "cancel_grace_ms"));
    }
    if (j.contains("max_depth")) {
        config.max_depth = get_count(j, "max_depth");
    }
}

void parse_synthesis(const json& j, ForecastConfig& config) {
    SynthesisPolicy& policy = config.synthesis;
    if (j.contains("min_gap_fraction")) {
        policy.min_gap_fraction = get_number(j, "min_gap_fraction");
    }
    if (j.contains("tail_overshoot_fraction")) {
        policy.tail_overshoot_fraction = get_number(j, "tail_overshoot_fraction");
    }
    if (j.contains("closed_bound_floor")) {
        policy.closed_bound_floor = get_number(j, "closed_bound_floor");
    }
    if (j.contains("open_bound_floor")) {
        policy.open_bound_floor = get_number(j, "open_bound_floor");
    }
    if (j.contains("max_bucket_mass")) {
        policy.max_bucket_mass = get_number(j, "max_bucket_mass");
    }
    if (j.contains("enable_mass_cap")) {
        policy.enable_mass_cap = get_flag(j, "enable_mass_cap");
    }
    if (j.contains("default_outcome_count")) {
        config.default_outcome_count = get_count(j, "default_outcome_count");
    }
}

void parse_aggregation(const json& j, AggregatorConfig& config) {
    if (j.contains("method")) {
        std::string method = get_text(j, "method");
        try {
            config.method = string_to_aggregation(method);
        } catch (const ValidationError&) {
            throw ConfigParseError("Unknown aggregation method '" + method +
                                   "' (expected weighted_average, geometric_mean or median)");
        }
    }
    if (j.contains("probability_floor")) {
        config.probability_floor = get_number(j, "probability_floor");
    }
    if (j.contains("categorical_tolerance")) {
        config.categorical_tolerance = get_number(j, "categorical_tolerance");
    }
}

void parse_logging(const json& j, LoggerConfig& config) {
    if (j.contains("level")) {
        std::string level = get_text(j, "level");
        if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
            throw ConfigParseError("Unknown log level '" + level + "'");
        }
        config.min_level = string_to_level(level);
    }
    if (j.contains("console")) {
        config.enable_console = get_flag(j, "console");
    }
    if (j.contains("file")) {
        config.enable_file = get_flag(j, "file");
    }
    if (j.contains("path")) {
        config.log_file_path = get_text(j, "path");
    }
    if (j.contains("json")) {
        config.enable_json = get_flag(j, "json");
    }
}

const json& section(const json& root, const std::string& name) {
    const json& value = root.at(name);
    if (!value.is_object()) {
        throw ConfigParseError("Section '" + name + "' must be a JSON object");
    }
    return value;
}

bool in_open_unit_interval(double value) {
    return value > 0.0 && value < 1.0;
}

} // namespace

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

        if (var_name.empty()) {
            // A lone '$' is kept literally
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

void validate_forecast_config(const ForecastConfig& config) {
    const CoordinatorConfig& c = config.coordinator;
    if (c.max_workers < 1) {
        throw ConfigParseError("coordinator.max_workers must be at least 1");
    }
    if (c.unit_timeout.count() <= 0 || c.unit_timeout > MAX_DURATION) {
        throw ConfigParseError("coordinator.unit_timeout_ms must be in [1," +
                               std::to_string(MAX_DURATION.count()) + "]");
    }
    if (c.cancel_grace > MAX_DURATION) {
        throw ConfigParseError("coordinator.cancel_grace_ms must not exceed " +
                               std::to_string(MAX_DURATION.count()));
    }

    const SynthesisPolicy& s = config.synthesis;
    if (!in_open_unit_interval(s.min_gap_fraction)) {
        throw ConfigParseError("synthesis.min_gap_fraction must be in (0,1)");
    }
    if (!(s.tail_overshoot_fraction >= 0.0 && s.tail_overshoot_fraction < 1.0)) {
        throw ConfigParseError("synthesis.tail_overshoot_fraction must be in [0,1)");
    }
    if (!(s.closed_bound_floor >= 0.0 && s.closed_bound_floor < 0.5)) {
        throw ConfigParseError("synthesis.closed_bound_floor must be in [0,0.5)");
    }
    if (!(s.open_bound_floor > 0.0 && s.open_bound_floor < 0.5)) {
        throw ConfigParseError("synthesis.open_bound_floor must be in (0,0.5)");
    }
    if (!(s.max_bucket_mass >= 0.0 && s.max_bucket_mass <= 1.0)) {
        throw ConfigParseError("synthesis.max_bucket_mass must be in [0,1]");
    }
    if (config.default_outcome_count < 2 || config.default_outcome_count > MAX_OUTCOME_COUNT) {
        throw ConfigParseError("synthesis.default_outcome_count must be in [2," +
                               std::to_string(MAX_OUTCOME_COUNT) + "]");
    }

    const AggregatorConfig& a = config.aggregation;
    if (!(a.probability_floor > 0.0 && a.probability_floor < 0.5)) {
        throw ConfigParseError("aggregation.probability_floor must be in (0,0.5)");
    }
    if (!in_open_unit_interval(a.categorical_tolerance)) {
        throw ConfigParseError("aggregation.categorical_tolerance must be in (0,1)");
    }

    if (config.logging.enable_file && config.logging.log_file_path.empty()) {
        throw ConfigParseError("logging.path must be set when logging.file is enabled");
    }
}

ForecastConfig parse_forecast_config_from_string(const std::string& json_string) {
    ForecastConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Configuration root must be a JSON object");
        }

        if (j.contains("coordinator")) {
            parse_coordinator(section(j, "coordinator"), config.coordinator);
        }
        if (j.contains("synthesis")) {
            parse_synthesis(section(j, "synthesis"), config);
        }
        if (j.contains("aggregation")) {
            parse_aggregation(section(j, "aggregation"), config.aggregation);
        }
        if (j.contains("logging")) {
            parse_logging(section(j, "logging"), config.logging);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    // The aggregator repairs numeric aggregates with the synthesis gap
    config.aggregation.min_gap_fraction = config.synthesis.min_gap_fraction;

    validate_forecast_config(config);

    return config;
}

ForecastConfig parse_forecast_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    ForecastConfig config = parse_forecast_config_from_string(buffer.str());

    if (!config.logging.log_file_path.empty()) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace forecast
