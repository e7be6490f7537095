#ifndef FORECAST_CONFIG_PARSER_HPP
#define FORECAST_CONFIG_PARSER_HPP

#include "decomposition_coordinator.hpp"
#include "distribution_synthesizer.hpp"
#include "logger.hpp"
#include "sub_forecast_aggregator.hpp"
#include <string>

namespace forecast {

/**
 * @brief Complete engine configuration
 *
 * Every section is optional in the JSON document; missing keys keep the
 * defaults of the corresponding struct.
 */
struct ForecastConfig {
    CoordinatorConfig coordinator;
    SynthesisPolicy synthesis;
    size_t default_outcome_count;   ///< CDF length when a question does not state one (default: 201)
    AggregatorConfig aggregation;
    LoggerConfig logging;

    ForecastConfig() : default_outcome_count(DEFAULT_OUTCOME_COUNT) {}
};

/**
 * @brief Parses an engine configuration from a JSON file
 *
 * A relative logging.path is resolved against the config file's directory.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed configuration
 * @throws ConfigParseError if the file cannot be read, the JSON is invalid,
 *         or a value is out of range
 */
ForecastConfig parse_forecast_config_from_file(const std::string& file_path);

/**
 * @brief Parses an engine configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed configuration
 * @throws ConfigParseError if the JSON is invalid or a value is out of range
 */
ForecastConfig parse_forecast_config_from_string(const std::string& json_string);

/**
 * @brief Range-check a configuration
 *
 * @throws ConfigParseError naming the first offending key
 */
void validate_forecast_config(const ForecastConfig& config);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace forecast

#endif // FORECAST_CONFIG_PARSER_HPP
