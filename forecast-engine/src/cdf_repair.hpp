/**
 * @file cdf_repair.hpp
 * @brief Structural repair and validation of discretized CDFs
 *
 * The submission format requires a fixed-length, non-decreasing CDF whose
 * consecutive entries differ by at least a minimum gap, with no single
 * bucket holding too much mass. These helpers establish and check those
 * properties. All of them preserve the first and last values.
 */

#ifndef FORECAST_CDF_REPAIR_HPP
#define FORECAST_CDF_REPAIR_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace forecast {

/**
 * @brief Minimum gap between consecutive CDF entries
 *
 * @param outcome_count Number of CDF points
 * @param fraction Share of the uniform bucket mass 1/(outcome_count - 1)
 * @return fraction / (outcome_count - 1), e.g. 5e-5 for 201 points and fraction 0.01
 */
double minimum_gap(size_t outcome_count, double fraction);

/**
 * @brief Default per-bucket mass cap
 *
 * 0.2 for 200 buckets, scaled inversely with the bucket count, with a 5% margin.
 */
double default_bucket_mass_cap(size_t outcome_count);

/**
 * @brief Check the non-decreasing / minimum-gap property
 */
bool satisfies_minimum_gap(const std::vector<double>& values, double min_gap);

/**
 * @brief Raise every gap below @p min_gap, taking the mass proportionally from larger gaps
 *
 * The first and last values are kept. A sequence that already satisfies
 * the minimum gap is returned unchanged, so the repair is a fixed point on
 * valid input.
 *
 * @throws ValidationError If the span between first and last value cannot
 *         hold (size - 1) gaps of @p min_gap, or values are not finite
 */
std::vector<double> enforce_minimum_gap(const std::vector<double>& values, double min_gap);

/**
 * @brief Limit the mass of each bucket to @p cap, spreading the excess over buckets with headroom
 *
 * @throws ValidationError If (size - 1) * cap is smaller than the total span
 */
std::vector<double> cap_bucket_mass(const std::vector<double>& values, double cap);

/**
 * @brief Pin or clamp the endpoint values
 *
 * Closed side: first value pinned to @p closed_floor, last to 1 - @p closed_floor.
 * Open side: first value at least @p open_floor, last at most 1 - @p open_floor.
 */
std::vector<double> anchor_endpoints(
    const std::vector<double>& values,
    bool lower_open,
    bool upper_open,
    double closed_floor,
    double open_floor
);

/**
 * @brief List every structural violation of a CDF
 *
 * @param values CDF values
 * @param min_gap Required minimum gap
 * @param expected_size Required length (0 = do not check)
 * @return Human-readable violations; empty if the CDF is valid
 */
std::vector<std::string> validate_cdf(
    const std::vector<double>& values,
    double min_gap,
    size_t expected_size = 0
);

inline bool is_valid_cdf(const std::vector<double>& values, double min_gap, size_t expected_size = 0) {
    return validate_cdf(values, min_gap, expected_size).empty();
}

} // namespace forecast

#endif // FORECAST_CDF_REPAIR_HPP
