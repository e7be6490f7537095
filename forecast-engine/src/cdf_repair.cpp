/**
 * @file cdf_repair.cpp
 * @brief Implementation of CDF repair and validation helpers
 */

#include "cdf_repair.hpp"
#include "forecast_errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace forecast {

namespace {

constexpr double MAX_BUCKET_MASS_AT_200 = 0.2;
constexpr double BUCKET_MASS_MARGIN = 0.95;

void require_finite(const std::vector<double>& values) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            throw ValidationError("CDF value at index " + std::to_string(i) + " is not finite");
        }
    }
}

std::vector<double> rebuild_from_gaps(double first, double last, const std::vector<double>& gaps) {
    std::vector<double> out;
    out.reserve(gaps.size() + 1);
    out.push_back(first);
    double running = first;
    for (size_t i = 0; i + 1 < gaps.size(); ++i) {
        running += gaps[i];
        out.push_back(running);
    }
    out.push_back(last);
    return out;
}

} // namespace

double minimum_gap(size_t outcome_count, double fraction) {
    if (outcome_count < 2) {
        return 0.0;
    }
    return fraction / static_cast<double>(outcome_count - 1);
}

double default_bucket_mass_cap(size_t outcome_count) {
    if (outcome_count < 2) {
        return 1.0;
    }
    double buckets = static_cast<double>(outcome_count - 1);
    return MAX_BUCKET_MASS_AT_200 * (200.0 / buckets) * BUCKET_MASS_MARGIN;
}

bool satisfies_minimum_gap(const std::vector<double>& values, double min_gap) {
    for (size_t i = 0; i + 1 < values.size(); ++i) {
        if (!(values[i + 1] - values[i] >= min_gap)) {
            return false;
        }
    }
    return true;
}

std::vector<double> enforce_minimum_gap(const std::vector<double>& values, double min_gap) {
    if (values.size() < 2) {
        return values;
    }
    require_finite(values);

    if (satisfies_minimum_gap(values, min_gap)) {
        return values;
    }

    const double first = values.front();
    const double last = values.back();
    const double buckets = static_cast<double>(values.size() - 1);
    const double span = last - first;

    if (span < min_gap * buckets) {
        std::ostringstream msg;
        msg << "cannot fit " << values.size() - 1 << " gaps of " << min_gap
            << " into span " << span;
        throw ValidationError(msg.str());
    }

    // Aim slightly above min_gap so cumulative rounding cannot undercut it
    double slack_per_bucket = (span - min_gap * buckets) / buckets;
    double target = min_gap + std::min(min_gap * 1e-6, slack_per_bucket);

    std::vector<double> gaps(values.size() - 1);
    double deficit = 0.0;
    double excess = 0.0;
    for (size_t i = 0; i < gaps.size(); ++i) {
        gaps[i] = values[i + 1] - values[i];
        if (gaps[i] < target) {
            deficit += target - gaps[i];
        } else {
            excess += gaps[i] - target;
        }
    }

    double keep = excess > 0.0 ? std::max(0.0, (excess - deficit) / excess) : 0.0;
    for (double& gap : gaps) {
        gap = gap < target ? target : target + (gap - target) * keep;
    }

    return rebuild_from_gaps(first, last, gaps);
}

std::vector<double> cap_bucket_mass(const std::vector<double>& values, double cap) {
    if (values.size() < 2 || cap <= 0.0) {
        return values;
    }
    require_finite(values);

    const double span = values.back() - values.front();
    const double buckets = static_cast<double>(values.size() - 1);
    if (cap * buckets < span) {
        throw ValidationError("bucket mass cap " + std::to_string(cap) +
                              " too small for span " + std::to_string(span));
    }

    std::vector<double> gaps(values.size() - 1);
    double over = 0.0;
    double headroom = 0.0;
    for (size_t i = 0; i < gaps.size(); ++i) {
        gaps[i] = values[i + 1] - values[i];
        if (gaps[i] > cap) {
            over += gaps[i] - cap;
        } else {
            headroom += cap - gaps[i];
        }
    }

    if (over <= 0.0) {
        return values;
    }

    // Feasibility above guarantees over <= headroom, so no bucket overflows again
    for (double& gap : gaps) {
        if (gap > cap) {
            gap = cap;
        } else if (headroom > 0.0) {
            gap += over * (cap - gap) / headroom;
        }
    }

    return rebuild_from_gaps(values.front(), values.back(), gaps);
}

std::vector<double> anchor_endpoints(
    const std::vector<double>& values,
    bool lower_open,
    bool upper_open,
    double closed_floor,
    double open_floor
) {
    std::vector<double> out = values;
    if (out.empty()) {
        return out;
    }

    if (lower_open) {
        out.front() = std::max(out.front(), open_floor);
    } else {
        out.front() = closed_floor;
    }

    if (upper_open) {
        out.back() = std::min(out.back(), 1.0 - open_floor);
    } else {
        out.back() = 1.0 - closed_floor;
    }

    return out;
}

std::vector<std::string> validate_cdf(
    const std::vector<double>& values,
    double min_gap,
    size_t expected_size
) {
    std::vector<std::string> violations;

    if (expected_size > 0 && values.size() != expected_size) {
        violations.push_back("CDF must have exactly " + std::to_string(expected_size) +
                             " points, got " + std::to_string(values.size()));
    }

    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            violations.push_back("value at index " + std::to_string(i) + " is not finite");
        } else if (values[i] < 0.0 || values[i] > 1.0) {
            violations.push_back("value at index " + std::to_string(i) + " outside [0,1]: " +
                                 std::to_string(values[i]));
        }
    }

    for (size_t i = 0; i + 1 < values.size(); ++i) {
        double gap = values[i + 1] - values[i];
        if (!(gap >= min_gap)) {
            std::ostringstream msg;
            msg << "gap between index " << i << " and " << i + 1 << " is " << gap
                << ", below minimum " << min_gap;
            violations.push_back(msg.str());
        }
    }

    return violations;
}

} // namespace forecast
