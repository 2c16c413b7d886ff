#include "diagnostics/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace streamready {
namespace stats {

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double stdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }

    const double avg = mean(values);
    double variance = 0.0;
    for (double value : values) {
        variance += (value - avg) * (value - avg);
    }
    variance /= static_cast<double>(values.size());

    return std::sqrt(variance);
}

double meanAbsoluteDeviation(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }

    const double avg = mean(values);
    double totalDeviation = 0.0;
    for (double value : values) {
        totalDeviation += std::abs(value - avg);
    }

    return totalDeviation / static_cast<double>(values.size());
}

double percentile(const std::vector<double>& values, double p) {
    if (values.empty()) {
        return 0.0;
    }

    std::vector<double> sorted(values);
    std::sort(sorted.begin(), sorted.end());

    const double clampedP = std::min(std::max(p, 0.0), 100.0);
    size_t index = static_cast<size_t>(std::floor(static_cast<double>(sorted.size()) * clampedP / 100.0));
    index = std::min(index, sorted.size() - 1);

    return sorted[index];
}

double median(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }

    std::vector<double> sorted(values);
    std::sort(sorted.begin(), sorted.end());

    const size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 != 0) {
        return sorted[mid];
    }
    return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

double trendSlope(const std::vector<double>& values, size_t points) {
    const size_t span = points == 0 ? values.size() : points;
    if (span < 2 || values.size() < span) {
        return 0.0;
    }

    const double newest = values.back();
    const double reference = values[values.size() - span];
    return (newest - reference) / static_cast<double>(span - 1);
}

double clamp01(double value) {
    return std::min(std::max(value, 0.0), 1.0);
}

} // namespace stats
} // namespace streamready
