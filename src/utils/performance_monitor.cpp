#include "utils/performance_monitor.hpp"
#include "diagnostics/statistics.hpp"
#include <algorithm>
#include <cstddef>

namespace streamready {
namespace utils {

const std::string PerformanceMonitor::METRIC_AUDIO_ANALYSIS_LATENCY = "diagnostics.audio_latency_ms";
const std::string PerformanceMonitor::METRIC_VIDEO_ANALYSIS_LATENCY = "diagnostics.video_latency_ms";
const std::string PerformanceMonitor::METRIC_NETWORK_ANALYSIS_LATENCY = "diagnostics.network_latency_ms";
const std::string PerformanceMonitor::METRIC_CYCLE_LATENCY = "diagnostics.cycle_latency_ms";
const std::string PerformanceMonitor::METRIC_BUDGET_OVERRUNS = "diagnostics.budget_overruns";
const std::string PerformanceMonitor::METRIC_CAPTURE_FAILURES = "diagnostics.capture_failures";
const std::string PerformanceMonitor::METRIC_OVERALL_QUALITY = "diagnostics.overall_quality";

LatencyTimer::LatencyTimer(const std::string& metricName)
    : metricName_(metricName)
    , startTime_(std::chrono::steady_clock::now())
    , stopped_(false)
    , recordedMs_(0.0) {
}

LatencyTimer::~LatencyTimer() {
    if (!stopped_) {
        stop();
    }
}

double LatencyTimer::stop() {
    if (!stopped_) {
        recordedMs_ = getElapsedMs();
        PerformanceMonitor::getInstance().recordLatency(metricName_, recordedMs_);
        stopped_ = true;
    }
    return recordedMs_;
}

double LatencyTimer::getElapsedMs() const {
    auto now = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(now - startTime_);
    return duration.count() / 1000.0;
}

PerformanceMonitor& PerformanceMonitor::getInstance() {
    static PerformanceMonitor instance;
    return instance;
}

void PerformanceMonitor::recordMetric(const std::string& name, double value, const std::string& unit) {
    if (!enabled_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(metricsMutex_);
    auto& points = metrics_[name];
    points.emplace_back(value, unit);
    pruneOldMetrics(points);
}

void PerformanceMonitor::recordLatency(const std::string& name, double latencyMs) {
    recordMetric(name, latencyMs, "ms");
}

void PerformanceMonitor::recordCounter(const std::string& name, int increment) {
    recordMetric(name, static_cast<double>(increment), "count");
}

std::unique_ptr<LatencyTimer> PerformanceMonitor::startLatencyTimer(const std::string& name) {
    return std::make_unique<LatencyTimer>(name);
}

MetricStats PerformanceMonitor::getMetricStats(const std::string& name, int windowMinutes) const {
    std::lock_guard<std::mutex> lock(metricsMutex_);

    auto it = metrics_.find(name);
    if (it == metrics_.end()) {
        return MetricStats();
    }

    return calculateStats(filterByTimeWindow(it->second, windowMinutes));
}

std::vector<MetricDataPoint> PerformanceMonitor::getRecentMetrics(const std::string& name, size_t maxPoints) const {
    std::lock_guard<std::mutex> lock(metricsMutex_);

    auto it = metrics_.find(name);
    if (it == metrics_.end()) {
        return {};
    }

    const auto& points = it->second;
    if (points.size() <= maxPoints) {
        return points;
    }

    return std::vector<MetricDataPoint>(points.end() - maxPoints, points.end());
}

std::vector<std::string> PerformanceMonitor::getAvailableMetrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);

    std::vector<std::string> names;
    names.reserve(metrics_.size());
    for (const auto& entry : metrics_) {
        names.push_back(entry.first);
    }
    return names;
}

std::map<std::string, MetricStats> PerformanceMonitor::getDiagnosticsMetrics(int windowMinutes) const {
    std::map<std::string, MetricStats> summary;
    for (const auto& name : getAvailableMetrics()) {
        summary[name] = getMetricStats(name, windowMinutes);
    }
    return summary;
}

void PerformanceMonitor::clearMetrics() {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    metrics_.clear();
}

void PerformanceMonitor::setMaxDataPoints(size_t maxPoints) {
    maxDataPoints_ = std::max<size_t>(maxPoints, 1);

    std::lock_guard<std::mutex> lock(metricsMutex_);
    for (auto& entry : metrics_) {
        pruneOldMetrics(entry.second);
    }
}

void PerformanceMonitor::pruneOldMetrics(std::vector<MetricDataPoint>& points) const {
    const size_t limit = maxDataPoints_.load();
    if (points.size() > limit) {
        points.erase(points.begin(), points.begin() + static_cast<std::ptrdiff_t>(points.size() - limit));
    }
}

MetricStats PerformanceMonitor::calculateStats(const std::vector<MetricDataPoint>& points) const {
    MetricStats result;

    if (points.empty()) {
        return result;
    }

    result.count = points.size();
    result.unit = points[0].unit;

    std::vector<double> values;
    values.reserve(points.size());
    for (const auto& point : points) {
        values.push_back(point.value);
    }

    result.min = *std::min_element(values.begin(), values.end());
    result.max = *std::max_element(values.begin(), values.end());
    result.mean = stats::mean(values);
    result.median = stats::median(values);
    result.p95 = stats::percentile(values, 95.0);
    result.p99 = stats::percentile(values, 99.0);

    return result;
}

std::vector<MetricDataPoint> PerformanceMonitor::filterByTimeWindow(
    const std::vector<MetricDataPoint>& points, int windowMinutes) const {

    if (windowMinutes <= 0) {
        return points;
    }

    auto cutoffTime = std::chrono::steady_clock::now() - std::chrono::minutes(windowMinutes);

    std::vector<MetricDataPoint> filtered;
    for (const auto& point : points) {
        if (point.timestamp >= cutoffTime) {
            filtered.push_back(point);
        }
    }

    return filtered;
}

} // namespace utils
} // namespace streamready
