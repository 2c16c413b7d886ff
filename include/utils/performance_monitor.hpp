#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace streamready {
namespace utils {

/**
 * Performance metric data point
 */
struct MetricDataPoint {
    std::chrono::steady_clock::time_point timestamp;
    double value;
    std::string unit;

    MetricDataPoint() : value(0.0) {}
    MetricDataPoint(double val, const std::string& u = "")
        : timestamp(std::chrono::steady_clock::now()), value(val), unit(u) {}
};

/**
 * Performance metric statistics
 */
struct MetricStats {
    double min;
    double max;
    double mean;
    double median;
    double p95;
    double p99;
    size_t count;
    std::string unit;

    MetricStats() : min(0), max(0), mean(0), median(0), p95(0), p99(0), count(0) {}
};

/**
 * Scoped latency measurement. Records into PerformanceMonitor on stop()
 * or destruction, whichever comes first.
 */
class LatencyTimer {
public:
    explicit LatencyTimer(const std::string& metricName);
    ~LatencyTimer();

    // Records once; returns the elapsed milliseconds
    double stop();
    double getElapsedMs() const;

private:
    std::string metricName_;
    std::chrono::steady_clock::time_point startTime_;
    bool stopped_;
    double recordedMs_;
};

/**
 * Named latency and value samples for the diagnostics cycle
 */
class PerformanceMonitor {
public:
    static PerformanceMonitor& getInstance();

    /**
     * Record a metric value
     * @param name Metric name
     * @param value Metric value
     * @param unit Optional unit string
     */
    void recordMetric(const std::string& name, double value, const std::string& unit = "");

    /**
     * Record latency measurement
     * @param name Metric name
     * @param latencyMs Latency in milliseconds
     */
    void recordLatency(const std::string& name, double latencyMs);

    void recordCounter(const std::string& name, int increment = 1);

    std::unique_ptr<LatencyTimer> startLatencyTimer(const std::string& name);

    /**
     * Get statistics for a metric
     * @param name Metric name
     * @param windowMinutes Time window in minutes (0 for all retained points)
     */
    MetricStats getMetricStats(const std::string& name, int windowMinutes = 0) const;

    std::vector<MetricDataPoint> getRecentMetrics(const std::string& name, size_t maxPoints = 100) const;
    std::vector<std::string> getAvailableMetrics() const;

    /**
     * Summary of every recorded metric keyed by name
     */
    std::map<std::string, MetricStats> getDiagnosticsMetrics(int windowMinutes = 0) const;

    void clearMetrics();

    void setEnabled(bool enabled) { enabled_ = enabled; }
    bool isEnabled() const { return enabled_.load(); }

    // Oldest points are dropped once a metric holds more than this
    void setMaxDataPoints(size_t maxPoints);

    static const std::string METRIC_AUDIO_ANALYSIS_LATENCY;
    static const std::string METRIC_VIDEO_ANALYSIS_LATENCY;
    static const std::string METRIC_NETWORK_ANALYSIS_LATENCY;
    static const std::string METRIC_CYCLE_LATENCY;
    static const std::string METRIC_BUDGET_OVERRUNS;
    static const std::string METRIC_CAPTURE_FAILURES;
    static const std::string METRIC_OVERALL_QUALITY;

private:
    PerformanceMonitor() = default;

    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    void pruneOldMetrics(std::vector<MetricDataPoint>& points) const;
    MetricStats calculateStats(const std::vector<MetricDataPoint>& points) const;
    std::vector<MetricDataPoint> filterByTimeWindow(const std::vector<MetricDataPoint>& points,
                                                    int windowMinutes) const;

    std::atomic<bool> enabled_{true};
    std::atomic<size_t> maxDataPoints_{10000};

    mutable std::mutex metricsMutex_;
    std::map<std::string, std::vector<MetricDataPoint>> metrics_;
};

} // namespace utils
} // namespace streamready
