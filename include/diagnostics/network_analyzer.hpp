#pragma once

#include "diagnostics/capture_sources.hpp"
#include "diagnostics/quality_status.hpp"
#include "diagnostics/statistics.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace streamready {
namespace diagnostics {

/**
 * Network condition analysis for one poll
 */
struct NetworkAnalysis {
    float bitrateKbps;         // outbound video bitrate
    float packetLoss;          // percent (0-100)
    float jitterMs;            // stdDev of recent round-trip times
    float latencyMs;           // current round-trip time
    float framesPerSecond;
    float frameDropRatio;      // (0-1)
    float bitrateStability;    // stdDev of the bitrate window, lower is better
    float lossStability;       // rising packet-loss slope, floored at 0
    float jitterStability;     // stdDev of the latency window
    float rttStability;        // stdDev of the latency window
    int stabilityScore;        // weighted composite (0-100)
    NetworkStatus status;

    NetworkAnalysis()
        : bitrateKbps(0.0f), packetLoss(0.0f), jitterMs(0.0f), latencyMs(0.0f),
          framesPerSecond(0.0f), frameDropRatio(0.0f), bitrateStability(0.0f),
          lossStability(0.0f), jitterStability(0.0f), rttStability(0.0f),
          stabilityScore(0), status(NetworkStatus::GOOD) {}
};

/**
 * Per-poll metrics already derived from transport counters
 */
struct NetworkSample {
    double bitrateKbps;
    double packetLoss;
    double latencyMs;
    double framesPerSecond;
    double frameDropRatio;

    NetworkSample()
        : bitrateKbps(0.0), packetLoss(0.0), latencyMs(0.0),
          framesPerSecond(0.0), frameDropRatio(0.0) {}
};

// Thresholds are defined for a ~500 ms polling cadence; rescale the windows if it changes.
struct NetworkAnalyzerConfig {
    size_t historySize;            // samples per metric window
    size_t latencyHistorySize;     // round-trip window, at most 20

    // Status tiers
    double bitrateCritical;
    double bitratePoor;
    double bitrateModerate;
    double latencyModerate;
    double latencyPoor;
    double latencyCritical;
    double packetLossModerate;
    double packetLossPoor;
    double jitterThreshold;
    double minViableFps;
    double moderateFps;
    double maxFrameDropRatio;
    double bitrateStabilityThreshold;
    double lossStabilityThreshold;

    // Current-conditions normalization
    double bitrateOptimal;
    double packetLossSpan;
    double latencySpan;
    double targetFps;

    // Stability normalization scales and weights
    size_t lossTrendPoints;
    double bitrateStabilityScale;
    double lossStabilityScale;
    double jitterStabilityScale;
    double rttStabilityScale;
    double bitrateStabilityWeight;
    double lossStabilityWeight;
    double jitterStabilityWeight;
    double rttStabilityWeight;
    double currentWeight;
    double stabilityWeight;

    NetworkAnalyzerConfig()
        : historySize(10), latencyHistorySize(10),
          bitrateCritical(250.0), bitratePoor(500.0), bitrateModerate(1000.0),
          latencyModerate(100.0), latencyPoor(200.0), latencyCritical(300.0),
          packetLossModerate(1.0), packetLossPoor(2.0), jitterThreshold(30.0),
          minViableFps(20.0), moderateFps(24.0), maxFrameDropRatio(0.10),
          bitrateStabilityThreshold(200.0), lossStabilityThreshold(1.0),
          bitrateOptimal(1500.0), packetLossSpan(5.0), latencySpan(500.0), targetFps(30.0),
          lossTrendPoints(3), bitrateStabilityScale(500.0), lossStabilityScale(2.0),
          jitterStabilityScale(100.0), rttStabilityScale(200.0),
          bitrateStabilityWeight(0.35), lossStabilityWeight(0.30),
          jitterStabilityWeight(0.20), rttStabilityWeight(0.15),
          currentWeight(0.4), stabilityWeight(0.6) {}
};

/**
 * Stateful network quality analyzer for one outbound stream.
 * Not reentrant: confine each instance to one calling context.
 */
class NetworkAnalyzer {
public:
    explicit NetworkAnalyzer(const NetworkAnalyzerConfig& config = NetworkAnalyzerConfig(),
                             std::shared_ptr<TransportStatsSource> source = nullptr);

    /**
     * Poll the attached transport and analyze the counters
     * @return zeroed Good analysis when no transport is attached or the poll fails
     */
    NetworkAnalysis analyze();

    /**
     * Analyze one transport counter snapshot
     * @param report Cumulative counters; missing sections leave their windows untouched
     */
    NetworkAnalysis analyzeReport(const TransportStatsReport& report);

    /**
     * Analyze already-derived metrics; every metric is pushed into its window
     */
    NetworkAnalysis analyzeSample(const NetworkSample& sample);

    /**
     * Clear all windows and restart the bitrate accumulator
     * @param start Reference time for the first bitrate delta
     */
    void reset(std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now());

    // Derived stability metrics over the current windows
    double getBitrateStability() const;
    double getLossStability() const;
    double getJitterStability() const;
    double getRttStability() const;

    int calculateStabilityScore(double bitrateKbps, double packetLoss, double latencyMs,
                                double framesPerSecond, double frameDropRatio) const;

    NetworkStatus resolveStatus(double bitrateKbps, double packetLoss, double latencyMs,
                                double jitterMs, double framesPerSecond, double frameDropRatio,
                                double bitrateStability, double lossStability) const;

    static double calculateBitrate(uint64_t nowBytes, uint64_t prevBytes, double deltaTimeMs);

    void attachSource(std::shared_ptr<TransportStatsSource> source) { source_ = std::move(source); }
    bool hasSource() const { return source_ != nullptr; }

    const stats::RollingWindow<double>& bitrateHistory() const { return bitrateHistory_; }
    const stats::RollingWindow<double>& latencyHistory() const { return latencyHistory_; }
    const stats::RollingWindow<double>& packetLossHistory() const { return packetLossHistory_; }
    const stats::RollingWindow<double>& fpsHistory() const { return fpsHistory_; }
    const stats::RollingWindow<double>& frameDropHistory() const { return frameDropHistory_; }

    std::map<std::string, double> getAnalyzerStats() const;

    const NetworkAnalyzerConfig& getConfig() const { return config_; }

private:
    // Bitrate needs the previous cumulative byte count and when it was seen
    struct ByteAccumulator {
        uint64_t lastBytesSent = 0;
        std::chrono::steady_clock::time_point lastTimestamp;
    };

    NetworkAnalysis buildAnalysis(double bitrateKbps, double packetLoss, double latencyMs,
                                  double framesPerSecond, double frameDropRatio);

    NetworkAnalyzerConfig config_;
    std::shared_ptr<TransportStatsSource> source_;
    ByteAccumulator accumulator_;

    stats::RollingWindow<double> bitrateHistory_;
    stats::RollingWindow<double> latencyHistory_;
    stats::RollingWindow<double> packetLossHistory_;
    stats::RollingWindow<double> fpsHistory_;
    stats::RollingWindow<double> frameDropHistory_;

    uint64_t totalPolls_;
    uint64_t statusChanges_;
    NetworkStatus lastStatus_;
};

} // namespace diagnostics
} // namespace streamready
