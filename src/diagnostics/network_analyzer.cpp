#include "diagnostics/network_analyzer.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace streamready {
namespace diagnostics {

namespace {

constexpr size_t kMaxLatencyHistory = 20;

} // namespace

NetworkAnalyzer::NetworkAnalyzer(const NetworkAnalyzerConfig& config,
                                 std::shared_ptr<TransportStatsSource> source)
    : config_(config)
    , source_(std::move(source))
    , bitrateHistory_(config.historySize)
    , latencyHistory_(std::min(config.latencyHistorySize, kMaxLatencyHistory))
    , packetLossHistory_(config.historySize)
    , fpsHistory_(config.historySize)
    , frameDropHistory_(config.historySize)
    , totalPolls_(0)
    , statusChanges_(0)
    , lastStatus_(NetworkStatus::GOOD) {
    accumulator_.lastTimestamp = std::chrono::steady_clock::now();
}

NetworkAnalysis NetworkAnalyzer::analyze() {
    if (!source_) {
        return NetworkAnalysis();
    }

    TransportStatsReport report;
    try {
        report = source_->collectStats();
    } catch (const std::exception& e) {
        reportCaptureFailure(e, utils::ErrorCategory::NETWORK_STATS, "NetworkAnalyzer");
        return NetworkAnalysis();
    }
    return analyzeReport(report);
}

NetworkAnalysis NetworkAnalyzer::analyzeReport(const TransportStatsReport& report) {
    double bitrateKbps = 0.0;
    double latencyMs = 0.0;
    double framesPerSecond = 0.0;
    uint64_t packetsSent = 0;
    int64_t packetsLost = 0;
    uint64_t framesDropped = 0;
    uint64_t totalFrames = 0;

    if (report.outboundVideo) {
        const OutboundRtpStats& rtp = *report.outboundVideo;

        if (rtp.bytesSent) {
            const double deltaTimeMs = std::chrono::duration<double, std::milli>(
                report.timestamp - accumulator_.lastTimestamp).count();

            if (deltaTimeMs > 0.0) {
                bitrateKbps = calculateBitrate(*rtp.bytesSent, accumulator_.lastBytesSent, deltaTimeMs);
                bitrateHistory_.push(bitrateKbps);
                accumulator_.lastBytesSent = *rtp.bytesSent;
                accumulator_.lastTimestamp = report.timestamp;
            }
        }

        if (rtp.packetsLost) {
            packetsLost = *rtp.packetsLost;
        }
        if (rtp.packetsSent) {
            packetsSent = *rtp.packetsSent;
        }
        if (rtp.framesPerSecond) {
            framesPerSecond = *rtp.framesPerSecond;
            fpsHistory_.push(framesPerSecond);
        }
        if (rtp.framesDropped && rtp.framesSent) {
            framesDropped = *rtp.framesDropped;
            totalFrames = *rtp.framesSent + framesDropped;
        }
    }

    if (report.candidatePair && report.candidatePair->currentRoundTripTimeSec) {
        latencyMs = *report.candidatePair->currentRoundTripTimeSec * 1000.0;
        latencyHistory_.push(latencyMs);
    }

    // Lost counters can go negative on duplicate receipt; report no loss in that case
    double packetLoss = 0.0;
    if (packetsSent > 0 && packetsLost > 0) {
        packetLoss = static_cast<double>(packetsLost) / static_cast<double>(packetsSent) * 100.0;
    }
    packetLoss = std::min(packetLoss, 100.0);
    packetLossHistory_.push(packetLoss);

    const double frameDropRatio = totalFrames > 0
        ? static_cast<double>(framesDropped) / static_cast<double>(totalFrames)
        : 0.0;
    frameDropHistory_.push(frameDropRatio);

    return buildAnalysis(bitrateKbps, packetLoss, latencyMs, framesPerSecond, frameDropRatio);
}

NetworkAnalysis NetworkAnalyzer::analyzeSample(const NetworkSample& sample) {
    const double bitrateKbps = std::max(sample.bitrateKbps, 0.0);
    const double packetLoss = std::min(std::max(sample.packetLoss, 0.0), 100.0);
    const double latencyMs = std::max(sample.latencyMs, 0.0);
    const double framesPerSecond = std::max(sample.framesPerSecond, 0.0);
    const double frameDropRatio = stats::clamp01(sample.frameDropRatio);

    bitrateHistory_.push(bitrateKbps);
    packetLossHistory_.push(packetLoss);
    latencyHistory_.push(latencyMs);
    fpsHistory_.push(framesPerSecond);
    frameDropHistory_.push(frameDropRatio);

    return buildAnalysis(bitrateKbps, packetLoss, latencyMs, framesPerSecond, frameDropRatio);
}

NetworkAnalysis NetworkAnalyzer::buildAnalysis(double bitrateKbps, double packetLoss, double latencyMs,
                                               double framesPerSecond, double frameDropRatio) {
    NetworkAnalysis analysis;

    analysis.bitrateKbps = static_cast<float>(bitrateKbps);
    analysis.packetLoss = static_cast<float>(packetLoss);
    analysis.latencyMs = static_cast<float>(latencyMs);
    analysis.framesPerSecond = static_cast<float>(framesPerSecond);
    analysis.frameDropRatio = static_cast<float>(frameDropRatio);

    analysis.bitrateStability = static_cast<float>(getBitrateStability());
    analysis.lossStability = static_cast<float>(getLossStability());
    analysis.jitterStability = static_cast<float>(getJitterStability());
    analysis.rttStability = static_cast<float>(getRttStability());
    analysis.jitterMs = analysis.jitterStability;

    analysis.stabilityScore = calculateStabilityScore(bitrateKbps, packetLoss, latencyMs,
                                                      framesPerSecond, frameDropRatio);

    analysis.status = resolveStatus(bitrateKbps, packetLoss, latencyMs, analysis.jitterMs,
                                    framesPerSecond, frameDropRatio,
                                    analysis.bitrateStability, analysis.lossStability);

    totalPolls_++;
    if (analysis.status != lastStatus_) {
        statusChanges_++;
        utils::Logger::debug(std::string("Network status changed: ") + toString(lastStatus_) +
                             " -> " + toString(analysis.status));
        lastStatus_ = analysis.status;
    }

    return analysis;
}

double NetworkAnalyzer::calculateBitrate(uint64_t nowBytes, uint64_t prevBytes, double deltaTimeMs) {
    if (deltaTimeMs <= 0.0 || nowBytes < prevBytes) {
        return 0.0;
    }

    const double deltaBytes = static_cast<double>(nowBytes - prevBytes);
    const double deltaSec = deltaTimeMs / 1000.0;
    return deltaBytes * 8.0 / deltaSec / 1000.0;
}

double NetworkAnalyzer::getBitrateStability() const {
    return stats::stdDev(stats::toDoubles(bitrateHistory_));
}

double NetworkAnalyzer::getLossStability() const {
    // Only rising loss counts as instability
    return std::max(0.0, stats::trendSlope(stats::toDoubles(packetLossHistory_), config_.lossTrendPoints));
}

double NetworkAnalyzer::getJitterStability() const {
    return stats::stdDev(stats::toDoubles(latencyHistory_));
}

double NetworkAnalyzer::getRttStability() const {
    return stats::stdDev(stats::toDoubles(latencyHistory_));
}

int NetworkAnalyzer::calculateStabilityScore(double bitrateKbps, double packetLoss, double latencyMs,
                                             double framesPerSecond, double frameDropRatio) const {
    // Current conditions, equally weighted
    const double bitrateNorm = std::min(bitrateKbps / config_.bitrateOptimal, 1.0);
    const double lossNorm = std::max(1.0 - packetLoss / config_.packetLossSpan, 0.0);
    const double latencyNorm = std::max(1.0 - latencyMs / config_.latencySpan, 0.0);
    const double fpsNorm = std::min(framesPerSecond / config_.targetFps, 1.0);
    const double currentComponent = 0.25 * (bitrateNorm + lossNorm + latencyNorm + fpsNorm);

    // Dispersion over the rolling windows
    const double bitrateStabilityNorm = std::max(1.0 - getBitrateStability() / config_.bitrateStabilityScale, 0.0);
    const double lossStabilityNorm = std::max(1.0 - getLossStability() / config_.lossStabilityScale, 0.0);
    const double jitterStabilityNorm = std::max(1.0 - getJitterStability() / config_.jitterStabilityScale, 0.0);
    const double rttStabilityNorm = std::max(1.0 - getRttStability() / config_.rttStabilityScale, 0.0);

    const double stabilityComponent =
        config_.bitrateStabilityWeight * bitrateStabilityNorm +
        config_.lossStabilityWeight * lossStabilityNorm +
        config_.jitterStabilityWeight * jitterStabilityNorm +
        config_.rttStabilityWeight * rttStabilityNorm;

    double score = (config_.currentWeight * currentComponent +
                    config_.stabilityWeight * stabilityComponent) * 100.0;

    if (frameDropRatio > config_.maxFrameDropRatio) {
        score -= (frameDropRatio - config_.maxFrameDropRatio) * 100.0;
    }

    return static_cast<int>(std::round(std::min(std::max(score, 0.0), 100.0)));
}

NetworkStatus NetworkAnalyzer::resolveStatus(double bitrateKbps, double packetLoss, double latencyMs,
                                             double jitterMs, double framesPerSecond, double frameDropRatio,
                                             double bitrateStability, double lossStability) const {
    // Any metric in the worst tier dominates
    if (bitrateKbps < config_.bitrateCritical ||
        packetLoss > config_.packetLossPoor ||
        latencyMs > config_.latencyCritical ||
        framesPerSecond < config_.minViableFps ||
        frameDropRatio > config_.maxFrameDropRatio) {
        return NetworkStatus::CRITICAL;
    }

    if (bitrateKbps < config_.bitratePoor ||
        packetLoss > config_.packetLossModerate ||
        latencyMs > config_.latencyPoor ||
        jitterMs > config_.jitterThreshold ||
        bitrateStability > config_.bitrateStabilityThreshold ||
        lossStability > config_.lossStabilityThreshold) {
        return NetworkStatus::UNSTABLE;
    }

    if (bitrateKbps < config_.bitrateModerate ||
        latencyMs > config_.latencyModerate ||
        framesPerSecond < config_.moderateFps) {
        return NetworkStatus::MODERATE;
    }

    return NetworkStatus::GOOD;
}

void NetworkAnalyzer::reset(std::chrono::steady_clock::time_point start) {
    accumulator_.lastBytesSent = 0;
    accumulator_.lastTimestamp = start;

    bitrateHistory_.clear();
    latencyHistory_.clear();
    packetLossHistory_.clear();
    fpsHistory_.clear();
    frameDropHistory_.clear();

    totalPolls_ = 0;
    statusChanges_ = 0;
    lastStatus_ = NetworkStatus::GOOD;

    utils::Logger::debug("NetworkAnalyzer state reset");
}

std::map<std::string, double> NetworkAnalyzer::getAnalyzerStats() const {
    std::map<std::string, double> analyzerStats;

    analyzerStats["total_polls"] = static_cast<double>(totalPolls_);
    analyzerStats["status_changes"] = static_cast<double>(statusChanges_);
    analyzerStats["bitrate_samples"] = static_cast<double>(bitrateHistory_.size());
    analyzerStats["latency_samples"] = static_cast<double>(latencyHistory_.size());
    analyzerStats["mean_bitrate_kbps"] = stats::mean(stats::toDoubles(bitrateHistory_));
    analyzerStats["mean_latency_ms"] = stats::mean(stats::toDoubles(latencyHistory_));
    analyzerStats["mean_fps"] = stats::mean(stats::toDoubles(fpsHistory_));
    analyzerStats["mean_frame_drop_ratio"] = stats::mean(stats::toDoubles(frameDropHistory_));

    return analyzerStats;
}

} // namespace diagnostics
} // namespace streamready
