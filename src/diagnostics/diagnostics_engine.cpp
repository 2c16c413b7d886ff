#include "diagnostics/diagnostics_engine.hpp"
#include "utils/logging.hpp"
#include "utils/performance_monitor.hpp"
#include <chrono>
#include <sstream>

namespace streamready {
namespace diagnostics {

namespace {

CompositeScorerConfig linkScorerConfig(CompositeScorerConfig scorerConfig, const AudioAnalyzerConfig& audioConfig) {
    if (!scorerConfig.audioRmsOptimal) {
        scorerConfig.audioRmsOptimal = audioConfig.rmsOptimal;
    }
    return scorerConfig;
}

} // namespace

DiagnosticsEngine::DiagnosticsEngine(const AudioAnalyzerConfig& audioConfig,
                                     const VideoAnalyzerConfig& videoConfig,
                                     const NetworkAnalyzerConfig& networkConfig,
                                     const CompositeScorerConfig& scorerConfig,
                                     const EngineConfig& engineConfig)
    : config_(engineConfig)
    , audioAnalyzer_(audioConfig)
    , videoAnalyzer_(videoConfig)
    , networkAnalyzer_(networkConfig)
    , scorer_(linkScorerConfig(scorerConfig, audioConfig))
    , cycleCount_(0)
    , budgetOverruns_(0) {
    utils::Logger::info("DiagnosticsEngine initialized: grid " + std::to_string(videoConfig.gridSize) +
                        "x" + std::to_string(videoConfig.gridSize) + ", network window " +
                        std::to_string(networkConfig.historySize) + " samples");
}

void DiagnosticsEngine::attachAudioSource(std::shared_ptr<AudioFrameSource> source) {
    audioAnalyzer_.attachSource(std::move(source));
}

void DiagnosticsEngine::attachVideoSource(std::shared_ptr<PixelSource> source) {
    videoAnalyzer_.attachSource(std::move(source));
}

void DiagnosticsEngine::attachTransportSource(std::shared_ptr<TransportStatsSource> source) {
    networkAnalyzer_.attachSource(std::move(source));
}

template <typename Analysis, typename AnalyzeFn>
Analysis DiagnosticsEngine::runStage(const std::string& stageName, const std::string& metricName,
                                     double budgetMs, utils::ErrorCategory category, AnalyzeFn analyze) {
    utils::LatencyTimer timer(metricName);
    Analysis result;

    // Analyzers absorb source failures themselves; this catches anything past the read
    try {
        result = analyze();
    } catch (const std::exception& e) {
        reportCaptureFailure(e, category, stageName);
        result = Analysis();
    }

    checkBudget(stageName, timer.stop(), budgetMs);
    return result;
}

DiagnosticSnapshot DiagnosticsEngine::runCycle() {
    return runCycle(currentTimestampMs());
}

DiagnosticSnapshot DiagnosticsEngine::runCycle(int64_t timestampMs) {
    utils::LatencyTimer cycleTimer(utils::PerformanceMonitor::METRIC_CYCLE_LATENCY);

    const AudioAnalysis audio = runStage<AudioAnalysis>(
        "AudioAnalyzer", utils::PerformanceMonitor::METRIC_AUDIO_ANALYSIS_LATENCY, config_.audioBudgetMs,
        utils::ErrorCategory::AUDIO_CAPTURE, [this]() { return audioAnalyzer_.analyze(); });

    const VideoAnalysis video = runStage<VideoAnalysis>(
        "VideoAnalyzer", utils::PerformanceMonitor::METRIC_VIDEO_ANALYSIS_LATENCY, config_.videoBudgetMs,
        utils::ErrorCategory::VIDEO_CAPTURE, [this]() { return videoAnalyzer_.analyze(); });

    const NetworkAnalysis network = runStage<NetworkAnalysis>(
        "NetworkAnalyzer", utils::PerformanceMonitor::METRIC_NETWORK_ANALYSIS_LATENCY, config_.networkBudgetMs,
        utils::ErrorCategory::NETWORK_STATS, [this]() { return networkAnalyzer_.analyze(); });

    DiagnosticSnapshot snapshot = composeSnapshot(audio, video, network, timestampMs, scorer_);

    checkBudget("Diagnostics cycle", cycleTimer.stop(), config_.cycleBudgetMs);
    utils::PerformanceMonitor::getInstance().recordMetric(
        utils::PerformanceMonitor::METRIC_OVERALL_QUALITY, snapshot.qualityScore.overallQuality);

    latest_ = snapshot;
    cycleCount_++;

    std::ostringstream oss;
    oss << "Cycle " << cycleCount_ << ": overall " << toString(snapshot.overallStatus)
        << " (" << snapshot.qualityScore.overallQuality << ")";
    utils::Logger::debug(oss.str());

    return snapshot;
}

void DiagnosticsEngine::checkBudget(const std::string& stageName, double elapsedMs, double budgetMs) {
    if (elapsedMs <= budgetMs) {
        return;
    }

    budgetOverruns_++;
    utils::PerformanceMonitor::getInstance().recordCounter(utils::PerformanceMonitor::METRIC_BUDGET_OVERRUNS);

    std::ostringstream oss;
    oss << stageName << " took " << elapsedMs << "ms (budget " << budgetMs << "ms)";
    utils::Logger::warn(oss.str());
}

DiagnosticSnapshot DiagnosticsEngine::composeSnapshot(const AudioAnalysis& audio,
                                                      const VideoAnalysis& video,
                                                      const NetworkAnalysis& network,
                                                      int64_t timestampMs,
                                                      const CompositeScorer& scorer) {
    DiagnosticSnapshot snapshot;
    snapshot.audio = audio;
    snapshot.video = video;
    snapshot.network = network;
    snapshot.qualityScore = scorer.calculateQualityScore(audio, video, network);
    snapshot.timestamp = timestampMs;
    snapshot.overallStatus = CompositeScorer::calculateOverallStatus(audio.status, video.status, network.status);
    return snapshot;
}

void DiagnosticsEngine::reset() {
    audioAnalyzer_.reset();
    videoAnalyzer_.reset();
    networkAnalyzer_.reset();
    latest_.reset();
    cycleCount_ = 0;
    budgetOverruns_ = 0;
    utils::Logger::info("DiagnosticsEngine reset");
}

int64_t DiagnosticsEngine::currentTimestampMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace diagnostics
} // namespace streamready
