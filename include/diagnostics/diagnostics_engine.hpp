#pragma once

#include "diagnostics/audio_analyzer.hpp"
#include "diagnostics/composite_scorer.hpp"
#include "diagnostics/diagnostic_snapshot.hpp"
#include "diagnostics/network_analyzer.hpp"
#include "diagnostics/video_analyzer.hpp"
#include "utils/error_handler.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace streamready {
namespace diagnostics {

// Per-stage latency budgets; overruns are logged and counted, never fatal
struct EngineConfig {
    double audioBudgetMs;
    double videoBudgetMs;
    double networkBudgetMs;
    double cycleBudgetMs;

    EngineConfig()
        : audioBudgetMs(10.0), videoBudgetMs(15.0), networkBudgetMs(5.0), cycleBudgetMs(30.0) {}
};

/**
 * Drives one analyzer of each kind through a diagnostics cycle and
 * composes their outputs into a DiagnosticSnapshot.
 *
 * The engine owns no timers: the caller decides the cadence and calls
 * runCycle(). Not reentrant.
 */
class DiagnosticsEngine {
public:
    // A scorer config without audioRmsOptimal scores audio against audioConfig.rmsOptimal
    explicit DiagnosticsEngine(const AudioAnalyzerConfig& audioConfig = AudioAnalyzerConfig(),
                               const VideoAnalyzerConfig& videoConfig = VideoAnalyzerConfig(),
                               const NetworkAnalyzerConfig& networkConfig = NetworkAnalyzerConfig(),
                               const CompositeScorerConfig& scorerConfig = CompositeScorerConfig(),
                               const EngineConfig& engineConfig = EngineConfig());

    void attachAudioSource(std::shared_ptr<AudioFrameSource> source);
    void attachVideoSource(std::shared_ptr<PixelSource> source);
    void attachTransportSource(std::shared_ptr<TransportStatsSource> source);

    /**
     * Analyze all three sources once and compose a snapshot.
     * A source that throws is reported to the ErrorHandler and its analyzer
     * contributes the neutral result for this cycle.
     * @param timestampMs Snapshot time, epoch milliseconds
     */
    DiagnosticSnapshot runCycle(int64_t timestampMs);
    DiagnosticSnapshot runCycle();

    /**
     * Pure composition of three analyses into a snapshot
     */
    static DiagnosticSnapshot composeSnapshot(const AudioAnalysis& audio,
                                              const VideoAnalysis& video,
                                              const NetworkAnalysis& network,
                                              int64_t timestampMs,
                                              const CompositeScorer& scorer);

    std::optional<DiagnosticSnapshot> latestSnapshot() const { return latest_; }
    uint64_t getCycleCount() const { return cycleCount_; }
    uint64_t getBudgetOverruns() const { return budgetOverruns_; }

    // Clears every analyzer's history and the latest snapshot; sources stay attached
    void reset();

    AudioAnalyzer& audioAnalyzer() { return audioAnalyzer_; }
    VideoAnalyzer& videoAnalyzer() { return videoAnalyzer_; }
    NetworkAnalyzer& networkAnalyzer() { return networkAnalyzer_; }
    const CompositeScorer& scorer() const { return scorer_; }
    const EngineConfig& getConfig() const { return config_; }

    static int64_t currentTimestampMs();

private:
    template <typename Analysis, typename AnalyzeFn>
    Analysis runStage(const std::string& stageName, const std::string& metricName, double budgetMs,
                      utils::ErrorCategory category, AnalyzeFn analyze);

    void checkBudget(const std::string& stageName, double elapsedMs, double budgetMs);

    EngineConfig config_;
    AudioAnalyzer audioAnalyzer_;
    VideoAnalyzer videoAnalyzer_;
    NetworkAnalyzer networkAnalyzer_;
    CompositeScorer scorer_;

    std::optional<DiagnosticSnapshot> latest_;
    uint64_t cycleCount_;
    uint64_t budgetOverruns_;
};

} // namespace diagnostics
} // namespace streamready
