#include "diagnostics/capture_sources.hpp"
#include "diagnostics/composite_scorer.hpp"
#include "diagnostics/json_export.hpp"
#include "diagnostics/network_analyzer.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>

using namespace streamready::diagnostics;

/**
 * Example replaying a degrading uplink through the network analyzer and
 * showing how the stability score and the categorical status diverge
 */
class NetworkReplayExample {
public:
    NetworkReplayExample() = default;

    void runExample() {
        std::cout << "Network Stability Replay Example" << std::endl;
        std::cout << "================================" << std::endl;

        // Step 1: Record a synthetic trace
        buildTrace();

        // Step 2: Replay it through the analyzer
        replayTrace();

        // Step 3: Combine the last poll with ideal audio and video
        showCompositeScore();

        std::cout << "\nExample completed successfully!" << std::endl;
    }

private:
    std::shared_ptr<ReplayStatsSource> source_;
    std::unique_ptr<NetworkAnalyzer> analyzer_;
    NetworkAnalysis lastAnalysis_;
    std::chrono::steady_clock::time_point start_;

    void buildTrace() {
        std::cout << "\n1. Building a 20-poll trace (steady, then congested)..." << std::endl;

        source_ = std::make_shared<ReplayStatsSource>();
        start_ = std::chrono::steady_clock::now();

        uint64_t bytesSent = 0;
        uint64_t packetsSent = 0;
        int64_t packetsLost = 0;

        for (int poll = 0; poll < 20; ++poll) {
            const bool congested = poll >= 10;
            const double bitrateKbps = congested ? 900.0 - (poll - 10) * 60.0 : 1800.0;

            bytesSent += static_cast<uint64_t>(bitrateKbps * 1000.0 / 8.0 * 0.5);
            packetsSent += 1000;
            packetsLost += congested ? 5 * (poll - 9) : 0;

            TransportStatsReport report;
            report.timestamp = start_ + std::chrono::milliseconds(500 * (poll + 1));

            OutboundRtpStats rtp;
            rtp.bytesSent = bytesSent;
            rtp.packetsSent = packetsSent;
            rtp.packetsLost = packetsLost;
            rtp.framesPerSecond = congested ? 24.0 : 30.0;
            report.outboundVideo = rtp;

            CandidatePairStats pair;
            pair.currentRoundTripTimeSec = congested ? 0.120 + 0.015 * (poll % 3) : 0.030;
            report.candidatePair = pair;

            source_->enqueue(report);
        }

        std::cout << "   Queued " << source_->pending() << " reports" << std::endl;
    }

    void replayTrace() {
        std::cout << "\n2. Replaying through NetworkAnalyzer..." << std::endl;

        analyzer_ = std::make_unique<NetworkAnalyzer>(NetworkAnalyzerConfig(), source_);
        analyzer_->reset(start_);

        std::cout << std::fixed << std::setprecision(1);
        while (source_->pending() > 0) {
            lastAnalysis_ = analyzer_->analyze();
            std::cout << "   bitrate " << std::setw(7) << lastAnalysis_.bitrateKbps << " kbps"
                      << "  loss " << std::setw(4) << lastAnalysis_.packetLoss << "%"
                      << "  rtt " << std::setw(5) << lastAnalysis_.latencyMs << " ms"
                      << "  score " << std::setw(3) << lastAnalysis_.stabilityScore
                      << "  " << toString(lastAnalysis_.status) << std::endl;
        }

        for (const auto& stat : analyzer_->getAnalyzerStats()) {
            std::cout << "   " << stat.first << ": " << stat.second << std::endl;
        }
    }

    void showCompositeScore() {
        std::cout << "\n3. Composite score with ideal audio and video..." << std::endl;

        AudioAnalysis audio;
        audio.rms = 0.08f;
        VideoAnalysis video;
        video.brightness = 128.0f;
        video.uniformityScore = 1.0f;

        CompositeScorer scorer;
        const QualityScore score = scorer.calculateQualityScore(audio, video, lastAnalysis_);
        const OverallStatus overall = CompositeScorer::calculateOverallStatus(audio.status, video.status,
                                                                              lastAnalysis_.status);

        std::cout << toJson(score).dump(2) << std::endl;
        std::cout << "   Overall status: " << toString(overall) << std::endl;
    }
};

int main() {
    try {
        streamready::utils::Logger::initialize();

        NetworkReplayExample example;
        example.runExample();

    } catch (const std::exception& e) {
        std::cerr << "Example failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
