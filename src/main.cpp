#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include "diagnostics/capture_sources.hpp"
#include "diagnostics/diagnostics_engine.hpp"
#include "diagnostics/json_export.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/performance_monitor.hpp"

using namespace streamready;

namespace {

constexpr int kPollIntervalMs = 500;
constexpr size_t kFftSize = 2048;
constexpr int kFrameWidth = 320;
constexpr int kFrameHeight = 240;

struct SceneParameters {
    float toneAmplitude = 0.078f;
    int clipEvery = 0;              // pin every n-th sample at full scale, 0 = never
    uint8_t leftGray = 128;
    uint8_t rightGray = 128;
    uint8_t flickerGray = 0;        // alternate frames use this gray when non-zero
    double bitrateKbps = 1800.0;
    double packetLossPercent = 0.0;
    double rttMs = 30.0;
    double rttSwingMs = 0.0;        // alternating RTT offset
    double framesPerSecond = 30.0;
};

bool sceneForName(const std::string& name, SceneParameters& scene) {
    scene = SceneParameters();
    if (name == "good") {
        return true;
    }
    if (name == "quiet") {
        scene.toneAmplitude = 0.004f;
        return true;
    }
    if (name == "clipping") {
        scene.clipEvery = 8;
        return true;
    }
    if (name == "dark") {
        scene.leftGray = scene.rightGray = 15;
        return true;
    }
    if (name == "uneven") {
        scene.leftGray = 20;
        scene.rightGray = 230;
        return true;
    }
    if (name == "congested") {
        scene.bitrateKbps = 420.0;
        scene.packetLossPercent = 1.5;
        scene.rttMs = 220.0;
        scene.rttSwingMs = 40.0;
        scene.framesPerSecond = 22.0;
        return true;
    }
    if (name == "flicker") {
        scene.leftGray = scene.rightGray = 70;
        scene.flickerGray = 150;
        return true;
    }
    return false;
}

/**
 * In-memory capture devices fed with one synthetic frame per cycle
 */
class SyntheticScene {
public:
    SyntheticScene(const SceneParameters& params, std::chrono::steady_clock::time_point start)
        : params_(params)
        , start_(start)
        , audio_(std::make_shared<diagnostics::BufferAudioSource>(kFftSize))
        , video_(std::make_shared<diagnostics::FramePixelSource>())
        , transport_(std::make_shared<diagnostics::ReplayStatsSource>()) {
    }

    void advance(int cycle) {
        audio_->setFrame(makeAudioFrame());
        video_->setFrame(makeVideoFrame(cycle));
        transport_->enqueue(makeReport(cycle));
    }

    std::shared_ptr<diagnostics::BufferAudioSource> audio() const { return audio_; }
    std::shared_ptr<diagnostics::FramePixelSource> video() const { return video_; }
    std::shared_ptr<diagnostics::ReplayStatsSource> transport() const { return transport_; }

private:
    std::vector<uint8_t> makeAudioFrame() const {
        const int offset = static_cast<int>(std::lround(params_.toneAmplitude * 128.0f));
        std::vector<uint8_t> frame(kFftSize);
        for (size_t i = 0; i < kFftSize; ++i) {
            const bool positive = (i % 2 == 0);
            if (params_.clipEvery > 0 && i % static_cast<size_t>(params_.clipEvery) == 0) {
                frame[i] = positive ? 255 : 0;
            } else {
                frame[i] = static_cast<uint8_t>(positive ? 128 + offset : 128 - offset);
            }
        }
        return frame;
    }

    diagnostics::RgbaFrame makeVideoFrame(int cycle) const {
        if (params_.flickerGray != 0 && cycle % 2 == 1) {
            const uint8_t gray = params_.flickerGray;
            return diagnostics::RgbaFrame(kFrameWidth, kFrameHeight, gray, gray, gray);
        }

        diagnostics::RgbaFrame frame(kFrameWidth, kFrameHeight,
                                     params_.leftGray, params_.leftGray, params_.leftGray);
        frame.fillRect(kFrameWidth / 2, 0, kFrameWidth - kFrameWidth / 2, kFrameHeight,
                       params_.rightGray, params_.rightGray, params_.rightGray);
        return frame;
    }

    diagnostics::TransportStatsReport makeReport(int cycle) {
        const double intervalSec = kPollIntervalMs / 1000.0;
        bytesSent_ += static_cast<uint64_t>(std::llround(params_.bitrateKbps * 1000.0 / 8.0 * intervalSec));
        packetsSent_ += 1000;
        framesSent_ += static_cast<uint64_t>(std::llround(params_.framesPerSecond * intervalSec));

        diagnostics::TransportStatsReport report;
        report.timestamp = start_ + std::chrono::milliseconds(kPollIntervalMs * (cycle + 1));

        diagnostics::OutboundRtpStats rtp;
        rtp.bytesSent = bytesSent_;
        rtp.packetsSent = packetsSent_;
        rtp.packetsLost = static_cast<int64_t>(
            std::llround(static_cast<double>(packetsSent_) * params_.packetLossPercent / 100.0));
        rtp.framesPerSecond = params_.framesPerSecond;
        rtp.framesSent = framesSent_;
        rtp.framesDropped = 0;
        report.outboundVideo = rtp;

        diagnostics::CandidatePairStats pair;
        const double swing = (cycle % 2 == 0) ? params_.rttSwingMs : -params_.rttSwingMs;
        pair.currentRoundTripTimeSec = (params_.rttMs + swing) / 1000.0;
        report.candidatePair = pair;

        return report;
    }

    SceneParameters params_;
    std::chrono::steady_clock::time_point start_;
    std::shared_ptr<diagnostics::BufferAudioSource> audio_;
    std::shared_ptr<diagnostics::FramePixelSource> video_;
    std::shared_ptr<diagnostics::ReplayStatsSource> transport_;
    uint64_t bytesSent_ = 0;
    uint64_t packetsSent_ = 0;
    uint64_t framesSent_ = 0;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <file>     Load thresholds from a JSON config (default: config/diagnostics.json)\n"
              << "  --scenario <name>   good, quiet, clipping, dark, uneven, congested, flicker (default: good)\n"
              << "  --cycles <n>        Number of 500ms diagnostics cycles to simulate (default: 10)\n"
              << "  --help, -h          Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        utils::Logger::initialize();

        std::string configPath = "config/diagnostics.json";
        std::string scenarioName = "good";
        int cycles = 10;

        // Parse command line arguments
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--scenario" && i + 1 < argc) {
                scenarioName = argv[++i];
            } else if (arg == "--cycles" && i + 1 < argc) {
                cycles = std::stoi(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        SceneParameters params;
        if (!sceneForName(scenarioName, params)) {
            std::cerr << "Unknown scenario: " << scenarioName << std::endl;
            return 1;
        }
        if (cycles <= 0) {
            std::cerr << "--cycles must be positive" << std::endl;
            return 1;
        }

        // Load configuration
        auto config = utils::Config::load(configPath);
        utils::Logger::setLevel(utils::Logger::parseLevel(config.getLogLevel()));

        utils::ErrorHandler::getInstance().setErrorCallback([](const utils::ErrorInfo& error) {
            std::cerr << "Capture failure [" << utils::toString(error.category) << "]: "
                      << error.message << std::endl;
        });

        diagnostics::DiagnosticsEngine engine(config.getAudioConfig(), config.getVideoConfig(),
                                              config.getNetworkConfig(), config.getCompositeConfig(),
                                              config.getEngineConfig());

        const auto start = std::chrono::steady_clock::now();
        SyntheticScene scene(params, start);
        engine.attachAudioSource(scene.audio());
        engine.attachVideoSource(scene.video());
        engine.attachTransportSource(scene.transport());
        engine.networkAnalyzer().reset(start);

        utils::Logger::info("Running scenario '" + scenarioName + "' for " + std::to_string(cycles) + " cycles");

        const int64_t startMs = diagnostics::DiagnosticsEngine::currentTimestampMs();
        for (int cycle = 0; cycle < cycles; ++cycle) {
            scene.advance(cycle);
            auto snapshot = engine.runCycle(startMs + static_cast<int64_t>(cycle) * kPollIntervalMs);
            std::cout << diagnostics::toJson(snapshot).dump(2) << std::endl;
        }

        // Stage timing summary
        for (const auto& entry : utils::PerformanceMonitor::getInstance().getDiagnosticsMetrics()) {
            std::ostringstream oss;
            oss << entry.first << ": count=" << entry.second.count << " mean=" << entry.second.mean
                << " p95=" << entry.second.p95 << " max=" << entry.second.max;
            utils::Logger::info(oss.str());
        }

        std::cout << "Completed " << engine.getCycleCount() << " cycles, "
                  << engine.getBudgetOverruns() << " budget overruns" << std::endl;

    } catch (const utils::ConfigurationException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
