#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace streamready {
namespace utils {

namespace {

using json = nlohmann::json;

constexpr size_t kMaxLatencyHistory = 20;

template <typename T>
void readValue(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

// Integral settings reject fractional and negative values instead of truncating them
template <typename Count>
void readCount(const json& section, const std::string& sectionName, const char* key, Count& target) {
    if (!section.contains(key)) {
        return;
    }

    const json& value = section.at(key);
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw ConfigurationException("Configuration value must be a non-negative integer",
                                     sectionName + "." + key);
    }
    target = value.get<Count>();
}

const json* findSection(const json& root, const char* name) {
    if (!root.contains(name)) {
        return nullptr;
    }

    const json& section = root.at(name);
    if (!section.is_object()) {
        throw ConfigurationException("Configuration section must be an object", name);
    }
    return &section;
}

void requireNonNegative(double value, const std::string& key) {
    if (!(value >= 0.0)) {
        throw ConfigurationException("Configuration value must be non-negative", key);
    }
}

void requirePositive(double value, const std::string& key) {
    if (!(value > 0.0)) {
        throw ConfigurationException("Configuration value must be positive", key);
    }
}

void requireRange(double value, double low, double high, const std::string& key) {
    if (!(value >= low && value <= high)) {
        std::ostringstream oss;
        oss << "Configuration value must be within [" << low << ", " << high << "]";
        throw ConfigurationException(oss.str(), key);
    }
}

bool isKnownLogLevel(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper == "DEBUG" || upper == "INFO" || upper == "WARN" || upper == "WARNING" || upper == "ERROR";
}

void parseAudio(const json& s, diagnostics::AudioAnalyzerConfig& c) {
    readValue(s, "rmsLow", c.rmsLow);
    readValue(s, "rmsOptimal", c.rmsOptimal);
    readValue(s, "rmsHigh", c.rmsHigh);
    readValue(s, "clippingPercentThreshold", c.clippingPercentThreshold);
    readValue(s, "clippingMagnitude", c.clippingMagnitude);
    readValue(s, "noiseSensitivity", c.noiseSensitivity);
    readValue(s, "noiseFloorPercentile", c.noiseFloorPercentile);
    readValue(s, "backgroundNoiseCeiling", c.backgroundNoiseCeiling);
    readValue(s, "backgroundNoiseRatioThreshold", c.backgroundNoiseRatioThreshold);
    readCount(s, "audio", "edgeGuardSamples", c.edgeGuardSamples);
    readCount(s, "audio", "rmsWindowSize", c.rmsWindowSize);
}

void parseVideo(const json& s, diagnostics::VideoAnalyzerConfig& c) {
    readCount(s, "video", "gridSize", c.gridSize);
    readValue(s, "brightnessLow", c.brightnessLow);
    readValue(s, "brightnessHigh", c.brightnessHigh);
    readValue(s, "uniformityThreshold", c.uniformityThreshold);
    readValue(s, "fluctuationThreshold", c.fluctuationThreshold);
    readCount(s, "video", "historySize", c.historySize);
}

void parseNetwork(const json& s, diagnostics::NetworkAnalyzerConfig& c) {
    readCount(s, "network", "historySize", c.historySize);
    readCount(s, "network", "latencyHistorySize", c.latencyHistorySize);
    readValue(s, "bitrateCritical", c.bitrateCritical);
    readValue(s, "bitratePoor", c.bitratePoor);
    readValue(s, "bitrateModerate", c.bitrateModerate);
    readValue(s, "latencyModerate", c.latencyModerate);
    readValue(s, "latencyPoor", c.latencyPoor);
    readValue(s, "latencyCritical", c.latencyCritical);
    readValue(s, "packetLossModerate", c.packetLossModerate);
    readValue(s, "packetLossPoor", c.packetLossPoor);
    readValue(s, "jitterThreshold", c.jitterThreshold);
    readValue(s, "minViableFps", c.minViableFps);
    readValue(s, "moderateFps", c.moderateFps);
    readValue(s, "maxFrameDropRatio", c.maxFrameDropRatio);
    readValue(s, "bitrateStabilityThreshold", c.bitrateStabilityThreshold);
    readValue(s, "lossStabilityThreshold", c.lossStabilityThreshold);
    readValue(s, "bitrateOptimal", c.bitrateOptimal);
    readValue(s, "packetLossSpan", c.packetLossSpan);
    readValue(s, "latencySpan", c.latencySpan);
    readValue(s, "targetFps", c.targetFps);
    readCount(s, "network", "lossTrendPoints", c.lossTrendPoints);
    readValue(s, "bitrateStabilityScale", c.bitrateStabilityScale);
    readValue(s, "lossStabilityScale", c.lossStabilityScale);
    readValue(s, "jitterStabilityScale", c.jitterStabilityScale);
    readValue(s, "rttStabilityScale", c.rttStabilityScale);
    readValue(s, "bitrateStabilityWeight", c.bitrateStabilityWeight);
    readValue(s, "lossStabilityWeight", c.lossStabilityWeight);
    readValue(s, "jitterStabilityWeight", c.jitterStabilityWeight);
    readValue(s, "rttStabilityWeight", c.rttStabilityWeight);
    readValue(s, "currentWeight", c.currentWeight);
    readValue(s, "stabilityWeight", c.stabilityWeight);
}

void parseComposite(const json& s, diagnostics::CompositeScorerConfig& c) {
    readValue(s, "videoWeight", c.videoWeight);
    readValue(s, "audioWeight", c.audioWeight);
    readValue(s, "networkWeight", c.networkWeight);
    readValue(s, "audioOkFloor", c.audioOkFloor);
    readValue(s, "audioOkDeviationGain", c.audioOkDeviationGain);
    if (s.contains("audioRmsOptimal")) {
        c.audioRmsOptimal = s.at("audioRmsOptimal").get<double>();
    }
    readValue(s, "audioBackgroundNoiseScore", c.audioBackgroundNoiseScore);
    readValue(s, "audioTooQuietScore", c.audioTooQuietScore);
    readValue(s, "audioTooLoudScore", c.audioTooLoudScore);
    readValue(s, "audioClippingScore", c.audioClippingScore);
    readValue(s, "videoOkBase", c.videoOkBase);
    readValue(s, "videoOkUniformityBonus", c.videoOkUniformityBonus);
    readValue(s, "videoAdjustCameraScore", c.videoAdjustCameraScore);
    readValue(s, "videoUnevenLightingScore", c.videoUnevenLightingScore);
    readValue(s, "videoTooDarkScore", c.videoTooDarkScore);
    readValue(s, "videoOverexposedScore", c.videoOverexposedScore);
}

void parseEngine(const json& s, diagnostics::EngineConfig& c) {
    readValue(s, "audioBudgetMs", c.audioBudgetMs);
    readValue(s, "videoBudgetMs", c.videoBudgetMs);
    readValue(s, "networkBudgetMs", c.networkBudgetMs);
    readValue(s, "cycleBudgetMs", c.cycleBudgetMs);
}

} // namespace

Config Config::load(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        Logger::warn("Config file not found: " + configPath + ", using defaults");
        return Config();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Config config = fromJson(buffer.str());
    Logger::info("Loaded configuration from " + configPath);
    return config;
}

Config Config::fromJson(const std::string& jsonText) {
    Config config;

    try {
        const json root = json::parse(jsonText);
        if (!root.is_object()) {
            throw ConfigurationException("Configuration document must be a JSON object");
        }

        readValue(root, "logLevel", config.logLevel_);

        if (const json* section = findSection(root, "audio")) {
            parseAudio(*section, config.audio_);
        }
        if (const json* section = findSection(root, "video")) {
            parseVideo(*section, config.video_);
        }
        if (const json* section = findSection(root, "network")) {
            parseNetwork(*section, config.network_);
        }

        // The OK-score reference level follows the audio optimum unless set explicitly
        config.composite_.audioRmsOptimal = config.audio_.rmsOptimal;
        if (const json* section = findSection(root, "composite")) {
            parseComposite(*section, config.composite_);
        }
        if (const json* section = findSection(root, "engine")) {
            parseEngine(*section, config.engine_);
        }
    } catch (const json::exception& e) {
        throw ConfigurationException("Invalid configuration document", e.what());
    }

    config.validate();
    return config;
}

std::string Config::toJson() const {
    json j;

    j["logLevel"] = logLevel_;

    j["audio"] = {
        {"rmsLow", audio_.rmsLow},
        {"rmsOptimal", audio_.rmsOptimal},
        {"rmsHigh", audio_.rmsHigh},
        {"clippingPercentThreshold", audio_.clippingPercentThreshold},
        {"clippingMagnitude", audio_.clippingMagnitude},
        {"noiseSensitivity", audio_.noiseSensitivity},
        {"noiseFloorPercentile", audio_.noiseFloorPercentile},
        {"backgroundNoiseCeiling", audio_.backgroundNoiseCeiling},
        {"backgroundNoiseRatioThreshold", audio_.backgroundNoiseRatioThreshold},
        {"edgeGuardSamples", audio_.edgeGuardSamples},
        {"rmsWindowSize", audio_.rmsWindowSize}
    };

    j["video"] = {
        {"gridSize", video_.gridSize},
        {"brightnessLow", video_.brightnessLow},
        {"brightnessHigh", video_.brightnessHigh},
        {"uniformityThreshold", video_.uniformityThreshold},
        {"fluctuationThreshold", video_.fluctuationThreshold},
        {"historySize", video_.historySize}
    };

    j["network"] = {
        {"historySize", network_.historySize},
        {"latencyHistorySize", network_.latencyHistorySize},
        {"bitrateCritical", network_.bitrateCritical},
        {"bitratePoor", network_.bitratePoor},
        {"bitrateModerate", network_.bitrateModerate},
        {"latencyModerate", network_.latencyModerate},
        {"latencyPoor", network_.latencyPoor},
        {"latencyCritical", network_.latencyCritical},
        {"packetLossModerate", network_.packetLossModerate},
        {"packetLossPoor", network_.packetLossPoor},
        {"jitterThreshold", network_.jitterThreshold},
        {"minViableFps", network_.minViableFps},
        {"moderateFps", network_.moderateFps},
        {"maxFrameDropRatio", network_.maxFrameDropRatio},
        {"bitrateStabilityThreshold", network_.bitrateStabilityThreshold},
        {"lossStabilityThreshold", network_.lossStabilityThreshold},
        {"bitrateOptimal", network_.bitrateOptimal},
        {"packetLossSpan", network_.packetLossSpan},
        {"latencySpan", network_.latencySpan},
        {"targetFps", network_.targetFps},
        {"lossTrendPoints", network_.lossTrendPoints},
        {"bitrateStabilityScale", network_.bitrateStabilityScale},
        {"lossStabilityScale", network_.lossStabilityScale},
        {"jitterStabilityScale", network_.jitterStabilityScale},
        {"rttStabilityScale", network_.rttStabilityScale},
        {"bitrateStabilityWeight", network_.bitrateStabilityWeight},
        {"lossStabilityWeight", network_.lossStabilityWeight},
        {"jitterStabilityWeight", network_.jitterStabilityWeight},
        {"rttStabilityWeight", network_.rttStabilityWeight},
        {"currentWeight", network_.currentWeight},
        {"stabilityWeight", network_.stabilityWeight}
    };

    j["composite"] = {
        {"videoWeight", composite_.videoWeight},
        {"audioWeight", composite_.audioWeight},
        {"networkWeight", composite_.networkWeight},
        {"audioOkFloor", composite_.audioOkFloor},
        {"audioOkDeviationGain", composite_.audioOkDeviationGain},
        {"audioRmsOptimal", composite_.audioRmsOptimal.value_or(audio_.rmsOptimal)},
        {"audioBackgroundNoiseScore", composite_.audioBackgroundNoiseScore},
        {"audioTooQuietScore", composite_.audioTooQuietScore},
        {"audioTooLoudScore", composite_.audioTooLoudScore},
        {"audioClippingScore", composite_.audioClippingScore},
        {"videoOkBase", composite_.videoOkBase},
        {"videoOkUniformityBonus", composite_.videoOkUniformityBonus},
        {"videoAdjustCameraScore", composite_.videoAdjustCameraScore},
        {"videoUnevenLightingScore", composite_.videoUnevenLightingScore},
        {"videoTooDarkScore", composite_.videoTooDarkScore},
        {"videoOverexposedScore", composite_.videoOverexposedScore}
    };

    j["engine"] = {
        {"audioBudgetMs", engine_.audioBudgetMs},
        {"videoBudgetMs", engine_.videoBudgetMs},
        {"networkBudgetMs", engine_.networkBudgetMs},
        {"cycleBudgetMs", engine_.cycleBudgetMs}
    };

    return j.dump(2);
}

void Config::validate() const {
    if (!isKnownLogLevel(logLevel_)) {
        throw ConfigurationException("Unknown log level '" + logLevel_ + "'", "logLevel");
    }

    requireNonNegative(audio_.rmsLow, "audio.rmsLow");
    requireNonNegative(audio_.rmsOptimal, "audio.rmsOptimal");
    requireNonNegative(audio_.rmsHigh, "audio.rmsHigh");
    if (audio_.rmsLow > audio_.rmsHigh) {
        throw ConfigurationException("rmsLow must not exceed rmsHigh", "audio.rmsLow");
    }
    requireRange(audio_.clippingPercentThreshold, 0.0, 100.0, "audio.clippingPercentThreshold");
    requireRange(audio_.clippingMagnitude, 0.0, 1.0, "audio.clippingMagnitude");
    requireNonNegative(audio_.noiseSensitivity, "audio.noiseSensitivity");
    requireRange(audio_.noiseFloorPercentile, 0.0, 100.0, "audio.noiseFloorPercentile");
    requireRange(audio_.backgroundNoiseCeiling, 0.0, 1.0, "audio.backgroundNoiseCeiling");
    requireRange(audio_.backgroundNoiseRatioThreshold, 0.0, 100.0, "audio.backgroundNoiseRatioThreshold");
    requirePositive(static_cast<double>(audio_.rmsWindowSize), "audio.rmsWindowSize");

    requirePositive(video_.gridSize, "video.gridSize");
    requireNonNegative(video_.brightnessLow, "video.brightnessLow");
    requireNonNegative(video_.brightnessHigh, "video.brightnessHigh");
    if (video_.brightnessLow > video_.brightnessHigh) {
        throw ConfigurationException("brightnessLow must not exceed brightnessHigh", "video.brightnessLow");
    }
    requireNonNegative(video_.uniformityThreshold, "video.uniformityThreshold");
    requireNonNegative(video_.fluctuationThreshold, "video.fluctuationThreshold");
    requirePositive(static_cast<double>(video_.historySize), "video.historySize");

    requirePositive(static_cast<double>(network_.historySize), "network.historySize");
    requireRange(static_cast<double>(network_.latencyHistorySize), 1.0,
                 static_cast<double>(kMaxLatencyHistory), "network.latencyHistorySize");
    requireNonNegative(network_.bitrateCritical, "network.bitrateCritical");
    requireNonNegative(network_.bitratePoor, "network.bitratePoor");
    requireNonNegative(network_.bitrateModerate, "network.bitrateModerate");
    requireNonNegative(network_.latencyModerate, "network.latencyModerate");
    requireNonNegative(network_.latencyPoor, "network.latencyPoor");
    requireNonNegative(network_.latencyCritical, "network.latencyCritical");
    requireRange(network_.packetLossModerate, 0.0, 100.0, "network.packetLossModerate");
    requireRange(network_.packetLossPoor, 0.0, 100.0, "network.packetLossPoor");
    requireNonNegative(network_.jitterThreshold, "network.jitterThreshold");
    requireNonNegative(network_.minViableFps, "network.minViableFps");
    requireNonNegative(network_.moderateFps, "network.moderateFps");
    requireRange(network_.maxFrameDropRatio, 0.0, 1.0, "network.maxFrameDropRatio");
    requireNonNegative(network_.bitrateStabilityThreshold, "network.bitrateStabilityThreshold");
    requireNonNegative(network_.lossStabilityThreshold, "network.lossStabilityThreshold");
    requirePositive(network_.bitrateOptimal, "network.bitrateOptimal");
    requirePositive(network_.packetLossSpan, "network.packetLossSpan");
    requirePositive(network_.latencySpan, "network.latencySpan");
    requirePositive(network_.targetFps, "network.targetFps");
    if (network_.lossTrendPoints < 2) {
        throw ConfigurationException("lossTrendPoints must be at least 2", "network.lossTrendPoints");
    }
    requirePositive(network_.bitrateStabilityScale, "network.bitrateStabilityScale");
    requirePositive(network_.lossStabilityScale, "network.lossStabilityScale");
    requirePositive(network_.jitterStabilityScale, "network.jitterStabilityScale");
    requirePositive(network_.rttStabilityScale, "network.rttStabilityScale");
    requireNonNegative(network_.bitrateStabilityWeight, "network.bitrateStabilityWeight");
    requireNonNegative(network_.lossStabilityWeight, "network.lossStabilityWeight");
    requireNonNegative(network_.jitterStabilityWeight, "network.jitterStabilityWeight");
    requireNonNegative(network_.rttStabilityWeight, "network.rttStabilityWeight");
    requireNonNegative(network_.currentWeight, "network.currentWeight");
    requireNonNegative(network_.stabilityWeight, "network.stabilityWeight");

    requireNonNegative(composite_.videoWeight, "composite.videoWeight");
    requireNonNegative(composite_.audioWeight, "composite.audioWeight");
    requireNonNegative(composite_.networkWeight, "composite.networkWeight");
    requireRange(composite_.audioOkFloor, 0.0, 100.0, "composite.audioOkFloor");
    requireNonNegative(composite_.audioOkDeviationGain, "composite.audioOkDeviationGain");
    requireNonNegative(composite_.audioRmsOptimal.value_or(audio_.rmsOptimal), "composite.audioRmsOptimal");
    requireRange(composite_.audioBackgroundNoiseScore, 0.0, 100.0, "composite.audioBackgroundNoiseScore");
    requireRange(composite_.audioTooQuietScore, 0.0, 100.0, "composite.audioTooQuietScore");
    requireRange(composite_.audioTooLoudScore, 0.0, 100.0, "composite.audioTooLoudScore");
    requireRange(composite_.audioClippingScore, 0.0, 100.0, "composite.audioClippingScore");
    requireRange(composite_.videoOkBase, 0.0, 100.0, "composite.videoOkBase");
    requireNonNegative(composite_.videoOkUniformityBonus, "composite.videoOkUniformityBonus");
    requireRange(composite_.videoAdjustCameraScore, 0.0, 100.0, "composite.videoAdjustCameraScore");
    requireRange(composite_.videoUnevenLightingScore, 0.0, 100.0, "composite.videoUnevenLightingScore");
    requireRange(composite_.videoTooDarkScore, 0.0, 100.0, "composite.videoTooDarkScore");
    requireRange(composite_.videoOverexposedScore, 0.0, 100.0, "composite.videoOverexposedScore");

    requirePositive(engine_.audioBudgetMs, "engine.audioBudgetMs");
    requirePositive(engine_.videoBudgetMs, "engine.videoBudgetMs");
    requirePositive(engine_.networkBudgetMs, "engine.networkBudgetMs");
    requirePositive(engine_.cycleBudgetMs, "engine.cycleBudgetMs");
}

} // namespace utils
} // namespace streamready
