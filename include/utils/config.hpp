#pragma once

#include "diagnostics/audio_analyzer.hpp"
#include "diagnostics/composite_scorer.hpp"
#include "diagnostics/diagnostics_engine.hpp"
#include "diagnostics/network_analyzer.hpp"
#include "diagnostics/video_analyzer.hpp"
#include <string>

namespace streamready {
namespace utils {

/**
 * Effective configuration of the diagnostics engine.
 *
 * JSON layout: optional top-level objects "audio", "video", "network",
 * "composite" and "engine" plus the string "logLevel". Absent keys keep
 * their defaults.
 */
class Config {
public:
    Config() = default;

    /**
     * Load from a JSON file. A missing file yields defaults and a warning.
     * @throws ConfigurationException on malformed JSON or out-of-domain values
     */
    static Config load(const std::string& configPath);

    /**
     * @throws ConfigurationException on malformed JSON or out-of-domain values
     */
    static Config fromJson(const std::string& jsonText);

    std::string toJson() const;

    // Throws ConfigurationException naming the first offending key
    void validate() const;

    std::string getLogLevel() const { return logLevel_; }
    const diagnostics::AudioAnalyzerConfig& getAudioConfig() const { return audio_; }
    const diagnostics::VideoAnalyzerConfig& getVideoConfig() const { return video_; }
    const diagnostics::NetworkAnalyzerConfig& getNetworkConfig() const { return network_; }
    const diagnostics::CompositeScorerConfig& getCompositeConfig() const { return composite_; }
    const diagnostics::EngineConfig& getEngineConfig() const { return engine_; }

    void setLogLevel(const std::string& level) { logLevel_ = level; }
    void setAudioConfig(const diagnostics::AudioAnalyzerConfig& config) { audio_ = config; }
    void setVideoConfig(const diagnostics::VideoAnalyzerConfig& config) { video_ = config; }
    void setNetworkConfig(const diagnostics::NetworkAnalyzerConfig& config) { network_ = config; }
    void setCompositeConfig(const diagnostics::CompositeScorerConfig& config) { composite_ = config; }
    void setEngineConfig(const diagnostics::EngineConfig& config) { engine_ = config; }

private:
    std::string logLevel_ = "INFO";
    diagnostics::AudioAnalyzerConfig audio_;
    diagnostics::VideoAnalyzerConfig video_;
    diagnostics::NetworkAnalyzerConfig network_;
    diagnostics::CompositeScorerConfig composite_;
    diagnostics::EngineConfig engine_;
};

} // namespace utils
} // namespace streamready
