#include "diagnostics/json_export.hpp"

namespace streamready {
namespace diagnostics {

nlohmann::json toJson(const AudioAnalysis& audio) {
    return {
        {"rms", audio.rms},
        {"clipping", audio.clipping},
        {"clippingPercent", audio.clippingPercent},
        {"noiseFloor", audio.noiseFloor},
        {"backgroundNoiseRatio", audio.backgroundNoiseRatio},
        {"status", toString(audio.status)}
    };
}

nlohmann::json toJson(const VideoAnalysis& video) {
    return {
        {"brightness", video.brightness},
        {"uniformityScore", video.uniformityScore},
        {"uniformityStandardDev", video.uniformityStandardDev},
        {"fluctuation", video.fluctuation},
        {"status", toString(video.status)}
    };
}

nlohmann::json toJson(const NetworkAnalysis& network) {
    return {
        {"bitrate", network.bitrateKbps},
        {"packetLoss", network.packetLoss},
        {"jitter", network.jitterMs},
        {"latency", network.latencyMs},
        {"framesPerSecond", network.framesPerSecond},
        {"frameDropRatio", network.frameDropRatio},
        {"bitrateStability", network.bitrateStability},
        {"lossStability", network.lossStability},
        {"jitterStability", network.jitterStability},
        {"rttStability", network.rttStability},
        {"stabilityScore", network.stabilityScore},
        {"status", toString(network.status)}
    };
}

nlohmann::json toJson(const QualityScore& score) {
    return {
        {"audioScore", score.audioScore},
        {"videoScore", score.videoScore},
        {"networkScore", score.networkScore},
        {"overallQuality", score.overallQuality}
    };
}

nlohmann::json toJson(const DiagnosticSnapshot& snapshot) {
    return {
        {"audio", toJson(snapshot.audio)},
        {"video", toJson(snapshot.video)},
        {"network", toJson(snapshot.network)},
        {"qualityScore", toJson(snapshot.qualityScore)},
        {"timestamp", snapshot.timestamp},
        {"overallStatus", toString(snapshot.overallStatus)}
    };
}

} // namespace diagnostics
} // namespace streamready
