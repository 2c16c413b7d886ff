#include "diagnostics/composite_scorer.hpp"
#include <algorithm>
#include <cmath>

namespace streamready {
namespace diagnostics {

namespace {

const double kDefaultRmsOptimal = AudioAnalyzerConfig().rmsOptimal;

double clampScore(double value) {
    return std::min(std::max(value, 0.0), 100.0);
}

int toScore(double value) {
    return static_cast<int>(std::round(clampScore(value)));
}

bool isCritical(AudioStatus status) { return status == AudioStatus::TOO_LOUD; }
bool isCritical(VideoStatus status) { return status == VideoStatus::TOO_DARK; }
bool isCritical(NetworkStatus status) { return status == NetworkStatus::CRITICAL; }

bool isPoor(AudioStatus status) {
    return status == AudioStatus::TOO_QUIET || status == AudioStatus::CLIPPING;
}
bool isPoor(VideoStatus status) { return status == VideoStatus::OVEREXPOSED; }
bool isPoor(NetworkStatus status) { return status == NetworkStatus::UNSTABLE; }

} // namespace

CompositeScorer::CompositeScorer(const CompositeScorerConfig& config) : config_(config) {
}

double CompositeScorer::audioRawScore(const AudioAnalysis& audio) const {
    switch (audio.status) {
        case AudioStatus::OK: {
            const double deviation = std::abs(static_cast<double>(audio.rms) -
                                              config_.audioRmsOptimal.value_or(kDefaultRmsOptimal));
            return std::max(config_.audioOkFloor, 100.0 - config_.audioOkDeviationGain * deviation);
        }
        case AudioStatus::BACKGROUND_NOISE:
            return config_.audioBackgroundNoiseScore;
        case AudioStatus::TOO_QUIET:
            return config_.audioTooQuietScore;
        case AudioStatus::TOO_LOUD:
            return config_.audioTooLoudScore;
        case AudioStatus::CLIPPING:
            return config_.audioClippingScore;
    }
    return 0.0;
}

double CompositeScorer::videoRawScore(const VideoAnalysis& video) const {
    switch (video.status) {
        case VideoStatus::OK:
            return config_.videoOkBase + config_.videoOkUniformityBonus * video.uniformityScore;
        case VideoStatus::ADJUST_CAMERA:
            return config_.videoAdjustCameraScore;
        case VideoStatus::UNEVEN_LIGHTING:
            return config_.videoUnevenLightingScore;
        case VideoStatus::TOO_DARK:
            return config_.videoTooDarkScore;
        case VideoStatus::OVEREXPOSED:
            return config_.videoOverexposedScore;
    }
    return 0.0;
}

int CompositeScorer::audioStatusToScore(const AudioAnalysis& audio) const {
    return toScore(audioRawScore(audio));
}

int CompositeScorer::videoStatusToScore(const VideoAnalysis& video) const {
    return toScore(videoRawScore(video));
}

QualityScore CompositeScorer::calculateQualityScore(const AudioAnalysis& audio,
                                                    const VideoAnalysis& video,
                                                    const NetworkAnalysis& network) const {
    QualityScore score;
    score.audioScore = audioStatusToScore(audio);
    score.videoScore = videoStatusToScore(video);
    score.networkScore = toScore(network.stabilityScore);

    // Blend the unrounded sub-scores; rounding happens once, on the total
    score.overallQuality = toScore(config_.videoWeight * clampScore(videoRawScore(video)) +
                                   config_.audioWeight * clampScore(audioRawScore(audio)) +
                                   config_.networkWeight * clampScore(network.stabilityScore));
    return score;
}

OverallStatus CompositeScorer::calculateOverallStatus(AudioStatus audio, VideoStatus video,
                                                      NetworkStatus network) {
    if (isCritical(audio) || isCritical(video) || isCritical(network)) {
        return OverallStatus::CRITICAL;
    }
    if (isPoor(audio) || isPoor(video) || isPoor(network)) {
        return OverallStatus::POOR;
    }
    if (audio == AudioStatus::OK && video == VideoStatus::OK && network == NetworkStatus::GOOD) {
        return OverallStatus::GOOD;
    }
    return OverallStatus::MODERATE;
}

} // namespace diagnostics
} // namespace streamready
