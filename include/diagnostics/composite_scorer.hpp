#pragma once

#include "diagnostics/audio_analyzer.hpp"
#include "diagnostics/network_analyzer.hpp"
#include "diagnostics/quality_status.hpp"
#include "diagnostics/video_analyzer.hpp"
#include <optional>

namespace streamready {
namespace diagnostics {

// Sub-scores are integers in [0, 100]
struct QualityScore {
    int audioScore;
    int videoScore;
    int networkScore;
    int overallQuality;

    QualityScore() : audioScore(0), videoScore(0), networkScore(0), overallQuality(0) {}
};

struct CompositeScorerConfig {
    double videoWeight;
    double audioWeight;
    double networkWeight;

    // Audio status lookup
    double audioOkFloor;
    double audioOkDeviationGain;      // points lost per unit of |rms - rmsOptimal|
    std::optional<double> audioRmsOptimal;  // unset: the audio analyzer's rmsOptimal
    double audioBackgroundNoiseScore;
    double audioTooQuietScore;
    double audioTooLoudScore;
    double audioClippingScore;

    // Video status lookup
    double videoOkBase;
    double videoOkUniformityBonus;
    double videoAdjustCameraScore;
    double videoUnevenLightingScore;
    double videoTooDarkScore;
    double videoOverexposedScore;

    CompositeScorerConfig()
        : videoWeight(0.4), audioWeight(0.4), networkWeight(0.2),
          audioOkFloor(85.0), audioOkDeviationGain(500.0),
          audioBackgroundNoiseScore(70.0), audioTooQuietScore(50.0),
          audioTooLoudScore(40.0), audioClippingScore(0.0),
          videoOkBase(85.0), videoOkUniformityBonus(15.0), videoAdjustCameraScore(70.0),
          videoUnevenLightingScore(60.0), videoTooDarkScore(50.0), videoOverexposedScore(40.0) {}
};

/**
 * Stateless conversion of analyzer outputs into numeric sub-scores and a
 * categorical overall status. The two judgments are independent and need
 * not agree.
 */
class CompositeScorer {
public:
    explicit CompositeScorer(const CompositeScorerConfig& config = CompositeScorerConfig());

    int audioStatusToScore(const AudioAnalysis& audio) const;
    int videoStatusToScore(const VideoAnalysis& video) const;

    /**
     * Map each analysis onto [0, 100] and combine them
     * @return Rounded sub-scores; overallQuality = round(wV*video + wA*audio + wN*network)
     *         over the unrounded sub-scores
     */
    QualityScore calculateQualityScore(const AudioAnalysis& audio,
                                       const VideoAnalysis& video,
                                       const NetworkAnalysis& network) const;

    /**
     * Severity lattice over the three raw statuses:
     * any critical-set status => Critical, else any poor-set status => Poor,
     * else all best => Good, else Moderate
     */
    static OverallStatus calculateOverallStatus(AudioStatus audio, VideoStatus video, NetworkStatus network);

    const CompositeScorerConfig& getConfig() const { return config_; }

private:
    double audioRawScore(const AudioAnalysis& audio) const;
    double videoRawScore(const VideoAnalysis& video) const;

    CompositeScorerConfig config_;
};

} // namespace diagnostics
} // namespace streamready
