#pragma once

#include "diagnostics/capture_sources.hpp"
#include "diagnostics/quality_status.hpp"
#include "diagnostics/statistics.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace streamready {
namespace diagnostics {

// Audio analysis result for one frame
struct AudioAnalysis {
    float rms;                     // [0, 1]
    bool clipping;                 // clippingPercent above threshold
    float clippingPercent;         // [0, 100]
    float noiseFloor;              // [0, 1], low-percentile magnitude
    float backgroundNoiseRatio;    // [0, 100], share of noise-like samples
    AudioStatus status;

    AudioAnalysis()
        : rms(0.0f), clipping(false), clippingPercent(0.0f), noiseFloor(0.0f),
          backgroundNoiseRatio(0.0f), status(AudioStatus::OK) {}
};

// Configuration for audio analysis
struct AudioAnalyzerConfig {
    float rmsLow;                          // below => Too Quiet
    float rmsOptimal;                      // center of the speech range
    float rmsHigh;                         // above => Too Loud
    float clippingPercentThreshold;        // percent of clipped samples that is audible
    float clippingMagnitude;               // normalized magnitude counted as clipped
    float noiseSensitivity;                // multiplier above the noise floor
    float noiseFloorPercentile;            // percentile used for the noise floor
    float backgroundNoiseCeiling;          // magnitudes at or above are signal, not noise
    float backgroundNoiseRatioThreshold;   // percent of noise-like samples
    size_t edgeGuardSamples;               // skipped at each end for RMS
    size_t rmsWindowSize;                  // rolling RMS history

    AudioAnalyzerConfig()
        : rmsLow(0.01f), rmsOptimal(0.08f), rmsHigh(0.70f),
          clippingPercentThreshold(5.0f), clippingMagnitude(0.95f),
          noiseSensitivity(0.15f), noiseFloorPercentile(5.0f),
          backgroundNoiseCeiling(0.3f), backgroundNoiseRatioThreshold(40.0f),
          edgeGuardSamples(10), rmsWindowSize(512) {}
};

/**
 * Audio quality analyzer
 *
 * Status is resolved from the instantaneous frame only. The RMS window is
 * bookkeeping for callers that want a smoothed level.
 */
class AudioAnalyzer {
public:
    explicit AudioAnalyzer(const AudioAnalyzerConfig& config = AudioAnalyzerConfig(),
                           std::shared_ptr<AudioFrameSource> source = nullptr);

    /**
     * Pull one frame from the attached source and analyze it
     * @return zeroed OK analysis when no source is attached or the read fails
     */
    AudioAnalysis analyze();

    /**
     * Analyze a frame pushed by the caller
     * @param frame Byte magnitudes, 128 = silence
     */
    AudioAnalysis analyzeFrame(const std::vector<uint8_t>& frame);

    // Individual metric calculations on normalized samples in [-1, 1]
    float calculateRms(const std::vector<float>& samples) const;
    float calculateClippingPercent(const std::vector<float>& samples) const;
    float estimateNoiseFloor(const std::vector<float>& samples) const;
    float calculateBackgroundNoiseRatio(const std::vector<float>& samples, float noiseFloor) const;
    AudioStatus resolveStatus(float rms, float clippingPercent, float backgroundNoiseRatio) const;

    static std::vector<float> normalizeFrame(const std::vector<uint8_t>& frame);

    void attachSource(std::shared_ptr<AudioFrameSource> source) { source_ = std::move(source); }
    bool hasSource() const { return source_ != nullptr; }

    const stats::RollingWindow<float>& rmsHistory() const { return rmsWindow_; }
    float smoothedRms() const;
    void reset();

    const AudioAnalyzerConfig& getConfig() const { return config_; }

private:
    AudioAnalyzerConfig config_;
    std::shared_ptr<AudioFrameSource> source_;
    stats::RollingWindow<float> rmsWindow_;
    std::vector<uint8_t> frameBuffer_;
};

} // namespace diagnostics
} // namespace streamready
