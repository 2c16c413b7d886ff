#include "diagnostics/audio_analyzer.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace streamready {
namespace diagnostics {

AudioAnalyzer::AudioAnalyzer(const AudioAnalyzerConfig& config,
                             std::shared_ptr<AudioFrameSource> source)
    : config_(config), source_(std::move(source)), rmsWindow_(config.rmsWindowSize) {
}

AudioAnalysis AudioAnalyzer::analyze() {
    if (!source_) {
        return AudioAnalysis();
    }

    try {
        frameBuffer_.resize(source_->fftSize());
        source_->readFrequencyData(frameBuffer_);
    } catch (const std::exception& e) {
        reportCaptureFailure(e, utils::ErrorCategory::AUDIO_CAPTURE, "AudioAnalyzer");
        return AudioAnalysis();
    }
    return analyzeFrame(frameBuffer_);
}

AudioAnalysis AudioAnalyzer::analyzeFrame(const std::vector<uint8_t>& frame) {
    AudioAnalysis analysis;

    if (frame.empty()) {
        return analysis;
    }

    const std::vector<float> samples = normalizeFrame(frame);

    analysis.rms = calculateRms(samples);
    analysis.clippingPercent = calculateClippingPercent(samples);
    analysis.noiseFloor = estimateNoiseFloor(samples);
    analysis.backgroundNoiseRatio = calculateBackgroundNoiseRatio(samples, analysis.noiseFloor);
    analysis.clipping = analysis.clippingPercent > config_.clippingPercentThreshold;

    rmsWindow_.push(analysis.rms);

    analysis.status = resolveStatus(analysis.rms, analysis.clippingPercent,
                                    analysis.backgroundNoiseRatio);
    return analysis;
}

std::vector<float> AudioAnalyzer::normalizeFrame(const std::vector<uint8_t>& frame) {
    std::vector<float> samples;
    samples.reserve(frame.size());
    for (uint8_t value : frame) {
        samples.push_back((static_cast<float>(value) - 128.0f) / 128.0f);
    }
    return samples;
}

float AudioAnalyzer::calculateRms(const std::vector<float>& samples) const {
    const size_t guard = config_.edgeGuardSamples;
    if (samples.size() <= guard * 2) {
        return 0.0f;
    }

    double sum = 0.0;
    size_t count = 0;
    for (size_t i = guard; i < samples.size() - guard; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
        count++;
    }

    const double rms = std::sqrt(sum / static_cast<double>(count));
    return static_cast<float>(std::min(rms, 1.0));
}

float AudioAnalyzer::calculateClippingPercent(const std::vector<float>& samples) const {
    if (samples.empty()) {
        return 0.0f;
    }

    size_t clippedSamples = 0;
    for (float sample : samples) {
        if (std::abs(sample) >= config_.clippingMagnitude) {
            clippedSamples++;
        }
    }

    return static_cast<float>(clippedSamples) / static_cast<float>(samples.size()) * 100.0f;
}

float AudioAnalyzer::estimateNoiseFloor(const std::vector<float>& samples) const {
    std::vector<double> magnitudes;
    magnitudes.reserve(samples.size());
    for (float sample : samples) {
        magnitudes.push_back(std::abs(sample));
    }

    return static_cast<float>(stats::percentile(magnitudes, config_.noiseFloorPercentile));
}

float AudioAnalyzer::calculateBackgroundNoiseRatio(const std::vector<float>& samples,
                                                   float noiseFloor) const {
    if (samples.empty()) {
        return 0.0f;
    }

    const float noiseThreshold = noiseFloor * (1.0f + config_.noiseSensitivity);
    size_t noiseCount = 0;
    for (float sample : samples) {
        const float magnitude = std::abs(sample);
        if (magnitude > noiseThreshold && magnitude < config_.backgroundNoiseCeiling) {
            noiseCount++;
        }
    }

    return static_cast<float>(noiseCount) / static_cast<float>(samples.size()) * 100.0f;
}

AudioStatus AudioAnalyzer::resolveStatus(float rms, float clippingPercent,
                                         float backgroundNoiseRatio) const {
    // Clipping > Too Loud > Too Quiet > Background Noise > OK
    if (clippingPercent > config_.clippingPercentThreshold) {
        return AudioStatus::CLIPPING;
    }
    if (rms > config_.rmsHigh) {
        return AudioStatus::TOO_LOUD;
    }
    if (rms < config_.rmsLow) {
        return AudioStatus::TOO_QUIET;
    }
    if (backgroundNoiseRatio > config_.backgroundNoiseRatioThreshold && rms < config_.rmsOptimal) {
        return AudioStatus::BACKGROUND_NOISE;
    }
    return AudioStatus::OK;
}

float AudioAnalyzer::smoothedRms() const {
    return static_cast<float>(stats::mean(stats::toDoubles(rmsWindow_)));
}

void AudioAnalyzer::reset() {
    rmsWindow_.clear();
    utils::Logger::debug("AudioAnalyzer state reset");
}

} // namespace diagnostics
} // namespace streamready
