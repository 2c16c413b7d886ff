#pragma once

#include "diagnostics/capture_sources.hpp"
#include "diagnostics/quality_status.hpp"
#include "diagnostics/statistics.hpp"
#include <memory>
#include <vector>

namespace streamready {
namespace diagnostics {

// Video analysis result for one frame
struct VideoAnalysis {
    float brightness;              // [0, 255], mean cell luminance
    float uniformityScore;         // [0, 1], 1 = perfectly even lighting
    float uniformityStandardDev;   // population stdDev of cell luminances
    float fluctuation;             // mean absolute deviation of recent brightness
    VideoStatus status;

    VideoAnalysis()
        : brightness(0.0f), uniformityScore(0.0f), uniformityStandardDev(0.0f),
          fluctuation(0.0f), status(VideoStatus::OK) {}
};

// Configuration for video analysis
struct VideoAnalyzerConfig {
    int gridSize;                  // cells per axis
    float brightnessLow;           // below => Too Dark
    float brightnessHigh;          // above => Overexposed
    float uniformityThreshold;     // cell stdDev above => Uneven Lighting
    float fluctuationThreshold;    // history deviation above => Adjust Camera
    size_t historySize;            // frame-level brightness history

    VideoAnalyzerConfig()
        : gridSize(16), brightnessLow(30.0f), brightnessHigh(180.0f),
          uniformityThreshold(30.0f), fluctuationThreshold(15.0f), historySize(10) {}
};

// ITU-R BT.709 luma
inline float rgbToLuminance(float r, float g, float b) {
    return 0.2126f * r + 0.7152f * g + 0.0722f * b;
}

/**
 * Average luminance of each cell of a gridSize x gridSize partition,
 * row-major. Cell (i, j) starts at floor(i * cellW) and spans ceil(cellW),
 * clipped to the surface. Empty when the surface has no pixels.
 */
std::vector<float> sampleLuminanceGrid(const PixelSource& source, int gridSize);

/**
 * Video lighting analyzer
 */
class VideoAnalyzer {
public:
    explicit VideoAnalyzer(const VideoAnalyzerConfig& config = VideoAnalyzerConfig(),
                           std::shared_ptr<PixelSource> source = nullptr);

    /**
     * Sample the attached surface and analyze it
     * @return zeroed OK analysis when no surface is attached, it is empty or the read fails
     */
    VideoAnalysis analyze();

    /**
     * Analyze pre-sampled cell luminances
     * @param luminances Cell luminances in [0, 255]
     */
    VideoAnalysis analyzeGrid(const std::vector<float>& luminances);

    VideoStatus resolveStatus(float brightness, float uniformityStdDev, float fluctuation) const;

    void attachSource(std::shared_ptr<PixelSource> source) { source_ = std::move(source); }
    bool hasSource() const { return source_ != nullptr; }

    const stats::RollingWindow<float>& brightnessHistory() const { return brightnessHistory_; }
    float currentFluctuation() const;
    void reset();

    const VideoAnalyzerConfig& getConfig() const { return config_; }

private:
    VideoAnalyzerConfig config_;
    std::shared_ptr<PixelSource> source_;
    stats::RollingWindow<float> brightnessHistory_;
};

} // namespace diagnostics
} // namespace streamready
