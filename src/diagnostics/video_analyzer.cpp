#include "diagnostics/video_analyzer.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace streamready {
namespace diagnostics {

std::vector<float> sampleLuminanceGrid(const PixelSource& source, int gridSize) {
    std::vector<float> luminances;

    const int width = source.width();
    const int height = source.height();
    if (width <= 0 || height <= 0 || gridSize <= 0) {
        return luminances;
    }

    const double blockWidth = static_cast<double>(width) / gridSize;
    const double blockHeight = static_cast<double>(height) / gridSize;
    const int w = static_cast<int>(std::ceil(blockWidth));
    const int h = static_cast<int>(std::ceil(blockHeight));

    luminances.reserve(static_cast<size_t>(gridSize) * gridSize);
    std::vector<uint8_t> region;

    for (int gridY = 0; gridY < gridSize; ++gridY) {
        for (int gridX = 0; gridX < gridSize; ++gridX) {
            const int x = static_cast<int>(std::floor(gridX * blockWidth));
            const int y = static_cast<int>(std::floor(gridY * blockHeight));

            source.readRegion(x, y, w, h, region);

            double totalLuminance = 0.0;
            size_t pixelCount = 0;
            for (size_t i = 0; i + 3 < region.size(); i += 4) {
                totalLuminance += rgbToLuminance(region[i], region[i + 1], region[i + 2]);
                pixelCount++;
            }

            luminances.push_back(pixelCount > 0
                                     ? static_cast<float>(totalLuminance / static_cast<double>(pixelCount))
                                     : 0.0f);
        }
    }

    return luminances;
}

VideoAnalyzer::VideoAnalyzer(const VideoAnalyzerConfig& config, std::shared_ptr<PixelSource> source)
    : config_(config), source_(std::move(source)), brightnessHistory_(config.historySize) {
}

VideoAnalysis VideoAnalyzer::analyze() {
    if (!source_) {
        return VideoAnalysis();
    }

    std::vector<float> luminances;
    try {
        luminances = sampleLuminanceGrid(*source_, config_.gridSize);
    } catch (const std::exception& e) {
        reportCaptureFailure(e, utils::ErrorCategory::VIDEO_CAPTURE, "VideoAnalyzer");
        return VideoAnalysis();
    }
    return analyzeGrid(luminances);
}

VideoAnalysis VideoAnalyzer::analyzeGrid(const std::vector<float>& luminances) {
    VideoAnalysis analysis;

    if (luminances.empty()) {
        return analysis;
    }

    const std::vector<double> cells(luminances.begin(), luminances.end());
    const double brightness = stats::mean(cells);
    const double stdDev = stats::stdDev(cells);

    analysis.brightness = static_cast<float>(brightness);
    analysis.uniformityStandardDev = static_cast<float>(stdDev);
    analysis.uniformityScore = static_cast<float>(1.0 - std::min(stdDev / 255.0, 1.0));

    brightnessHistory_.push(analysis.brightness);
    analysis.fluctuation = currentFluctuation();

    analysis.status = resolveStatus(analysis.brightness, analysis.uniformityStandardDev,
                                    analysis.fluctuation);
    return analysis;
}

VideoStatus VideoAnalyzer::resolveStatus(float brightness, float uniformityStdDev,
                                         float fluctuation) const {
    // Overexposed > Too Dark > Uneven Lighting > Adjust Camera > OK
    if (brightness > config_.brightnessHigh) {
        return VideoStatus::OVEREXPOSED;
    }
    if (brightness < config_.brightnessLow) {
        return VideoStatus::TOO_DARK;
    }
    if (uniformityStdDev > config_.uniformityThreshold) {
        return VideoStatus::UNEVEN_LIGHTING;
    }
    if (fluctuation > config_.fluctuationThreshold) {
        return VideoStatus::ADJUST_CAMERA;
    }
    return VideoStatus::OK;
}

float VideoAnalyzer::currentFluctuation() const {
    return static_cast<float>(stats::meanAbsoluteDeviation(stats::toDoubles(brightnessHistory_)));
}

void VideoAnalyzer::reset() {
    brightnessHistory_.clear();
    utils::Logger::debug("VideoAnalyzer state reset");
}

} // namespace diagnostics
} // namespace streamready
