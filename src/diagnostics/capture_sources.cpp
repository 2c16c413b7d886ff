#include "diagnostics/capture_sources.hpp"
#include "utils/error_handler.hpp"
#include "utils/performance_monitor.hpp"
#include <algorithm>

namespace streamready {
namespace diagnostics {

namespace {

// Byte magnitude of a silent sample
constexpr uint8_t kSilence = 128;

} // namespace

void reportCaptureFailure(const std::exception& e, utils::ErrorCategory category, const std::string& context) {
    if (dynamic_cast<const utils::StreamReadyException*>(&e)) {
        utils::ErrorHandler::getInstance().reportError(e, context);
    } else {
        utils::ErrorHandler::getInstance().reportError(
            utils::ErrorInfo(category, utils::ErrorSeverity::ERROR, context + " capture failed", e.what(), context));
    }
    utils::PerformanceMonitor::getInstance().recordCounter(utils::PerformanceMonitor::METRIC_CAPTURE_FAILURES);
}

BufferAudioSource::BufferAudioSource(size_t fftSize)
    : fftSize_(fftSize), frame_(fftSize, kSilence) {
}

void BufferAudioSource::readFrequencyData(std::vector<uint8_t>& out) {
    out = frame_;
}

void BufferAudioSource::setFrame(const std::vector<uint8_t>& frame) {
    frame_.assign(fftSize_, kSilence);
    std::copy_n(frame.begin(), std::min(frame.size(), fftSize_), frame_.begin());
}

RgbaFrame::RgbaFrame(int w, int h, uint8_t r, uint8_t g, uint8_t b)
    : width(std::max(w, 0)), height(std::max(h, 0)) {
    pixels.resize(static_cast<size_t>(width) * height * 4);
    for (size_t i = 0; i < pixels.size(); i += 4) {
        pixels[i] = r;
        pixels[i + 1] = g;
        pixels[i + 2] = b;
        pixels[i + 3] = 255;
    }
}

void RgbaFrame::setPixel(int x, int y, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    if (x < 0 || y < 0 || x >= width || y >= height) {
        return;
    }
    const size_t offset = (static_cast<size_t>(y) * width + x) * 4;
    pixels[offset] = r;
    pixels[offset + 1] = g;
    pixels[offset + 2] = b;
    pixels[offset + 3] = a;
}

void RgbaFrame::fillRect(int x, int y, int w, int h, uint8_t r, uint8_t g, uint8_t b) {
    for (int row = y; row < y + h; ++row) {
        for (int col = x; col < x + w; ++col) {
            setPixel(col, row, r, g, b);
        }
    }
}

FramePixelSource::FramePixelSource(RgbaFrame frame) : frame_(std::move(frame)) {
}

void FramePixelSource::readRegion(int x, int y, int w, int h, std::vector<uint8_t>& out) const {
    out.clear();

    const int x0 = std::max(x, 0);
    const int y0 = std::max(y, 0);
    const int x1 = std::min(x + w, frame_.width);
    const int y1 = std::min(y + h, frame_.height);
    if (x1 <= x0 || y1 <= y0) {
        return;
    }

    out.reserve(static_cast<size_t>(x1 - x0) * (y1 - y0) * 4);
    for (int row = y0; row < y1; ++row) {
        const auto rowStart = frame_.pixels.begin() +
                              (static_cast<size_t>(row) * frame_.width + x0) * 4;
        out.insert(out.end(), rowStart, rowStart + static_cast<size_t>(x1 - x0) * 4);
    }
}

void ReplayStatsSource::enqueue(const TransportStatsReport& report) {
    reports_.push_back(report);
}

TransportStatsReport ReplayStatsSource::collectStats() {
    if (!reports_.empty()) {
        last_ = reports_.front();
        reports_.pop_front();
    }

    if (!last_) {
        throw utils::CaptureException(utils::ErrorCategory::NETWORK_STATS,
                                      "No transport stats available", "ReplayStatsSource");
    }
    return *last_;
}

} // namespace diagnostics
} // namespace streamready
