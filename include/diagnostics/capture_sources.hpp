#pragma once

#include "utils/error_handler.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace streamready {
namespace diagnostics {

/**
 * Supplies one frame of byte frequency magnitudes per call.
 * Implemented by the capture layer around a real audio graph.
 */
class AudioFrameSource {
public:
    virtual ~AudioFrameSource() = default;

    virtual size_t fftSize() const = 0;

    /**
     * Fill the buffer with the latest frame
     * @param out Resized by the source to the frame length
     */
    virtual void readFrequencyData(std::vector<uint8_t>& out) = 0;
};

/**
 * Read access to an RGBA drawing surface.
 */
class PixelSource {
public:
    virtual ~PixelSource() = default;

    virtual int width() const = 0;
    virtual int height() const = 0;

    /**
     * Copy a sub-rectangle as tightly packed RGBA.
     * The rectangle is clipped to the surface; out receives (clipped w * clipped h * 4) bytes.
     */
    virtual void readRegion(int x, int y, int w, int h, std::vector<uint8_t>& out) const = 0;
};

// Outbound video RTP counters; any field may be missing from a given report
struct OutboundRtpStats {
    std::optional<uint64_t> bytesSent;
    std::optional<uint64_t> packetsSent;
    std::optional<int64_t> packetsLost;
    std::optional<double> framesPerSecond;
    std::optional<uint64_t> framesSent;
    std::optional<uint64_t> framesDropped;
};

// Selected transport pair
struct CandidatePairStats {
    std::optional<double> currentRoundTripTimeSec;
};

struct TransportStatsReport {
    std::chrono::steady_clock::time_point timestamp;
    std::optional<OutboundRtpStats> outboundVideo;
    std::optional<CandidatePairStats> candidatePair;

    TransportStatsReport() : timestamp(std::chrono::steady_clock::now()) {}
};

/**
 * Snapshot provider for the active transport.
 */
class TransportStatsSource {
public:
    virtual ~TransportStatsSource() = default;
    virtual TransportStatsReport collectStats() = 0;
};

/**
 * Report a failed source read to the ErrorHandler and count it under
 * diagnostics.capture_failures. StreamReadyExceptions keep their own category.
 */
void reportCaptureFailure(const std::exception& e, utils::ErrorCategory category, const std::string& context);

// In-memory sources used for replay, the demo driver and tests

class BufferAudioSource : public AudioFrameSource {
public:
    explicit BufferAudioSource(size_t fftSize = 2048);

    size_t fftSize() const override { return fftSize_; }
    void readFrequencyData(std::vector<uint8_t>& out) override;

    // Frames shorter than fftSize are padded with silence (128), longer ones truncated
    void setFrame(const std::vector<uint8_t>& frame);

private:
    size_t fftSize_;
    std::vector<uint8_t> frame_;
};

struct RgbaFrame {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels; // row-major RGBA

    RgbaFrame() = default;
    RgbaFrame(int w, int h, uint8_t r = 0, uint8_t g = 0, uint8_t b = 0);

    void setPixel(int x, int y, uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);
    void fillRect(int x, int y, int w, int h, uint8_t r, uint8_t g, uint8_t b);
};

class FramePixelSource : public PixelSource {
public:
    FramePixelSource() = default;
    explicit FramePixelSource(RgbaFrame frame);

    int width() const override { return frame_.width; }
    int height() const override { return frame_.height; }
    void readRegion(int x, int y, int w, int h, std::vector<uint8_t>& out) const override;

    void setFrame(RgbaFrame frame) { frame_ = std::move(frame); }
    const RgbaFrame& frame() const { return frame_; }

private:
    RgbaFrame frame_;
};

class ReplayStatsSource : public TransportStatsSource {
public:
    void enqueue(const TransportStatsReport& report);
    size_t pending() const { return reports_.size(); }

    // Returns the next queued report and repeats the last one once the queue drains.
    // Throws CaptureException when nothing was ever enqueued.
    TransportStatsReport collectStats() override;

private:
    std::deque<TransportStatsReport> reports_;
    std::optional<TransportStatsReport> last_;
};

} // namespace diagnostics
} // namespace streamready
