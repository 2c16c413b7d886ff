#pragma once

#include "diagnostics/audio_analyzer.hpp"
#include "diagnostics/composite_scorer.hpp"
#include "diagnostics/network_analyzer.hpp"
#include "diagnostics/video_analyzer.hpp"
#include <cstdint>

namespace streamready {
namespace diagnostics {

/**
 * One analysis cycle. Built once per cycle and replaced, never edited, by the next.
 */
struct DiagnosticSnapshot {
    AudioAnalysis audio;
    VideoAnalysis video;
    NetworkAnalysis network;
    QualityScore qualityScore;
    int64_t timestamp;              // milliseconds since the Unix epoch
    OverallStatus overallStatus;

    DiagnosticSnapshot() : timestamp(0), overallStatus(OverallStatus::GOOD) {}
};

} // namespace diagnostics
} // namespace streamready
