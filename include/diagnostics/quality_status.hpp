#pragma once

#include <string>

namespace streamready {
namespace diagnostics {

// Priority order is the declaration order of the resolution chain, not the enum order.

enum class AudioStatus {
    OK,
    TOO_QUIET,
    TOO_LOUD,
    BACKGROUND_NOISE,
    CLIPPING
};

enum class VideoStatus {
    OK,
    TOO_DARK,
    OVEREXPOSED,
    UNEVEN_LIGHTING,
    ADJUST_CAMERA
};

enum class NetworkStatus {
    GOOD,
    MODERATE,
    UNSTABLE,
    CRITICAL
};

enum class OverallStatus {
    GOOD,
    MODERATE,
    POOR,
    CRITICAL
};

// Fixed display literals consumed by the presentation layer
const char* toString(AudioStatus status);
const char* toString(VideoStatus status);
const char* toString(NetworkStatus status);
const char* toString(OverallStatus status);

} // namespace diagnostics
} // namespace streamready
