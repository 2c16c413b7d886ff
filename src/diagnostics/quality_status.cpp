#include "diagnostics/quality_status.hpp"

namespace streamready {
namespace diagnostics {

const char* toString(AudioStatus status) {
    switch (status) {
        case AudioStatus::OK: return "OK";
        case AudioStatus::TOO_QUIET: return "Too Quiet";
        case AudioStatus::TOO_LOUD: return "Too Loud";
        case AudioStatus::BACKGROUND_NOISE: return "Background Noise";
        case AudioStatus::CLIPPING: return "Clipping";
    }
    return "OK";
}

const char* toString(VideoStatus status) {
    switch (status) {
        case VideoStatus::OK: return "OK";
        case VideoStatus::TOO_DARK: return "Too Dark";
        case VideoStatus::OVEREXPOSED: return "Overexposed";
        case VideoStatus::UNEVEN_LIGHTING: return "Uneven Lighting";
        case VideoStatus::ADJUST_CAMERA: return "Adjust Camera";
    }
    return "OK";
}

const char* toString(NetworkStatus status) {
    switch (status) {
        case NetworkStatus::GOOD: return "Good";
        case NetworkStatus::MODERATE: return "Moderate";
        case NetworkStatus::UNSTABLE: return "Unstable";
        case NetworkStatus::CRITICAL: return "Critical";
    }
    return "Good";
}

const char* toString(OverallStatus status) {
    switch (status) {
        case OverallStatus::GOOD: return "Good";
        case OverallStatus::MODERATE: return "Moderate";
        case OverallStatus::POOR: return "Poor";
        case OverallStatus::CRITICAL: return "Critical";
    }
    return "Good";
}

} // namespace diagnostics
} // namespace streamready
