#pragma once

#include "diagnostics/diagnostic_snapshot.hpp"
#include <nlohmann/json.hpp>

namespace streamready {
namespace diagnostics {

// Read-only views for the presentation layer. Statuses use their display literals.
nlohmann::json toJson(const AudioAnalysis& audio);
nlohmann::json toJson(const VideoAnalysis& video);
nlohmann::json toJson(const NetworkAnalysis& network);
nlohmann::json toJson(const QualityScore& score);
nlohmann::json toJson(const DiagnosticSnapshot& snapshot);

} // namespace diagnostics
} // namespace streamready
