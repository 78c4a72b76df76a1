#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "diagnostic_log.hpp"

namespace sewerflow {

// How an Offline range interacts with a Discharging range covering the same
// samples when resampling a monitor history.
enum class OverlapPolicy {
    kIndependent,
    kOfflineSuppressesActivity,
};

bool ParseOverlapPolicy(std::string_view name, OverlapPolicy &policy);

inline constexpr double kChannelThreshold = 0.9;

struct EngineConfig {
    std::chrono::hours recent_window{48};
    double channel_threshold = kChannelThreshold;
    OverlapPolicy overlap_policy = OverlapPolicy::kIndependent;
    std::filesystem::path log_path{"/var/log/sewerflow/diagnostics.log"};
    std::uintmax_t log_max_bytes = kDefaultMaxLogBytes;
};

// Defaults overridden by SEWERFLOW_LOG_PATH, SEWERFLOW_LOG_MAX_BYTES and
// SEWERFLOW_OVERLAP_POLICY. Unparsable values leave the default in place.
EngineConfig LoadEngineConfigFromEnv();

// File backed log at config.log_path, rotating past config.log_max_bytes.
std::unique_ptr<DiagnosticLog> OpenDiagnosticLog(const EngineConfig &config, std::string source);

}  // namespace sewerflow
