#include "config.hpp"

#include <cstdlib>
#include <string>
#include <utility>

namespace sewerflow {

bool ParseOverlapPolicy(std::string_view name, OverlapPolicy &policy) {
    if (name == "independent") {
        policy = OverlapPolicy::kIndependent;
        return true;
    }
    if (name == "offline-suppresses-activity") {
        policy = OverlapPolicy::kOfflineSuppressesActivity;
        return true;
    }
    return false;
}

EngineConfig LoadEngineConfigFromEnv() {
    EngineConfig config;
    const char *path = std::getenv("SEWERFLOW_LOG_PATH");
    if (path && *path) {
        config.log_path = path;
    }
    const char *max_bytes = std::getenv("SEWERFLOW_LOG_MAX_BYTES");
    if (max_bytes && *max_bytes) {
        try {
            const auto parsed = std::stoull(max_bytes);
            if (parsed > 0) {
                config.log_max_bytes = static_cast<std::uintmax_t>(parsed);
            }
        } catch (const std::exception &) {
            // Keep the default rotation size.
        }
    }
    const char *policy = std::getenv("SEWERFLOW_OVERLAP_POLICY");
    if (policy && *policy) {
        OverlapPolicy parsed = config.overlap_policy;
        if (ParseOverlapPolicy(policy, parsed)) {
            config.overlap_policy = parsed;
        }
    }
    return config;
}

std::unique_ptr<DiagnosticLog> OpenDiagnosticLog(const EngineConfig &config, std::string source) {
    return std::make_unique<DiagnosticLog>(config.log_path, std::move(source), config.log_max_bytes);
}

}  // namespace sewerflow
