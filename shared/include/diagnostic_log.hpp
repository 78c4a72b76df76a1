#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "time_grid.hpp"

namespace sewerflow {

inline constexpr std::string_view kUnavailableData = "UnavailableData";
inline constexpr std::uintmax_t kDefaultMaxLogBytes = 5 * 1024 * 1024;

struct DiagnosticAttribute {
    std::string key;
    std::string value;
};

struct Diagnostic {
    std::string source;
    std::string category;
    std::string severity;
    std::string message;
    std::vector<DiagnosticAttribute> attributes;
    TimePoint timestamp{};
    std::uint64_t sequence = 0;
};

std::string SerializeDiagnostic(const Diagnostic &record);

// JSON-lines sink for non-fatal conditions (missing history, unknown flags,
// monitors outside the terrain grid). Writes to a file with size based
// rotation, or to a caller owned stream.
class DiagnosticLog {
  public:
    DiagnosticLog(std::filesystem::path log_path, std::string default_source,
                  std::uintmax_t max_bytes = kDefaultMaxLogBytes);
    DiagnosticLog(std::ostream &stream, std::string default_source);

    DiagnosticLog(const DiagnosticLog &) = delete;
    DiagnosticLog &operator=(const DiagnosticLog &) = delete;

    void Append(const Diagnostic &record);
    void Warn(std::string_view category, std::string message, std::vector<DiagnosticAttribute> attributes = {});
    // No-op for stream backed logs.
    void Rotate();

    std::uint64_t total_count() const;
    std::uint64_t warning_count() const;

  private:
    void open_stream();
    void ensure_directory();
    void rotate_locked(TimePoint now);
    std::string format_rotation_suffix() const;

    std::filesystem::path log_path_;
    std::ofstream file_stream_;
    std::ostream *stream_ = nullptr;
    mutable std::mutex mutex_;
    std::string default_source_;
    std::uintmax_t max_bytes_ = kDefaultMaxLogBytes;
    std::uint64_t next_sequence_ = 1;
    std::uint64_t entries_since_rotation_ = 0;
    std::uint64_t total_count_ = 0;
    std::uint64_t warning_count_ = 0;
};

}  // namespace sewerflow
