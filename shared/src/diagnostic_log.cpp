#include "diagnostic_log.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "json_text.hpp"

namespace sewerflow {

std::string SerializeDiagnostic(const Diagnostic &record) {
    std::ostringstream oss;
    oss << '{';
    oss << "\"timestamp\":\"" << FormatUtcTimestamp(record.timestamp) << "\",";
    oss << "\"sequence\":" << record.sequence << ',';
    oss << "\"source\":\"" << JsonEscape(record.source) << "\",";
    oss << "\"category\":\"" << JsonEscape(record.category) << "\",";
    oss << "\"severity\":\"" << JsonEscape(record.severity) << "\",";
    oss << "\"message\":\"" << JsonEscape(record.message) << "\",";

    std::vector<DiagnosticAttribute> attributes = record.attributes;
    std::sort(attributes.begin(), attributes.end(), [](const auto &lhs, const auto &rhs) {
        if (lhs.key == rhs.key) {
            return lhs.value < rhs.value;
        }
        return lhs.key < rhs.key;
    });

    oss << "\"attributes\":[";
    for (std::size_t i = 0; i < attributes.size(); ++i) {
        const auto &attr = attributes[i];
        oss << "{\"key\":\"" << JsonEscape(attr.key) << "\",\"value\":\"" << JsonEscape(attr.value) << "\"}";
        if (i + 1 < attributes.size()) {
            oss << ',';
        }
    }
    oss << "]}";
    return oss.str();
}

DiagnosticLog::DiagnosticLog(std::filesystem::path log_path, std::string default_source, std::uintmax_t max_bytes)
    : log_path_(std::move(log_path)), default_source_(std::move(default_source)), max_bytes_(max_bytes) {
    ensure_directory();
    open_stream();
}

DiagnosticLog::DiagnosticLog(std::ostream &stream, std::string default_source)
    : stream_(&stream), default_source_(std::move(default_source)) {}

void DiagnosticLog::ensure_directory() {
    const auto directory = log_path_.parent_path();
    if (directory.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw std::system_error(ec, "unable to create diagnostic log directory " + directory.string());
    }
}

void DiagnosticLog::open_stream() {
    file_stream_.open(log_path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("unable to open diagnostic log " + log_path_.string());
    }
    stream_ = &file_stream_;
}

std::string DiagnosticLog::format_rotation_suffix() const {
    auto time_t_value = Clock::to_time_t(Clock::now());
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t_value);
#else
    gmtime_r(&time_t_value, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

void DiagnosticLog::Append(const Diagnostic &record) {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!log_path_.empty() && !file_stream_.is_open()) {
        open_stream();
    }
    Diagnostic enriched = record;
    if (enriched.sequence == 0) {
        enriched.sequence = next_sequence_++;
    } else if (enriched.sequence >= next_sequence_) {
        next_sequence_ = enriched.sequence + 1;
    }
    if (enriched.timestamp.time_since_epoch().count() == 0) {
        enriched.timestamp = now;
    }
    if (enriched.source.empty()) {
        enriched.source = default_source_;
    }
    if (enriched.category.empty()) {
        enriched.category = "General";
    }
    if (enriched.severity.empty()) {
        enriched.severity = "Info";
    }

    ++total_count_;
    if (enriched.severity == "Warning") {
        ++warning_count_;
    }

    *stream_ << SerializeDiagnostic(enriched) << '\n';
    stream_->flush();
    ++entries_since_rotation_;

    if (!log_path_.empty() && file_stream_.tellp() > static_cast<std::streamoff>(max_bytes_)) {
        rotate_locked(now);
    }
}

void DiagnosticLog::Warn(std::string_view category, std::string message, std::vector<DiagnosticAttribute> attributes) {
    Diagnostic record;
    record.category = std::string(category);
    record.severity = "Warning";
    record.message = std::move(message);
    record.attributes = std::move(attributes);
    Append(record);
}

void DiagnosticLog::Rotate() {
    if (log_path_.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    rotate_locked(Clock::now());
}

void DiagnosticLog::rotate_locked(TimePoint now) {
    file_stream_.close();

    auto rotated_name = log_path_;
    // The sequence keeps rotations within the same second apart.
    rotated_name += '.' + format_rotation_suffix() + '-' + std::to_string(next_sequence_ - 1);
    std::error_code ec;
    std::filesystem::rename(log_path_, rotated_name, ec);
    if (ec) {
        // Keep appending to the current file; the next append retries.
        open_stream();
        return;
    }

    std::filesystem::path manifest_path = rotated_name;
    manifest_path += ".manifest";
    std::ofstream manifest(manifest_path, std::ios::out | std::ios::trunc | std::ios::binary);
    manifest << "{\n";
    manifest << "  \"entries\": " << entries_since_rotation_ << ",\n";
    manifest << "  \"rotatedAt\": \"" << FormatUtcTimestamp(now) << "\"\n";
    manifest << "}\n";
    manifest.close();

    entries_since_rotation_ = 0;
    open_stream();
}

std::uint64_t DiagnosticLog::total_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_count_;
}

std::uint64_t DiagnosticLog::warning_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warning_count_;
}

}  // namespace sewerflow
