#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "diagnostic_log.hpp"
#include "event.hpp"
#include "monitor.hpp"

namespace sewerflow {

// Per-operator access to monitor status and event history. One
// implementation per data source, chosen when the network is built.
class MonitorSource {
  public:
    virtual ~MonitorSource() = default;

    virtual std::vector<Monitor> FetchActiveMonitors(const std::string &network_name) = 0;
    // Chronological (oldest first) history of one monitor.
    virtual std::vector<Event> FetchMonitorHistory(const Monitor &monitor) = 0;
};

// Reads monitors and events from JSON-lines files, one object per line.
//
// Monitor lines: {"id", "permit", "x", "y", "watercourse", optional "status"
// with "statusStart", optional "recent48h"}. Event lines use SerializeEvent.
// Malformed lines, and open events followed by a later event of the same
// monitor, are skipped and reported to the log. Events are re-read on every
// FetchActiveMonitors call.
class JsonLinesMonitorSource : public MonitorSource {
  public:
    JsonLinesMonitorSource(std::filesystem::path monitors_path, std::filesystem::path events_path,
                           DiagnosticLog &log);

    std::vector<Monitor> FetchActiveMonitors(const std::string &network_name) override;
    std::vector<Event> FetchMonitorHistory(const Monitor &monitor) override;

  private:
    struct NumberedEvent {
        Event event;
        std::size_t line_number = 0;
    };

    void load_events();
    void report_malformed(const std::filesystem::path &path, std::size_t line_number, const std::string &reason);

    std::filesystem::path monitors_path_;
    std::filesystem::path events_path_;
    DiagnosticLog &log_;
    std::optional<std::map<std::string, std::vector<Event>, std::less<>>> events_by_monitor_;
};

std::optional<Monitor> DeserializeMonitor(std::string_view json, const std::string &network_name);

}  // namespace sewerflow
