#include "monitor_source.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "errors.hpp"
#include "json_text.hpp"

namespace sewerflow {
namespace {
std::ifstream open_or_throw(const std::filesystem::path &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("unable to open monitor feed " + path.string());
    }
    return in;
}

bool is_blank(const std::string &line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
}
}  // namespace

std::optional<Monitor> DeserializeMonitor(std::string_view json, const std::string &network_name) {
    std::string id;
    double x = 0.0;
    double y = 0.0;
    if (!JsonExtractString(json, "id", id) || id.empty() || !JsonExtractNumber(json, "x", x) ||
        !JsonExtractNumber(json, "y", y)) {
        return std::nullopt;
    }
    std::string permit;
    std::string watercourse;
    JsonExtractString(json, "permit", permit);
    JsonExtractString(json, "watercourse", watercourse);

    std::optional<bool> recent;
    bool recent_value = false;
    if (JsonExtractBool(json, "recent48h", recent_value)) {
        recent = recent_value;
    }

    Monitor monitor(id, permit, Coordinate{x, y}, watercourse, network_name, recent);

    std::string status;
    TimePoint status_start{};
    if (JsonExtractString(json, "status", status)) {
        EventKind kind{};
        if (!ParseEventKind(status, kind) || !JsonExtractTimestamp(json, "statusStart", status_start)) {
            return std::nullopt;
        }
        monitor.SetCurrentEvent(Event::Ongoing(id, kind, status_start));
    }
    return monitor;
}

JsonLinesMonitorSource::JsonLinesMonitorSource(std::filesystem::path monitors_path,
                                               std::filesystem::path events_path, DiagnosticLog &log)
    : monitors_path_(std::move(monitors_path)), events_path_(std::move(events_path)), log_(log) {}

void JsonLinesMonitorSource::report_malformed(const std::filesystem::path &path, std::size_t line_number,
                                              const std::string &reason) {
    log_.Warn("MalformedRecord", reason,
              {{"path", path.string()}, {"line", std::to_string(line_number)}});
}

std::vector<Monitor> JsonLinesMonitorSource::FetchActiveMonitors(const std::string &network_name) {
    auto in = open_or_throw(monitors_path_);
    // A new monitor listing starts a new history cycle; pick up appended events.
    events_by_monitor_.reset();
    std::vector<Monitor> monitors;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (is_blank(line)) {
            continue;
        }
        auto monitor = DeserializeMonitor(line, network_name);
        if (!monitor) {
            report_malformed(monitors_path_, line_number, "monitor record is missing id, coordinates or status");
            continue;
        }
        monitors.push_back(std::move(*monitor));
    }
    return monitors;
}

void JsonLinesMonitorSource::load_events() {
    auto in = open_or_throw(events_path_);
    std::map<std::string, std::vector<NumberedEvent>, std::less<>> numbered;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (is_blank(line)) {
            continue;
        }
        try {
            auto event = DeserializeEvent(line);
            if (!event) {
                report_malformed(events_path_, line_number, "event record is missing monitor, kind or start");
                continue;
            }
            const std::string monitor_id = event->monitor_id();
            numbered[monitor_id].push_back(NumberedEvent{std::move(*event), line_number});
        } catch (const ValidationError &error) {
            report_malformed(events_path_, line_number, error.what());
        }
    }

    std::map<std::string, std::vector<Event>, std::less<>> events;
    for (auto &entry : numbered) {
        auto &records = entry.second;
        std::stable_sort(records.begin(), records.end(), [](const NumberedEvent &lhs, const NumberedEvent &rhs) {
            return lhs.event.start() < rhs.event.start();
        });
        // Only the newest event of a monitor may still be open.
        auto &history = events[entry.first];
        history.reserve(records.size());
        for (std::size_t i = 0; i < records.size(); ++i) {
            if (records[i].event.ongoing() && i + 1 != records.size()) {
                report_malformed(events_path_, records[i].line_number,
                                 "open event of monitor " + entry.first + " is superseded by a later event");
                continue;
            }
            history.push_back(std::move(records[i].event));
        }
    }
    events_by_monitor_ = std::move(events);
}

std::vector<Event> JsonLinesMonitorSource::FetchMonitorHistory(const Monitor &monitor) {
    if (!events_by_monitor_) {
        load_events();
    }
    auto it = events_by_monitor_->find(monitor.id());
    if (it == events_by_monitor_->end()) {
        return {};
    }
    return it->second;
}

}  // namespace sewerflow
