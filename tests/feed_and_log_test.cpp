#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "diagnostic_log.hpp"
#include "json_text.hpp"
#include "monitor_network.hpp"
#include "monitor_source.hpp"

namespace {
int g_failures = 0;

void expect(bool condition, const std::string &what) {
    if (!condition) {
        std::cerr << "FAILED: " << what << "\n";
        ++g_failures;
    }
}

void write_file(const std::filesystem::path &path, const std::string &contents) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    out << contents;
}

std::string read_file(const std::filesystem::path &path) {
    std::ifstream in(path);
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

std::size_t count_lines(const std::string &text) {
    std::size_t lines = 0;
    for (char c : text) {
        lines += c == '\n' ? 1 : 0;
    }
    return lines;
}
}  // namespace

int main() {
    using namespace sewerflow;
    namespace fs = std::filesystem;

    const auto stamp = std::to_string(Clock::now().time_since_epoch().count());
    const fs::path dir = fs::temp_directory_path() / ("sewerflow_feed_test_" + stamp);
    fs::create_directories(dir);

    // JSON helpers.
    expect(JsonEscape("a\"b\\c\n") == "a\\\"b\\\\c\\n", "escape quotes, backslashes and newlines");
    expect(JsonUnescape(JsonEscape("Mill \"Lane\"\t")) == "Mill \"Lane\"\t", "unescape reverses escape");
    expect(JsonNumber(0.5) == "0.5" && JsonNumber(std::numeric_limits<double>::infinity()) == "null",
           "number formatting");
    double number = 0.0;
    expect(JsonExtractNumber(R"({"x" : 451200.5})", "x", number) && number == 451200.5, "spaced colon");
    bool flag = false;
    expect(JsonExtractBool(R"({"recent48h":false})", "recent48h", flag) && !flag, "boolean extraction");
    std::string text;
    expect(!JsonExtractString(R"({"id":12})", "id", text), "numbers are not strings");

    // Monitor records.
    auto monitor = DeserializeMonitor(
        R"({"id":"Mill Lane","permit":"P-42","x":451200,"y":207300,"watercourse":"River Test",)"
        R"("status":"Discharging","statusStart":"2024-03-01T09:00:00Z","recent48h":true})",
        "Southern Water");
    expect(monitor.has_value(), "full monitor record parses");
    if (monitor) {
        expect(monitor->permit_number() == "P-42" && monitor->network_name() == "Southern Water",
               "monitor metadata");
        expect(monitor->CurrentStatus() == EventKind::kDischarging, "status becomes the current event");
        expect(monitor->CurrentEvent().start() == MakeUtcTime(2024, 3, 1, 9), "status start");
        expect(monitor->discharged_in_last_48h() == true, "48h flag");
    }
    auto minimal = DeserializeMonitor(R"({"id":"Bare","x":1,"y":2})", "Southern Water");
    expect(minimal && !minimal->has_current_event() && !minimal->discharged_in_last_48h(),
           "optional fields stay unknown");
    expect(!DeserializeMonitor(R"({"id":"No Coordinates"})", "Southern Water"), "coordinates are required");
    expect(!DeserializeMonitor(R"({"id":"Odd","x":1,"y":2,"status":"Flooding","statusStart":"2024-03-01T09:00:00Z"})",
                               "Southern Water"),
           "unknown status is rejected");

    // JSON-lines feed.
    const fs::path monitors_path = dir / "monitors.jsonl";
    const fs::path events_path = dir / "events.jsonl";
    write_file(monitors_path,
               "{\"id\":\"Mill Lane\",\"permit\":\"P-42\",\"x\":5,\"y\":25,\"watercourse\":\"River Test\"}\n"
               "\n"
               "not json\n"
               "{\"id\":\"Weir\",\"x\":25,\"y\":25,\"recent48h\":false}\n");
    write_file(events_path,
               "{\"monitor\":\"Mill Lane\",\"kind\":\"Discharging\",\"start\":\"2024-03-01T11:00:00Z\","
               "\"ongoing\":true}\n"
               "{\"monitor\":\"Mill Lane\",\"kind\":\"Offline\",\"start\":\"2024-03-01T08:00:00Z\","
               "\"end\":\"2024-03-01T09:00:00Z\"}\n"
               "{\"monitor\":\"Mill Lane\",\"kind\":\"Discharging\",\"start\":\"2024-03-01T10:00:00Z\","
               "\"end\":\"2024-03-01T09:00:00Z\"}\n"
               "{\"monitor\":\"Weir\",\"kind\":\"Sideways\",\"start\":\"2024-03-01T10:00:00Z\"}\n");

    std::ostringstream feed_diagnostics;
    DiagnosticLog feed_log(feed_diagnostics, "feed_and_log_test");
    JsonLinesMonitorSource source(monitors_path, events_path, feed_log);
    auto monitors = source.FetchActiveMonitors("Southern Water");
    expect(monitors.size() == 2, "two valid monitor lines");
    expect(feed_log.warning_count() == 1, "malformed monitor line reported");
    expect(feed_diagnostics.str().find("\"key\":\"line\",\"value\":\"3\"") != std::string::npos,
           "report carries the line number");

    if (monitors.size() == 2) {
        const auto history = source.FetchMonitorHistory(monitors[0]);
        expect(history.size() == 2, "valid events for Mill Lane");
        expect(history.size() == 2 && history[0].kind() == EventKind::kOffline && history[1].ongoing(),
               "events are ordered by start");
        expect(feed_log.warning_count() == 3, "invalid events reported and skipped");
        expect(source.FetchMonitorHistory(monitors[1]).empty(), "monitor without valid events has no history");
        monitors[0].SetHistory(history);
        expect(monitors[0].has_history(), "fetched history is accepted by the monitor");
    }

    // Every refresh cycle re-reads the events file.
    {
        const fs::path cycle_monitors = dir / "cycle_monitors.jsonl";
        const fs::path cycle_events = dir / "cycle_events.jsonl";
        write_file(cycle_monitors, "{\"id\":\"Mill Lane\",\"x\":5,\"y\":25}\n");
        const std::string morning =
            "{\"monitor\":\"Mill Lane\",\"kind\":\"Discharging\",\"start\":\"2024-03-01T08:00:00Z\","
            "\"end\":\"2024-03-01T09:00:00Z\"}\n";
        write_file(cycle_events, morning);

        std::ostringstream cycle_diagnostics;
        DiagnosticLog cycle_log(cycle_diagnostics, "feed_and_log_test");
        MonitorNetwork network("Southern Water",
                               std::make_unique<JsonLinesMonitorSource>(cycle_monitors, cycle_events, cycle_log),
                               nullptr, cycle_log);
        network.Refresh(MakeUtcTime(2024, 3, 1, 9, 30));
        network.LoadAllHistories(MakeUtcTime(2024, 3, 1, 9, 30));
        expect(network.Find("Mill Lane")->history().size() == 1, "first cycle loads one event");

        write_file(cycle_events, morning +
                                     "{\"monitor\":\"Mill Lane\",\"kind\":\"Discharging\","
                                     "\"start\":\"2024-03-01T10:00:00Z\",\"ongoing\":true}\n");
        network.Refresh(MakeUtcTime(2024, 3, 1, 10, 30));
        network.LoadAllHistories(MakeUtcTime(2024, 3, 1, 10, 30));
        const auto &history = network.Find("Mill Lane")->history();
        expect(history.size() == 2 && history.back().ongoing(), "events appended between refreshes are loaded");
    }

    // An open event followed by a later one is dropped; other monitors load.
    {
        const fs::path pair_monitors = dir / "pair_monitors.jsonl";
        const fs::path pair_events = dir / "pair_events.jsonl";
        write_file(pair_monitors, "{\"id\":\"Mill Lane\",\"x\":5,\"y\":25}\n{\"id\":\"Weir\",\"x\":25,\"y\":25}\n");
        write_file(pair_events,
                   "{\"monitor\":\"Mill Lane\",\"kind\":\"Offline\",\"start\":\"2024-03-01T07:00:00Z\","
                   "\"end\":\"2024-03-01T07:30:00Z\"}\n"
                   "{\"monitor\":\"Weir\",\"kind\":\"Discharging\",\"start\":\"2024-03-01T08:00:00Z\","
                   "\"ongoing\":true}\n"
                   "{\"monitor\":\"Weir\",\"kind\":\"Discharging\",\"start\":\"2024-03-01T09:00:00Z\","
                   "\"ongoing\":true}\n");

        std::ostringstream pair_diagnostics;
        DiagnosticLog pair_log(pair_diagnostics, "feed_and_log_test");
        MonitorNetwork network("Southern Water",
                               std::make_unique<JsonLinesMonitorSource>(pair_monitors, pair_events, pair_log),
                               nullptr, pair_log);
        network.Refresh(MakeUtcTime(2024, 3, 1, 10));
        network.LoadAllHistories(MakeUtcTime(2024, 3, 1, 10));
        expect(network.Find("Mill Lane")->history().size() == 1, "valid monitor keeps its history");
        const auto &weir = network.Find("Weir")->history();
        expect(weir.size() == 1 && weir[0].ongoing() && weir[0].start() == MakeUtcTime(2024, 3, 1, 9),
               "only the newest open event is kept");
        expect(pair_log.warning_count() == 1, "superseded open event is reported");
        expect(pair_diagnostics.str().find("\"category\":\"MalformedRecord\"") != std::string::npos &&
                   pair_diagnostics.str().find("\"key\":\"line\",\"value\":\"2\"") != std::string::npos,
               "report names the superseded line");
    }

    JsonLinesMonitorSource missing(dir / "absent.jsonl", events_path, feed_log);
    bool unreadable = false;
    try {
        missing.FetchActiveMonitors("Southern Water");
    } catch (const std::runtime_error &) {
        unreadable = true;
    }
    expect(unreadable, "missing feed files are errors");

    // Diagnostic records.
    std::ostringstream stream;
    DiagnosticLog stream_log(stream, "sewerflow");
    Diagnostic record;
    record.message = "network refreshed";
    record.attributes = {{"network", "Southern Water"}, {"monitors", "2"}};
    stream_log.Append(record);
    stream_log.Warn(kUnavailableData, "monitor has no recorded events", {{"monitor", "Weir"}});
    const std::string lines = stream.str();
    expect(lines.find("\"sequence\":1,\"source\":\"sewerflow\",\"category\":\"General\",\"severity\":\"Info\"") !=
               std::string::npos,
           "defaults fill empty fields");
    expect(lines.find("[{\"key\":\"monitors\",\"value\":\"2\"},{\"key\":\"network\"") != std::string::npos,
           "attributes are sorted");
    expect(lines.find("\"sequence\":2,") != std::string::npos &&
               lines.find("\"category\":\"UnavailableData\",\"severity\":\"Warning\"") != std::string::npos,
           "warnings are sequenced");
    expect(stream_log.total_count() == 2 && stream_log.warning_count() == 1, "log counters");
    stream_log.Rotate();
    expect(count_lines(stream.str()) == 2, "stream logs ignore rotation");

    // File logs rotate by size and leave a manifest behind.
    const fs::path log_path = dir / "logs" / "diagnostics.log";
    {
        DiagnosticLog file_log(log_path, "sewerflow", 256);
        for (int i = 0; i < 4; ++i) {
            file_log.Warn(kUnavailableData, "monitor lies outside the flow grid and was not propagated",
                          {{"monitor", "Outfall " + std::to_string(i)}});
        }
    }
    std::size_t rotated = 0;
    std::size_t manifests = 0;
    for (const auto &entry : fs::directory_iterator(log_path.parent_path())) {
        const std::string name = entry.path().filename().string();
        if (name.size() > 9 && name.compare(name.size() - 9, 9, ".manifest") == 0) {
            ++manifests;
        } else if (name != "diagnostics.log") {
            ++rotated;
        }
    }
    expect(rotated >= 1 && manifests == rotated, "rotated files come with manifests");

    // Environment overrides.
    const std::string env_log = (dir / "env.log").string();
    setenv("SEWERFLOW_LOG_PATH", env_log.c_str(), 1);
    setenv("SEWERFLOW_LOG_MAX_BYTES", "4096", 1);
    setenv("SEWERFLOW_OVERLAP_POLICY", "offline-suppresses-activity", 1);
    auto config = LoadEngineConfigFromEnv();
    expect(config.log_path == env_log, "log path from the environment");
    expect(config.log_max_bytes == 4096, "rotation size from the environment");
    expect(config.overlap_policy == OverlapPolicy::kOfflineSuppressesActivity, "overlap policy from the environment");
    expect(config.recent_window == std::chrono::hours(48) && config.channel_threshold == kChannelThreshold,
           "engine defaults");

    setenv("SEWERFLOW_LOG_MAX_BYTES", "lots", 1);
    setenv("SEWERFLOW_OVERLAP_POLICY", "whatever", 1);
    config = LoadEngineConfigFromEnv();
    expect(config.log_max_bytes == kDefaultMaxLogBytes, "unparsable size keeps the default");
    expect(config.overlap_policy == OverlapPolicy::kIndependent, "unknown policy keeps the default");

    {
        auto env_diagnostics = OpenDiagnosticLog(config, "sewerflow");
        env_diagnostics->Warn(kUnavailableData, "monitor has no recorded events", {{"monitor", "Weir"}});
    }
    expect(read_file(env_log).find("monitor has no recorded events") != std::string::npos,
           "configured log path receives diagnostics");
    unsetenv("SEWERFLOW_LOG_PATH");
    unsetenv("SEWERFLOW_LOG_MAX_BYTES");
    unsetenv("SEWERFLOW_OVERLAP_POLICY");

    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        std::cerr << "unable to remove " << dir << ": " << ec.message() << "\n";
    }

    return g_failures == 0 ? 0 : 1;
}
