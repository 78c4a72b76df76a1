#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "diagnostic_log.hpp"
#include "flow_accumulator.hpp"
#include "monitor.hpp"
#include "monitor_source.hpp"
#include "time_grid.hpp"

namespace sewerflow {

using AccumulatorFactory = std::function<std::unique_ptr<FlowAccumulator>()>;

enum class SourceSelection {
    kCurrentlyDischarging,
    kRecentlyDischarged,
};

// The monitors of one operator plus the flow accumulator for its area.
class MonitorNetwork {
  public:
    MonitorNetwork(std::string name, std::unique_ptr<MonitorSource> source, AccumulatorFactory accumulator_factory,
                   DiagnosticLog &log, EngineConfig config = {});

    MonitorNetwork(const MonitorNetwork &) = delete;
    MonitorNetwork &operator=(const MonitorNetwork &) = delete;

    const std::string &name() const { return name_; }
    const EngineConfig &config() const { return config_; }
    DiagnosticLog &log() const { return log_; }

    // Replaces the monitor set from the source. Histories must be loaded again.
    void Refresh(TimePoint now);
    // Fetches the history of every monitor that does not have one yet. A
    // history that fails validation is reported and replaced by an empty one.
    // If a fetch throws, no history is installed.
    void LoadAllHistories(TimePoint now);

    std::optional<TimePoint> refreshed_at() const { return refreshed_at_; }
    std::optional<TimePoint> history_refreshed_at() const { return history_refreshed_at_; }

    const std::map<std::string, Monitor, std::less<>> &monitors() const { return monitors_; }
    std::vector<std::string> monitor_ids() const;
    const Monitor *Find(std::string_view id) const;
    Monitor *Find(std::string_view id);

    std::vector<const Monitor *> DischargingMonitors() const;
    // Monitors with an unknown 48h flag are left out and reported to the log.
    std::vector<const Monitor *> RecentlyDischargingMonitors() const;
    std::vector<const Monitor *> SelectMonitors(SourceSelection selection) const;

    // Built by the factory on first use and kept for the network's lifetime.
    // Throws InvalidStateError when no factory was supplied.
    const FlowAccumulator &Accumulator() const;

  private:
    std::string name_;
    std::unique_ptr<MonitorSource> source_;
    AccumulatorFactory accumulator_factory_;
    DiagnosticLog &log_;
    EngineConfig config_;
    std::map<std::string, Monitor, std::less<>> monitors_;
    std::optional<TimePoint> refreshed_at_;
    std::optional<TimePoint> history_refreshed_at_;
    mutable std::once_flag accumulator_once_;
    mutable std::unique_ptr<FlowAccumulator> accumulator_;
};

}  // namespace sewerflow
