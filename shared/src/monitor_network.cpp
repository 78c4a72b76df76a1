#include "monitor_network.hpp"

#include <utility>

#include "errors.hpp"

namespace sewerflow {

MonitorNetwork::MonitorNetwork(std::string name, std::unique_ptr<MonitorSource> source,
                               AccumulatorFactory accumulator_factory, DiagnosticLog &log, EngineConfig config)
    : name_(std::move(name)),
      source_(std::move(source)),
      accumulator_factory_(std::move(accumulator_factory)),
      log_(log),
      config_(std::move(config)) {}

void MonitorNetwork::Refresh(TimePoint now) {
    if (!source_) {
        throw InvalidStateError("network " + name_ + " has no monitor source");
    }
    std::map<std::string, Monitor, std::less<>> refreshed;
    for (auto &monitor : source_->FetchActiveMonitors(name_)) {
        const std::string id = monitor.id();
        if (!refreshed.emplace(id, std::move(monitor)).second) {
            log_.Warn("DuplicateMonitor", "monitor reported twice, keeping the first record",
                      {{"monitor", id}, {"network", name_}});
        }
    }
    monitors_ = std::move(refreshed);
    refreshed_at_ = now;
    history_refreshed_at_.reset();
}

void MonitorNetwork::LoadAllHistories(TimePoint now) {
    if (!source_) {
        throw InvalidStateError("network " + name_ + " has no monitor source");
    }
    auto updated = monitors_;
    for (auto &entry : updated) {
        Monitor &monitor = entry.second;
        if (monitor.has_history()) {
            continue;
        }
        try {
            monitor.SetHistory(source_->FetchMonitorHistory(monitor));
        } catch (const ValidationError &error) {
            log_.Warn("MalformedRecord", "history rejected, monitor treated as having no recorded events",
                      {{"monitor", entry.first}, {"network", name_}, {"error", error.what()}});
            monitor.SetHistory({});
        }
    }
    monitors_ = std::move(updated);
    history_refreshed_at_ = now;
}

std::vector<std::string> MonitorNetwork::monitor_ids() const {
    std::vector<std::string> ids;
    ids.reserve(monitors_.size());
    for (const auto &entry : monitors_) {
        ids.push_back(entry.first);
    }
    return ids;
}

const Monitor *MonitorNetwork::Find(std::string_view id) const {
    auto it = monitors_.find(id);
    return it == monitors_.end() ? nullptr : &it->second;
}

Monitor *MonitorNetwork::Find(std::string_view id) {
    auto it = monitors_.find(id);
    return it == monitors_.end() ? nullptr : &it->second;
}

std::vector<const Monitor *> MonitorNetwork::DischargingMonitors() const {
    std::vector<const Monitor *> out;
    for (const auto &entry : monitors_) {
        if (entry.second.CurrentStatus() == EventKind::kDischarging) {
            out.push_back(&entry.second);
        }
    }
    return out;
}

std::vector<const Monitor *> MonitorNetwork::RecentlyDischargingMonitors() const {
    std::vector<const Monitor *> out;
    for (const auto &entry : monitors_) {
        const auto flag = entry.second.discharged_in_last_48h();
        if (!flag) {
            log_.Warn(kUnavailableData, "discharge in last 48h is unknown, monitor excluded",
                      {{"monitor", entry.first}, {"network", name_}});
            continue;
        }
        if (*flag) {
            out.push_back(&entry.second);
        }
    }
    return out;
}

std::vector<const Monitor *> MonitorNetwork::SelectMonitors(SourceSelection selection) const {
    if (selection == SourceSelection::kRecentlyDischarged) {
        return RecentlyDischargingMonitors();
    }
    return DischargingMonitors();
}

const FlowAccumulator &MonitorNetwork::Accumulator() const {
    std::call_once(accumulator_once_, [this] {
        if (!accumulator_factory_) {
            throw InvalidStateError("network " + name_ + " has no flow accumulator configured");
        }
        auto accumulator = accumulator_factory_();
        if (!accumulator) {
            throw InvalidStateError("flow accumulator factory for network " + name_ + " returned nothing");
        }
        accumulator_ = std::move(accumulator);
    });
    return *accumulator_;
}

}  // namespace sewerflow
