#include "activity_aggregator.hpp"

namespace sewerflow {

std::vector<FleetSample> AggregateFleetActivity(const std::vector<const Monitor *> &monitors, const SampleGrid &grid,
                                                const EngineConfig &config, DiagnosticLog &log) {
    std::vector<FleetSample> series(grid.size());
    for (std::size_t i = 0; i < grid.size(); ++i) {
        series[i].time = grid.at(i);
    }

    for (const Monitor *monitor : monitors) {
        const auto masks = monitor->Resample(grid, config);
        if (!masks) {
            log.Warn(kUnavailableData, "monitor has no recorded events",
                     {{"monitor", monitor->id()}, {"network", monitor->network_name()}});
            continue;
        }
        for (std::size_t i = 0; i < grid.size(); ++i) {
            series[i].online += masks->online[i] ? 1 : 0;
            series[i].active += masks->active[i] ? 1 : 0;
            series[i].recent += masks->recent[i] ? 1 : 0;
        }
    }
    return series;
}

std::vector<FleetSample> BuildFleetTimeseries(const MonitorNetwork &network, const SampleGrid &grid) {
    std::vector<const Monitor *> monitors;
    monitors.reserve(network.monitors().size());
    for (const auto &entry : network.monitors()) {
        monitors.push_back(&entry.second);
    }
    return AggregateFleetActivity(monitors, grid, network.config(), network.log());
}

std::vector<FleetSample> BuildFleetTimeseries(const MonitorNetwork &network, TimePoint since, TimePoint now) {
    return BuildFleetTimeseries(network, SampleGrid::Covering(since, now));
}

}  // namespace sewerflow
