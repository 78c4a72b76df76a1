#pragma once

#include <cstddef>
#include <vector>

#include "config.hpp"
#include "diagnostic_log.hpp"
#include "monitor.hpp"
#include "monitor_network.hpp"
#include "time_grid.hpp"

namespace sewerflow {

struct FleetSample {
    TimePoint time{};
    std::size_t online = 0;
    std::size_t active = 0;
    std::size_t recent = 0;
};

// Sums per-monitor masks over grid. Monitors without recorded events count as
// offline and inactive throughout and are reported to the log. Throws
// InvalidStateError if a monitor's history was never loaded.
std::vector<FleetSample> AggregateFleetActivity(const std::vector<const Monitor *> &monitors, const SampleGrid &grid,
                                                const EngineConfig &config, DiagnosticLog &log);

std::vector<FleetSample> BuildFleetTimeseries(const MonitorNetwork &network, const SampleGrid &grid);
// Samples every 15 minutes from since up to (excluding) now.
std::vector<FleetSample> BuildFleetTimeseries(const MonitorNetwork &network, TimePoint since, TimePoint now);

}  // namespace sewerflow
