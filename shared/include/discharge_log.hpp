#pragma once

#include <optional>
#include <string>
#include <vector>

#include "geometry.hpp"
#include "monitor_network.hpp"
#include "time_grid.hpp"

namespace sewerflow {

struct DischargeLogRow {
    std::string monitor_id;
    std::string permit_number;
    Coordinate location;
    std::string receiving_watercourse;
    TimePoint start{};
    std::optional<TimePoint> end;
    Minutes duration{0.0};
    bool ongoing = false;
};

// One row per Discharging event across the network, newest start first.
// Throws InvalidStateError until histories have been loaded.
std::vector<DischargeLogRow> BuildDischargeLog(const MonitorNetwork &network, TimePoint now);

}  // namespace sewerflow
