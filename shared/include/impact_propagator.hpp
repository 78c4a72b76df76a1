#pragma once

#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "diagnostic_log.hpp"
#include "flow_accumulator.hpp"
#include "geometry.hpp"
#include "monitor.hpp"
#include "monitor_network.hpp"

namespace sewerflow {

struct SourceNode {
    const Monitor *monitor = nullptr;
    NodeIndex node = 0;
};

struct ImpactedNode {
    NodeIndex node = 0;
    Coordinate location;
    double upstream_sources = 0.0;
    double sources_per_km2 = 0.0;
    // Names of contributing monitors, in source iteration order.
    std::vector<std::string> monitors;
};

// Propagates a set of active monitors down the flow network of one
// accumulator. An empty source set yields all-zero grids and empty results.
class ImpactPropagator {
  public:
    ImpactPropagator(const FlowAccumulator &accumulator, DiagnosticLog &log,
                     double channel_threshold = kChannelThreshold);

    // Grid nodes of the sources, in input order. Sources outside the grid are
    // skipped and reported to the log.
    std::vector<SourceNode> MapSources(const std::vector<const Monitor *> &sources) const;

    // 1.0 at every source node, 0.0 elsewhere.
    GridValues SourceGrid(const std::vector<SourceNode> &sources) const;
    // Number of source nodes upstream of (or at) every cell.
    GridValues Impact(const std::vector<const Monitor *> &sources) const;
    // Upstream drainage area of every cell, in km2.
    GridValues DrainageArea() const;
    GridValues ImpactPerArea(const std::vector<const Monitor *> &sources) const;

    // One entry per cell with non-zero impact, ordered by node.
    std::vector<ImpactedNode> ImpactedNodes(const std::vector<const Monitor *> &sources) const;
    std::vector<Polyline> ChannelGeometry(const std::vector<const Monitor *> &sources) const;

  private:
    const FlowAccumulator &accumulator_;
    DiagnosticLog &log_;
    double channel_threshold_;
};

ImpactPropagator MakeImpactPropagator(const MonitorNetwork &network);

std::vector<ImpactedNode> DownstreamImpact(const MonitorNetwork &network, SourceSelection selection);
std::vector<Polyline> DownstreamChannels(const MonitorNetwork &network, SourceSelection selection);

}  // namespace sewerflow
