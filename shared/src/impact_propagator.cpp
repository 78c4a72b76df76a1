#include "impact_propagator.hpp"

#include <stdexcept>
#include <unordered_map>

#include "json_text.hpp"

namespace sewerflow {
namespace {
constexpr double kSquareMetresPerKm2 = 1.0e6;
}  // namespace

ImpactPropagator::ImpactPropagator(const FlowAccumulator &accumulator, DiagnosticLog &log, double channel_threshold)
    : accumulator_(accumulator), log_(log), channel_threshold_(channel_threshold) {}

std::vector<SourceNode> ImpactPropagator::MapSources(const std::vector<const Monitor *> &sources) const {
    std::vector<SourceNode> nodes;
    nodes.reserve(sources.size());
    for (const Monitor *monitor : sources) {
        const Coordinate location = monitor->location();
        try {
            nodes.push_back(SourceNode{monitor, accumulator_.CoordinateToNode(location.x, location.y)});
        } catch (const std::out_of_range &error) {
            log_.Warn(kUnavailableData, "monitor lies outside the flow grid and was not propagated",
                      {{"monitor", monitor->id()},
                       {"x", JsonNumber(location.x)},
                       {"y", JsonNumber(location.y)},
                       {"error", error.what()}});
        }
    }
    return nodes;
}

GridValues ImpactPropagator::SourceGrid(const std::vector<SourceNode> &sources) const {
    GridValues grid(accumulator_.shape().cells(), 0.0);
    for (const auto &source : sources) {
        grid.at(source.node) = 1.0;
    }
    return grid;
}

GridValues ImpactPropagator::Impact(const std::vector<const Monitor *> &sources) const {
    return accumulator_.Accumulate(SourceGrid(MapSources(sources)));
}

GridValues ImpactPropagator::DrainageArea() const {
    const double cell_area = accumulator_.transform().cell_area() / kSquareMetresPerKm2;
    return accumulator_.Accumulate(GridValues(accumulator_.shape().cells(), cell_area));
}

GridValues ImpactPropagator::ImpactPerArea(const std::vector<const Monitor *> &sources) const {
    GridValues impact = Impact(sources);
    const GridValues area = DrainageArea();
    for (std::size_t i = 0; i < impact.size(); ++i) {
        impact[i] /= area[i];
    }
    return impact;
}

std::vector<ImpactedNode> ImpactPropagator::ImpactedNodes(const std::vector<const Monitor *> &sources) const {
    const auto mapped = MapSources(sources);
    const GridValues impact = accumulator_.Accumulate(SourceGrid(mapped));

    std::vector<ImpactedNode> nodes;
    std::unordered_map<NodeIndex, std::size_t> position;
    bool any_impact = false;
    for (double value : impact) {
        if (value > 0.0) {
            any_impact = true;
            break;
        }
    }
    if (!any_impact) {
        return nodes;
    }

    const GridValues area = DrainageArea();
    for (NodeIndex node = 0; node < impact.size(); ++node) {
        if (impact[node] <= 0.0) {
            continue;
        }
        ImpactedNode entry;
        entry.node = node;
        entry.location = accumulator_.NodeToCoordinate(node);
        entry.upstream_sources = impact[node];
        entry.sources_per_km2 = impact[node] / area[node];
        position.emplace(node, nodes.size());
        nodes.push_back(std::move(entry));
    }

    for (const auto &source : mapped) {
        for (NodeIndex node : accumulator_.Profile(source.node).downstream) {
            auto it = position.find(node);
            if (it != position.end()) {
                nodes[it->second].monitors.push_back(source.monitor->id());
            }
        }
    }
    return nodes;
}

std::vector<Polyline> ImpactPropagator::ChannelGeometry(const std::vector<const Monitor *> &sources) const {
    return accumulator_.ChannelSegments(Impact(sources), channel_threshold_);
}

ImpactPropagator MakeImpactPropagator(const MonitorNetwork &network) {
    return ImpactPropagator(network.Accumulator(), network.log(), network.config().channel_threshold);
}

std::vector<ImpactedNode> DownstreamImpact(const MonitorNetwork &network, SourceSelection selection) {
    return MakeImpactPropagator(network).ImpactedNodes(network.SelectMonitors(selection));
}

std::vector<Polyline> DownstreamChannels(const MonitorNetwork &network, SourceSelection selection) {
    return MakeImpactPropagator(network).ChannelGeometry(network.SelectMonitors(selection));
}

}  // namespace sewerflow
