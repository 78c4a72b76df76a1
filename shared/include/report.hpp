#pragma once

#include <string>
#include <vector>

#include "activity_aggregator.hpp"
#include "discharge_log.hpp"
#include "geometry.hpp"
#include "impact_propagator.hpp"

namespace sewerflow {

// JSON text for the outputs handed to plotting, mapping and export tools.

std::string SerializeFleetTimeseries(const std::vector<FleetSample> &series);
// GeoJSON FeatureCollection of Point features.
std::string SerializeImpactedNodes(const std::vector<ImpactedNode> &nodes);
// GeoJSON MultiLineString.
std::string SerializeChannelGeometry(const std::vector<Polyline> &segments);
std::string SerializeDischargeLog(const std::vector<DischargeLogRow> &rows);

}  // namespace sewerflow
