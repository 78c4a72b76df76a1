#include "report.hpp"

#include <sstream>

#include "json_text.hpp"

namespace sewerflow {
namespace {
void append_position(std::ostringstream &oss, const Coordinate &coordinate) {
    oss << '[' << JsonNumber(coordinate.x) << ',' << JsonNumber(coordinate.y) << ']';
}
}  // namespace

std::string SerializeFleetTimeseries(const std::vector<FleetSample> &series) {
    std::ostringstream oss;
    oss << "[\n";
    for (std::size_t i = 0; i < series.size(); ++i) {
        const auto &sample = series[i];
        oss << "  {\"datetime\":\"" << FormatUtcTimestamp(sample.time) << "\",\"number_online\":" << sample.online
            << ",\"number_discharging\":" << sample.active
            << ",\"number_recently_discharging\":" << sample.recent << '}';
        if (i + 1 < series.size()) {
            oss << ',';
        }
        oss << '\n';
    }
    oss << "]\n";
    return oss.str();
}

std::string SerializeImpactedNodes(const std::vector<ImpactedNode> &nodes) {
    std::ostringstream oss;
    oss << "{\"type\":\"FeatureCollection\",\"features\":[";
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const auto &node = nodes[i];
        oss << "{\"type\":\"Feature\",\"geometry\":{\"type\":\"Point\",\"coordinates\":";
        append_position(oss, node.location);
        oss << "},\"properties\":{\"node\":" << node.node
            << ",\"number_upstream_CSOs\":" << JsonNumber(node.upstream_sources)
            << ",\"number_CSOs_per_km2\":" << JsonNumber(node.sources_per_km2) << ",\"CSOs\":[";
        for (std::size_t j = 0; j < node.monitors.size(); ++j) {
            oss << '"' << JsonEscape(node.monitors[j]) << '"';
            if (j + 1 < node.monitors.size()) {
                oss << ',';
            }
        }
        oss << "]}}";
        if (i + 1 < nodes.size()) {
            oss << ',';
        }
    }
    oss << "]}";
    return oss.str();
}

std::string SerializeChannelGeometry(const std::vector<Polyline> &segments) {
    std::ostringstream oss;
    oss << "{\"type\":\"MultiLineString\",\"coordinates\":[";
    for (std::size_t i = 0; i < segments.size(); ++i) {
        oss << '[';
        for (std::size_t j = 0; j < segments[i].size(); ++j) {
            append_position(oss, segments[i][j]);
            if (j + 1 < segments[i].size()) {
                oss << ',';
            }
        }
        oss << ']';
        if (i + 1 < segments.size()) {
            oss << ',';
        }
    }
    oss << "]}";
    return oss.str();
}

std::string SerializeDischargeLog(const std::vector<DischargeLogRow> &rows) {
    std::ostringstream oss;
    oss << "[\n";
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const auto &row = rows[i];
        oss << "  {\"LocationName\":\"" << JsonEscape(row.monitor_id) << "\",\"PermitNumber\":\""
            << JsonEscape(row.permit_number) << "\",\"X\":" << JsonNumber(row.location.x)
            << ",\"Y\":" << JsonNumber(row.location.y) << ",\"ReceivingWaterCourse\":\""
            << JsonEscape(row.receiving_watercourse) << "\",\"StartDateTime\":\"" << FormatUtcTimestamp(row.start)
            << "\",\"StopDateTime\":";
        if (row.end) {
            oss << '"' << FormatUtcTimestamp(*row.end) << '"';
        } else {
            oss << "null";
        }
        oss << ",\"Duration\":" << JsonNumber(row.duration.count())
            << ",\"OngoingDischarge\":" << (row.ongoing ? "true" : "false") << '}';
        if (i + 1 < rows.size()) {
            oss << ',';
        }
        oss << '\n';
    }
    oss << "]\n";
    return oss.str();
}

}  // namespace sewerflow
