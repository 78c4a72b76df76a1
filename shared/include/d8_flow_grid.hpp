#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <vector>

#include "flow_accumulator.hpp"

namespace sewerflow {

// FlowAccumulator over a precomputed D8 flow-direction raster. Codes follow
// the ESRI convention (1 E, 2 SE, 4 S, 8 SW, 16 W, 32 NW, 64 N, 128 NE);
// 0, nodata and directions leaving the grid mark outlets.
class D8FlowGrid : public FlowAccumulator {
  public:
    // Throws ValidationError if directions does not match shape or the
    // directions contain a cycle.
    D8FlowGrid(GridShape shape, GeoTransform transform, const std::vector<int> &directions);

    // ESRI ASCII grid (ncols, nrows, xllcorner/xllcenter, yllcorner/yllcenter,
    // cellsize, optional NODATA_value). Throws std::runtime_error on
    // unreadable or malformed input.
    static std::unique_ptr<D8FlowGrid> LoadAsciiGrid(const std::filesystem::path &path);
    static std::unique_ptr<D8FlowGrid> ParseAsciiGrid(std::istream &in);

    GridShape shape() const override { return shape_; }
    GeoTransform transform() const override { return transform_; }
    Extent extent() const override;

    NodeIndex CoordinateToNode(double x, double y) const override;
    Coordinate NodeToCoordinate(NodeIndex node) const override;
    GridValues Accumulate(const GridValues &weights) const override;
    FlowProfile Profile(NodeIndex node) const override;
    std::vector<Polyline> ChannelSegments(const GridValues &values, double threshold) const override;

    // The cell node drains into; node itself for outlets.
    NodeIndex receiver(NodeIndex node) const { return receivers_.at(node); }

  private:
    void build_donors();
    void build_order();

    GridShape shape_;
    GeoTransform transform_;
    std::vector<NodeIndex> receivers_;
    // Donors of node n are donors_[donor_offsets_[n] .. donor_offsets_[n + 1]).
    std::vector<std::size_t> donor_offsets_;
    std::vector<NodeIndex> donors_;
    // Every node appears after all of its donors.
    std::vector<NodeIndex> order_;
};

}  // namespace sewerflow
