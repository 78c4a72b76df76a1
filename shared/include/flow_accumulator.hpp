#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

#include "geometry.hpp"

namespace sewerflow {

using NodeIndex = std::size_t;

// Row-major grid values, one per terrain cell.
using GridValues = std::vector<double>;

struct GridShape {
    std::size_t rows = 0;
    std::size_t cols = 0;

    std::size_t cells() const { return rows * cols; }
};

// Top-left origin and signed cell size, as in a GDAL geotransform. cell_height
// is negative for north-up rasters.
struct GeoTransform {
    double origin_x = 0.0;
    double origin_y = 0.0;
    double cell_width = 1.0;
    double cell_height = -1.0;

    double cell_area() const { return std::fabs(cell_width * cell_height); }
};

struct Extent {
    double min_x = 0.0;
    double max_x = 0.0;
    double min_y = 0.0;
    double max_y = 0.0;
};

struct FlowProfile {
    std::vector<NodeIndex> downstream;
    std::vector<NodeIndex> upstream;
};

// Flow routing over a terrain grid. Implementations own the flow-direction
// model; callers only see nodes, weights and geometry.
class FlowAccumulator {
  public:
    virtual ~FlowAccumulator() = default;

    virtual GridShape shape() const = 0;
    virtual GeoTransform transform() const = 0;
    virtual Extent extent() const = 0;

    // Throws std::out_of_range for coordinates outside the grid extent.
    virtual NodeIndex CoordinateToNode(double x, double y) const = 0;
    virtual Coordinate NodeToCoordinate(NodeIndex node) const = 0;

    // For every cell, the sum of the weights of all cells draining through it,
    // itself included. weights must have shape().cells() entries.
    virtual GridValues Accumulate(const GridValues &weights) const = 0;

    virtual FlowProfile Profile(NodeIndex node) const = 0;

    // Connected channel polylines through cells whose value exceeds threshold.
    virtual std::vector<Polyline> ChannelSegments(const GridValues &values, double threshold) const = 0;
};

}  // namespace sewerflow
