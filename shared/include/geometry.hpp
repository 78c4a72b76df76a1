#pragma once

#include <vector>

namespace sewerflow {

// Planar coordinates in the terrain grid's projected reference system.
struct Coordinate {
    double x = 0.0;
    double y = 0.0;
};

using Polyline = std::vector<Coordinate>;

}  // namespace sewerflow
