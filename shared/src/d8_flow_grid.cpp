#include "d8_flow_grid.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <deque>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "errors.hpp"

namespace sewerflow {
namespace {
struct D8Offset {
    int code;
    int row;
    int col;
};

constexpr D8Offset kD8Offsets[] = {
    {1, 0, 1}, {2, 1, 1}, {4, 1, 0}, {8, 1, -1}, {16, 0, -1}, {32, -1, -1}, {64, -1, 0}, {128, -1, 1},
};

std::optional<D8Offset> find_offset(int code) {
    for (const auto &offset : kD8Offsets) {
        if (offset.code == code) {
            return offset;
        }
    }
    return std::nullopt;
}

// Cell count limit for grids read from text.
constexpr std::size_t kMaxAsciiGridCells = std::size_t{1} << 31;

std::size_t parse_dimension(const std::string &key, double value) {
    if (!std::isfinite(value) || value < 1.0 || value != std::floor(value) ||
        value > static_cast<double>(kMaxAsciiGridCells)) {
        throw std::runtime_error("ESRI ASCII grid " + key + " must be a positive integer");
    }
    return static_cast<std::size_t>(value);
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}  // namespace

D8FlowGrid::D8FlowGrid(GridShape shape, GeoTransform transform, const std::vector<int> &directions)
    : shape_(shape), transform_(transform) {
    if (directions.size() != shape_.cells()) {
        throw ValidationError("direction grid has " + std::to_string(directions.size()) + " cells, expected " +
                              std::to_string(shape_.cells()));
    }
    if (transform_.cell_width == 0.0 || transform_.cell_height == 0.0) {
        throw ValidationError("grid cell size must be non-zero");
    }
    receivers_.resize(shape_.cells());
    for (std::size_t row = 0; row < shape_.rows; ++row) {
        for (std::size_t col = 0; col < shape_.cols; ++col) {
            const NodeIndex node = row * shape_.cols + col;
            receivers_[node] = node;
            auto offset = find_offset(directions[node]);
            if (!offset) {
                continue;
            }
            const long long next_row = static_cast<long long>(row) + offset->row;
            const long long next_col = static_cast<long long>(col) + offset->col;
            if (next_row < 0 || next_col < 0 || next_row >= static_cast<long long>(shape_.rows) ||
                next_col >= static_cast<long long>(shape_.cols)) {
                continue;
            }
            receivers_[node] = static_cast<NodeIndex>(next_row) * shape_.cols + static_cast<NodeIndex>(next_col);
        }
    }
    build_donors();
    build_order();
}

void D8FlowGrid::build_donors() {
    const std::size_t cells = shape_.cells();
    donor_offsets_.assign(cells + 1, 0);
    for (NodeIndex node = 0; node < cells; ++node) {
        if (receivers_[node] != node) {
            ++donor_offsets_[receivers_[node] + 1];
        }
    }
    for (std::size_t i = 1; i <= cells; ++i) {
        donor_offsets_[i] += donor_offsets_[i - 1];
    }
    donors_.assign(donor_offsets_[cells], 0);
    std::vector<std::size_t> cursor(donor_offsets_.begin(), donor_offsets_.end() - 1);
    for (NodeIndex node = 0; node < cells; ++node) {
        if (receivers_[node] != node) {
            donors_[cursor[receivers_[node]]++] = node;
        }
    }
}

void D8FlowGrid::build_order() {
    const std::size_t cells = shape_.cells();
    std::vector<std::size_t> pending(cells, 0);
    std::deque<NodeIndex> ready;
    for (NodeIndex node = 0; node < cells; ++node) {
        pending[node] = donor_offsets_[node + 1] - donor_offsets_[node];
        if (pending[node] == 0) {
            ready.push_back(node);
        }
    }
    order_.clear();
    order_.reserve(cells);
    while (!ready.empty()) {
        const NodeIndex node = ready.front();
        ready.pop_front();
        order_.push_back(node);
        const NodeIndex next = receivers_[node];
        if (next != node && --pending[next] == 0) {
            ready.push_back(next);
        }
    }
    if (order_.size() != cells) {
        throw ValidationError("flow direction grid contains a cycle");
    }
}

std::unique_ptr<D8FlowGrid> D8FlowGrid::LoadAsciiGrid(const std::filesystem::path &path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("unable to open flow direction grid " + path.string());
    }
    return ParseAsciiGrid(in);
}

std::unique_ptr<D8FlowGrid> D8FlowGrid::ParseAsciiGrid(std::istream &in) {
    std::optional<std::size_t> ncols;
    std::optional<std::size_t> nrows;
    std::optional<double> xll;
    std::optional<double> yll;
    std::optional<double> cellsize;
    std::optional<double> nodata;
    bool centered = false;

    // Header lines are "key value" pairs preceding the first numeric row.
    std::string key;
    while (in >> std::ws && in.peek() != EOF && std::isalpha(in.peek())) {
        double value = 0.0;
        if (!(in >> key >> value)) {
            throw std::runtime_error("malformed ESRI ASCII grid header");
        }
        key = lower(key);
        if (key == "ncols") {
            ncols = parse_dimension(key, value);
        } else if (key == "nrows") {
            nrows = parse_dimension(key, value);
        } else if (key == "xllcorner" || key == "xllcenter") {
            xll = value;
            centered = key == "xllcenter";
        } else if (key == "yllcorner" || key == "yllcenter") {
            yll = value;
        } else if (key == "cellsize") {
            if (!std::isfinite(value) || value <= 0.0) {
                throw std::runtime_error("ESRI ASCII grid cellsize must be positive");
            }
            cellsize = value;
        } else if (key == "nodata_value") {
            nodata = value;
        }
    }
    if (!ncols || !nrows || !xll || !yll || !cellsize) {
        throw std::runtime_error("ESRI ASCII grid header is missing ncols, nrows, corner or cellsize");
    }
    if (*ncols > kMaxAsciiGridCells / *nrows) {
        throw std::runtime_error("ESRI ASCII grid of " + std::to_string(*nrows) + " x " + std::to_string(*ncols) +
                                 " cells is too large");
    }

    GridShape shape{*nrows, *ncols};
    GeoTransform transform;
    transform.cell_width = *cellsize;
    transform.cell_height = -*cellsize;
    transform.origin_x = centered ? *xll - *cellsize / 2.0 : *xll;
    const double bottom = centered ? *yll - *cellsize / 2.0 : *yll;
    transform.origin_y = bottom + static_cast<double>(*nrows) * *cellsize;

    std::vector<int> directions;
    directions.reserve(std::min<std::size_t>(shape.cells(), std::size_t{1} << 20));
    double value = 0.0;
    while (directions.size() < shape.cells() && in >> value) {
        // Nodata and values outside the D8 code range become outlets.
        int code = 0;
        if (!(nodata && value == *nodata) && value >= 0.0 && value <= 255.0) {
            code = static_cast<int>(value);
        }
        directions.push_back(code);
    }
    if (directions.size() != shape.cells()) {
        throw std::runtime_error("ESRI ASCII grid has " + std::to_string(directions.size()) + " values, expected " +
                                 std::to_string(shape.cells()));
    }
    return std::make_unique<D8FlowGrid>(shape, transform, directions);
}

Extent D8FlowGrid::extent() const {
    const double x0 = transform_.origin_x;
    const double x1 = transform_.origin_x + static_cast<double>(shape_.cols) * transform_.cell_width;
    const double y0 = transform_.origin_y;
    const double y1 = transform_.origin_y + static_cast<double>(shape_.rows) * transform_.cell_height;
    return Extent{std::min(x0, x1), std::max(x0, x1), std::min(y0, y1), std::max(y0, y1)};
}

NodeIndex D8FlowGrid::CoordinateToNode(double x, double y) const {
    const double col = std::floor((x - transform_.origin_x) / transform_.cell_width);
    const double row = std::floor((y - transform_.origin_y) / transform_.cell_height);
    if (!std::isfinite(col) || !std::isfinite(row) || col < 0 || row < 0 ||
        col >= static_cast<double>(shape_.cols) || row >= static_cast<double>(shape_.rows)) {
        std::ostringstream oss;
        oss << "coordinate (" << x << ", " << y << ") lies outside the flow grid";
        throw std::out_of_range(oss.str());
    }
    return static_cast<NodeIndex>(row) * shape_.cols + static_cast<NodeIndex>(col);
}

Coordinate D8FlowGrid::NodeToCoordinate(NodeIndex node) const {
    if (node >= shape_.cells()) {
        throw std::out_of_range("node " + std::to_string(node) + " lies outside the flow grid");
    }
    const double row = static_cast<double>(node / shape_.cols);
    const double col = static_cast<double>(node % shape_.cols);
    return Coordinate{transform_.origin_x + (col + 0.5) * transform_.cell_width,
                      transform_.origin_y + (row + 0.5) * transform_.cell_height};
}

GridValues D8FlowGrid::Accumulate(const GridValues &weights) const {
    if (weights.size() != shape_.cells()) {
        throw ValidationError("weight grid has " + std::to_string(weights.size()) + " cells, expected " +
                              std::to_string(shape_.cells()));
    }
    GridValues accumulated = weights;
    for (NodeIndex node : order_) {
        const NodeIndex next = receivers_[node];
        if (next != node) {
            accumulated[next] += accumulated[node];
        }
    }
    return accumulated;
}

FlowProfile D8FlowGrid::Profile(NodeIndex node) const {
    if (node >= shape_.cells()) {
        throw std::out_of_range("node " + std::to_string(node) + " lies outside the flow grid");
    }
    FlowProfile profile;
    NodeIndex current = node;
    profile.downstream.push_back(current);
    while (receivers_[current] != current) {
        current = receivers_[current];
        profile.downstream.push_back(current);
    }

    std::deque<NodeIndex> queue{node};
    while (!queue.empty()) {
        const NodeIndex next = queue.front();
        queue.pop_front();
        profile.upstream.push_back(next);
        for (std::size_t i = donor_offsets_[next]; i < donor_offsets_[next + 1]; ++i) {
            queue.push_back(donors_[i]);
        }
    }
    return profile;
}

std::vector<Polyline> D8FlowGrid::ChannelSegments(const GridValues &values, double threshold) const {
    if (values.size() != shape_.cells()) {
        throw ValidationError("value grid has " + std::to_string(values.size()) + " cells, expected " +
                              std::to_string(shape_.cells()));
    }
    const std::size_t cells = shape_.cells();
    std::vector<bool> channel(cells, false);
    for (NodeIndex node = 0; node < cells; ++node) {
        channel[node] = values[node] > threshold;
    }

    std::vector<Polyline> segments;
    std::vector<bool> traced(cells, false);
    for (NodeIndex head = 0; head < cells; ++head) {
        if (!channel[head]) {
            continue;
        }
        bool has_channel_donor = false;
        for (std::size_t i = donor_offsets_[head]; i < donor_offsets_[head + 1]; ++i) {
            if (channel[donors_[i]]) {
                has_channel_donor = true;
                break;
            }
        }
        if (has_channel_donor) {
            continue;
        }

        // Trace downstream until the outlet, the channel end, or a cell an
        // earlier segment already covers (the confluence, kept as last vertex).
        Polyline line{NodeToCoordinate(head)};
        traced[head] = true;
        NodeIndex current = head;
        while (receivers_[current] != current && channel[receivers_[current]]) {
            current = receivers_[current];
            line.push_back(NodeToCoordinate(current));
            if (traced[current]) {
                break;
            }
            traced[current] = true;
        }
        if (line.size() >= 2) {
            segments.push_back(std::move(line));
        }
    }
    return segments;
}

}  // namespace sewerflow
