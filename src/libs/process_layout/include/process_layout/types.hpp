#pragma once

#include <process_layout/layout_constants.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace process_layout {

struct LayoutConfig {
    double node_spacing_x = layout::node_spacing_x;
    double layer_spacing_y = layout::layer_spacing_y;
    double origin_x = layout::origin_x;
    double origin_y = layout::origin_y;
    // Glyph size, only used for flow lines and bounds.
    double node_width = layout::node_width;
    double node_height = layout::node_height;
};

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

struct NodePosition {
    std::string node_id;
    double x = 0;
    double y = 0;
    int layer = 0;
    std::size_t order = 0; // index within the layer
    bool isolated = false;
};

struct LayoutResult {
    // Sorted by (layer, order).
    std::vector<NodePosition> positions;
    // Nodes not reachable from any root, in graph node order.
    std::vector<std::string> isolated;
    std::vector<std::string> roots;
    // Set when the graph had no source node and a root had to be picked.
    bool degenerate = false;
    std::size_t layer_count = 0;

    const NodePosition* find(const std::string& node_id) const;
};

struct FlowLine {
    std::string from_node_id;
    std::string to_node_id;
    std::string label;
    bool back_edge = false;
    std::vector<std::pair<double, double>> points; // polyline in world coordinates
};

} // namespace process_layout
