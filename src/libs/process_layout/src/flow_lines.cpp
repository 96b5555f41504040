#include <process_layout/flow_lines.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace process_layout {

namespace {

struct GlyphRect {
    double x, y, w, h;
    double cx() const { return x + w * 0.5; }
    double cy() const { return y + h * 0.5; }
    double top() const { return y; }
    double bottom() const { return y + h; }
    double right() const { return x + w; }
};

GlyphRect glyph_of(const NodePosition& p, const LayoutConfig& config) {
    return { p.x, p.y, config.node_width, config.node_height };
}

void route_forward(const GlyphRect& from, const GlyphRect& to, FlowLine& line) {
    const double x1 = from.cx();
    const double y1 = from.bottom();
    const double x2 = to.cx();
    const double y2 = to.top();
    line.points.push_back({x1, y1});

    // Orthogonal bend at mid height unless the glyphs are stacked.
    if (std::abs(x2 - x1) > layout::straight_line_tolerance) {
        const double mid_y = (y1 + y2) * 0.5;
        line.points.push_back({x1, mid_y});
        line.points.push_back({x2, mid_y});
    }
    line.points.push_back({x2, y2});
}

void route_back(const GlyphRect& from, const GlyphRect& to, FlowLine& line) {
    const double x_out = std::max(from.right(), to.right()) + layout::back_edge_offset;
    line.points.push_back({from.right(), from.cy()});
    line.points.push_back({x_out, from.cy()});
    line.points.push_back({x_out, to.cy()});
    line.points.push_back({to.right(), to.cy()});
}

} // namespace

std::vector<FlowLine> compute_flow_lines(const process_model::ProcessGraph& graph,
    const LayoutResult& layout,
    const LayoutConfig& config)
{
    std::unordered_map<std::string, const NodePosition*> by_id;
    for (const auto& p : layout.positions)
        by_id[p.node_id] = &p;

    std::vector<FlowLine> lines;
    lines.reserve(graph.edge_count());
    for (const auto& e : graph.edges()) {
        const auto from_it = by_id.find(e.from);
        const auto to_it = by_id.find(e.to);
        if (from_it == by_id.end() || to_it == by_id.end()) continue;

        FlowLine line;
        line.from_node_id = e.from;
        line.to_node_id = e.to;
        line.label = e.label;
        line.back_edge = to_it->second->layer <= from_it->second->layer;

        const GlyphRect from_rect = glyph_of(*from_it->second, config);
        const GlyphRect to_rect = glyph_of(*to_it->second, config);
        if (line.back_edge)
            route_back(from_rect, to_rect, line);
        else
            route_forward(from_rect, to_rect, line);
        lines.push_back(std::move(line));
    }
    return lines;
}

Rect layout_bounds(const LayoutResult& layout, const LayoutConfig& config) {
    Rect r;
    if (layout.positions.empty()) return r;

    double left = layout.positions.front().x;
    double top = layout.positions.front().y;
    double right = left + config.node_width;
    double bottom = top + config.node_height;
    for (const auto& p : layout.positions) {
        left = std::min(left, p.x);
        top = std::min(top, p.y);
        right = std::max(right, p.x + config.node_width);
        bottom = std::max(bottom, p.y + config.node_height);
    }
    r.x = left;
    r.y = top;
    r.width = right - left;
    r.height = bottom - top;
    return r;
}

} // namespace process_layout
