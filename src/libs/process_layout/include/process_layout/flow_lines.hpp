#pragma once

#include <process_layout/types.hpp>
#include <process_model/graph.hpp>
#include <vector>

namespace process_layout {

// One routed polyline per graph edge (parallel edges included). Forward edges
// run from the bottom-centre of the source glyph to the top-centre of the
// target; edges into the same or an earlier layer loop around the right side.
std::vector<FlowLine> compute_flow_lines(const process_model::ProcessGraph& graph,
    const LayoutResult& layout,
    const LayoutConfig& config = {});

// Extent covering every glyph of the layout; all zero for an empty layout.
Rect layout_bounds(const LayoutResult& layout, const LayoutConfig& config = {});

} // namespace process_layout
