#pragma once

namespace process_layout {

// Default layout constants for process node glyphs (used by the layout engine
// and by presentation code). All values in world units.

namespace layout {

constexpr double node_width = 120.0;
constexpr double node_height = 60.0;

// Distance between neighbouring glyph origins; larger than the glyph itself.
constexpr double node_spacing_x = 170.0;
constexpr double layer_spacing_y = 100.0;

constexpr double origin_x = 0.0;
constexpr double origin_y = 0.0;

// Horizontal offset used to route back edges around the right side of a glyph.
constexpr double back_edge_offset = 24.0;
// Below this horizontal distance a flow line is drawn without a bend.
constexpr double straight_line_tolerance = 5.0;

inline constexpr double horizontal_gap() {
    return node_spacing_x - node_width;
}
inline constexpr double vertical_gap() {
    return layer_spacing_y - node_height;
}

static_assert(horizontal_gap() > 0.0, "node glyphs would overlap horizontally");
static_assert(vertical_gap() > 0.0, "node glyphs would overlap vertically");

} // namespace layout
} // namespace process_layout
