#pragma once

#include <process_model/graph.hpp>

namespace process_export {

// Order-handling demo process: an approval gateway, a rework loop back to
// review, a merge before shipping and per-step duration/cost/role.
process_model::ProcessGraph make_sample_process();

} // namespace process_export
