#pragma once

#include <process_model/graph.hpp>
#include <string>

namespace process_export {

// Header "id,label,kind,duration,cost,role"; absent attributes are empty cells.
std::string export_nodes_csv(const process_model::ProcessGraph& graph);
// Header "from,to,label".
std::string export_edges_csv(const process_model::ProcessGraph& graph);

} // namespace process_export
