#include <process_model/graph_provider.hpp>
#include <process_model/errors.hpp>
#include <utility>

namespace process_model {

void InMemoryGraphProvider::add(ProcessGraph graph) {
    std::string id = graph.info().id;
    graphs_.insert_or_assign(std::move(id), std::move(graph));
}

bool InMemoryGraphProvider::remove(const std::string& process_id) {
    return graphs_.erase(process_id) > 0;
}

ProcessGraph InMemoryGraphProvider::fetch_graph(const std::string& process_id) const {
    const auto it = graphs_.find(process_id);
    if (it == graphs_.end()) throw NotFoundError(process_id);
    return it->second;
}

std::vector<ProcessInfo> InMemoryGraphProvider::list_processes() const {
    std::vector<ProcessInfo> out;
    out.reserve(graphs_.size());
    for (const auto& kv : graphs_)
        out.push_back(kv.second.info());
    return out;
}

} // namespace process_model
