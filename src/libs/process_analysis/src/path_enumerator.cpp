#include <process_analysis/path_enumerator.hpp>
#include <process_model/log.hpp>
#include <unordered_set>

namespace process_analysis {

namespace {

class PathSearch {
public:
    PathSearch(const process_model::ProcessGraph& graph, process_model::NodeKind end_kind,
        std::size_t max_length, std::vector<Path>& out)
        : graph_(graph), end_kind_(end_kind), max_length_(max_length), out_(out) {}

    // False when the length bound was hit; paths found so far stay in out.
    bool run(const std::string& start_id) {
        path_.clear();
        on_path_.clear();
        return visit(start_id);
    }

private:
    bool visit(const std::string& id) {
        if (path_.size() >= max_length_) return false;
        path_.push_back(id);
        on_path_.insert(id);

        bool ok = true;
        if (graph_.node(id).kind == end_kind_) {
            out_.push_back(path_);
        } else {
            // Parallel edges lead to the same path; follow each successor once.
            std::unordered_set<std::string> tried;
            for (const auto& next : graph_.successors(id)) {
                if (on_path_.count(next) || !tried.insert(next).second) continue;
                if (!visit(next)) {
                    ok = false;
                    break;
                }
            }
        }

        on_path_.erase(id);
        path_.pop_back();
        return ok;
    }

    const process_model::ProcessGraph& graph_;
    process_model::NodeKind end_kind_;
    std::size_t max_length_;
    std::vector<Path>& out_;
    Path path_;
    std::unordered_set<std::string> on_path_;
};

} // namespace

PathSet enumerate_paths(const process_model::ProcessGraph& graph, const PathOptions& options) {
    PathSet out;
    const std::size_t max_length = options.max_path_length.value_or(2 * graph.node_count());
    const auto starts = graph.nodes_of_kind(options.start_kind);

    PathSearch search(graph, options.end_kind, max_length, out.paths);
    for (const auto& s : starts) {
        if (search.run(s)) continue;
        out.limit_exceeded = true;
        out.truncated.push_back(s);
    }

    auto log = process_model::engine_logger();
    if (out.limit_exceeded) {
        log->warn("process '{}': path search exceeded {} nodes from {} start node(s); results are partial",
            graph.info().id, max_length, out.truncated.size());
    }
    log->debug("process '{}': {} path(s) from {} start(s)",
        graph.info().id, out.paths.size(), starts.size());
    return out;
}

} // namespace process_analysis
