#pragma once

#include <process_model/graph.hpp>
#include <process_model/types.hpp>
#include <map>
#include <string>
#include <vector>

namespace process_model {

// Narrow contract to whatever store holds process definitions.
class GraphProvider {
public:
    virtual ~GraphProvider() = default;

    // Throws NotFoundError when the store has no such process.
    virtual ProcessGraph fetch_graph(const std::string& process_id) const = 0;
    virtual std::vector<ProcessInfo> list_processes() const = 0;
};

class InMemoryGraphProvider : public GraphProvider {
public:
    // Replaces any graph already stored under the same process id.
    void add(ProcessGraph graph);
    bool remove(const std::string& process_id);
    std::size_t size() const { return graphs_.size(); }

    ProcessGraph fetch_graph(const std::string& process_id) const override;
    // Ordered by process id.
    std::vector<ProcessInfo> list_processes() const override;

private:
    std::map<std::string, ProcessGraph> graphs_;
};

} // namespace process_model
