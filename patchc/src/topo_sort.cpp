#include "patchc/topo_sort.hpp"
#include <algorithm>
#include <deque>
#include <unordered_map>

namespace patchc {

std::optional<std::vector<std::string>>
topological_order(const std::vector<std::string>& node_ids,
                  const std::vector<Connection>& connections) {
    std::unordered_map<std::string, std::size_t> indegree;
    std::unordered_map<std::string, std::vector<std::string>> adjacency;
    for (const auto& id : node_ids) {
        indegree.emplace(id, 0);
        adjacency.emplace(id, std::vector<std::string>{});
    }

    for (const auto& conn : connections) {
        if (!indegree.contains(conn.from_node_id) || !indegree.contains(conn.to_node_id)) {
            continue;
        }
        adjacency[conn.from_node_id].push_back(conn.to_node_id);
        ++indegree[conn.to_node_id];
    }

    std::vector<std::string> ready;
    for (const auto& [id, degree] : indegree) {
        if (degree == 0) ready.push_back(id);
    }
    std::sort(ready.begin(), ready.end());
    std::deque<std::string> queue(ready.begin(), ready.end());

    std::vector<std::string> ordered;
    ordered.reserve(indegree.size());

    while (!queue.empty()) {
        std::string id = std::move(queue.front());
        queue.pop_front();
        for (const auto& target : adjacency[id]) {
            if (--indegree[target] == 0) {
                queue.push_back(target);
            }
        }
        ordered.push_back(std::move(id));
    }

    if (ordered.size() != indegree.size()) {
        return std::nullopt;
    }
    return ordered;
}

} // namespace patchc
