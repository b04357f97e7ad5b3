#include "patchc/patch.hpp"
#include <algorithm>
#include <set>

namespace patchc {

std::vector<std::string> duplicate_node_ids(const PatchGraph& graph) {
    std::set<std::string> seen;
    std::vector<std::string> duplicates;
    for (const auto& node : graph.nodes) {
        if (!seen.insert(node.id).second &&
            std::find(duplicates.begin(), duplicates.end(), node.id) == duplicates.end()) {
            duplicates.push_back(node.id);
        }
    }
    return duplicates;
}

} // namespace patchc
