#pragma once

#include "patch.hpp"
#include <optional>
#include <string>
#include <vector>

namespace patchc {

/// Order node ids so that every connection's source precedes its target.
///
/// Kahn's algorithm: the initial queue holds every zero-indegree node sorted by
/// id, nodes that become ready later are appended in edge order. Connections
/// whose endpoints are not in `node_ids` are ignored.
///
/// @return The order, or std::nullopt if the graph contains a cycle
std::optional<std::vector<std::string>>
topological_order(const std::vector<std::string>& node_ids,
                  const std::vector<Connection>& connections);

} // namespace patchc
