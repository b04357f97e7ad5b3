#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace patchc {

/// Literal parameter value attached to a node
using ParamValue = std::variant<std::string, std::int64_t, double, bool>;

/// Editor position of a node (carried through, never interpreted)
struct NodePosition {
    double x = 0.0;
    double y = 0.0;
};

/// One opcode instance in a patch graph
struct Node {
    std::string id;
    std::string opcode;
    std::map<std::string, ParamValue> params;  // keyed by port or parameter id
    NodePosition position;
};

/// Directed edge from an output port to an input port
struct Connection {
    std::string from_node_id;
    std::string from_port_id;
    std::string to_node_id;
    std::string to_port_id;
};

/// (node, port) pair used as a key for inputs and outputs
struct PortRef {
    std::string node_id;
    std::string port_id;

    auto operator<=>(const PortRef&) const = default;
};

/// Named binding of a formula token to an inbound source
struct FormulaBinding {
    std::string token;
    std::string from_node_id;
    std::string from_port_id;
};

/// Merge formula configured for one input port
struct InputFormula {
    std::optional<std::string> expression;  // absent = default sum
    std::vector<FormulaBinding> inputs;
};

/// Formulas keyed by the input they merge into
using FormulaTable = std::map<PortRef, InputFormula>;

/// Global settings of the synthesis engine
struct EngineConfig {
    std::uint32_t sr = 44'100;
    std::uint32_t control_rate = 4'400;
    std::uint32_t ksmps = 10;
    std::uint32_t nchnls = 2;
    double zero_dbfs = 1.0;
};

/// Limits enforced when a graph is loaded
constexpr std::uint32_t AUDIO_RATE_MIN = 22'000;
constexpr std::uint32_t AUDIO_RATE_MAX = 48'000;
constexpr std::uint32_t CONTROL_RATE_MIN = 25;
constexpr std::uint32_t CONTROL_RATE_MAX = 48'000;
constexpr std::size_t MAX_GRAPH_NODES = 500;
constexpr std::size_t MAX_GRAPH_CONNECTIONS = 2'000;

struct PatchGraph {
    std::vector<Node> nodes;
    std::vector<Connection> connections;
    FormulaTable formulas;
    EngineConfig engine;

    /// Find a node by id (linear scan, graphs are small)
    [[nodiscard]] const Node* find_node(const std::string& id) const {
        for (const auto& node : nodes) {
            if (node.id == id) return &node;
        }
        return nullptr;
    }

    /// Formula configured for an input, if any
    [[nodiscard]] const InputFormula* find_formula(const std::string& node_id,
                                                   const std::string& port_id) const {
        auto it = formulas.find(PortRef{node_id, port_id});
        return it == formulas.end() ? nullptr : &it->second;
    }
};

struct Patch {
    std::string id;
    std::string name;
    std::string description;
    int schema_version = 1;
    PatchGraph graph;
};

/// A patch compiled as one instrument of a bundle
struct InstrumentTarget {
    Patch patch;
    int midi_channel = 0;  // 0 = omni / no explicit channel
};

/// Node ids that occur more than once, in first-seen order
std::vector<std::string> duplicate_node_ids(const PatchGraph& graph);

} // namespace patchc
