#include "patchc/patch_json.hpp"
#include "patchc/formula_parser.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace patchc {

namespace {

constexpr std::size_t MAX_NAME_LENGTH = 128;
constexpr std::size_t MAX_DESCRIPTION_LENGTH = 2'048;

[[noreturn]] void fail(std::string_view origin, const std::string& message) {
    throw std::runtime_error(std::string(origin) + ": " + message);
}

std::string required_string(const json& j, const char* key, std::string_view origin,
                            const std::string& where) {
    if (!j.contains(key) || !j.at(key).is_string()) {
        fail(origin, where + " requires string field '" + key + "'");
    }
    auto value = j.at(key).get<std::string>();
    if (value.empty()) {
        fail(origin, where + " field '" + key + "' must not be empty");
    }
    return value;
}

std::optional<std::int64_t> optional_integer(const json& j, const char* key,
                                             std::string_view origin) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    const auto& v = j.at(key);
    if (v.is_number_unsigned()) {
        if (v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return v.get<std::int64_t>();
        }
    } else if (v.is_number_integer()) {
        return v.get<std::int64_t>();
    } else if (v.is_number_float()) {
        // 2^63 bounds the range a double can be cast from
        constexpr double LIMIT = 9223372036854775808.0;
        double d = v.get<double>();
        if (std::trunc(d) == d && d >= -LIMIT && d < LIMIT) return static_cast<std::int64_t>(d);
    }
    fail(origin, std::string("engine_config field '") + key + "' must be an integer in range");
}

ParamValue to_param_value(const json& v, std::string_view origin, const std::string& where) {
    if (v.is_string())          return ParamValue{v.get<std::string>()};
    if (v.is_boolean())         return ParamValue{v.get<bool>()};
    if (v.is_number_unsigned() &&
        v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return ParamValue{v.get<double>()};
    }
    if (v.is_number_integer())  return ParamValue{v.get<std::int64_t>()};
    if (v.is_number_float())    return ParamValue{v.get<double>()};
    fail(origin, where + " must be a string, number or boolean");
}

// Round half to even
std::int64_t round_even(double value) {
    return static_cast<std::int64_t>(std::nearbyint(value));
}

EngineConfig parse_engine(const json& j, std::string_view origin) {
    if (!j.is_object()) {
        fail(origin, "engine_config must be an object");
    }

    EngineConfigInput input;
    input.sr = optional_integer(j, "sr", origin);
    input.control_rate = optional_integer(j, "control_rate", origin);
    input.ksmps = optional_integer(j, "ksmps", origin);
    input.nchnls = optional_integer(j, "nchnls", origin);

    const char* dbfs_key = j.contains("0dbfs") ? "0dbfs" : "zero_dbfs";
    if (j.contains(dbfs_key) && !j.at(dbfs_key).is_null()) {
        if (!j.at(dbfs_key).is_number()) {
            fail(origin, "engine_config field '0dbfs' must be a number");
        }
        input.zero_dbfs = j.at(dbfs_key).get<double>();
    }

    try {
        return resolve_engine_config(input);
    } catch (const std::invalid_argument& e) {
        fail(origin, e.what());
    }
}

Node parse_node(const json& j, std::string_view origin) {
    if (!j.is_object()) {
        fail(origin, "graph node must be an object");
    }

    Node node;
    node.id = required_string(j, "id", origin, "graph node");
    node.opcode = required_string(j, "opcode", origin, "node '" + node.id + "'");

    if (j.contains("params") && !j.at("params").is_null()) {
        const auto& params = j.at("params");
        if (!params.is_object()) {
            fail(origin, "node '" + node.id + "' params must be an object");
        }
        for (const auto& [key, value] : params.items()) {
            node.params.emplace(key, to_param_value(value, origin,
                                                    "node '" + node.id + "' param '" + key + "'"));
        }
    }

    if (j.contains("position") && j.at("position").is_object()) {
        const auto& pos = j.at("position");
        node.position.x = pos.value("x", 0.0);
        node.position.y = pos.value("y", 0.0);
    }
    return node;
}

Connection parse_connection(const json& j, std::string_view origin) {
    if (!j.is_object()) {
        fail(origin, "graph connection must be an object");
    }
    return Connection{
        .from_node_id = required_string(j, "from_node_id", origin, "connection"),
        .from_port_id = required_string(j, "from_port_id", origin, "connection"),
        .to_node_id = required_string(j, "to_node_id", origin, "connection"),
        .to_port_id = required_string(j, "to_port_id", origin, "connection"),
    };
}

// Entries the editor cannot interpret are skipped, never fatal
std::string trimmed(std::string_view text) {
    constexpr std::string_view SPACE = " \t\r\n\f\v";
    auto first = text.find_first_not_of(SPACE);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(SPACE);
    return std::string(text.substr(first, last - first + 1));
}

// Trimmed string field; empty when absent or not a string
std::string trimmed_field(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) return {};
    return trimmed(j.at(key).get<std::string>());
}

FormulaTable parse_formulas(const json& ui_layout) {
    FormulaTable table;
    if (!ui_layout.is_object() || !ui_layout.contains("input_formulas")) {
        return table;
    }
    const auto& formulas = ui_layout.at("input_formulas");
    if (!formulas.is_object()) {
        return table;
    }

    for (const auto& [key, entry] : formulas.items()) {
        auto sep = key.find("::");
        if (sep == std::string::npos || sep == 0) continue;
        PortRef ref{trimmed(key.substr(0, sep)), trimmed(key.substr(sep + 2))};
        if (ref.node_id.empty() || ref.port_id.empty()) continue;

        // Entries without a string expression and an inputs array are dropped whole
        if (!entry.is_object()) continue;
        if (!entry.contains("expression") || !entry.at("expression").is_string()) continue;
        if (!entry.contains("inputs") || !entry.at("inputs").is_array()) continue;

        InputFormula formula;
        formula.expression = entry.at("expression").get<std::string>();
        for (const auto& binding : entry.at("inputs")) {
            if (!binding.is_object()) continue;
            auto token = trimmed_field(binding, "token");
            auto from_node = trimmed_field(binding, "from_node_id");
            auto from_port = trimmed_field(binding, "from_port_id");
            if (from_node.empty() || from_port.empty() || !is_formula_identifier(token)) continue;
            formula.inputs.push_back(FormulaBinding{
                std::move(token), std::move(from_node), std::move(from_port)});
        }

        table.insert_or_assign(std::move(ref), std::move(formula));
    }
    return table;
}

PatchGraph parse_graph(const json& j, std::string_view origin) {
    if (!j.is_object()) {
        fail(origin, "graph must be an object");
    }

    PatchGraph graph;
    if (j.contains("nodes")) {
        if (!j.at("nodes").is_array()) fail(origin, "graph.nodes must be an array");
        for (const auto& n : j.at("nodes")) {
            graph.nodes.push_back(parse_node(n, origin));
        }
    }
    if (graph.nodes.size() > MAX_GRAPH_NODES) {
        fail(origin, "Patch exceeds maximum node count (" + std::to_string(MAX_GRAPH_NODES) + ")");
    }

    if (j.contains("connections")) {
        if (!j.at("connections").is_array()) fail(origin, "graph.connections must be an array");
        for (const auto& c : j.at("connections")) {
            graph.connections.push_back(parse_connection(c, origin));
        }
    }
    if (graph.connections.size() > MAX_GRAPH_CONNECTIONS) {
        fail(origin, "Patch exceeds maximum connection count (" +
                         std::to_string(MAX_GRAPH_CONNECTIONS) + ")");
    }

    if (auto duplicates = duplicate_node_ids(graph); !duplicates.empty()) {
        fail(origin, "Node IDs must be unique (duplicate '" + duplicates.front() + "')");
    }

    if (j.contains("ui_layout")) {
        graph.formulas = parse_formulas(j.at("ui_layout"));
    }
    if (j.contains("engine_config") && !j.at("engine_config").is_null()) {
        graph.engine = parse_engine(j.at("engine_config"), origin);
    }
    return graph;
}

PortSpec parse_port(const json& j, std::string_view origin, const std::string& opcode) {
    if (!j.is_object()) {
        fail(origin, "opcode '" + opcode + "' port must be an object");
    }

    PortSpec port;
    port.id = required_string(j, "id", origin, "opcode '" + opcode + "' port");
    port.name = j.value("name", port.id);

    const char* rate_key = j.contains("signal_type") ? "signal_type" : "rate";
    auto rate = parse_signal_rate(j.value(rate_key, std::string{}));
    if (!rate) {
        fail(origin, "opcode '" + opcode + "' port '" + port.id + "' has an unknown signal type");
    }
    port.rate = *rate;
    port.required = j.value("required", true);

    if (j.contains("default") && !j.at("default").is_null()) {
        port.default_value = to_param_value(j.at("default"), origin,
                                            "opcode '" + opcode + "' port '" + port.id + "' default");
    }

    if (j.contains("accepted_signal_types") && j.at("accepted_signal_types").is_array()) {
        for (const auto& r : j.at("accepted_signal_types")) {
            auto accepted = r.is_string() ? parse_signal_rate(r.get<std::string>()) : std::nullopt;
            if (!accepted) {
                fail(origin, "opcode '" + opcode + "' port '" + port.id +
                                 "' lists an unknown accepted signal type");
            }
            port.accepted_rates.push_back(*accepted);
        }
    }

    port.description = j.value("description", std::string{});
    return port;
}

OpcodeSpec parse_opcode(const json& j, std::string_view origin) {
    if (!j.is_object()) {
        fail(origin, "opcode entry must be an object");
    }

    OpcodeSpec spec;
    spec.name = required_string(j, "name", origin, "opcode");
    spec.category = j.value("category", std::string("custom"));
    spec.description = j.value("description", std::string{});
    spec.code_template = j.value("template", std::string{});

    if (j.contains("inputs")) {
        for (const auto& p : j.at("inputs")) spec.inputs.push_back(parse_port(p, origin, spec.name));
    }
    if (j.contains("outputs")) {
        for (const auto& p : j.at("outputs")) spec.outputs.push_back(parse_port(p, origin, spec.name));
    }
    if (j.contains("params")) {
        for (const auto& p : j.at("params")) {
            ParamSpec param;
            param.id = required_string(p, "id", origin, "opcode '" + spec.name + "' param");
            if (p.contains("default")) {
                const auto& d = p.at("default");
                param.default_value = d.is_string() ? d.get<std::string>() : d.dump();
            }
            spec.params.push_back(std::move(param));
        }
    }
    if (j.contains("tags") && j.at("tags").is_array()) {
        for (const auto& t : j.at("tags")) {
            if (t.is_string()) spec.tags.push_back(t.get<std::string>());
        }
    }
    return spec;
}

json parse_json(std::string_view text, std::string_view origin) {
    try {
        return json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        fail(origin, std::string("invalid JSON: ") + e.what());
    }
}

} // namespace

EngineConfig resolve_engine_config(const EngineConfigInput& input) {
    EngineConfig config;

    if (input.sr) {
        if (*input.sr < AUDIO_RATE_MIN || *input.sr > AUDIO_RATE_MAX) {
            throw std::invalid_argument("Audio sample rate must be between " +
                                        std::to_string(AUDIO_RATE_MIN) + " and " +
                                        std::to_string(AUDIO_RATE_MAX) + ".");
        }
        config.sr = static_cast<std::uint32_t>(*input.sr);
    }
    if (input.control_rate) {
        if (*input.control_rate < CONTROL_RATE_MIN || *input.control_rate > CONTROL_RATE_MAX) {
            throw std::invalid_argument("Control sample rate must be between " +
                                        std::to_string(CONTROL_RATE_MIN) + " and " +
                                        std::to_string(CONTROL_RATE_MAX) + ".");
        }
        config.control_rate = static_cast<std::uint32_t>(*input.control_rate);
    }
    if (input.ksmps) {
        if (*input.ksmps < 1) {
            throw std::invalid_argument("ksmps must be >= 1.");
        }
        config.ksmps = static_cast<std::uint32_t>(*input.ksmps);
    }
    if (input.nchnls) {
        if (*input.nchnls < 1) {
            throw std::invalid_argument("nchnls must be >= 1.");
        }
        config.nchnls = static_cast<std::uint32_t>(*input.nchnls);
    }
    if (input.zero_dbfs) {
        if (!(*input.zero_dbfs > 0.0)) {
            throw std::invalid_argument("0dbfs must be > 0.");
        }
        config.zero_dbfs = *input.zero_dbfs;
    }

    if (!input.control_rate && input.ksmps) {
        auto derived = round_even(static_cast<double>(config.sr) / config.ksmps);
        if (derived >= CONTROL_RATE_MIN && derived <= CONTROL_RATE_MAX) {
            config.control_rate = static_cast<std::uint32_t>(derived);
        }
    }

    auto ksmps = round_even(static_cast<double>(config.sr) / config.control_rate);
    config.ksmps = static_cast<std::uint32_t>(std::max<std::int64_t>(1, ksmps));
    return config;
}

Patch parse_patch(std::string_view text, std::string_view origin) {
    json j = parse_json(text, origin);
    if (!j.is_object()) {
        fail(origin, "patch document must be an object");
    }

    Patch patch;
    patch.id = j.value("id", std::string{});
    patch.name = required_string(j, "name", origin, "patch");
    if (patch.name.size() > MAX_NAME_LENGTH) {
        fail(origin, "patch name exceeds " + std::to_string(MAX_NAME_LENGTH) + " characters");
    }
    patch.description = j.value("description", std::string{});
    if (patch.description.size() > MAX_DESCRIPTION_LENGTH) {
        fail(origin, "patch description exceeds " + std::to_string(MAX_DESCRIPTION_LENGTH) +
                         " characters");
    }
    patch.schema_version = j.value("schema_version", 1);

    if (!j.contains("graph")) {
        fail(origin, "patch requires a 'graph' object");
    }
    patch.graph = parse_graph(j.at("graph"), origin);
    return patch;
}

Patch load_patch_file(const std::string& path) {
    return parse_patch(read_text_file(path), path);
}

std::size_t parse_opcodes(OpcodeRegistry& registry, std::string_view text,
                          std::string_view origin) {
    json j = parse_json(text, origin);
    const json* entries = &j;
    if (j.is_object()) {
        if (!j.contains("opcodes")) {
            fail(origin, "opcode document requires an 'opcodes' array");
        }
        entries = &j.at("opcodes");
    }
    if (!entries->is_array()) {
        fail(origin, "opcodes must be an array");
    }

    std::size_t count = 0;
    for (const auto& entry : *entries) {
        auto spec = parse_opcode(entry, origin);
        try {
            registry.add(std::move(spec));
        } catch (const std::invalid_argument& e) {
            fail(origin, e.what());
        }
        ++count;
    }
    return count;
}

std::size_t load_opcode_file(OpcodeRegistry& registry, const std::string& path) {
    return parse_opcodes(registry, read_text_file(path), path);
}

std::string read_text_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace patchc
