#include "patchc/compiler.hpp"
#include "patchc/emitter.hpp"
#include "patchc/literal.hpp"
#include "patchc/topo_sort.hpp"
#include <map>
#include <sstream>

namespace patchc {

namespace {

Diagnostic make_error(std::string_view code, std::string message,
                      std::string node_id = {}, std::string port_id = {}) {
    return Diagnostic{
        .severity = Severity::Error,
        .code = std::string(code),
        .message = std::move(message),
        .instrument = 0,
        .node_id = std::move(node_id),
        .port_id = std::move(port_id),
        .location = {},
        .formula = {}
    };
}

std::string_view rate_name(SignalRate rate) {
    switch (rate) {
        case SignalRate::Audio:         return "audio";
        case SignalRate::Control:       return "control";
        case SignalRate::Init:          return "init";
        case SignalRate::String:        return "string";
        case SignalRate::FunctionTable: return "ftable";
    }
    return "?";
}

using ResolvedNodes = std::map<std::string, const OpcodeSpec*>;

void validate_connections(const PatchGraph& graph, const ResolvedNodes& resolved,
                          std::vector<Diagnostic>& diagnostics) {
    for (const auto& conn : graph.connections) {
        auto source = resolved.find(conn.from_node_id);
        auto target = resolved.find(conn.to_node_id);

        if (source == resolved.end()) {
            diagnostics.push_back(make_error(
                "E010", "Connection source node not found: '" + conn.from_node_id + "'",
                conn.from_node_id));
            continue;
        }
        if (target == resolved.end()) {
            diagnostics.push_back(make_error(
                "E011", "Connection target node not found: '" + conn.to_node_id + "'",
                conn.to_node_id));
            continue;
        }

        const PortSpec* source_port = source->second->find_output(conn.from_port_id);
        const PortSpec* target_port = target->second->find_input(conn.to_port_id);

        if (!source_port) {
            diagnostics.push_back(make_error(
                "E012", "Unknown source port '" + conn.from_port_id + "' on node '" +
                            conn.from_node_id + "' (" + source->second->name + ")",
                conn.from_node_id, conn.from_port_id));
            continue;
        }
        if (!target_port) {
            diagnostics.push_back(make_error(
                "E013", "Unknown target port '" + conn.to_port_id + "' on node '" +
                            conn.to_node_id + "' (" + target->second->name + ")",
                conn.to_node_id, conn.to_port_id));
            continue;
        }

        if (!is_compatible_rate(source_port->rate, target_port->rate,
                                target_port->accepted_rates)) {
            diagnostics.push_back(make_error(
                "E014", "Signal type mismatch: " + conn.from_node_id + "." + source_port->id +
                            " (" + std::string(rate_name(source_port->rate)) + ") -> " +
                            conn.to_node_id + "." + target_port->id + " (" +
                            std::string(rate_name(target_port->rate)) + ")",
                conn.to_node_id, conn.to_port_id));
        }
    }
}

void check_formula_targets(const PatchGraph& graph, const ResolvedNodes& resolved,
                           std::vector<Diagnostic>& diagnostics) {
    for (const auto& [ref, formula] : graph.formulas) {
        auto it = resolved.find(ref.node_id);
        if (it != resolved.end() && it->second->find_input(ref.port_id)) {
            continue;
        }
        auto diag = make_error("W202", "Formula for '" + ref.node_id + "." + ref.port_id +
                                           "' targets an input that does not exist; ignored.",
                               ref.node_id, ref.port_id);
        diag.severity = Severity::Warning;
        diagnostics.push_back(std::move(diag));
    }
}

void stamp_instrument(std::vector<Diagnostic>& diagnostics, std::uint32_t instrument) {
    for (auto& diag : diagnostics) {
        diag.instrument = instrument;
    }
}

} // namespace

InstrumentResult compile_instrument(const PatchGraph& graph, const OpcodeRegistry& registry) {
    InstrumentResult result;
    auto& diags = result.diagnostics;

    if (graph.nodes.empty()) {
        diags.push_back(make_error("E001",
            "Patch graph is empty. Add opcode nodes before compiling."));
        return result;
    }

    auto duplicates = duplicate_node_ids(graph);
    if (!duplicates.empty()) {
        for (const auto& id : duplicates) {
            diags.push_back(make_error("E002", "Duplicate node id '" + id + "'.", id));
        }
        return result;
    }

    // Resolve every opcode before failing
    ResolvedNodes resolved;
    for (const auto& node : graph.nodes) {
        const OpcodeSpec* spec = registry.lookup(node.opcode);
        if (!spec) {
            diags.push_back(make_error("E003", "Node '" + node.id +
                                                   "' references unknown opcode '" +
                                                   node.opcode + "'.",
                                       node.id));
            continue;
        }
        resolved.emplace(node.id, spec);
    }
    if (has_errors(diags)) {
        return result;
    }

    std::vector<std::string> sinks;
    for (const auto& node : graph.nodes) {
        if (resolved.at(node.id)->is_sink()) {
            sinks.push_back(node.id);
        }
    }
    if (sinks.empty()) {
        diags.push_back(make_error("E004",
            "Patch must include exactly one sink node (an opcode without outputs, e.g. 'outs')."));
        return result;
    }
    if (sinks.size() > 1) {
        std::string names;
        for (const auto& id : sinks) {
            if (!names.empty()) names += ", ";
            names += "'" + id + "'";
        }
        diags.push_back(make_error("E005", "Patch has " + std::to_string(sinks.size()) +
                                               " sink nodes (" + names +
                                               "); exactly one is allowed."));
        return result;
    }

    validate_connections(graph, resolved, diags);
    if (has_errors(diags)) {
        return result;
    }
    check_formula_targets(graph, resolved, diags);

    std::vector<std::string> node_ids;
    node_ids.reserve(graph.nodes.size());
    for (const auto& node : graph.nodes) {
        node_ids.push_back(node.id);
    }
    auto order = topological_order(node_ids, graph.connections);
    if (!order) {
        diags.push_back(make_error("E020",
            "Graph contains a cycle. Add explicit delay/feedback opcodes to break direct recursion."));
        return result;
    }

    CodeEmitter emitter(graph);
    for (const auto& id : *order) {
        emitter.emit_node(*graph.find_node(id), *resolved.at(id));
    }
    diags.insert(diags.end(), emitter.diagnostics().begin(), emitter.diagnostics().end());

    if (has_errors(diags)) {
        return result;
    }

    result.lines = emitter.lines();
    result.success = true;
    return result;
}

std::string orchestra_header(const EngineConfig& engine) {
    std::ostringstream out;
    out << "sr = " << engine.sr << "\n";
    out << "ksmps = " << engine.ksmps << "\n";
    out << "nchnls = " << engine.nchnls << "\n";
    out << "0dbfs = " << format_number(engine.zero_dbfs) << "\n";
    out << "\n";
    return out.str();
}

std::string wrap_document(const std::string& orc, const CompileOptions& options) {
    std::ostringstream out;
    out << "<CsoundSynthesizer>\n";
    out << "<CsOptions>\n";
    out << "-d -odac -M" << options.midi_input << " -+rtmidi=" << options.rtmidi_module;
    if (options.rtaudio_module) {
        out << " -+rtaudio=" << *options.rtaudio_module;
    }
    out << " -b " << options.software_buffer << " -B" << options.hardware_buffer << "\n";
    out << "</CsOptions>\n";
    out << "<CsInstruments>\n";
    out << orc << "\n";
    out << "</CsInstruments>\n";
    out << "<CsScore>\n";
    out << "f 1 0 16384 10 1\n";
    out << "f 0 z\n";
    out << "</CsScore>\n";
    out << "</CsoundSynthesizer>";
    return out.str();
}

CompileResult compile(std::span<const InstrumentTarget> targets, const CompileOptions& options) {
    CompileResult result;
    const OpcodeRegistry& registry = options.registry ? *options.registry : builtin_registry();

    if (targets.empty()) {
        result.diagnostics.push_back(make_error("E052", "Bundle contains no instruments."));
        return result;
    }

    // Channel bindings across the bundle
    std::map<int, std::uint32_t> channel_owner;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        auto instrument = static_cast<std::uint32_t>(i + 1);
        int channel = targets[i].midi_channel;
        if (channel < 0 || channel > 16) {
            auto diag = make_error("E050", "MIDI channel " + std::to_string(channel) +
                                               " is outside 0..16.");
            diag.instrument = instrument;
            result.diagnostics.push_back(std::move(diag));
            continue;
        }
        if (channel == 0) continue;

        auto [it, inserted] = channel_owner.emplace(channel, instrument);
        if (!inserted) {
            auto diag = make_error("E051", "MIDI channel " + std::to_string(channel) +
                                               " is bound to instruments " +
                                               std::to_string(it->second) + " and " +
                                               std::to_string(instrument) + ".");
            diag.instrument = instrument;
            result.diagnostics.push_back(std::move(diag));
        }
    }

    std::vector<std::vector<std::string>> bodies;
    bodies.reserve(targets.size());
    for (std::size_t i = 0; i < targets.size(); ++i) {
        auto instrument = compile_instrument(targets[i].patch.graph, registry);
        stamp_instrument(instrument.diagnostics, static_cast<std::uint32_t>(i + 1));
        result.diagnostics.insert(result.diagnostics.end(),
                                  instrument.diagnostics.begin(), instrument.diagnostics.end());
        bodies.push_back(std::move(instrument.lines));
    }

    if (has_errors(result.diagnostics)) {
        return result;
    }

    std::ostringstream orc;
    orc << orchestra_header(targets.front().patch.graph.engine);
    for (std::size_t i = 0; i < targets.size(); ++i) {
        const auto number = i + 1;
        if (i > 0) orc << "\n";
        orc << "massign " << targets[i].midi_channel << ", " << number << "\n";
        orc << "\n";
        orc << "instr " << number << "\n";
        for (const auto& line : bodies[i]) {
            if (line.empty()) {
                orc << "\n";
            } else {
                orc << "  " << line << "\n";
            }
        }
        orc << "endin";
        if (i + 1 < targets.size()) orc << "\n";
    }

    result.orc = orc.str();
    result.csd = wrap_document(result.orc, options);
    result.success = true;
    return result;
}

CompileResult compile_patch(const Patch& patch, const CompileOptions& options) {
    InstrumentTarget target{patch, 0};
    return compile(std::span<const InstrumentTarget>(&target, 1), options);
}

} // namespace patchc
