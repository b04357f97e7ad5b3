#include "patchc/emitter.hpp"
#include "patchc/literal.hpp"
#include "patchc/merge.hpp"
#include <set>

namespace patchc {

// ============================================================================
// NodeEnvironment
// ============================================================================

NodeEnvironment::NodeEnvironment(const OpcodeSpec& spec)
    : spec_(&spec)
{
    slots_.reserve(spec.inputs.size() + spec.outputs.size() + spec.params.size());
    for (const auto& port : spec.inputs) slots_.push_back(Slot{port.id, std::nullopt});
    for (const auto& port : spec.outputs) slots_.push_back(Slot{port.id, std::nullopt});
    for (const auto& param : spec.params) slots_.push_back(Slot{param.id, std::nullopt});
}

NodeEnvironment::Slot* NodeEnvironment::slot(std::string_view field) {
    for (auto& s : slots_) {
        if (s.field == field) return &s;
    }
    return nullptr;
}

const NodeEnvironment::Slot* NodeEnvironment::slot(std::string_view field) const {
    for (const auto& s : slots_) {
        if (s.field == field) return &s;
    }
    return nullptr;
}

bool NodeEnvironment::bind(std::string_view field, TemplateValue value) {
    Slot* s = slot(field);
    if (!s) return false;
    s->value = std::move(value);
    return true;
}

const TemplateValue* NodeEnvironment::find(std::string_view field) const {
    const Slot* s = slot(field);
    if (!s || !s->value) return nullptr;
    return &*s->value;
}

bool NodeEnvironment::declares(std::string_view field) const {
    return slot(field) != nullptr;
}

// ============================================================================
// Template helpers
// ============================================================================

TemplateFill fill_template(std::string_view code_template, const NodeEnvironment& env) {
    TemplateFill fill;
    std::string out;
    out.reserve(code_template.size() + 64);

    std::size_t i = 0;
    while (i < code_template.size()) {
        char c = code_template[i];
        if ((c == '{' || c == '}') && i + 1 < code_template.size() && code_template[i + 1] == c) {
            out += c;
            i += 2;
            continue;
        }
        if (c == '{') {
            auto close = code_template.find('}', i + 1);
            if (close == std::string_view::npos) {
                fill.missing_field = std::string(code_template.substr(i));
                return fill;
            }
            auto field = code_template.substr(i + 1, close - i - 1);
            const TemplateValue* value = env.find(field);
            if (!value) {
                fill.missing_field = std::string(field);
                return fill;
            }
            if (value->kind == BindingKind::Omitted) {
                out += OPTIONAL_OMIT_MARKER;
            } else {
                out += value->text;
            }
            i = close + 1;
            continue;
        }
        out += c;
        ++i;
    }

    fill.text = std::move(out);
    return fill;
}

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view rstrip(std::string_view text) {
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

// Remove one trailing marker preceded by a comma or whitespace.
// Returns false if the line does not end that way.
bool strip_trailing_marker(std::string& line) {
    std::string_view view = rstrip(line);
    if (view.size() < OPTIONAL_OMIT_MARKER.size() ||
        view.substr(view.size() - OPTIONAL_OMIT_MARKER.size()) != OPTIONAL_OMIT_MARKER) {
        return false;
    }

    std::string_view before = view.substr(0, view.size() - OPTIONAL_OMIT_MARKER.size());
    std::string_view stripped = rstrip(before);
    if (!stripped.empty() && stripped.back() == ',') {
        line = std::string(stripped.substr(0, stripped.size() - 1));
        return true;
    }
    if (stripped.size() < before.size()) {
        line = std::string(stripped);
        return true;
    }
    return false;
}

} // namespace

MarkerCleanup strip_optional_markers(std::string_view rendered) {
    MarkerCleanup cleanup;
    std::size_t start = 0;
    bool first = true;

    while (start <= rendered.size()) {
        auto end = rendered.find('\n', start);
        if (end == std::string_view::npos) end = rendered.size();
        std::string_view raw = rendered.substr(start, end - start);

        std::string line(raw);
        while (strip_trailing_marker(line)) {}

        if (line.find(OPTIONAL_OMIT_MARKER) != std::string::npos) {
            cleanup.ok = false;
            cleanup.offending_line = std::string(raw);
            return cleanup;
        }

        if (!first) cleanup.text += '\n';
        cleanup.text += line;
        first = false;

        if (end == rendered.size()) break;
        start = end + 1;
    }
    return cleanup;
}

std::string sanitize_identifier(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_';
        if (!keep) c = '_';
    }
    return out;
}

// ============================================================================
// CodeEmitter
// ============================================================================

CodeEmitter::CodeEmitter(const PatchGraph& graph)
    : graph_(graph)
{
    std::set<std::string> node_ids;
    for (const auto& node : graph.nodes) {
        node_ids.insert(node.id);
    }

    for (const auto& conn : graph.connections) {
        if (!node_ids.contains(conn.from_node_id) || !node_ids.contains(conn.to_node_id)) {
            continue;
        }
        inbound_[PortRef{conn.to_node_id, conn.to_port_id}].push_back(&conn);
    }
}

const std::string* CodeEmitter::output_variable(const std::string& node_id,
                                                const std::string& port_id) const {
    auto it = output_vars_.find(PortRef{node_id, port_id});
    return it == output_vars_.end() ? nullptr : &it->second;
}

std::string CodeEmitter::allocate_variable(const std::string& node_id, const PortSpec& port) {
    auto& counter = rate_counters_[static_cast<std::size_t>(port.rate)];
    ++counter;
    return std::string(signal_rate_prefix(port.rate)) + "_" + sanitize_identifier(node_id) +
           "_" + sanitize_identifier(port.id) + "_" + std::to_string(counter);
}

bool CodeEmitter::emit_node(const Node& node, const OpcodeSpec& spec) {
    NodeEnvironment env(spec);

    // Outputs first, so downstream nodes resolve even when this node fails
    for (const auto& port : spec.outputs) {
        auto var = allocate_variable(node.id, port);
        output_vars_[PortRef{node.id, port.id}] = var;
        env.bind(port.id, TemplateValue{BindingKind::Variable, std::move(var)});
    }

    bool ok = true;
    for (const auto& port : spec.inputs) {
        ok = resolve_input(node, port, env) && ok;
    }
    ok = resolve_params(node, spec, env) && ok;
    if (!ok) {
        return false;
    }

    auto fill = fill_template(spec.code_template, env);
    if (!fill.text) {
        error("E032", "Template value missing for node '" + node.id + "': '" +
                          fill.missing_field + "'.",
              node.id);
        return false;
    }

    auto cleanup = strip_optional_markers(*fill.text);
    if (!cleanup.ok) {
        error("E033", "Unsupported optional argument placement in opcode template line: '" +
                          cleanup.offending_line + "'",
              node.id);
        return false;
    }

    lines_.push_back("; node:" + node.id + " opcode:" + spec.name);
    std::size_t start = 0;
    while (true) {
        auto end = cleanup.text.find('\n', start);
        if (end == std::string::npos) {
            lines_.push_back(cleanup.text.substr(start));
            break;
        }
        lines_.push_back(cleanup.text.substr(start, end - start));
        start = end + 1;
    }
    return true;
}

bool CodeEmitter::resolve_input(const Node& node, const PortSpec& port, NodeEnvironment& env) {
    const InputFormula* formula = graph_.find_formula(node.id, port.id);

    auto inbound = inbound_.find(PortRef{node.id, port.id});
    if (inbound != inbound_.end() && !inbound->second.empty()) {
        std::vector<InboundSource> sources;
        bool resolved = true;
        for (const Connection* conn : inbound->second) {
            const std::string* var = output_variable(conn->from_node_id, conn->from_port_id);
            if (!var) {
                error("E031", "Internal compiler error: unresolved source variable for " +
                                  conn->from_node_id + "." + conn->from_port_id,
                      node.id, port.id);
                resolved = false;
                continue;
            }
            sources.push_back(InboundSource{conn->from_node_id, conn->from_port_id, *var});
        }
        if (!resolved) {
            return false;
        }

        auto merge = merge_inputs(node.id, port.id, sources, formula);
        diagnostics_.insert(diagnostics_.end(), merge.diagnostics.begin(), merge.diagnostics.end());
        if (!merge.expression) {
            return false;
        }

        auto kind = (sources.size() == 1 && formula == nullptr) ? BindingKind::Variable
                                                                : BindingKind::Expression;
        env.bind(port.id, TemplateValue{kind, std::move(*merge.expression)});
        return true;
    }

    if (formula) {
        warning("W203", "Formula for '" + node.id + "." + port.id +
                            "' has no inbound connections; ignored.",
                node.id, port.id);
    }

    const ParamValue* literal = nullptr;
    if (auto it = node.params.find(port.id); it != node.params.end()) {
        literal = &it->second;
    } else if (port.default_value) {
        literal = &*port.default_value;
    }

    if (literal) {
        auto formatted = format_literal(*literal, port.rate);
        if (!formatted.ok) {
            error(formatted.code, formatted.message, node.id, port.id);
            return false;
        }
        env.bind(port.id, TemplateValue{BindingKind::Literal, std::move(formatted.text)});
        return true;
    }

    if (port.required) {
        error("E030", "Missing required input '" + port.id + "' on node '" + node.id + "' (" +
                          env.spec().name + ").",
              node.id, port.id);
        return false;
    }

    env.bind(port.id, TemplateValue{BindingKind::Omitted, {}});
    return true;
}

bool CodeEmitter::resolve_params(const Node& node, const OpcodeSpec& spec, NodeEnvironment& env) {
    bool ok = true;

    for (const auto& [key, value] : node.params) {
        if (spec.find_input(key)) continue;

        if (!spec.find_param(key)) {
            warning("W101", "Node '" + node.id + "' parameter '" + key +
                                "' matches no input or parameter of opcode '" + spec.name +
                                "'; ignored.",
                    node.id, key);
            continue;
        }

        auto formatted = format_literal(value, SignalRate::Control);
        if (!formatted.ok) {
            error(formatted.code, formatted.message, node.id, key);
            ok = false;
            continue;
        }
        env.bind(key, TemplateValue{BindingKind::Literal, std::move(formatted.text)});
    }

    for (const auto& param : spec.params) {
        if (!env.is_bound(param.id)) {
            env.bind(param.id, TemplateValue{BindingKind::Literal, param.default_value});
        }
    }
    return ok;
}

void CodeEmitter::error(std::string_view code, std::string message,
                        const std::string& node_id, const std::string& port_id) {
    diagnostics_.push_back(Diagnostic{
        .severity = Severity::Error,
        .code = std::string(code),
        .message = std::move(message),
        .instrument = 0,
        .node_id = node_id,
        .port_id = port_id,
        .location = {},
        .formula = {}
    });
}

void CodeEmitter::warning(std::string_view code, std::string message,
                          const std::string& node_id, const std::string& port_id) {
    diagnostics_.push_back(Diagnostic{
        .severity = Severity::Warning,
        .code = std::string(code),
        .message = std::move(message),
        .instrument = 0,
        .node_id = node_id,
        .port_id = port_id,
        .location = {},
        .formula = {}
    });
}

} // namespace patchc
