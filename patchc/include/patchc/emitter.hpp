#pragma once

#include "diagnostics.hpp"
#include "opcode.hpp"
#include "patch.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchc {

// ============================================================================
// Node environment
// ============================================================================

/// Origin of a value bound to a template field
enum class BindingKind : std::uint8_t {
    Variable,    // Output variable of this or an upstream node
    Expression,  // Merged expression over several inbound variables
    Literal,     // Rendered parameter or default literal
    Omitted,     // Optional input left unresolved
};

struct TemplateValue {
    BindingKind kind = BindingKind::Literal;
    std::string text;
};

/// Fixed-schema binding of template fields for one node.
///
/// The slots are the opcode's declared inputs, outputs and parameters; binding
/// any other field is refused.
class NodeEnvironment {
public:
    explicit NodeEnvironment(const OpcodeSpec& spec);

    /// Bind a declared field. Returns false if the opcode does not declare it.
    bool bind(std::string_view field, TemplateValue value);

    [[nodiscard]] const TemplateValue* find(std::string_view field) const;
    [[nodiscard]] bool declares(std::string_view field) const;
    [[nodiscard]] bool is_bound(std::string_view field) const { return find(field) != nullptr; }

    [[nodiscard]] const OpcodeSpec& spec() const { return *spec_; }

private:
    struct Slot {
        std::string field;
        std::optional<TemplateValue> value;
    };

    Slot* slot(std::string_view field);
    [[nodiscard]] const Slot* slot(std::string_view field) const;

    const OpcodeSpec* spec_;
    std::vector<Slot> slots_;
};

/// Result of filling a code template
struct TemplateFill {
    std::optional<std::string> text;  // Absent if a field had no value
    std::string missing_field;
};

/// Substitute every `{field}` of a template with its bound value
[[nodiscard]] TemplateFill fill_template(std::string_view code_template,
                                         const NodeEnvironment& env);

/// Result of removing omission markers
struct MarkerCleanup {
    bool ok = true;
    std::string text;
    std::string offending_line;  // Original line with a marker that could not be removed
};

/// Strip omission markers that trail a line (after a comma or whitespace),
/// repeatedly, per line. A marker left anywhere else makes the cleanup fail.
[[nodiscard]] MarkerCleanup strip_optional_markers(std::string_view rendered);

/// Replace every character outside [A-Za-z0-9_] with '_'
[[nodiscard]] std::string sanitize_identifier(std::string_view text);

// ============================================================================
// Code emitter
// ============================================================================

/// Renders the lines of one instrument, node by node in dependency order.
///
/// Output variables are named `<prefix>_<node>_<port>_<n>` where n counts per
/// rate prefix within the instrument. A node that raises errors emits nothing;
/// later nodes are still emitted so every problem is reported.
class CodeEmitter {
public:
    /// @param graph Graph whose connections have already been validated
    explicit CodeEmitter(const PatchGraph& graph);

    /// Emit one node; returns false if the node raised errors
    bool emit_node(const Node& node, const OpcodeSpec& spec);

    [[nodiscard]] const std::vector<std::string>& lines() const { return lines_; }
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    /// Variable assigned to an output, if the node was already emitted
    [[nodiscard]] const std::string* output_variable(const std::string& node_id,
                                                     const std::string& port_id) const;

private:
    std::string allocate_variable(const std::string& node_id, const PortSpec& port);

    /// Resolve one input into `env`; returns false on error
    bool resolve_input(const Node& node, const PortSpec& port, NodeEnvironment& env);
    bool resolve_params(const Node& node, const OpcodeSpec& spec, NodeEnvironment& env);

    void error(std::string_view code, std::string message,
               const std::string& node_id, const std::string& port_id = {});
    void warning(std::string_view code, std::string message,
                 const std::string& node_id, const std::string& port_id = {});

    const PatchGraph& graph_;
    std::map<PortRef, std::vector<const Connection*>> inbound_;
    std::map<PortRef, std::string> output_vars_;
    std::array<std::uint32_t, 5> rate_counters_{};
    std::vector<std::string> lines_;
    std::vector<Diagnostic> diagnostics_;
};

} // namespace patchc
