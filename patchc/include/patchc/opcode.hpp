#pragma once

#include "patch.hpp"
#include "signal.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchc {

/// Typed input or output of an opcode
struct PortSpec {
    std::string id;
    std::string name;
    SignalRate rate = SignalRate::Control;
    bool required = true;
    std::optional<ParamValue> default_value;
    std::vector<SignalRate> accepted_rates;  // rates accepted besides `rate`
    std::string description;
};

/// Template placeholder that is not a port (e.g. the `value` of a constant)
struct ParamSpec {
    std::string id;
    std::string default_value = "0";  // rendered text used when the node omits it
};

/// Specification of one opcode: ports plus a code template.
///
/// The template references ports and parameters as `{id}`; `{{` and `}}`
/// produce literal braces.
struct OpcodeSpec {
    std::string name;
    std::string category;
    std::string description;
    std::vector<PortSpec> inputs;
    std::vector<PortSpec> outputs;
    std::vector<ParamSpec> params;
    std::string code_template;
    std::vector<std::string> tags;

    /// An opcode without outputs terminates the signal flow
    [[nodiscard]] bool is_sink() const { return outputs.empty(); }

    [[nodiscard]] const PortSpec* find_input(std::string_view id) const;
    [[nodiscard]] const PortSpec* find_output(std::string_view id) const;
    [[nodiscard]] const ParamSpec* find_param(std::string_view id) const;
};

/// Extract the placeholder names of a code template, in order of appearance.
/// Returns std::nullopt if the template has an unterminated or empty field.
std::optional<std::vector<std::string>> template_placeholders(std::string_view text);

/// Read-only catalogue of opcodes consulted by the compiler
class OpcodeRegistry {
public:
    OpcodeRegistry() = default;

    /// Registry pre-populated with the built-in opcode catalogue
    static OpcodeRegistry with_builtins();

    /// Register (or replace) an opcode.
    /// @throws std::invalid_argument if port ids collide or the template
    ///         references an undeclared port or parameter
    void add(OpcodeSpec spec);

    /// Look up an opcode by name
    [[nodiscard]] const OpcodeSpec* lookup(std::string_view name) const;

    /// All opcodes sorted by (category, name), optionally filtered by category
    [[nodiscard]] std::vector<const OpcodeSpec*> list(std::string_view category = {}) const;

    /// Opcode count per category
    [[nodiscard]] std::map<std::string, std::size_t> categories() const;

    [[nodiscard]] std::size_t size() const { return opcodes_.size(); }

private:
    std::map<std::string, OpcodeSpec, std::less<>> opcodes_;
};

/// Shared immutable registry holding the built-in catalogue
const OpcodeRegistry& builtin_registry();

} // namespace patchc
