#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace patchc {

/// Diagnostic severity levels
enum class Severity {
    Error,      // Compilation cannot succeed
    Warning,    // Input was ignored, compilation continues
};

/// Position inside a merge formula (1-based column, 0 = not applicable)
struct FormulaLocation {
    std::uint32_t column = 0;
    std::uint32_t length = 0;
};

/// A single diagnostic message
///
/// Diagnostics point at graph elements rather than source lines: the node and
/// port they concern, the instrument of a bundle they were raised for, and for
/// formula errors the column inside the formula text.
struct Diagnostic {
    Severity severity = Severity::Error;
    std::string code;           // Stable code (e.g., "E014", "W201")
    std::string message;        // Human-readable message
    std::uint32_t instrument = 0;  // 1-based instrument number, 0 = whole bundle
    std::string node_id;        // Node the diagnostic concerns (may be empty)
    std::string port_id;        // Port the diagnostic concerns (may be empty)
    FormulaLocation location;   // Column inside `formula`
    std::string formula;        // Formula text, for caret rendering
};

/// Format a diagnostic for terminal output
std::string format_diagnostic(const Diagnostic& diag);

/// Format a diagnostic as a single-line JSON object (for tooling)
std::string format_diagnostic_json(const Diagnostic& diag);

/// Check if any diagnostic is an error
bool has_errors(const std::vector<Diagnostic>& diagnostics);

/// Collect the plain messages of all errors, in order
std::vector<std::string> error_messages(const std::vector<Diagnostic>& diagnostics);

} // namespace patchc
