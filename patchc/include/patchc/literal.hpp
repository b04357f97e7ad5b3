#pragma once

#include "patch.hpp"
#include "signal.hpp"
#include <string>
#include <string_view>

namespace patchc {

/// Marker filling an unresolved optional input until the template is cleaned
constexpr std::string_view OPTIONAL_OMIT_MARKER = "__PATCHC_OPTIONAL_OMIT__";

/// Result of rendering a parameter literal
struct FormattedLiteral {
    bool ok = false;
    std::string text;       // Rendered literal when ok
    std::string code;       // Diagnostic code when !ok (E040, E041)
    std::string message;
};

/// Render a literal value for an input of the given rate.
///
/// String-rate inputs take quoted strings only. Booleans render as 1/0,
/// numbers in their shortest round-trip form. A string given to a numeric
/// input must consist of digits, identifier characters, spaces, dots,
/// parentheses and the four arithmetic operators; anything else is blocked.
[[nodiscard]] FormattedLiteral format_literal(const ParamValue& value, SignalRate rate);

/// Shortest round-trip text of a double, always carrying a fraction or exponent
/// (440.0, 0.25, 1e-05)
[[nodiscard]] std::string format_number(double value);

/// Check the character set accepted for expressions on numeric inputs
[[nodiscard]] bool is_safe_expression(std::string_view text);

} // namespace patchc
