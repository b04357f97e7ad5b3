#pragma once

#include "diagnostics.hpp"
#include "patch.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace patchc {

/// One inbound edge of an input with the variable its source output was given
struct InboundSource {
    std::string from_node_id;
    std::string from_port_id;
    std::string variable;
};

/// Outcome of merging the inbound edges of one input
struct MergeResult {
    std::optional<std::string> expression;     // Absent when an error was raised
    std::map<std::string, std::string> tokens; // Token -> source variable actually bound
    std::vector<Diagnostic> diagnostics;
};

/// Build the expression feeding an input from its inbound edges.
///
/// A single edge without a formula yields the source variable. Otherwise
/// formula bindings are validated (rejected ones raise W201), remaining
/// sources receive the lowest free `in<N>` token, and the formula expression
/// is parsed and rendered. Without an expression the sources are summed in
/// edge order.
///
/// @param sources Inbound edges in connection order (at least one)
/// @param formula Formula configured for the input, or nullptr
[[nodiscard]] MergeResult merge_inputs(const std::string& node_id, const std::string& port_id,
                                       const std::vector<InboundSource>& sources,
                                       const InputFormula* formula);

} // namespace patchc
