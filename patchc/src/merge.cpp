#include "patchc/merge.hpp"
#include "patchc/formula_lexer.hpp"
#include "patchc/formula_parser.hpp"
#include <set>

namespace patchc {

namespace {

std::string trim(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

Diagnostic make_diag(Severity severity, std::string_view code, std::string message,
                     const std::string& node_id, const std::string& port_id) {
    return Diagnostic{
        .severity = severity,
        .code = std::string(code),
        .message = std::move(message),
        .instrument = 0,
        .node_id = node_id,
        .port_id = port_id,
        .location = {},
        .formula = {}
    };
}

void append_stamped(std::vector<Diagnostic>& out, const std::vector<Diagnostic>& diags,
                    const std::string& node_id, const std::string& port_id) {
    for (auto diag : diags) {
        diag.node_id = node_id;
        diag.port_id = port_id;
        out.push_back(std::move(diag));
    }
}

std::string default_sum(const std::vector<InboundSource>& sources) {
    if (sources.size() == 1) {
        return sources.front().variable;
    }
    std::string sum;
    for (std::size_t i = 0; i < sources.size(); ++i) {
        if (i > 0) sum += " + ";
        sum += "(" + sources[i].variable + ")";
    }
    return sum;
}

} // namespace

MergeResult merge_inputs(const std::string& node_id, const std::string& port_id,
                         const std::vector<InboundSource>& sources,
                         const InputFormula* formula) {
    MergeResult result;
    const std::string target = node_id + "." + port_id;

    if (sources.size() == 1 && formula == nullptr) {
        result.expression = sources.front().variable;
        return result;
    }

    auto warn = [&](std::string message) {
        result.diagnostics.push_back(
            make_diag(Severity::Warning, "W201", std::move(message), node_id, port_id));
    };

    // Token assigned to each inbound edge, empty while unbound
    std::vector<std::string> edge_tokens(sources.size());
    std::set<std::string> used_tokens;

    if (formula != nullptr) {
        for (const auto& binding : formula->inputs) {
            const std::string source_label = binding.from_node_id + "." + binding.from_port_id;

            if (!is_formula_identifier(binding.token)) {
                warn("Formula binding token '" + binding.token + "' for '" + target +
                     "' is not a valid identifier; binding ignored.");
                continue;
            }
            if (used_tokens.contains(binding.token)) {
                warn("Formula token '" + binding.token + "' is bound more than once for '" +
                     target + "'; binding ignored.");
                continue;
            }

            bool has_edge = false;
            std::size_t edge = sources.size();
            for (std::size_t i = 0; i < sources.size(); ++i) {
                if (sources[i].from_node_id != binding.from_node_id ||
                    sources[i].from_port_id != binding.from_port_id) {
                    continue;
                }
                has_edge = true;
                if (edge_tokens[i].empty()) {
                    edge = i;
                    break;
                }
            }

            if (!has_edge) {
                warn("Formula token '" + binding.token + "' references '" + source_label +
                     "', which is not connected to '" + target + "'; binding ignored.");
                continue;
            }
            if (edge == sources.size()) {
                warn("Source '" + source_label + "' is bound to more than one token for '" +
                     target + "'; binding '" + binding.token + "' ignored.");
                continue;
            }

            edge_tokens[edge] = binding.token;
            used_tokens.insert(binding.token);
        }
    }

    // Remaining edges get the lowest free in<N> token
    std::uint32_t next_index = 1;
    for (auto& token : edge_tokens) {
        if (!token.empty()) continue;
        std::string candidate;
        do {
            candidate = "in" + std::to_string(next_index++);
        } while (used_tokens.contains(candidate));
        token = candidate;
        used_tokens.insert(candidate);
    }

    for (std::size_t i = 0; i < sources.size(); ++i) {
        result.tokens[edge_tokens[i]] = sources[i].variable;
    }

    if (formula == nullptr || !formula->expression.has_value()) {
        result.expression = default_sum(sources);
        return result;
    }

    std::string expression = trim(*formula->expression);
    if (expression.empty()) {
        result.diagnostics.push_back(make_diag(
            Severity::Error, "E201", "Formula for '" + target + "' is empty.", node_id, port_id));
        return result;
    }

    FormulaLexer lexer(expression, target);
    auto tokens = lexer.lex_all();
    append_stamped(result.diagnostics, lexer.diagnostics(), node_id, port_id);
    if (lexer.has_errors()) {
        return result;
    }

    FormulaParser parser(std::move(tokens), expression, used_tokens, target);
    auto ast = parser.parse();
    append_stamped(result.diagnostics, parser.diagnostics(), node_id, port_id);
    if (parser.has_errors() || !ast.valid()) {
        return result;
    }

    result.expression = render_formula(ast, result.tokens);
    return result;
}

} // namespace patchc
