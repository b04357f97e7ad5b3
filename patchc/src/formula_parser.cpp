#include "patchc/formula_parser.hpp"
#include <algorithm>

namespace patchc {

namespace {

bool is_function_name(std::string_view name) {
    return std::find(FORMULA_FUNCTIONS.begin(), FORMULA_FUNCTIONS.end(), name) !=
           FORMULA_FUNCTIONS.end();
}

bool is_literal_identifier(std::string_view name) {
    return std::find(FORMULA_LITERAL_IDENTIFIERS.begin(), FORMULA_LITERAL_IDENTIFIERS.end(),
                     name) != FORMULA_LITERAL_IDENTIFIERS.end();
}

} // namespace

FormulaParser::FormulaParser(std::vector<FormulaToken> tokens, std::string_view source,
                             std::set<std::string> bound_tokens, std::string_view target)
    : tokens_(std::move(tokens))
    , source_(source)
    , bound_tokens_(std::move(bound_tokens))
    , target_(target)
{
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        tokens_.push_back(FormulaToken{
            .type = FormulaTokenType::Eof,
            .lexeme = {},
            .column = static_cast<std::uint32_t>(source_.size() + 1),
            .length = 0
        });
    }
}

FormulaAst FormulaParser::parse() {
    nodes_.clear();
    diagnostics_.clear();
    current_idx_ = 0;

    std::uint32_t root = parse_expression();

    if (root != NO_FORMULA_NODE && !current().is_eof()) {
        const auto& tok = current();
        if (tok.type == FormulaTokenType::RParen) {
            error_at(tok, "E205", "Unmatched ')'" + position_suffix(tok) +
                                      " in formula for '" + target_ + "'.");
        } else {
            error_at(tok, "E206", "Unexpected token '" + std::string(tok.lexeme) + "'" +
                                      position_suffix(tok) + " in formula for '" + target_ + "'.");
        }
        root = NO_FORMULA_NODE;
    }

    if (has_errors()) {
        root = NO_FORMULA_NODE;
    }

    FormulaAst ast;
    ast.nodes = std::move(nodes_);
    ast.root = root;
    return ast;
}

// Token navigation

const FormulaToken& FormulaParser::current() const {
    return tokens_[current_idx_];
}

bool FormulaParser::check(FormulaTokenType type) const {
    return current().type == type;
}

bool FormulaParser::match(FormulaTokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

const FormulaToken& FormulaParser::advance() {
    const FormulaToken& tok = tokens_[current_idx_];
    if (!tok.is_eof()) {
        ++current_idx_;
    }
    return tok;
}

// Grammar

std::uint32_t FormulaParser::parse_expression() {
    std::uint32_t left = parse_term();
    if (left == NO_FORMULA_NODE) return NO_FORMULA_NODE;

    while (check(FormulaTokenType::Plus) || check(FormulaTokenType::Minus)) {
        const FormulaToken& op = advance();
        std::uint32_t right = parse_term();
        if (right == NO_FORMULA_NODE) return NO_FORMULA_NODE;
        left = make_binary(op.lexeme[0], left, right, op);
    }
    return left;
}

std::uint32_t FormulaParser::parse_term() {
    std::uint32_t left = parse_factor();
    if (left == NO_FORMULA_NODE) return NO_FORMULA_NODE;

    while (check(FormulaTokenType::Star) || check(FormulaTokenType::Slash)) {
        const FormulaToken& op = advance();
        std::uint32_t right = parse_factor();
        if (right == NO_FORMULA_NODE) return NO_FORMULA_NODE;
        left = make_binary(op.lexeme[0], left, right, op);
    }
    return left;
}

std::uint32_t FormulaParser::parse_factor() {
    const FormulaToken& tok = current();

    switch (tok.type) {
        case FormulaTokenType::Plus:
        case FormulaTokenType::Minus: {
            advance();
            std::uint32_t operand = parse_factor();
            if (operand == NO_FORMULA_NODE) return NO_FORMULA_NODE;
            std::uint32_t node = make_node(FormulaNodeKind::Unary, tok);
            nodes_[node].op = tok.lexeme[0];
            nodes_[node].lhs = operand;
            return node;
        }

        case FormulaTokenType::Number:
            advance();
            return make_node(FormulaNodeKind::Number, tok);

        case FormulaTokenType::Identifier: {
            advance();
            if (check(FormulaTokenType::LParen)) {
                return parse_call(tok);
            }
            std::string name(tok.lexeme);
            if (!bound_tokens_.contains(name) && !is_literal_identifier(name)) {
                // Keep parsing so every unknown token is reported
                error_at(tok, "E204", "Unknown input token '" + name + "'" +
                                          position_suffix(tok) + " in formula for '" +
                                          target_ + "'.");
            }
            return make_node(FormulaNodeKind::Identifier, tok);
        }

        case FormulaTokenType::LParen:
            advance();
            return parse_grouping(tok);

        case FormulaTokenType::Eof:
            error_at(tok, "E207", "Unexpected end of formula for '" + target_ + "'.");
            return NO_FORMULA_NODE;

        default:
            error_at(tok, "E206", "Unexpected token '" + std::string(tok.lexeme) + "'" +
                                      position_suffix(tok) + " in formula for '" + target_ + "'.");
            return NO_FORMULA_NODE;
    }
}

std::uint32_t FormulaParser::parse_call(const FormulaToken& name) {
    std::string fn(name.lexeme);
    if (!is_function_name(fn)) {
        error_at(name, "E208", "Unknown function '" + fn + "'" + position_suffix(name) +
                                   " in formula for '" + target_ + "'.");
        return NO_FORMULA_NODE;
    }

    const FormulaToken& open = advance();  // consume '('
    std::uint32_t argument = parse_expression();
    if (argument == NO_FORMULA_NODE) return NO_FORMULA_NODE;

    if (!match(FormulaTokenType::RParen)) {
        error_at(open, "E205", "Missing closing ')' for '" + fn + "('" + position_suffix(open) +
                                   " in formula for '" + target_ + "'.");
        return NO_FORMULA_NODE;
    }

    std::uint32_t node = make_node(FormulaNodeKind::Call, name);
    nodes_[node].lhs = argument;
    return node;
}

std::uint32_t FormulaParser::parse_grouping(const FormulaToken& open) {
    std::uint32_t inner = parse_expression();
    if (inner == NO_FORMULA_NODE) return NO_FORMULA_NODE;

    if (!match(FormulaTokenType::RParen)) {
        error_at(open, "E205", "Missing closing ')' for '('" + position_suffix(open) +
                                   " in formula for '" + target_ + "'.");
        return NO_FORMULA_NODE;
    }
    // Grouping needs no node of its own: rendering parenthesizes every operation
    return inner;
}

// Node creation

std::uint32_t FormulaParser::make_node(FormulaNodeKind kind, const FormulaToken& token) {
    nodes_.push_back(FormulaNode{
        .kind = kind,
        .op = 0,
        .text = std::string(token.lexeme),
        .lhs = NO_FORMULA_NODE,
        .rhs = NO_FORMULA_NODE,
        .column = token.column
    });
    return static_cast<std::uint32_t>(nodes_.size() - 1);
}

std::uint32_t FormulaParser::make_binary(char op, std::uint32_t lhs, std::uint32_t rhs,
                                         const FormulaToken& token) {
    std::uint32_t node = make_node(FormulaNodeKind::Binary, token);
    nodes_[node].op = op;
    nodes_[node].lhs = lhs;
    nodes_[node].rhs = rhs;
    return node;
}

// Errors

void FormulaParser::error_at(const FormulaToken& token, std::string_view code,
                             std::string message) {
    diagnostics_.push_back(Diagnostic{
        .severity = Severity::Error,
        .code = std::string(code),
        .message = std::move(message),
        .instrument = 0,
        .node_id = {},
        .port_id = {},
        .location = {.column = token.column, .length = std::max<std::uint32_t>(token.length, 1)},
        .formula = source_
    });
}

std::string FormulaParser::position_suffix(const FormulaToken& token) const {
    return " at position " + std::to_string(token.column);
}

// Rendering

namespace {

std::string render_node(const FormulaAst& ast, std::uint32_t index,
                        const std::map<std::string, std::string>& bindings) {
    const FormulaNode& node = ast.nodes[index];
    switch (node.kind) {
        case FormulaNodeKind::Number:
            return node.text;

        case FormulaNodeKind::Identifier: {
            auto it = bindings.find(node.text);
            return it != bindings.end() ? it->second : node.text;
        }

        case FormulaNodeKind::Unary: {
            std::string operand = render_node(ast, node.lhs, bindings);
            if (node.op == '-') {
                return "(-" + operand + ")";
            }
            return operand;
        }

        case FormulaNodeKind::Binary:
            return "(" + render_node(ast, node.lhs, bindings) + " " + node.op + " " +
                   render_node(ast, node.rhs, bindings) + ")";

        case FormulaNodeKind::Call:
            return node.text + "(" + render_node(ast, node.lhs, bindings) + ")";
    }
    return {};
}

} // namespace

std::string render_formula(const FormulaAst& ast,
                           const std::map<std::string, std::string>& bindings) {
    if (!ast.valid()) return {};
    return render_node(ast, ast.root, bindings);
}

bool is_formula_identifier(std::string_view text) {
    if (text.empty()) return false;
    auto alpha = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    };
    if (!alpha(text[0])) return false;
    return std::all_of(text.begin() + 1, text.end(), [&](char c) {
        return alpha(c) || (c >= '0' && c <= '9');
    });
}

} // namespace patchc
