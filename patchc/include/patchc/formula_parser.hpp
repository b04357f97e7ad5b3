#pragma once

#include "diagnostics.hpp"
#include "formula_token.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace patchc {

/// Unary functions a formula may call, e.g. `abs(in1 - in2)`
constexpr std::array<std::string_view, 5> FORMULA_FUNCTIONS = {
    "abs", "ceil", "floor", "ampdb", "dbamp"
};

/// Identifiers that render verbatim without being bound to an input
constexpr std::array<std::string_view, 1> FORMULA_LITERAL_IDENTIFIERS = {"sr"};

constexpr std::uint32_t NO_FORMULA_NODE = 0xFFFFFFFF;

enum class FormulaNodeKind : std::uint8_t {
    Number,
    Identifier,
    Unary,      // op is '+' or '-', operand in lhs
    Binary,     // op is one of + - * /
    Call,       // text is the function name, argument in lhs
};

struct FormulaNode {
    FormulaNodeKind kind = FormulaNodeKind::Number;
    char op = 0;
    std::string text;
    std::uint32_t lhs = NO_FORMULA_NODE;
    std::uint32_t rhs = NO_FORMULA_NODE;
    std::uint32_t column = 1;
};

/// Parsed formula, nodes stored in a flat arena
struct FormulaAst {
    std::vector<FormulaNode> nodes;
    std::uint32_t root = NO_FORMULA_NODE;

    [[nodiscard]] bool valid() const { return root != NO_FORMULA_NODE; }
};

/// Recursive-descent parser for merge formulas
///
///   expr   := term (('+'|'-') term)*
///   term   := factor (('*'|'/') factor)*
///   factor := ('+'|'-') factor | NUMBER | IDENT | IDENT '(' expr ')' | '(' expr ')'
///
/// Identifiers must name a bound input token or a literal identifier.
class FormulaParser {
public:
    /// @param tokens Tokens from FormulaLexer (must end with Eof)
    /// @param source Formula text, kept for caret rendering
    /// @param bound_tokens Tokens the formula may reference
    /// @param target Input the formula merges into ("node.port")
    FormulaParser(std::vector<FormulaToken> tokens, std::string_view source,
                  std::set<std::string> bound_tokens,
                  std::string_view target = "<formula>");

    /// Parse the whole formula (check diagnostics for errors)
    [[nodiscard]] FormulaAst parse();

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    [[nodiscard]] bool has_errors() const { return patchc::has_errors(diagnostics_); }

private:
    [[nodiscard]] const FormulaToken& current() const;
    [[nodiscard]] bool check(FormulaTokenType type) const;
    bool match(FormulaTokenType type);
    const FormulaToken& advance();

    std::uint32_t parse_expression();
    std::uint32_t parse_term();
    std::uint32_t parse_factor();
    std::uint32_t parse_call(const FormulaToken& name);
    std::uint32_t parse_grouping(const FormulaToken& open);

    std::uint32_t make_node(FormulaNodeKind kind, const FormulaToken& token);
    std::uint32_t make_binary(char op, std::uint32_t lhs, std::uint32_t rhs,
                              const FormulaToken& token);

    void error_at(const FormulaToken& token, std::string_view code, std::string message);
    [[nodiscard]] std::string position_suffix(const FormulaToken& token) const;

    std::vector<FormulaToken> tokens_;
    std::string source_;
    std::set<std::string> bound_tokens_;
    std::string target_;
    std::vector<Diagnostic> diagnostics_;
    std::vector<FormulaNode> nodes_;
    std::size_t current_idx_ = 0;
};

/// Render a parsed formula, substituting each bound identifier with its source
/// expression. Every binary operation is parenthesized.
std::string render_formula(const FormulaAst& ast,
                           const std::map<std::string, std::string>& bindings);

/// Check whether `text` is a valid formula identifier
[[nodiscard]] bool is_formula_identifier(std::string_view text);

} // namespace patchc
