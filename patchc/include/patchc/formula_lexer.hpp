#pragma once

#include "diagnostics.hpp"
#include "formula_token.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace patchc {

/// Lexer for merge formulas
///
/// Produces all tokens at once and keeps going after an invalid character so
/// every offending position is reported.
class FormulaLexer {
public:
    /// @param source Formula text (must outlive the returned tokens)
    /// @param target Input the formula merges into ("node.port"), used in messages
    explicit FormulaLexer(std::string_view source, std::string_view target = "<formula>");

    /// Lex all tokens, ending with an Eof token
    [[nodiscard]] std::vector<FormulaToken> lex_all();

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    [[nodiscard]] bool has_errors() const;

private:
    [[nodiscard]] bool is_at_end() const;
    [[nodiscard]] char peek() const;
    char advance();

    [[nodiscard]] static bool is_digit(char c);
    [[nodiscard]] static bool is_alpha(char c);
    [[nodiscard]] static bool is_alphanumeric(char c);
    [[nodiscard]] static bool is_whitespace(char c);

    FormulaToken make_token(FormulaTokenType type) const;

    void lex_number();
    void lex_identifier();
    void add_error(std::string_view code, std::string message,
                   std::uint32_t column, std::uint32_t length);

    std::string_view source_;
    std::string target_;
    std::vector<FormulaToken> tokens_;
    std::vector<Diagnostic> diagnostics_;

    std::uint32_t start_ = 0;    // Start of current token
    std::uint32_t current_ = 0;  // Current position
};

} // namespace patchc
