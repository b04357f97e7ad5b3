#include "patchc/formula_lexer.hpp"

namespace patchc {

FormulaLexer::FormulaLexer(std::string_view source, std::string_view target)
    : source_(source)
    , target_(target)
{}

std::vector<FormulaToken> FormulaLexer::lex_all() {
    tokens_.clear();
    diagnostics_.clear();
    current_ = 0;

    while (true) {
        while (!is_at_end() && is_whitespace(peek())) {
            advance();
        }

        start_ = current_;
        if (is_at_end()) {
            tokens_.push_back(make_token(FormulaTokenType::Eof));
            break;
        }

        char c = advance();

        if (is_alpha(c)) {
            lex_identifier();
            continue;
        }

        if (is_digit(c) || c == '.') {
            lex_number();
            continue;
        }

        switch (c) {
            case '+': tokens_.push_back(make_token(FormulaTokenType::Plus)); break;
            case '-': tokens_.push_back(make_token(FormulaTokenType::Minus)); break;
            case '*': tokens_.push_back(make_token(FormulaTokenType::Star)); break;
            case '/': tokens_.push_back(make_token(FormulaTokenType::Slash)); break;
            case '(': tokens_.push_back(make_token(FormulaTokenType::LParen)); break;
            case ')': tokens_.push_back(make_token(FormulaTokenType::RParen)); break;
            default:
                add_error("E202",
                          "Unsupported character '" + std::string(1, c) + "' at position " +
                              std::to_string(start_ + 1) + " in formula for '" + target_ + "'.",
                          start_ + 1, 1);
                break;
        }
    }

    return tokens_;
}

bool FormulaLexer::has_errors() const {
    return patchc::has_errors(diagnostics_);
}

bool FormulaLexer::is_at_end() const {
    return current_ >= source_.size();
}

char FormulaLexer::peek() const {
    if (is_at_end()) return '\0';
    return source_[current_];
}

char FormulaLexer::advance() {
    return source_[current_++];
}

bool FormulaLexer::is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool FormulaLexer::is_alpha(char c) {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           c == '_';
}

bool FormulaLexer::is_alphanumeric(char c) {
    return is_alpha(c) || is_digit(c);
}

bool FormulaLexer::is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

FormulaToken FormulaLexer::make_token(FormulaTokenType type) const {
    return FormulaToken{
        .type = type,
        .lexeme = source_.substr(start_, current_ - start_),
        .column = start_ + 1,
        .length = current_ - start_
    };
}

// Digits with at most one dot; the first character was already consumed
void FormulaLexer::lex_number() {
    bool saw_dot = source_[start_] == '.';
    bool saw_digit = is_digit(source_[start_]);

    while (!is_at_end()) {
        char c = peek();
        if (is_digit(c)) {
            saw_digit = true;
            advance();
        } else if (c == '.' && !saw_dot) {
            saw_dot = true;
            advance();
        } else {
            break;
        }
    }

    if (!saw_digit) {
        auto literal = source_.substr(start_, current_ - start_);
        add_error("E203",
                  "Invalid number near '" + std::string(literal) + "' at position " +
                      std::to_string(start_ + 1) + " in formula for '" + target_ + "'.",
                  start_ + 1, current_ - start_);
        return;
    }

    tokens_.push_back(make_token(FormulaTokenType::Number));
}

void FormulaLexer::lex_identifier() {
    while (is_alphanumeric(peek())) {
        advance();
    }
    tokens_.push_back(make_token(FormulaTokenType::Identifier));
}

void FormulaLexer::add_error(std::string_view code, std::string message,
                             std::uint32_t column, std::uint32_t length) {
    diagnostics_.push_back(Diagnostic{
        .severity = Severity::Error,
        .code = std::string(code),
        .message = std::move(message),
        .instrument = 0,
        .node_id = {},
        .port_id = {},
        .location = {.column = column, .length = length},
        .formula = std::string(source_)
    });
}

} // namespace patchc
