#pragma once

#include <cstdint>
#include <string_view>

namespace patchc {

/// Token types of the merge-formula language
enum class FormulaTokenType : std::uint8_t {
    Eof,
    Identifier,     // in1, osc_gain, sr
    Number,         // 2, 0.5, .25
    Plus,           // +
    Minus,          // -
    Star,           // *
    Slash,          // /
    LParen,         // (
    RParen,         // )
};

constexpr std::string_view formula_token_name(FormulaTokenType type) {
    switch (type) {
        case FormulaTokenType::Eof:        return "Eof";
        case FormulaTokenType::Identifier: return "Identifier";
        case FormulaTokenType::Number:     return "Number";
        case FormulaTokenType::Plus:       return "Plus";
        case FormulaTokenType::Minus:      return "Minus";
        case FormulaTokenType::Star:       return "Star";
        case FormulaTokenType::Slash:      return "Slash";
        case FormulaTokenType::LParen:     return "LParen";
        case FormulaTokenType::RParen:     return "RParen";
    }
    return "Unknown";
}

/// A single token of a formula
struct FormulaToken {
    FormulaTokenType type = FormulaTokenType::Eof;
    std::string_view lexeme{};   // View into the formula text
    std::uint32_t column = 1;    // 1-based position of the first character
    std::uint32_t length = 0;

    [[nodiscard]] bool is_eof() const { return type == FormulaTokenType::Eof; }
};

} // namespace patchc
