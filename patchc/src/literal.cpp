#include "patchc/literal.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>

namespace patchc {

namespace {

FormattedLiteral literal_ok(std::string text) {
    return FormattedLiteral{.ok = true, .text = std::move(text), .code = {}, .message = {}};
}

FormattedLiteral literal_error(std::string_view code, std::string message) {
    return FormattedLiteral{.ok = false, .text = {}, .code = std::string(code),
                            .message = std::move(message)};
}

std::string quote_string(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (char c : value) {
        if (c == '"') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

std::string format_number(double value) {
    std::array<char, 64> buf{};
    double magnitude = std::fabs(value);

    // Fixed notation in [1e-4, 1e16), scientific outside of it
    auto format = std::chars_format::fixed;
    if (magnitude != 0.0 && (magnitude < 1e-4 || magnitude >= 1e16)) {
        format = std::chars_format::scientific;
    }

    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value, format);
    if (ec != std::errc{}) {
        return "0.0";
    }
    std::string text(buf.data(), ptr);

    if (format == std::chars_format::fixed &&
        text.find('.') == std::string::npos) {
        text += ".0";
    }
    return text;
}

bool is_safe_expression(std::string_view text) {
    if (text.empty()) return false;
    return std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= '0' && c <= '9') ||
               (c >= 'a' && c <= 'z') ||
               (c >= 'A' && c <= 'Z') ||
               c == '_' || c == ' ' || c == '.' ||
               c == '(' || c == ')' ||
               c == '+' || c == '-' || c == '*' || c == '/';
    });
}

FormattedLiteral format_literal(const ParamValue& value, SignalRate rate) {
    if (rate == SignalRate::String) {
        if (const auto* text = std::get_if<std::string>(&value)) {
            return literal_ok(quote_string(*text));
        }
        return literal_error("E040", "String signal inputs require string values.");
    }

    if (const auto* flag = std::get_if<bool>(&value)) {
        return literal_ok(*flag ? "1" : "0");
    }
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return literal_ok(std::to_string(*integer));
    }
    if (const auto* number = std::get_if<double>(&value)) {
        if (!std::isfinite(*number)) {
            return literal_error("E041", "Unsafe expression '" + std::to_string(*number) +
                                             "' blocked by compiler.");
        }
        return literal_ok(format_number(*number));
    }

    const auto& text = std::get<std::string>(value);
    if (is_safe_expression(text)) {
        return literal_ok(text);
    }
    return literal_error("E041", "Unsafe expression '" + text + "' blocked by compiler.");
}

} // namespace patchc
