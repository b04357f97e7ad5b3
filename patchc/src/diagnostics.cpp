#include "patchc/diagnostics.hpp"
#include <sstream>
#include <algorithm>

namespace patchc {

namespace {

std::string_view severity_string(Severity s) {
    switch (s) {
        case Severity::Error:   return "error";
        case Severity::Warning: return "warning";
    }
    return "unknown";
}

std::string_view severity_color(Severity s) {
    switch (s) {
        case Severity::Error:   return "\033[1;31m"; // Bold red
        case Severity::Warning: return "\033[1;33m"; // Bold yellow
    }
    return "";
}

constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view BOLD = "\033[1m";

std::string escape_json(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static constexpr char hex[] = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(static_cast<unsigned char>(c) >> 4) & 0x0F];
                    out += hex[static_cast<unsigned char>(c) & 0x0F];
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

// "instr 2: osc1.freq" style prefix; empty when the diagnostic is global
std::string site_string(const Diagnostic& diag) {
    std::string site;
    if (diag.instrument > 0) {
        site += "instr " + std::to_string(diag.instrument);
    }
    if (!diag.node_id.empty()) {
        if (!site.empty()) site += ": ";
        site += diag.node_id;
        if (!diag.port_id.empty()) {
            site += "." + diag.port_id;
        }
    }
    return site;
}

} // namespace

std::string format_diagnostic(const Diagnostic& diag) {
    std::ostringstream out;

    // Header: instr N: node.port: severity[code]: message
    auto site = site_string(diag);
    if (!site.empty()) {
        out << BOLD << site << ": " << RESET;
    }

    out << severity_color(diag.severity) << severity_string(diag.severity);
    if (!diag.code.empty()) {
        out << "[" << diag.code << "]";
    }
    out << RESET << ": " << BOLD << diag.message << RESET << "\n";

    // Formula with caret
    if (!diag.formula.empty() && diag.location.column > 0) {
        out << "    | " << diag.formula << "\n";
        out << "    | ";
        for (std::uint32_t i = 1; i < diag.location.column; ++i) {
            out << ' ';
        }
        out << severity_color(diag.severity) << "^";
        for (std::uint32_t i = 1; i < diag.location.length && i < 80; ++i) {
            out << "~";
        }
        out << RESET << "\n";
    }

    return out.str();
}

std::string format_diagnostic_json(const Diagnostic& diag) {
    std::ostringstream out;

    out << R"({"severity":")" << severity_string(diag.severity) << R"(",)";
    out << R"("code":")" << escape_json(diag.code) << R"(",)";
    out << R"("message":")" << escape_json(diag.message) << R"(",)";
    out << R"("instrument":)" << diag.instrument << ",";
    out << R"("node":")" << escape_json(diag.node_id) << R"(",)";
    out << R"("port":")" << escape_json(diag.port_id) << R"(",)";
    out << R"("column":)" << diag.location.column << ",";
    out << R"("length":)" << diag.location.length << "}";

    return out.str();
}

bool has_errors(const std::vector<Diagnostic>& diagnostics) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const Diagnostic& d) { return d.severity == Severity::Error; });
}

std::vector<std::string> error_messages(const std::vector<Diagnostic>& diagnostics) {
    std::vector<std::string> messages;
    for (const auto& d : diagnostics) {
        if (d.severity == Severity::Error) {
            messages.push_back(d.message);
        }
    }
    return messages;
}

} // namespace patchc
