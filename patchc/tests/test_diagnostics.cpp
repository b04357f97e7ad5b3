#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "patchc/diagnostics.hpp"
#include "patchc/formula_lexer.hpp"

using namespace patchc;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Diagnostic formatting", "[diagnostics]") {
    Diagnostic diag{
        .severity = Severity::Error,
        .code = "E204",
        .message = "Unknown input token 'gain' at position 7 in formula for 'out.left'.",
        .instrument = 2,
        .node_id = "out",
        .port_id = "left",
        .location = {.column = 7, .length = 4},
        .formula = "in1 + gain"
    };

    SECTION("terminal output") {
        auto text = format_diagnostic(diag);
        CHECK_THAT(text, ContainsSubstring("instr 2: out.left"));
        CHECK_THAT(text, ContainsSubstring("error"));
        CHECK_THAT(text, ContainsSubstring("[E204]"));
        CHECK_THAT(text, ContainsSubstring(diag.message));
        CHECK_THAT(text, ContainsSubstring("    | in1 + gain\n"));
        CHECK_THAT(text, ContainsSubstring("    |       "));
        CHECK_THAT(text, ContainsSubstring("^~~~"));
    }

    SECTION("no caret without a formula") {
        diag.formula.clear();
        diag.location = {};
        auto text = format_diagnostic(diag);
        CHECK_THAT(text, !ContainsSubstring("    |"));
    }

    SECTION("json output") {
        CHECK(format_diagnostic_json(diag) ==
              R"({"severity":"error","code":"E204",)"
              R"("message":"Unknown input token 'gain' at position 7 in formula for 'out.left'.",)"
              R"("instrument":2,"node":"out","port":"left","column":7,"length":4})");
    }

    SECTION("json escaping") {
        diag.message = "quote \" and\nnewline";
        CHECK_THAT(format_diagnostic_json(diag), ContainsSubstring(R"(quote \" and\nnewline)"));
    }

    SECTION("control characters are escaped") {
        FormulaLexer lexer("in1 \x01", "out.left");
        (void)lexer.lex_all();
        REQUIRE(lexer.diagnostics().size() == 1);
        auto json = format_diagnostic_json(lexer.diagnostics()[0]);
        CHECK_THAT(json, ContainsSubstring(R"(Unsupported character '\u0001')"));
        CHECK(json.find('\x01') == std::string::npos);
    }
}

TEST_CASE("Diagnostic helpers", "[diagnostics]") {
    std::vector<Diagnostic> diags;
    CHECK_FALSE(has_errors(diags));

    diags.push_back(Diagnostic{.severity = Severity::Warning, .code = "W101", .message = "ignored"});
    CHECK_FALSE(has_errors(diags));
    CHECK(error_messages(diags).empty());

    diags.push_back(Diagnostic{.severity = Severity::Error, .code = "E030", .message = "missing"});
    CHECK(has_errors(diags));
    CHECK(error_messages(diags) == std::vector<std::string>{"missing"});
}
