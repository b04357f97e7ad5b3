#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "patchc/formula_lexer.hpp"
#include "patchc/formula_parser.hpp"
#include "patchc/merge.hpp"

using namespace patchc;
using Catch::Matchers::ContainsSubstring;

namespace {

struct Parsed {
    FormulaAst ast;
    std::vector<Diagnostic> diagnostics;
};

Parsed parse_formula(std::string_view text, std::set<std::string> bound = {"in1", "in2", "in3"}) {
    const std::string source(text);

    FormulaLexer lexer(source, "mix.left");
    auto tokens = lexer.lex_all();
    Parsed result;
    result.diagnostics = lexer.diagnostics();
    if (lexer.has_errors()) return result;

    FormulaParser parser(std::move(tokens), source, std::move(bound), "mix.left");
    result.ast = parser.parse();
    result.diagnostics.insert(result.diagnostics.end(),
                              parser.diagnostics().begin(), parser.diagnostics().end());
    return result;
}

std::string render(std::string_view text, const std::map<std::string, std::string>& bindings) {
    auto parsed = parse_formula(text);
    REQUIRE(parsed.diagnostics.empty());
    REQUIRE(parsed.ast.valid());
    return render_formula(parsed.ast, bindings);
}

const std::map<std::string, std::string> XY = {{"in1", "X"}, {"in2", "Y"}, {"in3", "Z"}};

} // namespace

TEST_CASE("Formula lexer tokens", "[formula]") {
    SECTION("identifiers numbers and operators") {
        FormulaLexer lexer("in1 + (osc_2 * .5) - 10 / 2.25");
        auto tokens = lexer.lex_all();
        REQUIRE_FALSE(lexer.has_errors());
        REQUIRE(tokens.size() == 12);

        CHECK(tokens[0].type == FormulaTokenType::Identifier);
        CHECK(tokens[0].lexeme == "in1");
        CHECK(tokens[1].type == FormulaTokenType::Plus);
        CHECK(tokens[2].type == FormulaTokenType::LParen);
        CHECK(tokens[3].lexeme == "osc_2");
        CHECK(tokens[4].type == FormulaTokenType::Star);
        CHECK(tokens[5].type == FormulaTokenType::Number);
        CHECK(tokens[5].lexeme == ".5");
        CHECK(tokens[6].type == FormulaTokenType::RParen);
        CHECK(tokens[7].type == FormulaTokenType::Minus);
        CHECK(tokens[8].lexeme == "10");
        CHECK(tokens[9].type == FormulaTokenType::Slash);
        CHECK(tokens[10].lexeme == "2.25");
        CHECK(tokens[11].is_eof());
    }

    SECTION("columns are 1-based") {
        FormulaLexer lexer("  in1*in2");
        auto tokens = lexer.lex_all();
        CHECK(tokens[0].column == 3);
        CHECK(tokens[1].column == 6);
        CHECK(tokens[2].column == 7);
    }

    SECTION("unsupported character") {
        FormulaLexer lexer("in1 % in2", "mix.left");
        (void)lexer.lex_all();
        REQUIRE(lexer.has_errors());
        REQUIRE(lexer.diagnostics().size() == 1);
        const auto& diag = lexer.diagnostics()[0];
        CHECK(diag.code == "E202");
        CHECK(diag.location.column == 5);
        CHECK_THAT(diag.message, ContainsSubstring("'%'"));
        CHECK_THAT(diag.message, ContainsSubstring("position 5"));
        CHECK_THAT(diag.message, ContainsSubstring("mix.left"));
    }

    SECTION("every bad character is reported") {
        FormulaLexer lexer("in1 ; in2 $");
        (void)lexer.lex_all();
        CHECK(lexer.diagnostics().size() == 2);
    }

    SECTION("a lone dot is not a number") {
        FormulaLexer lexer("in1 + .");
        (void)lexer.lex_all();
        REQUIRE(lexer.has_errors());
        CHECK(lexer.diagnostics()[0].code == "E203");
    }

    SECTION("second dot ends the number") {
        FormulaLexer lexer("1.2.3");
        auto tokens = lexer.lex_all();
        REQUIRE_FALSE(lexer.has_errors());
        REQUIRE(tokens.size() == 3);
        CHECK(tokens[0].lexeme == "1.2");
        CHECK(tokens[1].lexeme == ".3");
    }
}

TEST_CASE("Formula rendering", "[formula]") {
    SECTION("single identifier") {
        CHECK(render("in1", XY) == "X");
    }

    SECTION("every binary operation is parenthesized") {
        CHECK(render("in1 + (in2 * 0.5)", XY) == "(X + (Y * 0.5))");
        CHECK(render("in1 + in2 * 0.5", XY) == "(X + (Y * 0.5))");
    }

    SECTION("left associativity") {
        CHECK(render("in1 - in2 - in3", XY) == "((X - Y) - Z)");
        CHECK(render("in1 / in2 * in3", XY) == "((X / Y) * Z)");
    }

    SECTION("grouping overrides precedence") {
        CHECK(render("(in1 + in2) * in3", XY) == "((X + Y) * Z)");
    }

    SECTION("unary operators") {
        CHECK(render("-in1", XY) == "(-X)");
        CHECK(render("+in1", XY) == "X");
        CHECK(render("in1 * -2", XY) == "(X * (-2))");
        CHECK(render("--in1", XY) == "(-(-X))");
    }

    SECTION("functions and literal identifiers") {
        CHECK(render("abs(in1 - in2)", XY) == "abs((X - Y))");
        CHECK(render("ampdb(in1) + sr", XY) == "(ampdb(X) + sr)");
    }

    SECTION("substituted expressions are kept intact") {
        std::map<std::string, std::string> bindings = {{"in1", "k_lfo_kout_1"}, {"in2", "0.5"}};
        CHECK(render("in1 * in2", bindings) == "(k_lfo_kout_1 * 0.5)");
    }
}

TEST_CASE("Formula parse errors", "[formula]") {
    auto first_code = [](const Parsed& p) {
        REQUIRE_FALSE(p.diagnostics.empty());
        return p.diagnostics.front().code;
    };

    SECTION("unknown input token") {
        auto p = parse_formula("in1 + foo");
        CHECK(first_code(p) == "E204");
        CHECK_THAT(p.diagnostics[0].message, ContainsSubstring("'foo'"));
        CHECK(p.diagnostics[0].location.column == 7);
        CHECK_FALSE(p.ast.valid());
    }

    SECTION("all unknown tokens are reported") {
        auto p = parse_formula("foo + bar");
        REQUIRE(p.diagnostics.size() == 2);
        CHECK(p.diagnostics[0].code == "E204");
        CHECK(p.diagnostics[1].code == "E204");
    }

    SECTION("missing closing paren") {
        auto p = parse_formula("(in1 + in2");
        CHECK(first_code(p) == "E205");
        CHECK_THAT(p.diagnostics[0].message, ContainsSubstring("Missing closing ')'"));
    }

    SECTION("unmatched closing paren") {
        auto p = parse_formula("in1 + in2)");
        CHECK(first_code(p) == "E205");
        CHECK_THAT(p.diagnostics[0].message, ContainsSubstring("Unmatched ')'"));
    }

    SECTION("trailing tokens") {
        auto p = parse_formula("in1 in2");
        CHECK(first_code(p) == "E206");
        CHECK(p.diagnostics[0].location.column == 5);
    }

    SECTION("empty parentheses") {
        auto p = parse_formula("()");
        CHECK(first_code(p) == "E206");
    }

    SECTION("dangling operator") {
        auto p = parse_formula("in1 +");
        CHECK(first_code(p) == "E207");
    }

    SECTION("unknown function") {
        auto p = parse_formula("sqrt(in1)");
        CHECK(first_code(p) == "E208");
        CHECK_THAT(p.diagnostics[0].message, ContainsSubstring("'sqrt'"));
    }

    SECTION("diagnostics carry the formula for caret rendering") {
        auto p = parse_formula("in1 + foo");
        CHECK(p.diagnostics[0].formula == "in1 + foo");
        CHECK(p.diagnostics[0].location.length == 3);
    }
}

TEST_CASE("Formula identifiers", "[formula]") {
    CHECK(is_formula_identifier("in1"));
    CHECK(is_formula_identifier("_x"));
    CHECK(is_formula_identifier("Osc_Gain2"));
    CHECK_FALSE(is_formula_identifier(""));
    CHECK_FALSE(is_formula_identifier("1in"));
    CHECK_FALSE(is_formula_identifier("in-1"));
    CHECK_FALSE(is_formula_identifier("in 1"));
}

TEST_CASE("Input merging", "[formula]") {
    std::vector<InboundSource> two = {
        {"osc1", "asig", "X"},
        {"osc2", "asig", "Y"},
    };

    SECTION("single edge without formula uses the variable") {
        std::vector<InboundSource> one = {{"osc1", "asig", "a_osc1_asig_1"}};
        auto r = merge_inputs("out", "left", one, nullptr);
        REQUIRE(r.expression);
        CHECK(*r.expression == "a_osc1_asig_1");
        CHECK(r.diagnostics.empty());
    }

    SECTION("default sum in edge order") {
        auto r = merge_inputs("out", "left", two, nullptr);
        REQUIRE(r.expression);
        CHECK(*r.expression == "(X) + (Y)");
        CHECK(r.tokens.at("in1") == "X");
        CHECK(r.tokens.at("in2") == "Y");
    }

    SECTION("three sources") {
        auto three = two;
        three.push_back({"osc3", "asig", "Z"});
        auto r = merge_inputs("out", "left", three, nullptr);
        REQUIRE(r.expression);
        CHECK(*r.expression == "(X) + (Y) + (Z)");
    }

    SECTION("formula without expression on a single edge renders the source") {
        InputFormula formula;
        std::vector<InboundSource> one = {{"osc1", "asig", "X"}};
        auto r = merge_inputs("out", "left", one, &formula);
        REQUIRE(r.expression);
        CHECK(*r.expression == "X");
    }

    SECTION("named bindings") {
        InputFormula formula{
            .expression = "carrier * (1 + mod)",
            .inputs = {{"mod", "osc2", "asig"}, {"carrier", "osc1", "asig"}},
        };
        auto r = merge_inputs("out", "left", two, &formula);
        REQUIRE(r.expression);
        CHECK(*r.expression == "(X * (1 + Y))");
        CHECK(r.diagnostics.empty());
    }

    SECTION("unbound sources get the lowest free in<N>") {
        InputFormula formula{
            .expression = "in1 + in2",
            .inputs = {{"in1", "osc2", "asig"}},
        };
        auto r = merge_inputs("out", "left", two, &formula);
        REQUIRE(r.expression);
        CHECK(r.tokens.at("in1") == "Y");
        CHECK(r.tokens.at("in2") == "X");
        CHECK(*r.expression == "(Y + X)");
    }

    SECTION("formula on a single edge") {
        InputFormula formula{.expression = "in1 * 0.25", .inputs = {}};
        std::vector<InboundSource> one = {{"osc1", "asig", "X"}};
        auto r = merge_inputs("out", "left", one, &formula);
        REQUIRE(r.expression);
        CHECK(*r.expression == "(X * 0.25)");
    }

    SECTION("rejected bindings warn and fall back to auto tokens") {
        InputFormula formula{
            .expression = "a + in1",
            .inputs = {
                {"1bad", "osc1", "asig"},      // invalid identifier
                {"lfo", "nowhere", "kout"},    // not connected
                {"a", "osc1", "asig"},
                {"a", "osc2", "asig"},         // token reused
                {"b", "osc1", "asig"},         // source already bound
            },
        };
        auto r = merge_inputs("out", "left", two, &formula);
        REQUIRE(r.diagnostics.size() == 4);
        for (const auto& diag : r.diagnostics) {
            CHECK(diag.code == "W201");
            CHECK(diag.severity == Severity::Warning);
            CHECK(diag.node_id == "out");
            CHECK(diag.port_id == "left");
        }
        CHECK(r.tokens.at("a") == "X");
        CHECK(r.tokens.at("in1") == "Y");
        REQUIRE(r.expression);
        CHECK(*r.expression == "(X + Y)");
    }

    SECTION("empty expression") {
        InputFormula formula{.expression = "   ", .inputs = {}};
        auto r = merge_inputs("out", "left", two, &formula);
        CHECK_FALSE(r.expression);
        REQUIRE(r.diagnostics.size() == 1);
        CHECK(r.diagnostics[0].code == "E201");
        CHECK_THAT(r.diagnostics[0].message, ContainsSubstring("out.left"));
    }

    SECTION("unknown token names the input") {
        InputFormula formula{.expression = "in1 + in7", .inputs = {}};
        auto r = merge_inputs("out", "left", two, &formula);
        CHECK_FALSE(r.expression);
        REQUIRE(has_errors(r.diagnostics));
        const auto& diag = r.diagnostics.back();
        CHECK(diag.code == "E204");
        CHECK(diag.node_id == "out");
        CHECK(diag.port_id == "left");
        CHECK_THAT(diag.message, ContainsSubstring("in7"));
        CHECK_THAT(diag.message, ContainsSubstring("out.left"));
    }
}
