#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "patchc/compiler.hpp"
#include <algorithm>

using namespace patchc;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

Node node(std::string id, std::string opcode, std::map<std::string, ParamValue> params = {}) {
    return Node{.id = std::move(id), .opcode = std::move(opcode), .params = std::move(params),
                .position = {}};
}

Connection edge(std::string from, std::string from_port, std::string to, std::string to_port) {
    return Connection{std::move(from), std::move(from_port), std::move(to), std::move(to_port)};
}

Patch make_patch(std::vector<Node> nodes, std::vector<Connection> connections) {
    Patch patch;
    patch.name = "test";
    patch.graph.nodes = std::move(nodes);
    patch.graph.connections = std::move(connections);
    return patch;
}

// oscillator straight into both output channels
Patch sine_patch() {
    return make_patch(
        {node("osc", "oscili"), node("out", "outs")},
        {edge("osc", "asig", "out", "left"), edge("osc", "asig", "out", "right")});
}

std::vector<std::string> codes(const CompileResult& result) {
    std::vector<std::string> out;
    for (const auto& d : result.diagnostics) out.push_back(d.code);
    return out;
}

std::size_t count_code(const CompileResult& result, std::string_view code) {
    return static_cast<std::size_t>(std::count_if(
        result.diagnostics.begin(), result.diagnostics.end(),
        [&](const Diagnostic& d) { return d.code == code; }));
}

} // namespace

TEST_CASE("Compile a minimal patch", "[compiler]") {
    auto result = compile_patch(sine_patch());
    REQUIRE(result.success);
    CHECK(result.diagnostics.empty());

    const std::string expected =
        "sr = 44100\n"
        "ksmps = 10\n"
        "nchnls = 2\n"
        "0dbfs = 1.0\n"
        "\n"
        "massign 0, 1\n"
        "\n"
        "instr 1\n"
        "  ; node:osc opcode:oscili\n"
        "  a_osc_asig_1 oscili 0.4, 440, 1\n"
        "  ; node:out opcode:outs\n"
        "  outs a_osc_asig_1, a_osc_asig_1\n"
        "endin";
    CHECK(result.orc == expected);
}

TEST_CASE("Program document wrapper", "[compiler]") {
    SECTION("default options") {
        auto result = compile_patch(sine_patch());
        REQUIRE(result.success);
        CHECK_THAT(result.csd, StartsWith("<CsoundSynthesizer>\n<CsOptions>\n"
                                          "-d -odac -M0 -+rtmidi=cmidi -b 128 -B512\n"
                                          "</CsOptions>\n<CsInstruments>\nsr = 44100\n"));
        CHECK_THAT(result.csd, ContainsSubstring("endin\n</CsInstruments>\n<CsScore>\n"
                                                 "f 1 0 16384 10 1\nf 0 z\n</CsScore>\n"
                                                 "</CsoundSynthesizer>"));
    }

    SECTION("custom options") {
        CompileOptions options;
        options.midi_input = "a";
        options.rtmidi_module = "alsaseq";
        options.rtaudio_module = "jack";
        options.software_buffer = 256;
        options.hardware_buffer = 1024;
        auto result = compile_patch(sine_patch(), options);
        REQUIRE(result.success);
        CHECK_THAT(result.csd, ContainsSubstring(
            "-d -odac -Ma -+rtmidi=alsaseq -+rtaudio=jack -b 256 -B1024\n"));
    }
}

TEST_CASE("Engine configuration header", "[compiler]") {
    auto patch = sine_patch();
    patch.graph.engine = EngineConfig{.sr = 48'000, .control_rate = 1'500, .ksmps = 32,
                                      .nchnls = 1, .zero_dbfs = 32768.0};
    auto result = compile_patch(patch);
    REQUIRE(result.success);
    CHECK_THAT(result.orc, StartsWith("sr = 48000\nksmps = 32\nnchnls = 1\n0dbfs = 32768.0\n\n"));
}

TEST_CASE("Emission follows dependency order", "[compiler]") {
    // Ids sorted alphabetically would put the sink first
    auto patch = make_patch(
        {
            node("out", "outs"),
            node("zc", "const_k", {{"value", ParamValue{std::int64_t{2}}}}),
            node("m", "k_mul"),
            node("yc", "const_k", {{"value", ParamValue{std::int64_t{3}}}}),
            node("conv", "k_to_a"),
        },
        {
            edge("conv", "aout", "out", "left"),
            edge("conv", "aout", "out", "right"),
            edge("m", "kout", "conv", "kin"),
            edge("zc", "kout", "m", "a"),
            edge("yc", "kout", "m", "b"),
        });

    auto result = compile_patch(patch);
    REQUIRE(result.success);
    CHECK_THAT(result.orc, ContainsSubstring(
        "instr 1\n"
        "  ; node:yc opcode:const_k\n"
        "  k_yc_kout_1 = 3\n"
        "  ; node:zc opcode:const_k\n"
        "  k_zc_kout_2 = 2\n"
        "  ; node:m opcode:k_mul\n"
        "  k_m_kout_3 = (k_zc_kout_2) * (k_yc_kout_1)\n"
        "  ; node:conv opcode:k_to_a\n"
        "  a_conv_aout_1 interp k_m_kout_3\n"
        "  ; node:out opcode:outs\n"
        "  outs a_conv_aout_1, a_conv_aout_1\n"
        "endin"));

    // Every node block appears after the blocks of its sources
    auto position = [&](const std::string& id) {
        return result.orc.find("; node:" + id + " ");
    };
    for (const auto& conn : patch.graph.connections) {
        CHECK(position(conn.from_node_id) < position(conn.to_node_id));
    }
}

TEST_CASE("Optional inputs", "[compiler]") {
    SECTION("trailing optional arguments are dropped") {
        auto patch = make_patch(
            {node("v", "vco"), node("out", "outs")},
            {edge("v", "asig", "out", "left"), edge("v", "asig", "out", "right")});
        auto result = compile_patch(patch);
        REQUIRE(result.success);
        CHECK_THAT(result.orc, ContainsSubstring("  a_v_asig_1 vco 0.4, 440, 1, 0.5\n"));
    }

    SECTION("ftgen drops every unset argument") {
        auto patch = make_patch(
            {node("tab", "ftgen"), node("osc", "oscili"), node("out", "outs")},
            {edge("tab", "ift", "osc", "ifn"),
             edge("osc", "asig", "out", "left"), edge("osc", "asig", "out", "right")});
        auto result = compile_patch(patch);
        REQUIRE(result.success);
        CHECK_THAT(result.orc, ContainsSubstring("  i_tab_ift_1 ftgen 1, 0, 16384, 10, 1\n"));
        CHECK_THAT(result.orc, ContainsSubstring("  a_osc_asig_1 oscili 0.4, 440, i_tab_ift_1\n"));
    }

    SECTION("a set optional argument is kept") {
        auto patch = make_patch(
            {node("tab", "ftgen", {{"iarg2", ParamValue{0.5}}}), node("osc", "oscili"),
             node("out", "outs")},
            {edge("tab", "ift", "osc", "ifn"),
             edge("osc", "asig", "out", "left"), edge("osc", "asig", "out", "right")});
        auto result = compile_patch(patch);
        REQUIRE(result.success);
        CHECK_THAT(result.orc, ContainsSubstring("ftgen 1, 0, 16384, 10, 1, 0.5\n"));
    }

    SECTION("an optional argument before a set one cannot be omitted") {
        auto patch = make_patch(
            {node("tab", "ftgen", {{"iarg3", ParamValue{std::int64_t{2}}}}), node("osc", "oscili"),
             node("out", "outs")},
            {edge("tab", "ift", "osc", "ifn"),
             edge("osc", "asig", "out", "left"), edge("osc", "asig", "out", "right")});
        auto result = compile_patch(patch);
        CHECK_FALSE(result.success);
        CHECK(codes(result) == std::vector<std::string>{"E033"});
        CHECK_THAT(result.diagnostics[0].message,
                   StartsWith("Unsupported optional argument placement in opcode template line:"));
    }
}

TEST_CASE("Parameters and constants", "[compiler]") {
    SECTION("constant without value renders 0") {
        auto patch = make_patch(
            {node("c", "const_a"), node("out", "outs")},
            {edge("c", "aout", "out", "left"), edge("c", "aout", "out", "right")});
        auto result = compile_patch(patch);
        REQUIRE(result.success);
        CHECK_THAT(result.orc, ContainsSubstring("  a_c_aout_1 = 0\n"));
    }

    SECTION("expression parameters") {
        auto patch = make_patch(
            {node("c", "const_a", {{"value", ParamValue{std::string("0.5 * (1 + 1)")}}}),
             node("out", "outs")},
            {edge("c", "aout", "out", "left"), edge("c", "aout", "out", "right")});
        auto result = compile_patch(patch);
        REQUIRE(result.success);
        CHECK_THAT(result.orc, ContainsSubstring("  a_c_aout_1 = 0.5 * (1 + 1)\n"));
    }

    SECTION("unsafe parameter is blocked") {
        auto patch = make_patch(
            {node("c", "const_a", {{"value", ParamValue{std::string("1\nouts 0, 0")}}}),
             node("out", "outs")},
            {edge("c", "aout", "out", "left"), edge("c", "aout", "out", "right")});
        auto result = compile_patch(patch);
        CHECK_FALSE(result.success);
        CHECK(codes(result) == std::vector<std::string>{"E041"});
    }

    SECTION("input literal overrides the port default") {
        auto patch = sine_patch();
        patch.graph.nodes[0].params = {{"amp", ParamValue{0.8}}, {"freq", ParamValue{true}}};
        auto result = compile_patch(patch);
        REQUIRE(result.success);
        CHECK_THAT(result.orc, ContainsSubstring("a_osc_asig_1 oscili 0.8, 1, 1\n"));
    }

    SECTION("unknown parameter warns but compiles") {
        auto patch = sine_patch();
        patch.graph.nodes[0].params = {{"detune", ParamValue{0.1}}};
        auto result = compile_patch(patch);
        REQUIRE(result.success);
        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].code == "W101");
        CHECK(result.diagnostics[0].severity == Severity::Warning);
        CHECK(result.diagnostics[0].node_id == "osc");
    }
}

TEST_CASE("Input merging in compiled programs", "[compiler]") {
    auto two_osc = [] {
        return make_patch(
            {node("o1", "oscili"), node("o2", "oscili"), node("out", "outs")},
            {edge("o1", "asig", "out", "left"), edge("o2", "asig", "out", "left"),
             edge("o1", "asig", "out", "right")});
    };

    SECTION("default sum") {
        auto result = compile_patch(two_osc());
        REQUIRE(result.success);
        CHECK_THAT(result.orc, ContainsSubstring(
            "  outs (a_o1_asig_1) + (a_o2_asig_2), a_o1_asig_1\n"));
    }

    SECTION("formula with named bindings") {
        auto patch = two_osc();
        patch.graph.formulas[PortRef{"out", "left"}] = InputFormula{
            .expression = "in1 + (in2 * 0.5)",
            .inputs = {{"in1", "o1", "asig"}, {"in2", "o2", "asig"}},
        };
        auto result = compile_patch(patch);
        REQUIRE(result.success);
        CHECK_THAT(result.orc, ContainsSubstring(
            "  outs (a_o1_asig_1 + (a_o2_asig_2 * 0.5)), a_o1_asig_1\n"));
    }

    SECTION("unknown token fails and names the token") {
        auto patch = two_osc();
        patch.graph.formulas[PortRef{"out", "left"}] =
            InputFormula{.expression = "in1 + gain", .inputs = {}};
        auto result = compile_patch(patch);
        CHECK_FALSE(result.success);
        REQUIRE(count_code(result, "E204") == 1);
        CHECK_THAT(result.diagnostics.back().message, ContainsSubstring("'gain'"));
        CHECK_THAT(result.diagnostics.back().message, ContainsSubstring("out.left"));
    }

    SECTION("formula on an unconnected input is ignored") {
        auto patch = sine_patch();
        patch.graph.formulas[PortRef{"osc", "amp"}] =
            InputFormula{.expression = "in1 * 2", .inputs = {}};
        auto result = compile_patch(patch);
        REQUIRE(result.success);
        CHECK(codes(result) == std::vector<std::string>{"W203"});
        CHECK_THAT(result.orc, ContainsSubstring("oscili 0.4, 440, 1"));
    }

    SECTION("formula for a missing input warns") {
        auto patch = sine_patch();
        patch.graph.formulas[PortRef{"osc", "phase"}] =
            InputFormula{.expression = "in1", .inputs = {}};
        auto result = compile_patch(patch);
        REQUIRE(result.success);
        CHECK(codes(result) == std::vector<std::string>{"W202"});
    }
}

TEST_CASE("Structural errors fail fast", "[compiler]") {
    SECTION("empty graph") {
        auto result = compile_patch(make_patch({}, {}));
        CHECK_FALSE(result.success);
        CHECK(codes(result) == std::vector<std::string>{"E001"});
        CHECK(result.orc.empty());
        CHECK(result.csd.empty());
    }

    SECTION("duplicate node ids") {
        auto patch = sine_patch();
        patch.graph.nodes.push_back(node("osc", "oscili"));
        auto result = compile_patch(patch);
        CHECK_FALSE(result.success);
        CHECK(codes(result) == std::vector<std::string>{"E002"});
    }

    SECTION("every unknown opcode is reported") {
        auto patch = sine_patch();
        patch.graph.nodes.push_back(node("a", "reverb9"));
        patch.graph.nodes.push_back(node("b", "chorus9"));
        auto result = compile_patch(patch);
        CHECK_FALSE(result.success);
        CHECK(codes(result) == std::vector<std::string>{"E003", "E003"});
        CHECK(result.diagnostics[0].message == "Node 'a' references unknown opcode 'reverb9'.");
    }

    SECTION("no sink") {
        auto result = compile_patch(make_patch({node("osc", "oscili")}, {}));
        CHECK_FALSE(result.success);
        CHECK(codes(result) == std::vector<std::string>{"E004"});
    }

    SECTION("two sinks") {
        auto patch = sine_patch();
        patch.graph.nodes.push_back(node("out2", "outs"));
        auto result = compile_patch(patch);
        CHECK_FALSE(result.success);
        CHECK(codes(result) == std::vector<std::string>{"E005"});
        CHECK_THAT(result.diagnostics[0].message, ContainsSubstring("'out', 'out2'"));
    }
}

TEST_CASE("Connection validation collects every error", "[compiler]") {
    auto patch = sine_patch();
    patch.graph.nodes.push_back(node("km", "k_mul"));
    patch.graph.connections.push_back(edge("ghost", "kout", "km", "a"));
    patch.graph.connections.push_back(edge("osc", "asig", "nowhere", "a"));
    patch.graph.connections.push_back(edge("osc", "bogus", "km", "a"));
    patch.graph.connections.push_back(edge("osc", "asig", "km", "bogus"));
    patch.graph.connections.push_back(edge("osc", "asig", "km", "b"));

    auto result = compile_patch(patch);
    CHECK_FALSE(result.success);
    CHECK(codes(result) == std::vector<std::string>{"E010", "E011", "E012", "E013", "E014"});
    CHECK(result.diagnostics[4].message == "Signal type mismatch: osc.asig (audio) -> km.b (control)");
}

TEST_CASE("Signal rates on connections", "[compiler]") {
    SECTION("init feeds control") {
        auto patch = make_patch(
            {node("i", "const_i", {{"value", ParamValue{0.3}}}), node("osc", "oscili"), node("out", "outs")},
            {edge("i", "iout", "osc", "amp"),
             edge("osc", "asig", "out", "left"), edge("osc", "asig", "out", "right")});
        auto result = compile_patch(patch);
        REQUIRE(result.success);
        CHECK_THAT(result.orc, ContainsSubstring("a_osc_asig_1 oscili i_i_iout_1, 440, 1"));
    }

    SECTION("accepted rate override") {
        auto patch = make_patch(
            {node("fm", "const_a"), node("osc", "oscili"), node("out", "outs")},
            {edge("fm", "aout", "osc", "freq"),
             edge("osc", "asig", "out", "left"), edge("osc", "asig", "out", "right")});
        auto result = compile_patch(patch);
        REQUIRE(result.success);
    }

    SECTION("audio into control-only input") {
        auto patch = make_patch(
            {node("osc", "oscili"), node("flt", "moogladder"), node("out", "outs")},
            {edge("osc", "asig", "flt", "ain"), edge("osc", "asig", "flt", "kcf"),
             edge("flt", "aout", "out", "left"), edge("flt", "aout", "out", "right")});
        auto result = compile_patch(patch);
        CHECK_FALSE(result.success);
        REQUIRE(count_code(result, "E014") == 1);
        const auto& diag = result.diagnostics[0];
        CHECK_THAT(diag.message, ContainsSubstring("osc.asig"));
        CHECK_THAT(diag.message, ContainsSubstring("flt.kcf"));
    }
}

TEST_CASE("Cycles yield a single diagnostic", "[compiler]") {
    auto patch = sine_patch();
    for (int i = 0; i < 20; ++i) {
        patch.graph.nodes.push_back(node("c" + std::to_string(i), "const_k"));
    }
    patch.graph.nodes.push_back(node("a", "k_mul"));
    patch.graph.nodes.push_back(node("b", "k_mul"));
    patch.graph.connections.push_back(edge("a", "kout", "b", "a"));
    patch.graph.connections.push_back(edge("b", "kout", "a", "b"));

    auto result = compile_patch(patch);
    CHECK_FALSE(result.success);
    REQUIRE(result.diagnostics.size() == 1);
    CHECK(result.diagnostics[0].code == "E020");
    CHECK(result.diagnostics[0].message ==
          "Graph contains a cycle. Add explicit delay/feedback opcodes to break direct recursion.");
}

TEST_CASE("Missing inputs are all reported", "[compiler]") {
    auto patch = make_patch(
        {node("km", "k_mul"), node("out", "outs")},
        {});
    auto result = compile_patch(patch);
    CHECK_FALSE(result.success);
    CHECK(codes(result) == std::vector<std::string>{"E030", "E030", "E030", "E030"});
    CHECK(result.diagnostics[0].message == "Missing required input 'a' on node 'km' (k_mul).");
    CHECK(result.diagnostics[0].port_id == "a");
}

TEST_CASE("Multi-instrument bundles", "[compiler]") {
    auto lead = sine_patch();
    auto bass = sine_patch();
    bass.graph.engine.sr = 48'000;

    SECTION("instruments are numbered and bound to their channels") {
        std::vector<InstrumentTarget> targets = {{lead, 1}, {bass, 0}};
        auto result = compile(targets);
        REQUIRE(result.success);
        CHECK_THAT(result.orc, StartsWith("sr = 44100\n"));
        CHECK_THAT(result.orc, ContainsSubstring(
            "massign 1, 1\n\ninstr 1\n  ; node:osc opcode:oscili\n  a_osc_asig_1 oscili"));
        CHECK_THAT(result.orc, ContainsSubstring(
            "endin\n\nmassign 0, 2\n\ninstr 2\n  ; node:osc opcode:oscili\n  a_osc_asig_1 oscili"));
        CHECK(result.orc.ends_with("endin"));
    }

    SECTION("duplicate channel binding") {
        std::vector<InstrumentTarget> targets = {{lead, 3}, {bass, 3}};
        auto result = compile(targets);
        CHECK_FALSE(result.success);
        REQUIRE(codes(result) == std::vector<std::string>{"E051"});
        CHECK(result.diagnostics[0].instrument == 2);
    }

    SECTION("omni instruments may share channel 0") {
        std::vector<InstrumentTarget> targets = {{lead, 0}, {bass, 0}};
        CHECK(compile(targets).success);
    }

    SECTION("channel out of range") {
        std::vector<InstrumentTarget> targets = {{lead, 17}};
        auto result = compile(targets);
        CHECK_FALSE(result.success);
        CHECK(codes(result) == std::vector<std::string>{"E050"});
    }

    SECTION("empty bundle") {
        auto result = compile(std::vector<InstrumentTarget>{});
        CHECK_FALSE(result.success);
        CHECK(codes(result) == std::vector<std::string>{"E052"});
    }

    SECTION("diagnostics carry the instrument number") {
        auto broken = make_patch({node("osc", "oscili")}, {});
        std::vector<InstrumentTarget> targets = {{lead, 1}, {broken, 2}};
        auto result = compile(targets);
        CHECK_FALSE(result.success);
        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].code == "E004");
        CHECK(result.diagnostics[0].instrument == 2);
    }
}

TEST_CASE("Compilation is deterministic", "[compiler]") {
    auto patch = make_patch(
        {node("o1", "oscili"), node("o2", "vco"), node("lfo", "midictrl"), node("env", "adsr"),
         node("amp", "k_mul"), node("flt", "moogladder"), node("mix", "mix2"), node("out", "outs")},
        {edge("env", "kenv", "amp", "a"), edge("lfo", "kval", "amp", "b"),
         edge("amp", "kout", "o1", "amp"), edge("amp", "kout", "o2", "amp"),
         edge("o1", "asig", "mix", "a"), edge("o2", "asig", "mix", "b"),
         edge("mix", "aout", "flt", "ain"), edge("lfo", "kval", "flt", "kcf"),
         edge("flt", "aout", "out", "left"), edge("o1", "asig", "out", "right"),
         edge("o2", "asig", "out", "right")});

    auto first = compile_patch(patch);
    auto second = compile_patch(patch);
    REQUIRE(first.success);
    CHECK(first.orc == second.orc);
    CHECK(first.csd == second.csd);
}
