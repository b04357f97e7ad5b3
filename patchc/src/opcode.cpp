#include "patchc/opcode.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace patchc {

namespace {

using SR = SignalRate;

PortSpec in(std::string id, std::string name, SignalRate rate,
            std::optional<ParamValue> default_value = std::nullopt,
            bool required = true) {
    return PortSpec{
        .id = std::move(id),
        .name = std::move(name),
        .rate = rate,
        .required = required,
        .default_value = std::move(default_value),
        .accepted_rates = {},
        .description = {}
    };
}

PortSpec optional_in(std::string id, std::string name, SignalRate rate,
                     std::optional<ParamValue> default_value = std::nullopt) {
    return in(std::move(id), std::move(name), rate, std::move(default_value), false);
}

PortSpec out(std::string id, std::string name, SignalRate rate) {
    return PortSpec{.id = std::move(id), .name = std::move(name), .rate = rate};
}

// Frequency inputs of the oscillators take any numeric rate
PortSpec freq_in() {
    PortSpec port = in("freq", "Frequency", SR::Control, ParamValue{std::int64_t{440}});
    port.accepted_rates = {SR::Audio, SR::Control, SR::Init};
    return port;
}

ParamValue num(double v) { return ParamValue{v}; }
ParamValue num(std::int64_t v) { return ParamValue{v}; }

std::vector<OpcodeSpec> builtin_opcodes() {
    std::vector<OpcodeSpec> specs;

    specs.push_back(OpcodeSpec{
        .name = "midi_note",
        .category = "midi",
        .description = "Extract MIDI note frequency and velocity amplitude.",
        .inputs = {optional_in("gain", "Gain", SR::Init, num(std::int64_t{1}))},
        .outputs = {out("kfreq", "kFreq", SR::Control), out("kamp", "kAmp", SR::Control)},
        .params = {},
        .code_template = "{kfreq} cpsmidi\n{kamp} ampmidi {gain}",
        .tags = {"performance", "source"}
    });

    specs.push_back(OpcodeSpec{
        .name = "adsr",
        .category = "envelope",
        .description = "Control-rate ADSR envelope.",
        .inputs = {
            in("iatt", "Attack", SR::Init, num(0.01)),
            in("idec", "Decay", SR::Init, num(0.15)),
            in("islev", "Sustain", SR::Init, num(0.7)),
            in("irel", "Release", SR::Init, num(0.2)),
        },
        .outputs = {out("kenv", "kEnv", SR::Control)},
        .params = {},
        .code_template = "{kenv} madsr {iatt}, {idec}, {islev}, {irel}",
        .tags = {"control", "modulation"}
    });

    specs.push_back(OpcodeSpec{
        .name = "oscili",
        .category = "oscillator",
        .description = "Classic interpolating oscillator.",
        .inputs = {
            in("amp", "Amplitude", SR::Control, num(0.4)),
            freq_in(),
            in("ifn", "FunctionTable", SR::Init, num(std::int64_t{1})),
        },
        .outputs = {out("asig", "aSig", SR::Audio)},
        .params = {},
        .code_template = "{asig} oscili {amp}, {freq}, {ifn}",
        .tags = {"sound", "source"}
    });

    specs.push_back(OpcodeSpec{
        .name = "vco",
        .category = "oscillator",
        .description = "Band-limited voltage-controlled oscillator.",
        .inputs = {
            in("amp", "Amplitude", SR::Control, num(0.4)),
            freq_in(),
            optional_in("iwave", "Waveform", SR::Init, num(std::int64_t{1})),
            optional_in("kpw", "PulseWidth", SR::Control, num(0.5)),
            optional_in("ifn", "FunctionTable", SR::Init),
        },
        .outputs = {out("asig", "aSig", SR::Audio)},
        .params = {},
        .code_template = "{asig} vco {amp}, {freq}, {iwave}, {kpw}, {ifn}",
        .tags = {"sound", "source"}
    });

    specs.push_back(OpcodeSpec{
        .name = "ftgen",
        .category = "tables",
        .description = "Create a function table at init time using a GEN routine.",
        .inputs = {
            in("ifn", "TableNumber", SR::Init, num(std::int64_t{1})),
            in("itime", "StartTime", SR::Init, num(std::int64_t{0})),
            in("isize", "TableSize", SR::Init, num(std::int64_t{16384})),
            in("igen", "GenRoutine", SR::Init, num(std::int64_t{10})),
            in("iarg1", "Arg1", SR::Init, num(std::int64_t{1})),
            optional_in("iarg2", "Arg2", SR::Init),
            optional_in("iarg3", "Arg3", SR::Init),
            optional_in("iarg4", "Arg4", SR::Init),
            optional_in("iarg5", "Arg5", SR::Init),
            optional_in("iarg6", "Arg6", SR::Init),
            optional_in("iarg7", "Arg7", SR::Init),
            optional_in("iarg8", "Arg8", SR::Init),
        },
        .outputs = {out("ift", "iFn", SR::Init)},
        .params = {},
        .code_template = "{ift} ftgen {ifn}, {itime}, {isize}, {igen}, {iarg1}, "
                         "{iarg2}, {iarg3}, {iarg4}, {iarg5}, {iarg6}, {iarg7}, {iarg8}",
        .tags = {"source", "tables", "gen"}
    });

    specs.push_back(OpcodeSpec{
        .name = "cpsmidi",
        .category = "midi",
        .description = "Read active MIDI note pitch as cycles-per-second.",
        .inputs = {},
        .outputs = {out("kfreq", "iFreq", SR::Init)},
        .params = {},
        .code_template = "{kfreq} cpsmidi",
        .tags = {"performance", "source"}
    });

    specs.push_back(OpcodeSpec{
        .name = "midictrl",
        .category = "midi",
        .description = "Read a MIDI controller value with optional scaling.",
        .inputs = {
            in("inum", "Controller", SR::Init, num(std::int64_t{1})),
            optional_in("imin", "Min", SR::Init, num(std::int64_t{0})),
            optional_in("imax", "Max", SR::Init, num(std::int64_t{127})),
        },
        .outputs = {out("kval", "kVal", SR::Control)},
        .params = {},
        .code_template = "{kval} midictrl {inum}, {imin}, {imax}",
        .tags = {"performance", "modulation"}
    });

    specs.push_back(OpcodeSpec{
        .name = "k_mul",
        .category = "math",
        .description = "Multiply two control signals.",
        .inputs = {in("a", "A", SR::Control), in("b", "B", SR::Control)},
        .outputs = {out("kout", "kOut", SR::Control)},
        .params = {},
        .code_template = "{kout} = ({a}) * ({b})",
        .tags = {"utility"}
    });

    specs.push_back(OpcodeSpec{
        .name = "a_mul",
        .category = "math",
        .description = "Multiply two audio signals.",
        .inputs = {in("a", "A", SR::Audio), in("b", "B", SR::Audio)},
        .outputs = {out("aout", "aOut", SR::Audio)},
        .params = {},
        .code_template = "{aout} = ({a}) * ({b})",
        .tags = {"utility"}
    });

    specs.push_back(OpcodeSpec{
        .name = "k_to_a",
        .category = "utility",
        .description = "Interpolate control signal to audio-rate.",
        .inputs = {in("kin", "kIn", SR::Control)},
        .outputs = {out("aout", "aOut", SR::Audio)},
        .params = {},
        .code_template = "{aout} interp {kin}",
        .tags = {"conversion"}
    });

    specs.push_back(OpcodeSpec{
        .name = "moogladder",
        .category = "filter",
        .description = "Moog ladder low-pass filter.",
        .inputs = {
            in("ain", "aIn", SR::Audio),
            in("kcf", "Cutoff", SR::Control, num(std::int64_t{2000})),
            in("kres", "Resonance", SR::Control, num(0.2)),
        },
        .outputs = {out("aout", "aOut", SR::Audio)},
        .params = {},
        .code_template = "{aout} moogladder {ain}, {kcf}, {kres}",
        .tags = {"tone"}
    });

    specs.push_back(OpcodeSpec{
        .name = "mix2",
        .category = "mixer",
        .description = "Mix two audio signals.",
        .inputs = {in("a", "Left", SR::Audio), in("b", "Right", SR::Audio)},
        .outputs = {out("aout", "aOut", SR::Audio)},
        .params = {},
        .code_template = "{aout} = ({a}) + ({b})",
        .tags = {"mix"}
    });

    specs.push_back(OpcodeSpec{
        .name = "outs",
        .category = "output",
        .description = "Stereo output sink.",
        .inputs = {in("left", "Left", SR::Audio), in("right", "Right", SR::Audio)},
        .outputs = {},
        .params = {},
        .code_template = "outs {left}, {right}",
        .tags = {"sink"}
    });

    // Constants render their `value` parameter; an omitted value renders as 0
    struct ConstantDef {
        const char* name;
        const char* description;
        const char* port;
        const char* port_name;
        SignalRate rate;
    };
    const ConstantDef constants[] = {
        {"const_k", "Control-rate constant value.", "kout", "kOut", SR::Control},
        {"const_i", "Init-rate constant value.", "iout", "iOut", SR::Init},
        {"const_a", "Audio-rate constant value.", "aout", "aOut", SR::Audio},
    };
    for (const auto& c : constants) {
        specs.push_back(OpcodeSpec{
            .name = c.name,
            .category = "constants",
            .description = c.description,
            .inputs = {},
            .outputs = {out(c.port, c.port_name, c.rate)},
            .params = {ParamSpec{"value", "0"}},
            .code_template = std::string("{") + c.port + "} = {value}",
            .tags = {"source"}
        });
    }

    return specs;
}

template <typename T>
const T* find_by_id(const std::vector<T>& items, std::string_view id) {
    for (const auto& item : items) {
        if (item.id == id) return &item;
    }
    return nullptr;
}

} // namespace

const PortSpec* OpcodeSpec::find_input(std::string_view id) const {
    return find_by_id(inputs, id);
}

const PortSpec* OpcodeSpec::find_output(std::string_view id) const {
    return find_by_id(outputs, id);
}

const ParamSpec* OpcodeSpec::find_param(std::string_view id) const {
    return find_by_id(params, id);
}

std::optional<std::vector<std::string>> template_placeholders(std::string_view text) {
    std::vector<std::string> names;
    std::size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '{') {
            if (i + 1 < text.size() && text[i + 1] == '{') {
                i += 2;
                continue;
            }
            auto close = text.find('}', i + 1);
            if (close == std::string_view::npos || close == i + 1) {
                return std::nullopt;
            }
            names.emplace_back(text.substr(i + 1, close - i - 1));
            i = close + 1;
            continue;
        }
        if (c == '}') {
            if (i + 1 < text.size() && text[i + 1] == '}') {
                i += 2;
                continue;
            }
            return std::nullopt;
        }
        ++i;
    }
    return names;
}

OpcodeRegistry OpcodeRegistry::with_builtins() {
    OpcodeRegistry registry;
    for (auto& spec : builtin_opcodes()) {
        registry.add(std::move(spec));
    }
    return registry;
}

void OpcodeRegistry::add(OpcodeSpec spec) {
    if (spec.name.empty()) {
        throw std::invalid_argument("Opcode name must not be empty");
    }

    std::set<std::string> ids;
    auto declare = [&](const std::string& id) {
        if (id.empty() || !ids.insert(id).second) {
            throw std::invalid_argument("Opcode '" + spec.name +
                                        "' declares port or parameter '" + id +
                                        "' more than once or with an empty id");
        }
    };
    for (const auto& p : spec.inputs) declare(p.id);
    for (const auto& p : spec.outputs) declare(p.id);
    for (const auto& p : spec.params) declare(p.id);

    auto placeholders = template_placeholders(spec.code_template);
    if (!placeholders) {
        throw std::invalid_argument("Opcode '" + spec.name + "' has a malformed template");
    }
    for (const auto& name : *placeholders) {
        if (!ids.contains(name)) {
            throw std::invalid_argument("Opcode '" + spec.name + "' template references undeclared '" +
                                        name + "'");
        }
    }

    auto name = spec.name;
    opcodes_.insert_or_assign(std::move(name), std::move(spec));
}

const OpcodeSpec* OpcodeRegistry::lookup(std::string_view name) const {
    auto it = opcodes_.find(name);
    return it == opcodes_.end() ? nullptr : &it->second;
}

std::vector<const OpcodeSpec*> OpcodeRegistry::list(std::string_view category) const {
    std::vector<const OpcodeSpec*> result;
    for (const auto& [name, spec] : opcodes_) {
        if (category.empty() || spec.category == category) {
            result.push_back(&spec);
        }
    }
    std::sort(result.begin(), result.end(), [](const OpcodeSpec* a, const OpcodeSpec* b) {
        if (a->category != b->category) return a->category < b->category;
        return a->name < b->name;
    });
    return result;
}

std::map<std::string, std::size_t> OpcodeRegistry::categories() const {
    std::map<std::string, std::size_t> counts;
    for (const auto& [name, spec] : opcodes_) {
        ++counts[spec.category];
    }
    return counts;
}

const OpcodeRegistry& builtin_registry() {
    static const OpcodeRegistry registry = OpcodeRegistry::with_builtins();
    return registry;
}

} // namespace patchc
