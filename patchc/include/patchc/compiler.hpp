#pragma once

#include "diagnostics.hpp"
#include "opcode.hpp"
#include "patch.hpp"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace patchc {

/// Options of the wrapped program document
struct CompileOptions {
    std::string midi_input = "0";              // -M selector
    std::string rtmidi_module = "cmidi";       // -+rtmidi=
    std::optional<std::string> rtaudio_module; // -+rtaudio=, omitted when unset
    std::uint32_t software_buffer = 128;       // -b
    std::uint32_t hardware_buffer = 512;       // -B
    const OpcodeRegistry* registry = nullptr;  // nullptr = builtin_registry()
};

/// Compilation result
struct CompileResult {
    bool success = false;
    std::string orc;                       // Orchestra text (header + instruments)
    std::string csd;                       // Full wrapped document
    std::vector<Diagnostic> diagnostics;   // Errors and warnings, in discovery order
};

/// Lines of one compiled instrument body, before indentation
struct InstrumentResult {
    bool success = false;
    std::vector<std::string> lines;
    std::vector<Diagnostic> diagnostics;
};

/// Validate one patch graph and emit its instrument body.
///
/// Structural problems (empty graph, duplicate ids, unknown opcodes, sink
/// count) stop compilation immediately; connection errors, the cycle check and
/// per-node emission each collect every problem before failing.
InstrumentResult compile_instrument(const PatchGraph& graph, const OpcodeRegistry& registry);

/// Compile a multi-instrument bundle; instrument N is targets[N-1]
CompileResult compile(std::span<const InstrumentTarget> targets,
                      const CompileOptions& options = {});

/// Compile a single patch as instrument 1 with an omni channel binding
CompileResult compile_patch(const Patch& patch, const CompileOptions& options = {});

/// Orchestra header for an engine configuration (ends with a blank line)
std::string orchestra_header(const EngineConfig& engine);

/// Wrap orchestra text into a complete program document
std::string wrap_document(const std::string& orc, const CompileOptions& options);

} // namespace patchc
