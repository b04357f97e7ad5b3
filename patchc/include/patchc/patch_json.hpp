#pragma once

#include "opcode.hpp"
#include "patch.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace patchc {

/// Engine settings as given by a document, before defaults and derivation
struct EngineConfigInput {
    std::optional<std::int64_t> sr;
    std::optional<std::int64_t> control_rate;
    std::optional<std::int64_t> ksmps;
    std::optional<std::int64_t> nchnls;
    std::optional<double> zero_dbfs;
};

/// Apply defaults, range checks and rate derivation.
///
/// When only ksmps is given the control rate becomes round(sr / ksmps) if that
/// lies in range; ksmps is then always recomputed as round(sr / control_rate).
/// @throws std::invalid_argument on out-of-range values
EngineConfig resolve_engine_config(const EngineConfigInput& input);

/// Parse a patch document.
/// @param origin File name or other label used in error messages
/// @throws std::runtime_error on malformed JSON or invalid fields
Patch parse_patch(std::string_view text, std::string_view origin = "<input>");

/// Read and parse a patch file
/// @throws std::runtime_error if the file cannot be read or is invalid
Patch load_patch_file(const std::string& path);

/// Register the opcodes of a registry document (`{"opcodes": [...]}` or a
/// bare array) into `registry`.
/// @return Number of opcodes registered
/// @throws std::runtime_error on malformed documents or invalid opcodes
std::size_t parse_opcodes(OpcodeRegistry& registry, std::string_view text,
                          std::string_view origin = "<input>");

/// Read a registry document from a file
std::size_t load_opcode_file(OpcodeRegistry& registry, const std::string& path);

/// Read a whole text file
/// @throws std::runtime_error if the file cannot be opened
std::string read_text_file(const std::string& path);

} // namespace patchc
