#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace patchc {

/// Update-rate class of a port value
enum class SignalRate : std::uint8_t {
    Audio,          // a-rate, once per sample
    Control,        // k-rate, once per control block
    Init,           // i-rate, once per note
    String,         // S, string values
    FunctionTable,  // f, function table reference
};

/// Variable prefix used by the synthesis language for a rate ("a", "k", ...)
constexpr std::string_view signal_rate_prefix(SignalRate rate) {
    switch (rate) {
        case SignalRate::Audio:         return "a";
        case SignalRate::Control:       return "k";
        case SignalRate::Init:          return "i";
        case SignalRate::String:        return "S";
        case SignalRate::FunctionTable: return "f";
    }
    return "?";
}

/// Parse a rate from its prefix form; also accepts the long names
/// ("audio", "control", "init", "string", "ftable")
std::optional<SignalRate> parse_signal_rate(std::string_view text);

/// Check whether a value of rate `source` may feed an input of rate `target`.
///
/// Compatible iff the target explicitly accepts the source rate, the rates are
/// equal, or the source is init-rate and the target control-rate. No other
/// promotion is implicit.
[[nodiscard]] bool is_compatible_rate(SignalRate source, SignalRate target,
                                      std::span<const SignalRate> accepted = {});

} // namespace patchc
