#include "patchc/signal.hpp"
#include <algorithm>

namespace patchc {

std::optional<SignalRate> parse_signal_rate(std::string_view text) {
    if (text == "a" || text == "audio")   return SignalRate::Audio;
    if (text == "k" || text == "control") return SignalRate::Control;
    if (text == "i" || text == "init")    return SignalRate::Init;
    if (text == "S" || text == "string")  return SignalRate::String;
    if (text == "f" || text == "ftable")  return SignalRate::FunctionTable;
    return std::nullopt;
}

bool is_compatible_rate(SignalRate source, SignalRate target,
                        std::span<const SignalRate> accepted) {
    if (std::find(accepted.begin(), accepted.end(), source) != accepted.end()) {
        return true;
    }
    if (source == target) {
        return true;
    }
    return source == SignalRate::Init && target == SignalRate::Control;
}

} // namespace patchc
