#pragma once

#include <stdexcept>
#include <string>

namespace stepseq {

/// Precondition violation raised by a sequencer call.
/// Thrown before any state is mutated.
class SequencerError : public std::runtime_error {
public:
    enum class Kind {
        InvalidReference,  // unknown track id, pad index out of range
        InvalidConfig,     // configuration value out of range
    };

    SequencerError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

} // namespace stepseq
