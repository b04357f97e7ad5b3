#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace stepseq {

/// Raw 3-byte channel voice message
using MidiMessage = std::array<std::uint8_t, 3>;

constexpr std::uint8_t STATUS_NOTE_OFF = 0x80;
constexpr std::uint8_t STATUS_NOTE_ON = 0x90;
constexpr std::uint8_t STATUS_CONTROL_CHANGE = 0xB0;

constexpr std::uint8_t CC_ALL_SOUND_OFF = 120;
constexpr std::uint8_t CC_ALL_NOTES_OFF = 123;

/// Clamp an arbitrary integer into the 0..127 data byte range
[[nodiscard]] constexpr std::uint8_t clamp_data_byte(long long value) noexcept {
    return static_cast<std::uint8_t>(std::clamp<long long>(value, 0, 127));
}

/// Status byte for a 1-based MIDI channel
[[nodiscard]] constexpr std::uint8_t status_byte(std::uint8_t status, int channel) noexcept {
    return static_cast<std::uint8_t>(status | ((channel - 1) & 0x0F));
}

[[nodiscard]] constexpr MidiMessage note_on(int channel, std::uint8_t note,
                                            std::uint8_t velocity) noexcept {
    return {status_byte(STATUS_NOTE_ON, channel), clamp_data_byte(note), clamp_data_byte(velocity)};
}

/// Note off with release velocity 0
[[nodiscard]] constexpr MidiMessage note_off(int channel, std::uint8_t note) noexcept {
    return {status_byte(STATUS_NOTE_OFF, channel), clamp_data_byte(note), 0};
}

[[nodiscard]] constexpr MidiMessage control_change(int channel, std::uint8_t controller,
                                                   std::uint8_t value) noexcept {
    return {status_byte(STATUS_CONTROL_CHANGE, channel), controller, value};
}

/// Hex dump such as "90 3C 64"
std::string format_midi(const MidiMessage& message);

/// Destination for sequencer output.
///
/// Implementations report failure by returning false or throwing a
/// std::exception; the sequencer logs both and keeps running.
class MidiSink {
public:
    virtual ~MidiSink() = default;

    /// Send one message to the input addressed by `selector`
    virtual bool send(std::string_view selector, const MidiMessage& message) = 0;
};

} // namespace stepseq
