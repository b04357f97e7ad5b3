#include "stepseq/midi.hpp"
#include <cstdio>

namespace stepseq {

std::string format_midi(const MidiMessage& message) {
    char buf[12];
    std::snprintf(buf, sizeof(buf), "%02X %02X %02X",
                  message[0], message[1], message[2]);
    return buf;
}

} // namespace stepseq
