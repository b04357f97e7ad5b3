#pragma once

#include "events.hpp"
#include "status.hpp"
#include "track.hpp"
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace stepseq {

/// Parse a performance document into a sequencer configuration.
///
/// Steps may be written as null, a note number, a list of notes or an
/// object `{"note"|"notes", "hold", "velocity"}`. Value ranges are checked
/// later by SequencerEngine::configure().
/// @throws std::runtime_error naming `origin` on malformed input
SequencerConfig parse_performance(std::string_view text, std::string_view origin = "<input>");

/// Read and parse a performance file
SequencerConfig load_performance_file(const std::string& path);

[[nodiscard]] nlohmann::json status_to_json(const SequencerStatus& status);

/// `{"session_id", "type", "payload"}`
[[nodiscard]] nlohmann::json event_to_json(const Event& event);

} // namespace stepseq
