// bindings/bindings.cpp
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "patchc/patchc.hpp"
#include "stepseq/config_json.hpp"
#include "stepseq/engine.hpp"
#include "stepseq/error.hpp"

namespace py = pybind11;

namespace {

// Forwards sequencer MIDI to a Python callable(selector: str, message: list[int]) -> bool|None
class PythonMidiSink : public stepseq::MidiSink {
public:
    explicit PythonMidiSink(py::function callback) : callback_(std::move(callback)) {}

    ~PythonMidiSink() override {
        py::gil_scoped_acquire gil;
        callback_ = py::function();
    }

    bool send(std::string_view selector, const stepseq::MidiMessage& message) override {
        py::gil_scoped_acquire gil;
        try {
            py::object result = callback_(std::string(selector),
                                          py::make_tuple(message[0], message[1], message[2]));
            return result.is_none() || result.cast<bool>();
        } catch (py::error_already_set& e) {
            throw std::runtime_error(e.what());
        }
    }

private:
    py::function callback_;
};

py::dict compile_result_dict(const patchc::CompileResult& result) {
    py::list diagnostics;
    for (const auto& diag : result.diagnostics) {
        py::dict d;
        d["severity"] = diag.severity == patchc::Severity::Error ? "error" : "warning";
        d["code"] = diag.code;
        d["message"] = diag.message;
        d["instrument"] = diag.instrument;
        d["node"] = diag.node_id;
        d["port"] = diag.port_id;
        d["column"] = diag.location.column;
        d["length"] = diag.location.length;
        diagnostics.append(d);
    }
    py::dict out;
    out["success"] = result.success;
    out["orc"] = result.orc;
    out["csd"] = result.csd;
    out["diagnostics"] = diagnostics;
    return out;
}

patchc::CompileOptions make_options(const std::string& midi_input, const std::string& rtmidi,
                                    std::optional<std::string> rtaudio) {
    patchc::CompileOptions options;
    options.midi_input = midi_input;
    options.rtmidi_module = rtmidi;
    options.rtaudio_module = std::move(rtaudio);
    return options;
}

py::object status_object(const stepseq::SequencerStatus& status) {
    auto json_module = py::module_::import("json");
    return json_module.attr("loads")(stepseq::status_to_json(status).dump());
}

// Engine plus the channel its events are drained from. Every engine call
// releases the GIL: the scheduling thread takes it inside the MIDI callback
// while holding the engine lock.
struct PySequencer {
    std::shared_ptr<stepseq::EventChannel> events;
    std::unique_ptr<stepseq::SequencerEngine> engine;

    PySequencer(const std::string& session_id, py::function midi_callback,
                const std::string& midi_input)
        : events(std::make_shared<stepseq::EventChannel>()),
          engine(std::make_unique<stepseq::SequencerEngine>(
              session_id, std::make_shared<PythonMidiSink>(std::move(midi_callback)),
              midi_input, events)) {}

    ~PySequencer() {
        py::gil_scoped_release release;
        engine.reset();
    }

    template<typename F>
    py::object call(F&& fn) {
        stepseq::SequencerStatus status;
        {
            py::gil_scoped_release release;
            status = fn();
        }
        return status_object(status);
    }
};

} // namespace

PYBIND11_MODULE(patchbay_core, m) {
    m.doc() = "Patch compiler and step sequencer bindings";

    m.attr("__version__") = std::string(patchc::Version::string());

    py::register_exception<stepseq::SequencerError>(m, "SequencerError", PyExc_ValueError);

    // --- Compiler ---
    m.def("compile_patch_json", [](const std::string& patch_json, const std::string& midi_input,
                                   const std::string& rtmidi, std::optional<std::string> rtaudio) {
        auto patch = patchc::parse_patch(patch_json, "<patch>");
        return compile_result_dict(patchc::compile_patch(
            patch, make_options(midi_input, rtmidi, std::move(rtaudio))));
    }, py::arg("patch_json"), py::arg("midi_input") = "0", py::arg("rtmidi") = "cmidi",
       py::arg("rtaudio") = py::none(),
       "Compile one patch document; returns {success, orc, csd, diagnostics}");

    m.def("compile_bundle_json", [](const std::vector<std::pair<std::string, int>>& targets,
                                    const std::string& midi_input, const std::string& rtmidi,
                                    std::optional<std::string> rtaudio) {
        std::vector<patchc::InstrumentTarget> parsed;
        parsed.reserve(targets.size());
        for (const auto& [patch_json, channel] : targets) {
            parsed.push_back(patchc::InstrumentTarget{patchc::parse_patch(patch_json, "<patch>"),
                                                      channel});
        }
        return compile_result_dict(patchc::compile(
            parsed, make_options(midi_input, rtmidi, std::move(rtaudio))));
    }, py::arg("targets"), py::arg("midi_input") = "0", py::arg("rtmidi") = "cmidi",
       py::arg("rtaudio") = py::none(),
       "Compile [(patch_json, midi_channel), ...] into one program");

    // --- Sequencer ---
    py::class_<PySequencer>(m, "Sequencer")
        .def(py::init<const std::string&, py::function, const std::string&>(),
             py::arg("session_id"), py::arg("midi_callback"), py::arg("midi_input") = "0")
        .def("configure", [](PySequencer& self, const std::string& config_json) {
            auto config = stepseq::parse_performance(config_json, "<config>");
            return self.call([&] { return self.engine->configure(config); });
        })
        .def("start", [](PySequencer& self) {
            return self.call([&] { return self.engine->start(); });
        })
        .def("stop", [](PySequencer& self) {
            return self.call([&] { return self.engine->stop(); });
        })
        .def("queue_pad", [](PySequencer& self, const std::string& track_id, int pad_index) {
            return self.call([&] { return self.engine->queue_pad(track_id, pad_index); });
        })
        .def("status", [](PySequencer& self) {
            return self.call([&] { return self.engine->status(); });
        })
        .def("set_midi_input", [](PySequencer& self, const std::string& selector) {
            py::gil_scoped_release release;
            self.engine->set_midi_input(selector);
        })
        .def("drain_events", [](PySequencer& self) {
            auto json_module = py::module_::import("json");
            py::list out;
            for (const auto& event : self.events->drain()) {
                out.append(json_module.attr("loads")(stepseq::event_to_json(event).dump()));
            }
            return out;
        }, "Events raised by the scheduling thread since the last call");
}
