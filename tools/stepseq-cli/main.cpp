#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include "stepseq/config_json.hpp"
#include "stepseq/engine.hpp"
#include "stepseq/error.hpp"

namespace {

std::atomic<bool> g_signal_received{false};

void signal_handler(int signal) {
    (void)signal;
    g_signal_received.store(true, std::memory_order_release);
}

void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

std::mutex g_output_mutex;

// Prints every message instead of talking to a device
class PrintingSink : public stepseq::MidiSink {
public:
    explicit PrintingSink(bool quiet) : quiet_(quiet) {}

    bool send(std::string_view selector, const stepseq::MidiMessage& message) override {
        if (!quiet_) {
            std::lock_guard<std::mutex> lock(g_output_mutex);
            std::cout << "midi " << selector << ": " << stepseq::format_midi(message) << "\n";
        }
        return true;
    }

private:
    bool quiet_;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <performance.json>\n\n"
              << "Runs the step sequencer on a performance file and prints the MIDI\n"
              << "it sends together with the sequencer events.\n\n"
              << "Options:\n"
              << "  --seconds <n>       Stop after n seconds (default: 10)\n"
              << "  --cycles <n>        Stop after n transport cycles\n"
              << "  --midi-input <sel>  MIDI input selector (default: 0)\n"
              << "  --quiet             Only print the final status\n"
              << "  -h, --help          Show this help\n";
}

void print_events(stepseq::EventChannel& events, bool quiet) {
    auto drained = events.drain();
    if (quiet) return;
    std::lock_guard<std::mutex> lock(g_output_mutex);
    for (const auto& event : drained) {
        std::cout << stepseq::event_to_json(event).dump() << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string input;
    std::string midi_input = "0";
    double seconds = 10.0;
    std::uint64_t cycles = 0;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }

        if (arg == "--seconds" || arg == "--cycles" || arg == "--midi-input") {
            if (++i >= argc) {
                std::cerr << "error: " << arg << " requires a value\n";
                return EXIT_FAILURE;
            }
            try {
                if (arg == "--seconds") {
                    seconds = std::stod(argv[i]);
                } else if (arg == "--cycles") {
                    cycles = std::stoull(argv[i]);
                } else {
                    midi_input = argv[i];
                }
            } catch (const std::exception&) {
                std::cerr << "error: invalid value for " << arg << ": " << argv[i] << "\n";
                return EXIT_FAILURE;
            }
            continue;
        }

        if (arg == "--quiet") {
            quiet = true;
            continue;
        }

        if (arg[0] != '-' && input.empty()) {
            input = arg;
            continue;
        }

        std::cerr << "error: unknown argument: " << arg << "\n";
        return EXIT_FAILURE;
    }

    if (input.empty()) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    auto events = std::make_shared<stepseq::EventChannel>();
    stepseq::SequencerEngine engine("cli", std::make_shared<PrintingSink>(quiet),
                                    midi_input, events);

    try {
        engine.configure(stepseq::load_performance_file(input));
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    install_signal_handlers();
    engine.start();

    const auto started = std::chrono::steady_clock::now();
    const auto limit = std::chrono::duration<double>(seconds);
    while (!g_signal_received.load(std::memory_order_acquire)) {
        if (std::chrono::steady_clock::now() - started >= limit) break;
        if (cycles > 0 && engine.status().cycle >= cycles) break;
        print_events(*events, quiet);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    auto status = engine.stop();
    events->close();
    print_events(*events, quiet);

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << stepseq::status_to_json(status).dump(2) << std::endl;
    return EXIT_SUCCESS;
}
