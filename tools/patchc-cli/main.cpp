#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <vector>
#include "patchc/patchc.hpp"

void print_usage(const char* program) {
    std::cout << "Patch Compiler v" << patchc::Version::string() << "\n\n"
              << "Usage: " << program << " [options] <patch.json>[@channel] ...\n\n"
              << "Each patch becomes one instrument; instrument N is the N-th file.\n"
              << "A channel suffix (1-16) binds the instrument to a MIDI channel.\n\n"
              << "Options:\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << "  -o, --output <file>    Write the program here (default: stdout)\n"
              << "  --orc                  Output the orchestra only, without the wrapper\n"
              << "  --json                 Output diagnostics as JSON (for tooling)\n"
              << "  --midi-input <sel>     MIDI input selector (default: 0)\n"
              << "  --rtmidi <module>      Realtime MIDI module (default: cmidi)\n"
              << "  --rtaudio <module>     Realtime audio module\n"
              << "  --opcodes <file>       Register extra opcodes from a JSON file\n"
              << "  --list-opcodes         List the available opcodes and exit\n"
              << std::endl;
}

void print_version() {
    std::cout << "patchc " << patchc::Version::string() << std::endl;
}

void list_opcodes(const patchc::OpcodeRegistry& registry) {
    std::string category;
    for (const auto* spec : registry.list()) {
        if (spec->category != category) {
            category = spec->category;
            std::cout << category << ":\n";
        }
        std::cout << "  " << spec->name;
        if (!spec->description.empty()) {
            std::cout << " - " << spec->description;
        }
        std::cout << "\n";
    }
}

// "file.json@3" -> ("file.json", 3); no suffix means channel 0
std::pair<std::string, int> split_target(const std::string& arg) {
    auto at = arg.rfind('@');
    if (at == std::string::npos || at + 1 == arg.size()) {
        return {arg, 0};
    }
    int channel = 0;
    const char* begin = arg.data() + at + 1;
    const char* end = arg.data() + arg.size();
    auto [ptr, ec] = std::from_chars(begin, end, channel);
    if (ec != std::errc{} || ptr != end) {
        return {arg, 0};
    }
    return {arg.substr(0, at), channel};
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::vector<std::string> inputs;
    std::vector<std::string> opcode_files;
    std::string output_file;
    bool json_output = false;
    bool orc_only = false;
    bool show_opcodes = false;
    patchc::CompileOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }

        if (arg == "-v" || arg == "--version") {
            print_version();
            return EXIT_SUCCESS;
        }

        if (arg == "--json") {
            json_output = true;
            continue;
        }

        if (arg == "--orc") {
            orc_only = true;
            continue;
        }

        if (arg == "--list-opcodes") {
            show_opcodes = true;
            continue;
        }

        if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_file = argv[++i];
            continue;
        }

        if (arg == "--midi-input" && i + 1 < argc) {
            options.midi_input = argv[++i];
            continue;
        }

        if (arg == "--rtmidi" && i + 1 < argc) {
            options.rtmidi_module = argv[++i];
            continue;
        }

        if (arg == "--rtaudio" && i + 1 < argc) {
            options.rtaudio_module = std::string(argv[++i]);
            continue;
        }

        if (arg == "--opcodes" && i + 1 < argc) {
            opcode_files.emplace_back(argv[++i]);
            continue;
        }

        if (arg.starts_with("-")) {
            std::cerr << "error: unknown option '" << arg << "'\n";
            return EXIT_FAILURE;
        }

        inputs.emplace_back(arg);
    }

    auto registry = patchc::OpcodeRegistry::with_builtins();
    std::vector<patchc::InstrumentTarget> targets;
    try {
        for (const auto& file : opcode_files) {
            patchc::load_opcode_file(registry, file);
        }

        if (show_opcodes) {
            list_opcodes(registry);
            return EXIT_SUCCESS;
        }

        for (const auto& input : inputs) {
            auto [path, channel] = split_target(input);
            targets.push_back(patchc::InstrumentTarget{patchc::load_patch_file(path), channel});
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    if (targets.empty()) {
        std::cerr << "error: no input file specified\n";
        return EXIT_FAILURE;
    }

    options.registry = &registry;
    auto result = patchc::compile(targets, options);

    for (const auto& diag : result.diagnostics) {
        if (json_output) {
            std::cout << patchc::format_diagnostic_json(diag) << "\n";
        } else {
            std::cerr << patchc::format_diagnostic(diag);
        }
    }

    if (!result.success) {
        return EXIT_FAILURE;
    }

    const std::string& program = orc_only ? result.orc : result.csd;
    if (output_file.empty()) {
        if (!json_output) {
            std::cout << program << "\n";
        }
        return EXIT_SUCCESS;
    }

    std::ofstream out(output_file);
    if (!out) {
        std::cerr << "error: could not write to " << output_file << "\n";
        return EXIT_FAILURE;
    }
    out << program << "\n";
    std::cerr << "Wrote " << program.size() << " bytes to " << output_file << "\n";
    return EXIT_SUCCESS;
}
