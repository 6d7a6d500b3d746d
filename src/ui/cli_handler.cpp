// src/ui/cli_handler.cpp

#include "cli_handler.h"
#include "color/presets.h"
#include <iostream>
#include <iomanip>

namespace CLIHandler {

std::optional<CommandLineOptions> parseArguments(int argc, char* argv[]) {
    CommandLineOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
            return options;
        }
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a file path." << std::endl;
                return std::nullopt;
            }
            options.configPath = std::filesystem::path(argv[++i]);
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'." << std::endl;
            return std::nullopt;
        }
        if (!options.inputPath.empty()) {
            std::cerr << "Error: Only one input path may be given (got '" << options.inputPath << "' and '" << arg << "')." << std::endl;
            return std::nullopt;
        }
        options.inputPath = arg;
    }

    if (options.inputPath.empty()) {
        std::cerr << "Error: Missing input path." << std::endl;
        return std::nullopt;
    }
    return options;
}

void printWelcomeMessage() {
    std::cout << "--- ASCII Art Recolor ---" << std::endl;
}

void printUsage(const std::string& programName) {
    std::cerr << "\nA command-line tool to recolor fetch ascii art with gradient color profiles." << std::endl;
    std::cerr << "\nUsage:\n  " << programName << " [--config <config.json>] <path_to_art_or_directory>" << std::endl;
    std::cerr << "\nArguments:" << std::endl;
    std::cerr << "  path_to_art_or_directory   A .txt ascii art file using ${c1}..${c6} color codes, or a directory of them." << std::endl;
    std::cerr << "\nOptions:" << std::endl;
    std::cerr << "  -c, --config <file>        Use this config file instead of config.json next to the executable." << std::endl;
    std::cerr << "  -h, --help                 Show this help." << std::endl;
    std::cerr << "\nPresets:\n  ";
    const auto names = presetNames();
    for (size_t i = 0; i < names.size(); ++i) {
        std::cerr << names[i] << (i + 1 < names.size() ? ", " : "");
    }
    std::cerr << "\n\nExample:" << std::endl;
    std::cerr << "  " << programName << " ~/ascii/fedora.txt" << std::endl;
}


void printEffectiveConfiguration(const Config& config, const ColorProfile& profile) {
    std::cout << "\n--- Effective Configuration ---" << std::endl;
    if (config.customHexColors.empty()) {
        std::cout << "Preset:               " << config.presetName << std::endl;
    } else {
        std::cout << "Preset:               (custom colors)" << std::endl;
    }
    std::cout << "Profile Colors:       ";
    for (size_t i = 0; i < profile.length(); ++i) {
        std::cout << profile.colorAt(i).toHex() << (i + 1 < profile.length() ? " " : "");
    }
    std::cout << std::endl;
    std::cout << "Color Mode:           " << ansiModeToString(config.colorMode) << std::endl;
    std::cout << "Terminal Theme:       " << terminalThemeToString(config.theme) << std::endl;
    std::cout << "Fore/Back Table:      " << (config.useForeBack ? "Enabled" : "Disabled") << std::endl;
    std::cout << "Distro:               " << (config.distroOverride.empty() ? "(from file name)" : config.distroOverride) << std::endl;
    std::cout << "--- Output Settings ---" << std::endl;
    std::cout << "Print To Terminal:    " << (config.printToTerminal ? "Enabled" : "Disabled") << std::endl;
    std::cout << "Write Text Output:    " << (config.writeTextOutput ? "Enabled" : "Disabled") << std::endl;
    std::cout << "Backend:              " << backendToString(config.backend) << std::endl;
    std::cout << "--- Alignments ---" << std::endl;
    std::cout << "Alignments:           ";
    if (config.alignmentsToGenerate.empty()) {
        std::cout << "(None - Check config)";
    } else {
        for (size_t i = 0; i < config.alignmentsToGenerate.size(); ++i) {
            std::cout << alignmentModeToString(config.alignmentsToGenerate[i].mode) << (i == config.alignmentsToGenerate.size() - 1 ? "" : ", ");
        }
    }
    std::cout << "\n-----------------------------" << std::endl;
}

void printProcessingSummary(int processedCount, int failedCount, double duration, const std::filesystem::path& outputDir) {
    std::cout << "\n==================================================" << std::endl;
    std::cout << "Processing Summary:" << std::endl;
    std::cout << "  Successfully processed: " << processedCount << " art file(s)" << std::endl;
    std::cout << "  Failed/Skipped:       " << failedCount << " art file(s)" << std::endl;
    std::cout << "  Total time:           " << std::fixed << std::setprecision(3) << duration << "s" << std::endl;
    if (!outputDir.empty()){
         std::cout << "Output(s) can be found in/under: " << outputDir.string() << std::endl;
    }
    std::cout << "==================================================" << std::endl;
}

} // namespace CLIHandler
