// src/ui/cli_handler.h

#ifndef CLI_HANDLER_H
#define CLI_HANDLER_H

#include "common_types.h"
#include "color/color_profile.h"
#include <optional>
#include <string>
#include <filesystem>

namespace CLIHandler {

    struct CommandLineOptions {
        std::string inputPath;
        std::optional<std::filesystem::path> configPath;
        bool showHelp = false;
    };

    // Returns nullopt (after printing the problem) when the arguments are invalid.
    std::optional<CommandLineOptions> parseArguments(int argc, char* argv[]);

    void printWelcomeMessage();
    void printUsage(const std::string& programName);

    void printEffectiveConfiguration(const Config& config, const ColorProfile& profile);
    void printProcessingSummary(int processedCount, int failedCount, double duration, const std::filesystem::path& outputDir);

} // namespace CLIHandler

#endif // CLI_HANDLER_H
