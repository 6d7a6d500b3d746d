#include "FetchBackendRenderer.h"
#include "utils/PathManager.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <system_error>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace { // Anonymous namespace for internal helpers

// Only one backend process prints at a time.
std::mutex g_backendMutex;

const int FASTFETCH_TOO_OLD_EXIT_CODE = 144;

std::string shellQuote(const std::string& arg) {
#ifdef _WIN32
    std::string quoted = "\"";
    for (char c : arg) {
        if (c == '"') quoted += '\\';
        quoted += c;
    }
    return quoted + "\"";
#else
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    return quoted + "'";
#endif
}

// Runs the command and returns its exit code, or -1 if it could not be run.
int runCommand(const std::vector<std::string>& command) {
    std::string commandLine;
    for (size_t i = 0; i < command.size(); ++i) {
        if (i > 0) commandLine += ' ';
        commandLine += shellQuote(command[i]);
    }

    const int status = std::system(commandLine.c_str());
    if (status == -1) return -1;
#ifdef _WIN32
    return status;
#else
    if (!WIFEXITED(status)) return -1;
    return WEXITSTATUS(status);
#endif
}

} // end anonymous namespace

FetchBackendRenderer::FetchBackendRenderer(Backend backend) : m_backend(backend) {}

std::string FetchBackendRenderer::escapeForNeofetch(const std::string& ascii) {
    std::string escaped;
    escaped.reserve(ascii.size());
    for (char c : ascii) {
        if (c == '\\') escaped += '\\';
        escaped += c;
    }
    return escaped;
}

std::optional<std::vector<std::string>> FetchBackendRenderer::buildCommand(
    const std::filesystem::path& artFile,
    const std::vector<std::string>& extraArgs) const
{
    std::vector<std::string> command;
    switch (m_backend) {
        case Backend::NEOFETCH: {
            auto neofetch = PathManager::findInPath("neofetch");
            if (!neofetch) return std::nullopt;
            command = {"bash", neofetch->string(), "--ascii", "--source", artFile.string(), "--ascii-colors"};
            break;
        }
        case Backend::FASTFETCH:
        case Backend::FASTFETCH_OLD: {
            auto fastfetch = PathManager::findInPath("fastfetch");
            if (!fastfetch) return std::nullopt;
            const std::string rawFlag = (m_backend == Backend::FASTFETCH_OLD) ? "--raw" : "--file-raw";
            command = {fastfetch->string(), rawFlag, artFile.string()};
            break;
        }
        case Backend::NONE:
        default:
            return std::nullopt;
    }
    command.insert(command.end(), extraArgs.begin(), extraArgs.end());
    return command;
}

bool FetchBackendRenderer::render(
    const std::string& coloredAscii,
    const std::filesystem::path& /*outputPath*/,
    const Config& config) const
{
    const std::string ascii = (m_backend == Backend::NEOFETCH) ? escapeForNeofetch(coloredAscii) : coloredAscii;

    const std::filesystem::path tempPath = PathManager::makeTempFilePath("ascii", ART_FILE_EXTENSION);
    {
        std::ofstream tempFile(tempPath, std::ios::binary);
        if (!tempFile.is_open()) {
            std::cerr << "Error: Failed to create temp file for ascii: " << tempPath.string() << std::endl;
            return false;
        }
        tempFile << ascii;
        if (!tempFile) {
            std::cerr << "Error: Failed to write ascii to temp file: " << tempPath.string() << std::endl;
            return false;
        }
    }

    bool success = false;
    auto command = buildCommand(tempPath, config.backendArgs);
    if (!command) {
        std::cerr << "Error: " << getName() << " command not found in PATH." << std::endl;
    } else {
        std::lock_guard<std::mutex> lock(g_backendMutex);
        const int exitCode = runCommand(*command);
        if (exitCode == FASTFETCH_TOO_OLD_EXIT_CODE && m_backend == Backend::FASTFETCH) {
            std::cerr << "Warning: exit code 144 detected; please upgrade fastfetch to >=1.8.0 or use the 'fastfetch-old' backend" << std::endl;
        }
        if (exitCode != 0) {
            std::cerr << "Error: " << getName() << " command exited with code " << exitCode << "." << std::endl;
        } else {
            success = true;
        }
    }

    std::error_code ec;
    std::filesystem::remove(tempPath, ec);
    if (ec) {
        std::cerr << "Warning: Failed to remove temp file " << tempPath.string() << ": " << ec.message() << std::endl;
    }
    return success;
}

std::string FetchBackendRenderer::getName() const {
    return backendToString(m_backend);
}
