#include "PathManager.h"
#include <iostream>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <system_error> // For std::error_code

#if defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#include <process.h>
#else
#include <unistd.h>
#endif

namespace PathManager {

namespace {

const std::string FALLBACK_EXE_NAME = "ascii_recolor_fallback";

std::filesystem::path fallbackExecutablePath() {
#ifdef _WIN32
    char pathBuf[MAX_PATH];
    if (GetModuleFileNameA(NULL, pathBuf, MAX_PATH) != 0) {
        return pathBuf;
    }
    return std::filesystem::current_path() / (FALLBACK_EXE_NAME + ".exe");
#else
    std::error_code ec;
    std::filesystem::path self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return self;
    }
    return std::filesystem::current_path() / FALLBACK_EXE_NAME;
#endif
}

bool isExecutableFile(const std::filesystem::path& p) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec)) return false;
#ifdef _WIN32
    return true;
#else
    return ::access(p.c_str(), X_OK) == 0;
#endif
}

} // namespace

std::filesystem::path getExecutablePath(int argc, char* argv[]) {
    std::filesystem::path exePath;
    try {
        if (argc > 0 && argv[0] != nullptr) {
            std::error_code ec;
            std::filesystem::path tempPath = std::filesystem::canonical(argv[0], ec);
            exePath = !ec ? tempPath : fallbackExecutablePath();
        } else {
            exePath = fallbackExecutablePath();
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception resolving executable path: " << e.what() << ". Using fallback." << std::endl;
        exePath = std::filesystem::current_path() / FALLBACK_EXE_NAME;
    }
    return exePath;
}

std::filesystem::path setupOutputDirectory(const std::filesystem::path& baseDir, const std::string& dirName) {
    std::filesystem::path outputDirPath = baseDir / dirName;
    try {
        if (std::filesystem::create_directories(outputDirPath)) {
             std::cout << "Created output directory: " << outputDirPath.string() << std::endl;
        } else if (!std::filesystem::exists(outputDirPath) || !std::filesystem::is_directory(outputDirPath)) {
             std::cerr << "Error: Failed to create or access output directory: " << outputDirPath.string() << std::endl;
             return std::filesystem::path();
        }
        return outputDirPath;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Error (filesystem): Creating directory " << outputDirPath.string() << ": " << e.what() << std::endl;
        return std::filesystem::path();
    }
}

std::optional<std::filesystem::path> findInPath(const std::string& programName) {
    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) return std::nullopt;

#ifdef _WIN32
    const char separator = ';';
    const std::string suffix = ".exe";
#else
    const char separator = ':';
    const std::string suffix;
#endif

    const std::string pathList(pathEnv);
    size_t begin = 0;
    while (begin <= pathList.size()) {
        size_t end = pathList.find(separator, begin);
        if (end == std::string::npos) end = pathList.size();
        const std::string dir = pathList.substr(begin, end - begin);
        if (!dir.empty()) {
            std::filesystem::path candidate = std::filesystem::path(dir) / (programName + suffix);
            if (isExecutableFile(candidate)) {
                return candidate;
            }
        }
        begin = end + 1;
    }
    return std::nullopt;
}

std::filesystem::path makeTempFilePath(const std::string& prefix, const std::string& extension) {
    static std::atomic<unsigned> counter{0};
#ifdef _WIN32
    const long pid = static_cast<long>(_getpid());
#else
    const long pid = static_cast<long>(::getpid());
#endif
    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();

    std::error_code ec;
    std::filesystem::path tempDir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tempDir = std::filesystem::current_path();
    }

    for (;;) {
        std::filesystem::path candidate = tempDir /
            (prefix + "_" + std::to_string(pid) + "_" + std::to_string(ticks) + "_" + std::to_string(counter++) + extension);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

} // namespace PathManager
