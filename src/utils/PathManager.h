#ifndef PATH_MANAGER_H
#define PATH_MANAGER_H

#include <filesystem>
#include <optional>
#include <string>

namespace PathManager {
    std::filesystem::path getExecutablePath(int argc, char* argv[]);
    std::filesystem::path setupOutputDirectory(const std::filesystem::path& baseDir, const std::string& dirName);

    // Searches the PATH environment variable for an executable file.
    std::optional<std::filesystem::path> findInPath(const std::string& programName);

    // A fresh, not yet existing file path inside the system temp directory.
    std::filesystem::path makeTempFilePath(const std::string& prefix, const std::string& extension);
}

#endif // PATH_MANAGER_H
