#ifndef PROCESSING_ORCHESTRATOR_H
#define PROCESSING_ORCHESTRATOR_H

#include "common/common_types.h"
#include "color/color_profile.h"
#include "rendering/IRenderer.h"
#include <filesystem>
#include <vector>
#include <memory>

class ProcessingOrchestrator {
public:
    ProcessingOrchestrator(const Config& config, const ColorProfile& profile);
    void process(const std::filesystem::path& inputPath);

    int getProcessedCount() const { return m_processedCount; }
    int getFailedCount() const { return m_failedCount; }
    const std::filesystem::path& getFinalOutputDir() const { return m_finalMainOutputDirPath; }

    // Loads one art file: strips the trailing newline and CRs, then pads every
    // line to the art width. Returns nullopt (and logs) on failure.
    static std::optional<std::string> loadAsciiArt(const std::filesystem::path& artPath);

private:
    void setupRenderers();
    void processSingleArt(const std::filesystem::path& artPath);
    void processDirectory(const std::filesystem::path& dirPath);
    bool processArtFile(const std::filesystem::path& artPath, const std::filesystem::path& outputSubDirPath);

    const Config& m_config;
    const ColorProfile& m_profile;
    int m_processedCount = 0;
    int m_failedCount = 0;
    std::filesystem::path m_finalMainOutputDirPath;
    std::vector<std::unique_ptr<IRenderer>> m_renderers;
};

#endif // PROCESSING_ORCHESTRATOR_H
