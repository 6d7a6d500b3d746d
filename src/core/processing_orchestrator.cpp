#include "processing_orchestrator.h"
#include "core/canvas_metrics.h"
#include "core/color_alignment.h"
#include "core/fore_back_table.h"
#include "core/recolor_error.h"
#include "rendering/TerminalRenderer.h"
#include "rendering/TextFileRenderer.h"
#include "rendering/FetchBackendRenderer.h"
#include "config/config_handler.h"
#include "utils/PathManager.h"
#include "utils/GraphemeUtils.h"

#include <iostream>
#include <future>
#include <chrono>
#include <iomanip>
#include <map>

using namespace std::chrono;

ProcessingOrchestrator::ProcessingOrchestrator(const Config& config, const ColorProfile& profile)
    : m_config(config), m_profile(profile) {
    setupRenderers();
}

void ProcessingOrchestrator::setupRenderers() {
    if (m_config.writeTextOutput) {
        m_renderers.push_back(std::make_unique<TextFileRenderer>());
    }
    if (m_config.printToTerminal) {
        m_renderers.push_back(std::make_unique<TerminalRenderer>());
    }
    if (m_config.backend != Backend::NONE) {
        m_renderers.push_back(std::make_unique<FetchBackendRenderer>(m_config.backend));
    }
}

std::optional<std::string> ProcessingOrchestrator::loadAsciiArt(const std::filesystem::path& artPath) {
    auto content = readTextFile(artPath);
    if (!content) {
        return std::nullopt;
    }

    std::string asc;
    asc.reserve(content->size());
    for (char c : *content) {
        if (c != '\r') asc += c;
    }
    while (!asc.empty() && asc.back() == '\n') {
        asc.pop_back();
    }
    // Drop a UTF-8 BOM so it does not count as a column
    if (asc.size() >= 3 && static_cast<unsigned char>(asc[0]) == 0xEF &&
        static_cast<unsigned char>(asc[1]) == 0xBB && static_cast<unsigned char>(asc[2]) == 0xBF) {
        asc.erase(0, 3);
    }

    if (!GraphemeUtils::isValidUtf8(asc)) {
        std::cerr << "Error: Ascii art '" << artPath.filename().string() << "' is not valid UTF-8." << std::endl;
        return std::nullopt;
    }

    try {
        return normalizeAscii(asc);
    } catch (const RecolorError& e) {
        std::cerr << "Error: Failed to normalize ascii art '" << artPath.filename().string() << "': " << e.what() << std::endl;
        return std::nullopt;
    }
}

void ProcessingOrchestrator::process(const std::filesystem::path& inputPath) {
    if (!std::filesystem::exists(inputPath)) {
        std::cerr << "Error: Input path does not exist: " << inputPath.string() << std::endl;
        m_failedCount++;
        return;
    }

    if (std::filesystem::is_regular_file(inputPath)) {
        processSingleArt(inputPath);
    } else if (std::filesystem::is_directory(inputPath)) {
        processDirectory(inputPath);
    } else {
        std::cerr << "Error: Input path is not a file or directory: " << inputPath.string() << std::endl;
        m_failedCount++;
    }
}

void ProcessingOrchestrator::processSingleArt(const std::filesystem::path& artPath) {
    std::cout << "\nInput is a single file." << std::endl;
    if (!isArtFile(artPath)) {
        std::cerr << "Error: Input file is not an ascii art text file (" << ART_FILE_EXTENSION << "): " << artPath.string() << std::endl;
        m_failedCount++;
        return;
    }

    std::string artSubDirName = artPath.stem().string() + m_config.artOutputSubDirSuffix;
    m_finalMainOutputDirPath = PathManager::setupOutputDirectory(artPath.parent_path(), artSubDirName);

    if (m_finalMainOutputDirPath.empty()) {
        std::cerr << "Error: Failed to create output directory for " << artPath.filename().string() << ". Skipping." << std::endl;
        m_failedCount++;
        return;
    }

    std::filesystem::path configOutputPath = m_finalMainOutputDirPath / "_run_config.txt";
    if (!writeConfigToFile(m_config, configOutputPath)) {
        std::cerr << "Warning: Failed to write configuration file for this run." << std::endl;
    }
    if (processArtFile(artPath, m_finalMainOutputDirPath)) {
        m_processedCount++;
    } else {
        m_failedCount++;
    }
}

void ProcessingOrchestrator::processDirectory(const std::filesystem::path& dirPath) {
    std::cout << "\nInput is a directory. Processing ascii art files concurrently..." << std::endl;
    std::string batchDirName = dirPath.filename().string() + m_config.batchOutputSubDirSuffix;
    m_finalMainOutputDirPath = PathManager::setupOutputDirectory(dirPath.parent_path(), batchDirName);

    if (m_finalMainOutputDirPath.empty()) {
        std::cerr << "Error: Failed to create main batch output directory. Aborting." << std::endl;
        m_failedCount++;
        return;
    }

    std::filesystem::path configOutputPath = m_finalMainOutputDirPath / "_run_config.txt";
    if (!writeConfigToFile(m_config, configOutputPath)) {
        std::cerr << "Warning: Failed to write configuration file for this batch run." << std::endl;
    }

    std::vector<std::filesystem::path> artFilesToProcess;
    for (const auto& entry : std::filesystem::directory_iterator(dirPath)) {
        if (entry.is_regular_file() && isArtFile(entry.path())) {
            artFilesToProcess.push_back(entry.path());
        }
    }
    std::sort(artFilesToProcess.begin(), artFilesToProcess.end());

    if (artFilesToProcess.empty()) {
        std::cout << "No ascii art files found in directory: " << dirPath.string() << std::endl;
        return;
    }

    std::cout << "Found " << artFilesToProcess.size() << " ascii art file(s) to process." << std::endl;
    std::vector<std::future<bool>> futures;
    futures.reserve(artFilesToProcess.size());

    for (const auto& artPath : artFilesToProcess) {
        std::string artSubDirName = artPath.stem().string() + m_config.artOutputSubDirSuffix;
        std::filesystem::path artSpecificOutputDir = PathManager::setupOutputDirectory(m_finalMainOutputDirPath, artSubDirName);

        if (!artSpecificOutputDir.empty()) {
            futures.push_back(
                std::async(std::launch::async,
                           &ProcessingOrchestrator::processArtFile, this,
                           artPath,
                           artSpecificOutputDir)
            );
        } else {
            std::cerr << "Error: Failed to create output subdirectory for " << artPath.filename().string() << " within batch. Skipping." << std::endl;
            m_failedCount++;
        }
    }

    std::cout << "Waiting for recoloring tasks to complete..." << std::endl;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            if (futures[i].valid()) {
                if (futures[i].get()) {
                    m_processedCount++;
                } else {
                    m_failedCount++;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "Error retrieving result from recoloring task " << i << ": " << e.what() << std::endl;
            m_failedCount++;
        }
    }
}


bool ProcessingOrchestrator::processArtFile(const std::filesystem::path& artPath, const std::filesystem::path& outputSubDirPath) {
    std::cout << "\n==================================================" << std::endl;
    std::cout << "Processing ART: " << artPath.string() << std::endl;
    std::cout << "Output SubDir: " << outputSubDirPath.string() << std::endl;
    std::cout << "==================================================" << std::endl;

    auto proc_start = high_resolution_clock::now();

    auto asciiOpt = loadAsciiArt(artPath);
    if (!asciiOpt) {
        std::cerr << "-> Skipping " << artPath.filename().string() << " because it could not be loaded." << std::endl;
        return false;
    }
    const std::string& asc = *asciiOpt;

    const std::string distro = m_config.distroOverride.empty() ? artPath.stem().string() : m_config.distroOverride;
    const std::optional<ForeBackPair> foreBack = m_config.useForeBack ? foreBackForDistro(distro) : std::nullopt;
    if (foreBack) {
        std::cout << "Fore/back slots for '" << distro << "': " << foreBack->fore << "/" << foreBack->back << std::endl;
    }

    bool allOutputsSuccessful = true;
    std::map<AlignmentMode, int> seenModes; // repeated modes get a numbered file name
    for (const auto& spec : m_config.alignmentsToGenerate) {
        std::string recolored;
        std::string alignmentName = alignmentModeToString(spec.mode);
        try {
            const ColorAlignment alignment = ColorAlignment::fromSpec(spec, foreBack);
            alignmentName = alignment.name();
            std::cout << "  Processing alignment: " << alignmentName << std::endl;
            recolored = alignment.recolorAscii(asc, m_profile, m_config.colorMode, m_config.theme);
        } catch (const RecolorError& e) {
            std::cerr << "    Error: " << recolorErrcToString(e.code()) << " while recoloring "
                      << artPath.filename().string() << " (" << alignmentName << "): " << e.what() << std::endl;
            allOutputsSuccessful = false;
            continue;
        }

        const int repeat = seenModes[spec.mode]++;
        const std::string outputName = artPath.stem().string() + "_" + alignmentName +
                                       (repeat > 0 ? std::to_string(repeat + 1) : "");
        const std::filesystem::path outputBase = outputSubDirPath / outputName;
        for (const auto& renderer : m_renderers) {
            std::cout << "    -> " << renderer->getName() << ": " << outputBase.filename().string() << std::endl;
            if (!renderer->render(recolored, outputBase, m_config)) {
                std::cerr << "    Error: Failed to render " << renderer->getName() << " output for alignment " << alignmentName << "." << std::endl;
                allOutputsSuccessful = false;
            }
        }
    }

    auto proc_end = high_resolution_clock::now();
    std::cout << "-> Finished ART processing '" << artPath.filename().string() << "'. Time: "
         << std::fixed << std::setprecision(3) << duration_cast<milliseconds>(proc_end - proc_start).count() / 1000.0 << "s" << std::endl;

    return allOutputsSuccessful;
}
