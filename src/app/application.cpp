// src/app/application.cpp

#include "application.h"
#include "config/config_handler.h"
#include "color/presets.h"
#include "core/recolor_error.h"
#include "ui/cli_handler.h"
#include "utils/PathManager.h"
#include "core/processing_orchestrator.h"

#include <iostream>
#include <chrono>

using namespace std::chrono;

Application::Application(int argc, char* argv[]) : m_argc(argc), m_argv(argv) {}

int Application::run() {
    CLIHandler::printWelcomeMessage();

    const std::string programName = (m_argc > 0 && m_argv[0] != nullptr)
        ? std::filesystem::path(m_argv[0]).filename().string()
        : "ascii_recolor";

    auto options = CLIHandler::parseArguments(m_argc, m_argv);
    if (!options) {
        CLIHandler::printUsage(programName);
        return 1; // 参数错误，打印用法并退出
    }
    if (options->showHelp) {
        CLIHandler::printUsage(programName);
        return 0; // 打印用法后正常退出
    }

    if (!initialize(options->configPath)) {
        return 1; // 初始化失败，直接退出
    }

    CLIHandler::printEffectiveConfiguration(m_config, m_profile);

    auto overall_start_time = high_resolution_clock::now();

    ProcessingOrchestrator orchestrator(m_config, m_profile);
    orchestrator.process(options->inputPath);

    auto overall_end_time = high_resolution_clock::now();
    double total_duration = duration_cast<duration<double>>(overall_end_time - overall_start_time).count();

    CLIHandler::printProcessingSummary(
        orchestrator.getProcessedCount(),
        orchestrator.getFailedCount(),
        total_duration,
        orchestrator.getFinalOutputDir()
    );

    // 如果有任何文件处理失败，返回一个非零的退出码
    return (orchestrator.getFailedCount() > 0) ? 1 : 0;
}

bool Application::initialize(const std::optional<std::filesystem::path>& configOverride) {
    std::filesystem::path exePath = PathManager::getExecutablePath(m_argc, m_argv);
    m_exeDir = exePath.parent_path();

    const std::string configFilename = "config.json";
    std::filesystem::path configPathObj = configOverride ? *configOverride : m_exeDir / configFilename;

    if (!loadConfiguration(configPathObj, m_config)) {
        std::cout << "Error: Configuration file could not be parsed correctly. Please check " << configPathObj.filename().string() << ". Proceeding with default values." << std::endl;
        m_config = Config();
    }

    return resolveColorProfile();
}

bool Application::resolveColorProfile() {
    try {
        m_profile = buildColorProfile(m_config);
    } catch (const RecolorError& e) {
        std::cerr << "!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!" << std::endl;
        std::cerr << "Error: Could not build the color profile: " << e.what() << std::endl;
        std::cerr << "Please set 'preset' to one of the built-in presets or give valid hex 'colors' in config.json." << std::endl;
        std::cerr << "!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!" << std::endl;
        return false;
    }

    if (m_profile.empty()) {
        std::cerr << "Error: The color profile has no colors." << std::endl;
        return false;
    }
    return true;
}
