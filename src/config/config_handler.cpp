// config_handler.cpp
// 专门负责读取和解析 config.json
#include "config_handler.h"
#include "common_types.h"
#include <nlohmann/json.hpp> // 使用 nlohmann/json 库
#include <iostream>
#include <fstream>
#include <stdexcept>

// 使用 nlohmann::json 的命名空间
using json = nlohmann::json;

namespace {

const std::unordered_map<std::string, AlignmentMode> g_alignmentNameMap = {
    {"horizontal", AlignmentMode::HORIZONTAL},
    {"vertical", AlignmentMode::VERTICAL},
    {"custom", AlignmentMode::CUSTOM},
};

const std::unordered_map<std::string, AnsiMode> g_ansiModeNameMap = {
    {"8bit", AnsiMode::ANSI_256},
    {"ansi256", AnsiMode::ANSI_256},
    {"rgb", AnsiMode::RGB},
};

const std::unordered_map<std::string, TerminalTheme> g_themeNameMap = {
    {"light", TerminalTheme::LIGHT},
    {"dark", TerminalTheme::DARK},
};

const std::unordered_map<std::string, Backend> g_backendNameMap = {
    {"none", Backend::NONE},
    {"neofetch", Backend::NEOFETCH},
    {"fastfetch", Backend::FASTFETCH},
    {"fastfetch-old", Backend::FASTFETCH_OLD},
};

template <typename T>
std::optional<T> lookupName(const std::unordered_map<std::string, T>& map, const std::string& name) {
    auto it = map.find(toLower(name));
    if (it == map.end()) return std::nullopt;
    return it->second;
}

// Reads {"1": 0, "3": 2}: placeholder slot -> palette index.
std::map<int, int> parseCustomColors(const json& customColors) {
    std::map<int, int> colors;
    if (!customColors.is_object()) {
        std::cerr << "Warning: 'custom_colors' must be an object mapping slot to palette index. Ignoring." << std::endl;
        return colors;
    }
    for (auto it = customColors.begin(); it != customColors.end(); ++it) {
        int slot = 0;
        try {
            size_t consumed = 0;
            slot = std::stoi(it.key(), &consumed);
            if (consumed != it.key().size()) {
                throw std::invalid_argument("trailing characters");
            }
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid color slot '" << it.key() << "' in custom_colors. Ignoring." << std::endl;
            continue;
        }
        if (slot < 1 || slot > NUM_PLACEHOLDER_SLOTS) {
            std::cerr << "Warning: Color slot " << slot << " is outside [1, 6] in custom_colors. Ignoring." << std::endl;
            continue;
        }
        if (!it.value().is_number_integer() || it.value().get<int>() < 0) {
            std::cerr << "Warning: Palette index for slot " << slot << " must be a non-negative integer. Ignoring." << std::endl;
            continue;
        }
        colors[slot] = it.value().get<int>();
    }
    return colors;
}

std::optional<AlignmentSpec> parseAlignment(const json& entry) {
    if (entry.is_string()) {
        const std::string name = entry.get<std::string>();
        auto mode = lookupName(g_alignmentNameMap, name);
        if (!mode) {
            std::cerr << "Warning: Unknown alignment name in config: '" << name << "'. Ignoring." << std::endl;
            return std::nullopt;
        }
        if (*mode == AlignmentMode::CUSTOM) {
            std::cerr << "Warning: 'custom' alignment needs an object with 'custom_colors'. Ignoring." << std::endl;
            return std::nullopt;
        }
        return AlignmentSpec{*mode, {}};
    }

    if (entry.is_object()) {
        const std::string name = entry.value("mode", std::string());
        auto mode = lookupName(g_alignmentNameMap, name);
        if (!mode) {
            std::cerr << "Warning: Unknown alignment mode in config: '" << name << "'. Ignoring." << std::endl;
            return std::nullopt;
        }
        AlignmentSpec spec{*mode, {}};
        if (*mode == AlignmentMode::CUSTOM) {
            spec.customColors = parseCustomColors(entry.value("custom_colors", json::object()));
        }
        return spec;
    }

    std::cerr << "Warning: Alignment entries must be strings or objects. Ignoring." << std::endl;
    return std::nullopt;
}

std::vector<std::string> readStringArray(const json& settings, const char* key) {
    std::vector<std::string> values;
    if (!settings.contains(key)) return values;
    if (!settings[key].is_array()) {
        std::cerr << "Warning: '" << key << "' must be an array of strings. Ignoring." << std::endl;
        return values;
    }
    for (const auto& item : settings[key]) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        } else {
            std::cerr << "Warning: Non-string entry in '" << key << "'. Ignoring." << std::endl;
        }
    }
    return values;
}

} // end anonymous namespace

const std::unordered_map<std::string, AlignmentMode>& getAlignmentModeMap() {
    return g_alignmentNameMap;
}

std::optional<AnsiMode> parseAnsiMode(const std::string& name) {
    return lookupName(g_ansiModeNameMap, name);
}

std::optional<TerminalTheme> parseTerminalTheme(const std::string& name) {
    return lookupName(g_themeNameMap, name);
}

std::optional<Backend> parseBackend(const std::string& name) {
    return lookupName(g_backendNameMap, name);
}


// --- Public Functions ---

bool loadConfiguration(const std::filesystem::path& configPath, Config& config) {
    std::cout << "Info: Attempting to load configuration from '" << configPath.string() << "'..." << std::endl;

    std::ifstream configFile(configPath);
    if (!configFile.is_open()) {
        std::cout << "Info: Config file '" << configPath.string() << "' not found. Using default values." << std::endl;
        return true; // 文件不存在是正常情况，使用默认配置
    }

    try {
        json j;
        configFile >> j; // 从文件流解析 JSON

        // 安全地获取 "Settings" 对象
        const auto& settings = j.value("Settings", json::object());

        // 使用 .value() 方法安全地读取每个配置项，如果键不存在则使用默认值
        config.presetName = settings.value("preset", config.presetName);
        config.customHexColors = readStringArray(settings, "colors");

        const std::string modeName = settings.value("colorMode", ansiModeToString(config.colorMode));
        if (auto mode = parseAnsiMode(modeName)) {
            config.colorMode = *mode;
        } else {
            std::cerr << "Warning: Unknown colorMode '" << modeName << "'. Using " << ansiModeToString(config.colorMode) << "." << std::endl;
        }

        const std::string themeName = settings.value("theme", terminalThemeToString(config.theme));
        if (auto theme = parseTerminalTheme(themeName)) {
            config.theme = *theme;
        } else {
            std::cerr << "Warning: Unknown theme '" << themeName << "'. Using " << terminalThemeToString(config.theme) << "." << std::endl;
        }

        const std::string backendName = settings.value("backend", backendToString(config.backend));
        if (auto backend = parseBackend(backendName)) {
            config.backend = *backend;
        } else {
            std::cerr << "Warning: Unknown backend '" << backendName << "'. Using " << backendToString(config.backend) << "." << std::endl;
        }
        config.backendArgs = readStringArray(settings, "backendArgs");

        config.useForeBack = settings.value("useForeBack", config.useForeBack);
        config.distroOverride = settings.value("distro", config.distroOverride);

        // 输出相关配置
        config.printToTerminal = settings.value("printToTerminal", config.printToTerminal);
        config.writeTextOutput = settings.value("writeTextOutput", config.writeTextOutput);
        config.artOutputSubDirSuffix = settings.value("outputSubDirSuffix", config.artOutputSubDirSuffix);
        config.batchOutputSubDirSuffix = settings.value("batchOutputSubDirSuffix", config.batchOutputSubDirSuffix);

        // 处理对齐方式数组
        if (settings.contains("alignments") && settings["alignments"].is_array()) {
            config.alignmentsToGenerate.clear();
            for (const auto& entry : settings["alignments"]) {
                if (auto spec = parseAlignment(entry)) {
                    config.alignmentsToGenerate.push_back(*spec);
                }
            }
        }

        // 如果加载后列表为空，则恢复默认值
        if (config.alignmentsToGenerate.empty()) {
            std::cerr << "Warning: No valid alignments found in config. Reverting to defaults." << std::endl;
            config.alignmentsToGenerate = Config().alignmentsToGenerate;
        }

    } catch (const json::parse_error& e) {
        // 捕获 JSON 解析错误
        std::cerr << "Error: Failed to parse config file '" << configPath.string() << "'." << std::endl;
        std::cerr << "       Reason: " << e.what() << std::endl;
        std::cerr << "       Using default values instead." << std::endl;
        return false;
    } catch (const std::exception& e) {
        // 捕获其他可能的异常 (例如类型不匹配)
        std::cerr << "An unexpected error occurred while reading config: " << e.what() << std::endl;
        return false;
    }

    std::cout << "Info: Configuration loaded successfully." << std::endl;
    return true;
}


// 生成一个人类可读的运行日志，而不是一个有效的JSON文件。
bool writeConfigToFile(const Config& config, const std::filesystem::path& outputFilePath) {
    std::ofstream configFile(outputFilePath);
    if (!configFile.is_open()) {
        std::cerr << "Error: Could not open config output file for writing: " << outputFilePath.string() << std::endl;
        return false;
    }

    std::cout << "Info: Writing effective configuration to: " << outputFilePath.string() << std::endl;

    configFile << "# Effective configuration used for this run" << std::endl;
    configFile << "# Automatically generated by the program." << std::endl;
    configFile << std::endl;

    configFile << "[Settings]" << std::endl;
    if (config.customHexColors.empty()) {
        configFile << "preset = " << config.presetName << std::endl;
    } else {
        configFile << "colors = ";
        for (size_t i = 0; i < config.customHexColors.size(); ++i) {
            configFile << config.customHexColors[i] << (i + 1 < config.customHexColors.size() ? ", " : "");
        }
        configFile << "  # Overrides the preset" << std::endl;
    }
    configFile << "colorMode = " << ansiModeToString(config.colorMode) << std::endl;
    configFile << "theme = " << terminalThemeToString(config.theme) << std::endl;
    configFile << "useForeBack = " << (config.useForeBack ? "true" : "false") << std::endl;
    configFile << "distro = " << (config.distroOverride.empty() ? "(file stem)" : config.distroOverride) << std::endl;
    configFile << "backend = " << backendToString(config.backend) << std::endl;
    configFile << "backendArgs = ";
    for (size_t i = 0; i < config.backendArgs.size(); ++i) {
        configFile << config.backendArgs[i] << (i + 1 < config.backendArgs.size() ? " " : "");
    }
    configFile << std::endl;

    // Output Settings
    configFile << "printToTerminal = " << (config.printToTerminal ? "true" : "false") << std::endl;
    configFile << "writeTextOutput = " << (config.writeTextOutput ? "true" : "false") << std::endl;
    configFile << "outputSubDirSuffix = " << config.artOutputSubDirSuffix << std::endl;
    configFile << "batchOutputSubDirSuffix = " << config.batchOutputSubDirSuffix << std::endl;

    configFile << "alignments = ";
    for (size_t i = 0; i < config.alignmentsToGenerate.size(); ++i) {
        const AlignmentSpec& spec = config.alignmentsToGenerate[i];
        configFile << alignmentModeToString(spec.mode);
        if (spec.mode == AlignmentMode::CUSTOM) {
            configFile << " {";
            bool first = true;
            for (const auto& entry : spec.customColors) {
                configFile << (first ? "" : ", ") << entry.first << ": " << entry.second;
                first = false;
            }
            configFile << "}";
        }
        if (i + 1 < config.alignmentsToGenerate.size()) {
            configFile << ", ";
        }
    }
    configFile << " # List of alignments generated in this run" << std::endl;

    configFile.close();
    if (!configFile) {
         std::cerr << "Error: Failed to write all data or close the config output file: " << outputFilePath.string() << std::endl;
         return false;
    }

    return true;
}


// 定义在 common_types.h 中声明的辅助函数
string alignmentModeToString(AlignmentMode mode) {
    switch (mode) {
        case AlignmentMode::HORIZONTAL: return "horizontal";
        case AlignmentMode::VERTICAL:   return "vertical";
        case AlignmentMode::CUSTOM:     return "custom";
        default:                        return "unknown";
    }
}

string ansiModeToString(AnsiMode mode) {
    switch (mode) {
        case AnsiMode::ANSI_256: return "8bit";
        case AnsiMode::RGB:      return "rgb";
        default:                 return "unknown";
    }
}

string terminalThemeToString(TerminalTheme theme) {
    switch (theme) {
        case TerminalTheme::LIGHT: return "light";
        case TerminalTheme::DARK:  return "dark";
        default:                   return "unknown";
    }
}

string backendToString(Backend backend) {
    switch (backend) {
        case Backend::NONE:          return "none";
        case Backend::NEOFETCH:      return "neofetch";
        case Backend::FASTFETCH:     return "fastfetch";
        case Backend::FASTFETCH_OLD: return "fastfetch-old";
        default:                     return "unknown";
    }
}
