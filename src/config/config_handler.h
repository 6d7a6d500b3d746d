// config_handler.h
#ifndef CONFIG_HANDLER_H
#define CONFIG_HANDLER_H

#include "common_types.h" // Includes filesystem, string, vector, etc.
#include <filesystem>
#include <optional>
#include <unordered_map>

// 从指定的 JSON 文件路径加载配置到 Config 结构体中。
// 如果文件不存在则使用默认值；解析失败时返回 false。
bool loadConfiguration(const std::filesystem::path& configPath, Config& config);

// 将当前生效的配置写入一个文本文件，用于记录和调试。
// 成功返回 true，失败返回 false。
bool writeConfigToFile(const Config& config, const std::filesystem::path& outputFilePath);

// Name lookups used by the loader, keys are lowercase.
const std::unordered_map<std::string, AlignmentMode>& getAlignmentModeMap();
std::optional<AnsiMode> parseAnsiMode(const std::string& name);
std::optional<TerminalTheme> parseTerminalTheme(const std::string& name);
std::optional<Backend> parseBackend(const std::string& name);

#endif // CONFIG_HANDLER_H
