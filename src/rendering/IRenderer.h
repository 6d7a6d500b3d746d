#ifndef IRENDERER_H
#define IRENDERER_H

#include "common_types.h"
#include <filesystem>
#include <string>

class IRenderer {
public:
    virtual ~IRenderer() = default;

    // 纯虚函数，用于输出已经着色完成的 ascii 图。
    // outputPath 是建议的输出文件路径 (不含扩展名)，只写文件的渲染器会使用它。
    virtual bool render(
        const std::string& coloredAscii,
        const std::filesystem::path& outputPath,
        const Config& config) const = 0;

    // 纯虚函数，用于获取该渲染器的名称 (用于日志)
    virtual std::string getName() const = 0;
};

#endif // IRENDERER_H
