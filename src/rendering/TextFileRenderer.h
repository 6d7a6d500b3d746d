#ifndef TEXT_FILE_RENDERER_H
#define TEXT_FILE_RENDERER_H

#include "IRenderer.h"

// Writes the recolored art, escape codes included, to "<outputPath>.txt".
class TextFileRenderer : public IRenderer {
public:
    bool render(
        const std::string& coloredAscii,
        const std::filesystem::path& outputPath,
        const Config& config) const override;

    std::string getName() const override;
    std::string getOutputFileExtension() const;
};

#endif // TEXT_FILE_RENDERER_H
