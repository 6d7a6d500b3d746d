#ifndef TERMINAL_RENDERER_H
#define TERMINAL_RENDERER_H

#include "IRenderer.h"

// Prints the recolored art to stdout.
class TerminalRenderer : public IRenderer {
public:
    bool render(
        const std::string& coloredAscii,
        const std::filesystem::path& outputPath,
        const Config& config) const override;

    std::string getName() const override;
};

#endif // TERMINAL_RENDERER_H
