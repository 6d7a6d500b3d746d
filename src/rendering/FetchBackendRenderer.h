#ifndef FETCH_BACKEND_RENDERER_H
#define FETCH_BACKEND_RENDERER_H

#include "IRenderer.h"
#include <optional>
#include <string>
#include <vector>

// Hands the recolored art to neofetch or fastfetch, which print it next to the
// system information. The art is passed through a temporary file.
class FetchBackendRenderer : public IRenderer {
public:
    explicit FetchBackendRenderer(Backend backend);

    bool render(
        const std::string& coloredAscii,
        const std::filesystem::path& outputPath,
        const Config& config) const override;

    std::string getName() const override;

    // Command line for the configured backend, or nullopt if its program is
    // not installed. Exposed for tests.
    std::optional<std::vector<std::string>> buildCommand(
        const std::filesystem::path& artFile,
        const std::vector<std::string>& extraArgs) const;

    // neofetch passes the art through printf, so backslashes must be doubled.
    static std::string escapeForNeofetch(const std::string& ascii);

private:
    Backend m_backend;
};

#endif // FETCH_BACKEND_RENDERER_H
