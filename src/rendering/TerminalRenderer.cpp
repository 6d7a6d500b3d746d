#include "TerminalRenderer.h"
#include <iostream>
#include <mutex>

namespace {
// Directory runs render concurrently; one art must not interleave with another.
std::mutex g_stdoutMutex;
}

bool TerminalRenderer::render(
    const std::string& coloredAscii,
    const std::filesystem::path& outputPath,
    const Config& /*config*/) const
{
    std::lock_guard<std::mutex> lock(g_stdoutMutex);
    std::cout << "\n[" << outputPath.filename().string() << "]\n"
              << coloredAscii << ANSI_RESET_ALL << std::endl;
    return static_cast<bool>(std::cout);
}

std::string TerminalRenderer::getName() const {
    return "terminal";
}
