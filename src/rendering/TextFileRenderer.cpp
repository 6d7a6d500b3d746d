#include "TextFileRenderer.h"
#include <iostream>
#include <fstream>

bool TextFileRenderer::render(
    const std::string& coloredAscii,
    const std::filesystem::path& outputPath,
    const Config& /*config*/) const
{
    std::filesystem::path filePath = outputPath;
    filePath += getOutputFileExtension();

    std::ofstream outFile(filePath, std::ios::binary);
    if (!outFile.is_open()) {
        std::cerr << "Error: Cannot open text output file for writing: " << filePath.string() << std::endl;
        return false;
    }

    outFile << coloredAscii << '\n';
    outFile.close();
    if (!outFile) {
        std::cerr << "Error: Failed to write text output file: " << filePath.string() << std::endl;
        return false;
    }
    return true;
}

std::string TextFileRenderer::getName() const {
    return "txt";
}

std::string TextFileRenderer::getOutputFileExtension() const {
    return ART_FILE_EXTENSION;
}
