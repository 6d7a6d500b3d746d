// src/core/fore_back_table.cpp

#include "fore_back_table.h"

#include <cctype>

namespace {

const ForeBackPair OUTLINE_SECOND = {2, 1};
const ForeBackPair OUTLINE_FIRST = {1, 2};

const std::vector<std::pair<std::string, ForeBackPair>> g_foreBackTable = {
    {"Anarchy", OUTLINE_SECOND},
    {"ArchStrike", OUTLINE_SECOND},
    {"Astra Linux", OUTLINE_SECOND},
    {"Chapeau", OUTLINE_SECOND},
    {"Fedora", OUTLINE_SECOND},
    {"GalliumOS", OUTLINE_SECOND},
    {"KrassOS", OUTLINE_SECOND},
    {"Kubuntu", OUTLINE_SECOND},
    {"Lubuntu", OUTLINE_SECOND},
    {"openEuler", OUTLINE_SECOND},
    {"Peppermint", OUTLINE_SECOND},
    {"Pop!_OS", OUTLINE_SECOND},
    {"Ubuntu Cinnamon", OUTLINE_SECOND},
    {"Ubuntu Kylin", OUTLINE_SECOND},
    {"Ubuntu MATE", OUTLINE_SECOND},
    {"Ubuntu_old", OUTLINE_SECOND},
    {"Ubuntu Studio", OUTLINE_SECOND},
    {"Ubuntu Sway", OUTLINE_SECOND},
    {"Ultramarine Linux", OUTLINE_SECOND},
    {"Univention", OUTLINE_SECOND},
    {"Vanilla", OUTLINE_SECOND},
    {"Xubuntu", OUTLINE_SECOND},

    {"Antergos", OUTLINE_FIRST},
};

std::string canonicalName(const std::string& name) {
    std::string key;
    for (unsigned char c : name) {
        if (std::isalnum(c)) key += static_cast<char>(std::tolower(c));
    }
    return key;
}

} // end anonymous namespace

std::optional<ForeBackPair> foreBackForDistro(const std::string& distro) {
    const std::string key = canonicalName(distro);
    if (key.empty()) return std::nullopt;
    for (const auto& entry : g_foreBackTable) {
        if (canonicalName(entry.first) == key) {
            return entry.second;
        }
    }
    return std::nullopt;
}

const std::vector<std::pair<std::string, ForeBackPair>>& foreBackTable() {
    return g_foreBackTable;
}
