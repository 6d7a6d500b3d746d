// common_types.h
#ifndef COMMON_TYPES_H
#define COMMON_TYPES_H
//定义了整个程序共享的基础数据类型、常量、枚举以及一些通用的辅助函数声明。
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <fstream>
#include <sstream>
#include <filesystem> // For path
#include <algorithm> // For std::transform
#include <cctype>    // For std::tolower
#include <iostream>  // For cerr in helpers

using std::string;
using std::vector;
using std::filesystem::path;

// --- Constants ---
const int NUM_PLACEHOLDER_SLOTS = 6;
const int MAX_ASCII_DIMENSION = 255; // width/height must fit in 8 bits

const string ANSI_RESET_ALL = "\033[0m";
const string ANSI_RESET_FG_BG = "\033[39m\033[49m";
const string ANSI_NEUTRAL_DARK_THEME = "\033[38;5;15m";  // white text
const string ANSI_NEUTRAL_LIGHT_THEME = "\033[38;5;0m";  // black text

const string ART_FILE_EXTENSION = ".txt";

// --- Enums ---
enum class AnsiMode { ANSI_256, RGB };

enum class TerminalTheme { LIGHT, DARK };

enum class ForegroundBackground { FOREGROUND, BACKGROUND };

enum class Backend { NONE, NEOFETCH, FASTFETCH, FASTFETCH_OLD };

enum class AlignmentMode { HORIZONTAL, VERTICAL, CUSTOM };

// --- Structures ---

// One entry of the "alignments" array in config.json.
struct AlignmentSpec {
    AlignmentMode mode = AlignmentMode::HORIZONTAL;
    std::map<int, int> customColors; // slot (1..6) -> palette index, CUSTOM only
};

struct Config {
    string presetName = "rainbow";
    vector<string> customHexColors;      // Overrides the preset when non-empty
    AnsiMode colorMode = AnsiMode::RGB;
    TerminalTheme theme = TerminalTheme::DARK;

    vector<AlignmentSpec> alignmentsToGenerate = {
        AlignmentSpec{AlignmentMode::HORIZONTAL, {}},
        AlignmentSpec{AlignmentMode::VERTICAL, {}},
    };
    bool useForeBack = true;             // Consult the distro fore/back table
    string distroOverride = "";          // Empty: use the art file stem

    Backend backend = Backend::NONE;
    vector<string> backendArgs;

    // Output Settings
    bool printToTerminal = true;
    bool writeTextOutput = true;
    string artOutputSubDirSuffix = "_recolored";
    string batchOutputSubDirSuffix = "_recolored_batch";
};

// --- Helper Functions ---

inline string toLower(string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return s;
}

inline bool isArtFile(const path& p) {
    if (!p.has_extension()) return false;
    return toLower(p.extension().string()) == ART_FILE_EXTENSION;
}

// Reads a whole text file. Returns nullopt (and logs) if it cannot be read.
inline std::optional<string> readTextFile(const path& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << filename.string() << "'" << std::endl;
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        std::cerr << "Error: Cannot read file '" << filename.string() << "'" << std::endl;
        return std::nullopt;
    }
    return buffer.str();
}

// Declared here, defined in config_handler.cpp
string alignmentModeToString(AlignmentMode mode);
string ansiModeToString(AnsiMode mode);
string terminalThemeToString(TerminalTheme theme);
string backendToString(Backend backend);

#endif // COMMON_TYPES_H
