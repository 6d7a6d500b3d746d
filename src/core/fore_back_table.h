// src/core/fore_back_table.h
#ifndef FORE_BACK_TABLE_H
#define FORE_BACK_TABLE_H

#include <optional>
#include <string>
#include <utility>
#include <vector>

// Two placeholder slots singled out for special treatment: `fore` keeps a
// neutral theme color (the outline), `back` receives the gradient (the fill).
struct ForeBackPair {
    int fore = 0;
    int back = 0;

    bool operator==(const ForeBackPair& other) const { return fore == other.fore && back == other.back; }
    bool operator!=(const ForeBackPair& other) const { return !(*this == other); }
};

// Recommended fore/back configuration for a distro, or nullopt if the distro's
// ascii art is not suited to it. Matching ignores case and any character that
// is not a letter or a digit, so "Pop!_OS", "pop-os" and "POPOS" are the same.
std::optional<ForeBackPair> foreBackForDistro(const std::string& distro);

// Every distro that has a recommendation, as spelled in the table.
const std::vector<std::pair<std::string, ForeBackPair>>& foreBackTable();

#endif // FORE_BACK_TABLE_H
