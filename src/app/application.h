#ifndef APPLICATION_H
#define APPLICATION_H

#include "common_types.h"
#include "color/color_profile.h"
#include <optional>

class Application {
public:
    Application(int argc, char* argv[]);
    int run();

private:
    bool initialize(const std::optional<std::filesystem::path>& configOverride);
    bool resolveColorProfile();

    int m_argc;
    char** m_argv;
    Config m_config;
    ColorProfile m_profile;
    std::filesystem::path m_exeDir;
};

#endif // APPLICATION_H
