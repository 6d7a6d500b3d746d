#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>

#include "common_types.h"
#include "config/config_handler.h"

namespace {

class ConfigHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = std::filesystem::temp_directory_path() /
                (std::string("ascii_recolor_config_") + info->name());
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::filesystem::path writeConfig(const std::string& content) const {
        const std::filesystem::path p = m_dir / "config.json";
        std::ofstream out(p);
        out << content;
        return p;
    }

    std::filesystem::path m_dir;
};

} // namespace

TEST_F(ConfigHandlerTest, MissingFileKeepsDefaults) {
    Config config;
    EXPECT_TRUE(loadConfiguration(m_dir / "absent.json", config));
    EXPECT_EQ(config.presetName, "rainbow");
    EXPECT_EQ(config.colorMode, AnsiMode::RGB);
    EXPECT_EQ(config.alignmentsToGenerate.size(), 2u);
}

TEST_F(ConfigHandlerTest, ReadsAllSettings) {
    const auto p = writeConfig(R"({
        "Settings": {
            "preset": "bisexual",
            "colors": ["#ff0000", "#00ff00"],
            "colorMode": "8bit",
            "theme": "light",
            "alignments": ["vertical", {"mode": "custom", "custom_colors": {"1": 0, "3": 1}}],
            "useForeBack": false,
            "distro": "Fedora",
            "backend": "fastfetch-old",
            "backendArgs": ["--logo-padding", "2"],
            "printToTerminal": false,
            "writeTextOutput": false,
            "outputSubDirSuffix": "_out",
            "batchOutputSubDirSuffix": "_batch"
        }
    })");

    Config config;
    ASSERT_TRUE(loadConfiguration(p, config));
    EXPECT_EQ(config.presetName, "bisexual");
    ASSERT_EQ(config.customHexColors.size(), 2u);
    EXPECT_EQ(config.colorMode, AnsiMode::ANSI_256);
    EXPECT_EQ(config.theme, TerminalTheme::LIGHT);
    ASSERT_EQ(config.alignmentsToGenerate.size(), 2u);
    EXPECT_EQ(config.alignmentsToGenerate[0].mode, AlignmentMode::VERTICAL);
    EXPECT_EQ(config.alignmentsToGenerate[1].mode, AlignmentMode::CUSTOM);
    EXPECT_EQ(config.alignmentsToGenerate[1].customColors, (std::map<int, int>{{1, 0}, {3, 1}}));
    EXPECT_FALSE(config.useForeBack);
    EXPECT_EQ(config.distroOverride, "Fedora");
    EXPECT_EQ(config.backend, Backend::FASTFETCH_OLD);
    EXPECT_EQ(config.backendArgs.size(), 2u);
    EXPECT_FALSE(config.printToTerminal);
    EXPECT_FALSE(config.writeTextOutput);
    EXPECT_EQ(config.artOutputSubDirSuffix, "_out");
    EXPECT_EQ(config.batchOutputSubDirSuffix, "_batch");
}

TEST_F(ConfigHandlerTest, InvalidEntriesAreSkipped) {
    const auto p = writeConfig(R"({
        "Settings": {
            "colorMode": "24bit",
            "alignments": ["diagonal", "custom", {"mode": "custom", "custom_colors": {"9": 0, "x": 1, "1abc": 0, "2": -1, "4": 2}}]
        }
    })");

    Config config;
    ASSERT_TRUE(loadConfiguration(p, config));
    EXPECT_EQ(config.colorMode, AnsiMode::RGB);
    ASSERT_EQ(config.alignmentsToGenerate.size(), 1u);
    EXPECT_EQ(config.alignmentsToGenerate[0].customColors, (std::map<int, int>{{4, 2}}));
}

TEST_F(ConfigHandlerTest, EmptyAlignmentListRevertsToDefaults) {
    const auto p = writeConfig(R"({"Settings": {"alignments": []}})");
    Config config;
    ASSERT_TRUE(loadConfiguration(p, config));
    EXPECT_EQ(config.alignmentsToGenerate.size(), Config().alignmentsToGenerate.size());
}

TEST_F(ConfigHandlerTest, MalformedJsonFails) {
    const auto p = writeConfig("{ \"Settings\": { \"preset\": ");
    Config config;
    EXPECT_FALSE(loadConfiguration(p, config));
}

TEST_F(ConfigHandlerTest, NameParsing) {
    EXPECT_EQ(parseAnsiMode("8BIT"), AnsiMode::ANSI_256);
    EXPECT_EQ(parseAnsiMode("rgb"), AnsiMode::RGB);
    EXPECT_FALSE(parseAnsiMode("truecolor").has_value());
    EXPECT_EQ(parseTerminalTheme("Dark"), TerminalTheme::DARK);
    EXPECT_EQ(parseBackend("neofetch"), Backend::NEOFETCH);
    EXPECT_EQ(getAlignmentModeMap().count("horizontal"), 1u);
    EXPECT_EQ(backendToString(Backend::FASTFETCH_OLD), "fastfetch-old");
}

TEST_F(ConfigHandlerTest, WritesRunLog) {
    Config config;
    config.alignmentsToGenerate.push_back(AlignmentSpec{AlignmentMode::CUSTOM, {{1, 0}}});
    const auto p = m_dir / "_run_config.txt";
    ASSERT_TRUE(writeConfigToFile(config, p));

    std::ifstream in(p);
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("preset = rainbow"), std::string::npos);
    EXPECT_NE(content.find("custom {1: 0}"), std::string::npos);
}
