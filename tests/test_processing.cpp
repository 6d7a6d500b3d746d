#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "common_types.h"
#include "color/presets.h"
#include "core/processing_orchestrator.h"
#include "rendering/FetchBackendRenderer.h"
#include "rendering/TextFileRenderer.h"
#include "utils/GraphemeUtils.h"

namespace {

std::string readAll(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

class ProcessingTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = std::filesystem::temp_directory_path() /
                (std::string("ascii_recolor_processing_") + info->name());
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir);

        m_config.printToTerminal = false;
        m_config.writeTextOutput = true;
        m_profile = *findPreset("rainbow");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::filesystem::path writeFile(const std::filesystem::path& p, const std::string& content) const {
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

    std::filesystem::path m_dir;
    Config m_config;
    ColorProfile m_profile;
};

} // namespace

TEST_F(ProcessingTest, LoadAsciiArtCleansAndPads) {
    const auto p = writeFile(m_dir / "art.txt", "\xEF\xBB\xBF${c1}abc\r\n${c2}a\r\n\r\n");
    auto art = ProcessingOrchestrator::loadAsciiArt(p);
    ASSERT_TRUE(art.has_value());
    EXPECT_EQ(*art, "${c1}abc\n${c2}a  ");
}

TEST_F(ProcessingTest, LoadAsciiArtRejectsOversizedArt) {
    const auto p = writeFile(m_dir / "wide.txt", "${c1}" + std::string(MAX_ASCII_DIMENSION + 1, '#'));
    EXPECT_FALSE(ProcessingOrchestrator::loadAsciiArt(p).has_value());
    EXPECT_FALSE(ProcessingOrchestrator::loadAsciiArt(m_dir / "absent.txt").has_value());
}

TEST_F(ProcessingTest, LoadAsciiArtRejectsInvalidUtf8) {
    const auto p = writeFile(m_dir / "broken.txt", "${c1}a\xC3(b\n${c2}\xFF");
    EXPECT_FALSE(ProcessingOrchestrator::loadAsciiArt(p).has_value());
}

TEST_F(ProcessingTest, SingleFileWritesOneOutputPerAlignment) {
    m_config.alignmentsToGenerate = {
        AlignmentSpec{AlignmentMode::HORIZONTAL, {}},
        AlignmentSpec{AlignmentMode::VERTICAL, {}},
        AlignmentSpec{AlignmentMode::HORIZONTAL, {}},
    };
    const auto art = writeFile(m_dir / "art.txt", "${c1}ab\n${c2}cd\n");

    ProcessingOrchestrator orchestrator(m_config, m_profile);
    orchestrator.process(art);

    EXPECT_EQ(orchestrator.getProcessedCount(), 1);
    EXPECT_EQ(orchestrator.getFailedCount(), 0);

    const auto outDir = m_dir / "art_recolored";
    EXPECT_EQ(orchestrator.getFinalOutputDir(), outDir);
    EXPECT_TRUE(std::filesystem::exists(outDir / "_run_config.txt"));
    EXPECT_TRUE(std::filesystem::exists(outDir / "art_vertical.txt"));
    EXPECT_TRUE(std::filesystem::exists(outDir / "art_horizontal2.txt"));

    const std::string horizontal = readAll(outDir / "art_horizontal.txt");
    EXPECT_EQ(horizontal.rfind("\x1b[38;2;229;0;0mab", 0), 0u);
    EXPECT_EQ(horizontal.find("${c"), std::string::npos);
}

TEST_F(ProcessingTest, FailedAlignmentMarksFileFailed) {
    m_config.alignmentsToGenerate = {
        AlignmentSpec{AlignmentMode::HORIZONTAL, {}},
        AlignmentSpec{AlignmentMode::CUSTOM, {{1, 99}}},
    };
    const auto art = writeFile(m_dir / "art.txt", "${c1}ab\n");

    ProcessingOrchestrator orchestrator(m_config, m_profile);
    orchestrator.process(art);

    EXPECT_EQ(orchestrator.getProcessedCount(), 0);
    EXPECT_EQ(orchestrator.getFailedCount(), 1);
    EXPECT_TRUE(std::filesystem::exists(m_dir / "art_recolored" / "art_horizontal.txt"));
    EXPECT_FALSE(std::filesystem::exists(m_dir / "art_recolored" / "art_custom.txt"));
}

TEST_F(ProcessingTest, DirectoryProcessesEveryArtFile) {
    m_config.alignmentsToGenerate = {AlignmentSpec{AlignmentMode::VERTICAL, {}}};
    const auto arts = m_dir / "arts";
    writeFile(arts / "a.txt", "${c1}ab\n");
    writeFile(arts / "b.txt", "${c2}xyz\n");
    writeFile(arts / "bad.txt", "${c1}" + std::string(MAX_ASCII_DIMENSION + 1, '#'));
    writeFile(arts / "notes.md", "not art");

    ProcessingOrchestrator orchestrator(m_config, m_profile);
    orchestrator.process(arts);

    EXPECT_EQ(orchestrator.getProcessedCount(), 2);
    EXPECT_EQ(orchestrator.getFailedCount(), 1);

    const auto batchDir = m_dir / "arts_recolored_batch";
    EXPECT_EQ(orchestrator.getFinalOutputDir(), batchDir);
    EXPECT_TRUE(std::filesystem::exists(batchDir / "a_recolored" / "a_vertical.txt"));
    EXPECT_TRUE(std::filesystem::exists(batchDir / "b_recolored" / "b_vertical.txt"));
    EXPECT_FALSE(std::filesystem::exists(batchDir / "notes_recolored"));
}

TEST_F(ProcessingTest, MissingInputCountsAsFailure) {
    ProcessingOrchestrator orchestrator(m_config, m_profile);
    orchestrator.process(m_dir / "absent.txt");
    EXPECT_EQ(orchestrator.getFailedCount(), 1);
    EXPECT_EQ(orchestrator.getProcessedCount(), 0);
}

TEST_F(ProcessingTest, TextRendererAppendsExtension) {
    TextFileRenderer renderer;
    EXPECT_EQ(renderer.getName(), "txt");
    ASSERT_TRUE(renderer.render("colored", m_dir / "out", m_config));
    EXPECT_EQ(readAll(m_dir / "out.txt"), "colored\n");
}

TEST(GraphemeUtilsTest, Utf8Validation) {
    EXPECT_TRUE(GraphemeUtils::isValidUtf8("plain"));
    EXPECT_TRUE(GraphemeUtils::isValidUtf8("\xE2\x96\x88 e\xCC\x81"));
    EXPECT_FALSE(GraphemeUtils::isValidUtf8("a\xC3(b"));
    EXPECT_FALSE(GraphemeUtils::isValidUtf8("\xFF"));
    EXPECT_FALSE(GraphemeUtils::isValidUtf8("\xE2\x96"));
}

TEST(FetchBackendRendererTest, NeofetchEscapesBackslashes) {
    EXPECT_EQ(FetchBackendRenderer::escapeForNeofetch("a\\b"), "a\\\\b");
    EXPECT_EQ(FetchBackendRenderer::escapeForNeofetch("plain"), "plain");
}

TEST(FetchBackendRendererTest, NoBackendHasNoCommand) {
    FetchBackendRenderer renderer(Backend::NONE);
    EXPECT_FALSE(renderer.buildCommand("art.txt", {}).has_value());
    EXPECT_EQ(FetchBackendRenderer(Backend::FASTFETCH).getName(), "fastfetch");
}
