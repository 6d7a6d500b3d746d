#include <gtest/gtest.h>

#include <map>
#include <string>

#include "color/color_profile.h"
#include "core/color_alignment.h"
#include "core/recolor_error.h"

namespace {

const RgbColor RED{255, 0, 0};
const RgbColor GREEN{0, 255, 0};
const RgbColor BLUE{0, 0, 255};
const RgbColor WHITE{255, 255, 255};

const std::string FG_RED = "\x1b[38;2;255;0;0m";
const std::string FG_GREEN = "\x1b[38;2;0;255;0m";
const std::string FG_BLUE = "\x1b[38;2;0;0;255m";
const std::string FG_WHITE = "\x1b[38;2;255;255;255m";
const std::string RESET_FG_BG = "\x1b[39m\x1b[49m";
const std::string RESET_ALL = "\x1b[0m";
const std::string NEUTRAL_DARK = "\x1b[38;5;15m";
const std::string NEUTRAL_LIGHT = "\x1b[38;5;0m";

class ColorAlignmentTest : public ::testing::Test {
protected:
    std::string recolor(const ColorAlignment& alignment, const std::string& asc,
                        const ColorProfile& profile,
                        TerminalTheme theme = TerminalTheme::DARK) const {
        return alignment.recolorAscii(asc, profile, AnsiMode::RGB, theme);
    }

    RecolorErrc errorCode(const ColorAlignment& alignment, const std::string& asc,
                          const ColorProfile& profile) const {
        try {
            recolor(alignment, asc, profile);
        } catch (const RecolorError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected RecolorError";
        return RecolorErrc::CONFIG_ERROR;
    }

    const ColorProfile m_rgb{{RED, GREEN, BLUE}};
    const ColorProfile m_redGreen{{RED, GREEN}};
    const ColorProfile m_four{{RED, GREEN, BLUE, WHITE}};
};

} // namespace

TEST_F(ColorAlignmentTest, ModeAndName) {
    EXPECT_EQ(ColorAlignment::horizontal().mode(), AlignmentMode::HORIZONTAL);
    EXPECT_EQ(ColorAlignment::vertical().name(), "vertical");
    EXPECT_EQ(ColorAlignment::custom({{1, 0}}).mode(), AlignmentMode::CUSTOM);
}

TEST_F(ColorAlignmentTest, HorizontalColorsOneRowEach) {
    const std::string out = recolor(ColorAlignment::horizontal(), "${c1}ab\n${c2}cd\n${c1}ef", m_rgb);
    EXPECT_EQ(out,
              FG_RED + "ab" + RESET_FG_BG + "\n" +
              FG_GREEN + "cd" + RESET_FG_BG + "\n" +
              FG_BLUE + "ef" + RESET_FG_BG);
}

TEST_F(ColorAlignmentTest, HorizontalIn8BitMode) {
    const std::string out = ColorAlignment::horizontal().recolorAscii(
        "${c1}a", ColorProfile({RED}), AnsiMode::ANSI_256, TerminalTheme::DARK);
    EXPECT_EQ(out, "\x1b[38;5;196ma" + RESET_FG_BG);
}

TEST_F(ColorAlignmentTest, HorizontalDoesNotNeedStartingCodes) {
    EXPECT_EQ(recolor(ColorAlignment::horizontal(), "ab", ColorProfile({RED})), FG_RED + "ab" + RESET_FG_BG);
}

TEST_F(ColorAlignmentTest, VerticalColorsEachColumn) {
    EXPECT_EQ(recolor(ColorAlignment::vertical(), "${c1}ab\n${c2}ab", m_redGreen),
              FG_RED + "a" + FG_GREEN + "b" + RESET_ALL + "\n" +
              FG_RED + "a" + FG_GREEN + "b" + RESET_ALL);
}

TEST_F(ColorAlignmentTest, VerticalForeBackUsesColumnOffsets) {
    const ForeBackPair pair{1, 2};
    EXPECT_EQ(recolor(ColorAlignment::vertical(pair), "${c1}AA${c2}BB", m_four),
              NEUTRAL_DARK + "AA" + RESET_FG_BG + FG_BLUE + "B" + FG_WHITE + "B" + RESET_ALL);
}

TEST_F(ColorAlignmentTest, VerticalForeBackCountsMultiByteGlyphsAsOneColumn) {
    // "██" is six bytes but two columns
    const ForeBackPair pair{1, 2};
    EXPECT_EQ(recolor(ColorAlignment::vertical(pair), "${c1}\xE2\x96\x88\xE2\x96\x88${c2}BB", m_four),
              NEUTRAL_DARK + "\xE2\x96\x88\xE2\x96\x88" + RESET_FG_BG + FG_BLUE + "B" + FG_WHITE + "B" + RESET_ALL);
}

TEST_F(ColorAlignmentTest, VerticalForeBackLeadingSpacesKeepTheirColumns) {
    const ForeBackPair pair{1, 2};
    EXPECT_EQ(recolor(ColorAlignment::vertical(pair), "  ${c2}ab", m_redGreen),
              "  " + FG_GREEN + "ab" + RESET_ALL);
}

TEST_F(ColorAlignmentTest, VerticalForeBackLeavesOtherSlotsUncolored) {
    const ForeBackPair pair{1, 2};
    EXPECT_EQ(recolor(ColorAlignment::vertical(pair), "${c3}xy${c1}z", m_redGreen),
              "xy" + NEUTRAL_DARK + "z" + RESET_FG_BG);
}

TEST_F(ColorAlignmentTest, VerticalForeBackNeedsStartingCode) {
    EXPECT_EQ(errorCode(ColorAlignment::vertical(ForeBackPair{1, 2}), "ab\n${c1}cd", m_redGreen),
              RecolorErrc::MISSING_COLOR_STATE);
}

TEST_F(ColorAlignmentTest, HorizontalForeBack) {
    const ForeBackPair pair{2, 1};
    EXPECT_EQ(recolor(ColorAlignment::horizontal(pair), "${c2}ab${c1}cd\nef", m_redGreen),
              NEUTRAL_DARK + "ab" + FG_RED + "cd" + RESET_FG_BG + "\n" +
              FG_GREEN + "ef" + RESET_FG_BG);
}

TEST_F(ColorAlignmentTest, HorizontalForeBackWidthIgnoresInsertedEscapes) {
    // 100 columns, but 20 neutral escapes would add 200 bytes
    std::string line;
    for (int i = 0; i < 20; ++i) line += "${c2}ab${c1}xyz";
    const ForeBackPair pair{2, 1};

    std::string out;
    ASSERT_NO_THROW(out = recolor(ColorAlignment::horizontal(pair), line, m_redGreen));
    EXPECT_EQ(out.find("${c"), std::string::npos);
    EXPECT_EQ(out.rfind(NEUTRAL_DARK + "ab" + FG_GREEN + "xyz", 0), 0u);
}

TEST_F(ColorAlignmentTest, HorizontalForeBackLightTheme) {
    const ForeBackPair pair{2, 1};
    EXPECT_EQ(recolor(ColorAlignment::horizontal(pair), "${c2}ab${c3}!", ColorProfile({RED}), TerminalTheme::LIGHT),
              NEUTRAL_LIGHT + "ab!" + RESET_FG_BG);
}

TEST_F(ColorAlignmentTest, CustomMapsSlotsToPalette) {
    const ColorAlignment custom = ColorAlignment::custom({{1, 0}, {3, 2}});
    EXPECT_EQ(recolor(custom, "${c1}a${c3}b\n${c2}c", m_rgb),
              FG_RED + "a" + FG_BLUE + "b" + RESET_FG_BG + "\n" +
              "c" + RESET_FG_BG);
}

TEST_F(ColorAlignmentTest, CustomCarriesColorAcrossLines) {
    const ColorAlignment custom = ColorAlignment::custom({{1, 1}});
    EXPECT_EQ(recolor(custom, "${c1}a\nb", m_rgb),
              FG_GREEN + "a" + RESET_FG_BG + "\n" + FG_GREEN + "b" + RESET_FG_BG);
}

TEST_F(ColorAlignmentTest, CustomSlotsMayShareAnIndex) {
    const ColorAlignment custom = ColorAlignment::custom({{1, 0}, {2, 0}});
    EXPECT_EQ(recolor(custom, "${c1}a${c2}b", m_rgb), FG_RED + "a" + FG_RED + "b" + RESET_FG_BG);
}

TEST_F(ColorAlignmentTest, CustomWithEmptyMappingStripsCodes) {
    EXPECT_EQ(recolor(ColorAlignment::custom({}), "${c1}a${c2}b", m_rgb), "ab" + RESET_FG_BG);
}

TEST_F(ColorAlignmentTest, CustomIndexesTheDeduplicatedPalette) {
    const ColorProfile repeated({RED, RED, GREEN});
    EXPECT_EQ(recolor(ColorAlignment::custom({{1, 1}}), "${c1}a", repeated), FG_GREEN + "a" + RESET_FG_BG);
    EXPECT_EQ(errorCode(ColorAlignment::custom({{1, 2}}), "${c1}a", repeated), RecolorErrc::INVALID_COLOR_INDEX);
}

TEST_F(ColorAlignmentTest, CustomRejectsInvalidSlot) {
    try {
        ColorAlignment::custom({{7, 0}});
        FAIL() << "expected RecolorError";
    } catch (const RecolorError& e) {
        EXPECT_EQ(e.code(), RecolorErrc::INVALID_PLACEHOLDER);
    }
}

TEST_F(ColorAlignmentTest, EmptyProfileFailsForEveryMode) {
    const ColorProfile empty;
    EXPECT_EQ(errorCode(ColorAlignment::horizontal(), "${c1}a", empty), RecolorErrc::PROFILE_SPREAD_FAILURE);
    EXPECT_EQ(errorCode(ColorAlignment::vertical(), "${c1}a", empty), RecolorErrc::PROFILE_SPREAD_FAILURE);
    EXPECT_EQ(errorCode(ColorAlignment::custom({}), "${c1}a", empty), RecolorErrc::PROFILE_SPREAD_FAILURE);
}

TEST_F(ColorAlignmentTest, OversizedArtIsRejected) {
    const std::string wide = "${c1}" + std::string(MAX_ASCII_DIMENSION + 1, '#');
    EXPECT_EQ(errorCode(ColorAlignment::horizontal(), wide, m_rgb), RecolorErrc::DIMENSION_OVERFLOW);
    EXPECT_EQ(errorCode(ColorAlignment::vertical(), wide, m_rgb), RecolorErrc::DIMENSION_OVERFLOW);
}

TEST_F(ColorAlignmentTest, FromSpec) {
    AlignmentSpec spec;
    spec.mode = AlignmentMode::CUSTOM;
    spec.customColors = {{2, 1}};
    const ColorAlignment alignment = ColorAlignment::fromSpec(spec, ForeBackPair{2, 1});
    ASSERT_EQ(alignment.mode(), AlignmentMode::CUSTOM);
    EXPECT_EQ(std::get<ColorAlignment::Custom>(alignment.value()).colors, (std::map<int, int>{{2, 1}}));

    spec.mode = AlignmentMode::VERTICAL;
    const ColorAlignment vertical = ColorAlignment::fromSpec(spec, ForeBackPair{2, 1});
    const auto& value = std::get<ColorAlignment::Vertical>(vertical.value());
    ASSERT_TRUE(value.foreBack.has_value());
    EXPECT_EQ(*value.foreBack, (ForeBackPair{2, 1}));
}
