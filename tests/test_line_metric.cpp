#include <gtest/gtest.h>
#include <scribe/text.hpp>
#include "fake_shaper.hpp"

using namespace scribe;
using scribe::test::FakeShaper;

namespace {

std::unique_ptr<TextLayout> makeLayout(const std::shared_ptr<FakeShaper>& shaper,
                                       std::string_view text, TextLayoutOptions options = {},
                                       std::optional<f32> width = std::nullopt) {
    TextFactory factory(shaper);
    auto font = factory.newFont("Fake Mono", 12.0f);
    return factory.newTextLayout(font, text, width).options(options).build();
}

} // namespace

// --- Geometry ---

TEST(LineMetric, BaselineAndHeightFromFontMetrics) {
    auto shaper = std::make_shared<FakeShaper>();
    auto l = makeLayout(shaper, "one\ntwo\nthree");
    ASSERT_NE(l, nullptr);

    for (size_t i = 0; i < l->lineCount(); ++i) {
        auto m = *l->lineMetric(i);
        EXPECT_FLOAT_EQ(m.baseline, 12.0f);
        EXPECT_FLOAT_EQ(m.height, 18.0f);
        EXPECT_FLOAT_EQ(m.cumulativeHeight, 18.0f * f32(i + 1));
    }
}

TEST(LineMetric, CumulativeHeightIsMonotonicAndEndsAtFrameHeight) {
    auto shaper = std::make_shared<FakeShaper>();
    auto l = makeLayout(shaper, "a fairly long sentence that wraps a few times", {}, 70.0f);
    ASSERT_NE(l, nullptr);
    ASSERT_GT(l->lineCount(), 2u);

    f32 previous = 0;
    for (size_t i = 0; i < l->lineCount(); ++i) {
        f32 current = l->lineMetric(i)->cumulativeHeight;
        EXPECT_GT(current, previous) << "line " << i;
        previous = current;
    }
    EXPECT_FLOAT_EQ(previous, l->size().h);
}

// --- Trailing whitespace ---

TEST(LineMetric, TrailingWhitespaceCountsAsciiOnly) {
    auto shaper = std::make_shared<FakeShaper>();
    auto l = makeLayout(shaper, "tabs\t \r\nnbsp\xC2\xA0\nplain");
    ASSERT_NE(l, nullptr);
    ASSERT_EQ(l->lineCount(), 3u);

    EXPECT_EQ(l->lineMetric(0)->trailingWhitespace, 4u);  // "\t \r\n"
    EXPECT_EQ(l->lineMetric(1)->trailingWhitespace, 1u);  // "\n"; U+00A0 is not counted
    EXPECT_EQ(l->lineMetric(2)->trailingWhitespace, 0u);
}

TEST(LineMetric, AllWhitespaceLine) {
    auto shaper = std::make_shared<FakeShaper>();
    auto l = makeLayout(shaper, "   \nx");
    ASSERT_NE(l, nullptr);
    auto m = *l->lineMetric(0);
    EXPECT_EQ(m.trailingWhitespace, m.endOffset - m.startOffset);
}

// --- Rounding ---

TEST(LineMetric, CeilRoundingByDefault) {
    auto shaper = std::make_shared<FakeShaper>();
    shaper->metrics = {12.5f, 4.25f, 1.0f};
    auto l = makeLayout(shaper, "one\ntwo");
    ASSERT_NE(l, nullptr);
    ASSERT_EQ(l->lineCount(), 2u);

    EXPECT_FLOAT_EQ(l->lineMetric(0)->cumulativeHeight, 18.0f);
    EXPECT_FLOAT_EQ(l->lineMetric(1)->cumulativeHeight, 36.0f);
    EXPECT_FLOAT_EQ(l->lineMetric(1)->cumulativeHeight, l->size().h);
}

TEST(LineMetric, NoRoundingKeepsSubPixelHeights) {
    auto shaper = std::make_shared<FakeShaper>();
    shaper->metrics = {12.5f, 4.25f, 1.0f};
    TextLayoutOptions options;
    options.heightRounding = HeightRounding::None;
    auto l = makeLayout(shaper, "one\ntwo", options);
    ASSERT_NE(l, nullptr);

    EXPECT_FLOAT_EQ(l->lineMetric(0)->cumulativeHeight, 17.75f);
    EXPECT_FLOAT_EQ(l->lineMetric(1)->cumulativeHeight, 35.5f);
    EXPECT_FLOAT_EQ(l->lineMetric(0)->height, 17.75f);
    EXPECT_EQ(l->options().heightRounding, HeightRounding::None);
}
