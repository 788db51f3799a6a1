#include <gtest/gtest.h>
#include <scribe/types.hpp>
#include <scribe/version.hpp>

#include <string>

using namespace scribe;

// --- Type aliases ---

TEST(TypeAliases, SizeTypes) {
    static_assert(sizeof(i32) == 4, "i32 must be 4 bytes");
    static_assert(sizeof(u32) == 4, "u32 must be 4 bytes");
    static_assert(sizeof(u16) == 2, "u16 must be 2 bytes");
    static_assert(sizeof(u8)  == 1, "u8 must be 1 byte");
    static_assert(sizeof(f32) == 4, "f32 must be 4 bytes");
}

// --- Geometry ---

TEST(Point, DefaultConstruction) {
    Point p;
    EXPECT_FLOAT_EQ(p.x, 0.0f);
    EXPECT_FLOAT_EQ(p.y, 0.0f);
}

TEST(Rect, MakeSize) {
    Rect r = Rect::MakeSize({120.0f, 40.0f});
    EXPECT_FLOAT_EQ(r.x, 0.0f);
    EXPECT_FLOAT_EQ(r.y, 0.0f);
    EXPECT_FLOAT_EQ(r.w, 120.0f);
    EXPECT_FLOAT_EQ(r.h, 40.0f);

    Size s = Rect{5, 6, 7, 8}.size();
    EXPECT_FLOAT_EQ(s.w, 7.0f);
    EXPECT_FLOAT_EQ(s.h, 8.0f);
}

// --- Color ---

TEST(Color, DefaultIsOpaqueBlack) {
    Color c;
    EXPECT_EQ(c.r, 0);
    EXPECT_EQ(c.g, 0);
    EXPECT_EQ(c.b, 0);
    EXPECT_EQ(c.a, 255);
}

TEST(Color, ThreeComponentInitKeepsOpaqueAlpha) {
    Color c{10, 20, 30};
    EXPECT_EQ(c.a, 255);
}

// --- Version ---

TEST(Version, StringMatchesMacros) {
    std::string expected = std::to_string(SCRIBE_VERSION_MAJOR) + "." +
                           std::to_string(SCRIBE_VERSION_MINOR) + "." +
                           std::to_string(SCRIBE_VERSION_PATCH);
    EXPECT_EQ(expected, version());
    EXPECT_EQ(versionMajor(), SCRIBE_VERSION_MAJOR);
}
