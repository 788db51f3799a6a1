#include <gtest/gtest.h>
#include <scribe/offset_mapper.hpp>

#include <string>

using namespace scribe;

namespace {

// "a" (1 byte, 1 unit), U+1F600 (4 bytes, 2 units), "b" (1 byte, 1 unit)
const std::string kMixed = "a\xF0\x9F\x98\x80" "b";

} // namespace

// --- UTF-16 -> UTF-8 ---

TEST(OffsetMapper, MapsAscendingBoundaries) {
    OffsetMapper mapper(kMixed);
    EXPECT_EQ(mapper.utf8FromUtf16(0), size_t(0));
    EXPECT_EQ(mapper.utf8FromUtf16(1), size_t(1));
    EXPECT_EQ(mapper.utf8FromUtf16(3), size_t(5));
    EXPECT_EQ(mapper.utf8FromUtf16(4), size_t(6));
}

TEST(OffsetMapper, ZeroNeverMovesCursor) {
    OffsetMapper mapper(kMixed);
    ASSERT_EQ(mapper.utf8FromUtf16(3), size_t(5));
    EXPECT_EQ(mapper.utf8FromUtf16(0), size_t(0));
    EXPECT_EQ(mapper.utf16Position(), 3u);
    EXPECT_EQ(mapper.utf8Position(), size_t(5));
}

TEST(OffsetMapper, RepeatedTargetIsAnsweredInPlace) {
    OffsetMapper mapper(kMixed);
    EXPECT_EQ(mapper.utf8FromUtf16(1), size_t(1));
    EXPECT_EQ(mapper.utf8FromUtf16(1), size_t(1));
}

TEST(OffsetMapper, OffsetInsideSurrogatePairFails) {
    OffsetMapper mapper(kMixed);
    EXPECT_FALSE(mapper.utf8FromUtf16(2).has_value());
}

TEST(OffsetMapper, OffsetPastEndFails) {
    OffsetMapper mapper(kMixed);
    EXPECT_FALSE(mapper.utf8FromUtf16(5).has_value());
}

TEST(OffsetMapper, TargetBehindCursorFailsUntilRewind) {
    OffsetMapper mapper(kMixed);
    ASSERT_EQ(mapper.utf8FromUtf16(3), size_t(5));
    EXPECT_FALSE(mapper.utf8FromUtf16(1).has_value());

    mapper.rewind();
    EXPECT_EQ(mapper.utf8FromUtf16(1), size_t(1));
}

TEST(OffsetMapper, EmptyText) {
    OffsetMapper mapper("");
    EXPECT_EQ(mapper.utf8FromUtf16(0), size_t(0));
    EXPECT_FALSE(mapper.utf8FromUtf16(1).has_value());
}

// --- UTF-8 -> UTF-16 ---

TEST(OffsetMapper, Utf16FromUtf8) {
    OffsetMapper mapper(kMixed);
    EXPECT_EQ(mapper.utf16FromUtf8(1), 1u);
    EXPECT_EQ(mapper.utf16FromUtf8(5), 3u);
    EXPECT_EQ(mapper.utf16FromUtf8(6), 4u);
}

TEST(OffsetMapper, Utf8OffsetInsideSequenceFails) {
    OffsetMapper mapper("\xC3\xA9x");  // "éx"
    EXPECT_FALSE(mapper.utf16FromUtf8(1).has_value());

    mapper.rewind();
    EXPECT_EQ(mapper.utf16FromUtf8(2), 1u);
}

// --- Validation ---

TEST(OffsetMapper, IsValidUtf8) {
    EXPECT_TRUE(OffsetMapper::IsValidUtf8(""));
    EXPECT_TRUE(OffsetMapper::IsValidUtf8("plain ascii"));
    EXPECT_TRUE(OffsetMapper::IsValidUtf8(kMixed));

    EXPECT_FALSE(OffsetMapper::IsValidUtf8("\xFF"));
    EXPECT_FALSE(OffsetMapper::IsValidUtf8("\xC0\x80"));      // overlong NUL
    EXPECT_FALSE(OffsetMapper::IsValidUtf8("\xED\xA0\x80"));  // encoded surrogate
    EXPECT_FALSE(OffsetMapper::IsValidUtf8("\xE2\x82"));      // truncated
}

TEST(OffsetMapper, Utf16Length) {
    EXPECT_EQ(OffsetMapper::Utf16Length(""), 0u);
    EXPECT_EQ(OffsetMapper::Utf16Length("abc"), 3u);
    EXPECT_EQ(OffsetMapper::Utf16Length(kMixed), 4u);
    EXPECT_EQ(OffsetMapper::Utf16Length("\xC3\xA9"), 1u);
}
