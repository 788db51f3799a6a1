#pragma once

/**
 * @file offset_mapper.hpp
 * @brief Translation between UTF-16 code-unit offsets and UTF-8 byte offsets.
 */

#include "scribe/types.hpp"
#include <optional>
#include <string_view>

namespace scribe {

/**
 * @brief Forward-only cursor mapping UTF-16 offsets to UTF-8 offsets and back.
 *
 * Native shapers report positions in UTF-16 code units while the public API
 * indexes strings by UTF-8 byte. The mapper walks the text's code points once,
 * accumulating both counts, so mapping an ascending sequence of targets costs
 * O(text length) in total.
 *
 * Targets passed to either direction must be non-decreasing across calls.
 * A target equal to the current position is answered without consuming input.
 *
 * Usage:
 *
 *   OffsetMapper mapper(text);
 *   for (u32 start16 : lineStarts) {
 *       auto start8 = mapper.utf8FromUtf16(start16);
 *       if (!start8) { ... offset splits a code point ... }
 *   }
 */
class OffsetMapper {
public:
    /// @brief Create a mapper over UTF-8 text. The text must outlive the mapper.
    explicit OffsetMapper(std::string_view text);

    /// @brief Map a UTF-16 offset to the UTF-8 offset of the same boundary.
    ///
    /// Offset 0 always maps to 0 without touching the cursor.
    /// @return std::nullopt if the offset falls inside a code point, lies past
    ///         the end of the text, or is behind the cursor.
    std::optional<size_t> utf8FromUtf16(u32 offset16);

    /// @brief Map a UTF-8 offset to the UTF-16 offset of the same boundary.
    /// @return std::nullopt if the offset falls inside a multi-byte sequence,
    ///         lies past the end of the text, or is behind the cursor.
    std::optional<u32> utf16FromUtf8(size_t offset8);

    /// @brief Move the cursor back to the start of the text.
    void rewind();

    size_t utf8Position() const { return pos8_; }
    u32 utf16Position() const { return pos16_; }

    /// @brief Check that text is well-formed UTF-8 (no surrogates, no overlongs).
    static bool IsValidUtf8(std::string_view text);

    /// @brief Number of UTF-16 code units needed to encode valid UTF-8 text.
    static u32 Utf16Length(std::string_view text);

private:
    bool advance();

    std::string_view text_;
    size_t pos8_ = 0;
    u32 pos16_ = 0;
};

} // namespace scribe
