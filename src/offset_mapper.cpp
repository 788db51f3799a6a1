#include "scribe/offset_mapper.hpp"

#include <unicode/utf16.h>
#include <unicode/utf8.h>

#include <limits>

namespace scribe {

namespace {

bool fitsIcuLength(std::string_view text) {
    return text.size() <= size_t(std::numeric_limits<int32_t>::max());
}

} // namespace

OffsetMapper::OffsetMapper(std::string_view text)
    : text_(text) {
}

void OffsetMapper::rewind() {
    pos8_ = 0;
    pos16_ = 0;
}

// Consume one code point. Fails at the end of the text or on a malformed sequence.
bool OffsetMapper::advance() {
    if (pos8_ >= text_.size() || !fitsIcuLength(text_)) return false;

    const auto* s = reinterpret_cast<const uint8_t*>(text_.data());
    int32_t i = int32_t(pos8_);
    UChar32 c;
    U8_NEXT(s, i, int32_t(text_.size()), c);
    if (c < 0) return false;

    pos8_ = size_t(i);
    pos16_ += u32(U16_LENGTH(c));
    return true;
}

std::optional<size_t> OffsetMapper::utf8FromUtf16(u32 offset16) {
    if (offset16 == 0) return size_t(0);

    while (pos16_ < offset16) {
        if (!advance()) return std::nullopt;
    }
    if (pos16_ != offset16) return std::nullopt;
    return pos8_;
}

std::optional<u32> OffsetMapper::utf16FromUtf8(size_t offset8) {
    if (offset8 == 0) return u32(0);

    while (pos8_ < offset8) {
        if (!advance()) return std::nullopt;
    }
    if (pos8_ != offset8) return std::nullopt;
    return pos16_;
}

bool OffsetMapper::IsValidUtf8(std::string_view text) {
    if (!fitsIcuLength(text)) return false;

    const auto* s = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = int32_t(text.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c < 0) return false;
    }
    return true;
}

u32 OffsetMapper::Utf16Length(std::string_view text) {
    if (!fitsIcuLength(text)) return 0;

    const auto* s = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = int32_t(text.size());
    int32_t i = 0;
    u32 units = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        units += c < 0 ? 1 : u32(U16_LENGTH(c));
    }
    return units;
}

} // namespace scribe
