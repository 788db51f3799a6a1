#pragma once

// Width-independent shaping state of one paragraph for the FreeType shaper.

#include "scribe/shaper.hpp"
#include "ft_font.hpp"

#include <unicode/utypes.h>

#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace scribe {

/**
 * A UTF-16 paragraph with per-code-unit glyphs and advances, grapheme
 * clusters and ICU line-break opportunities.
 *
 * Built once per TextLayout. breakLines() and placeLine() are pure, so the
 * same paragraph can be re-wrapped at any width.
 */
class FtParagraph : public ShapedParagraph {
public:
    /// Half-open range of cluster indices forming one line.
    struct ClusterRange {
        size_t first = 0;
        size_t last = 0;
    };

    /// Returns nullptr if ICU cannot convert or segment the text.
    static std::shared_ptr<FtParagraph> Make(std::shared_ptr<const FtFont> font,
                                             std::string_view text);

    u32 utf16Length() const override { return u32(text16_.size()); }

    const std::shared_ptr<const FtFont>& font() const { return font_; }

    /// Greedy line fill at maxWidth. Always returns at least one line.
    std::vector<ClusterRange> breakLines(f32 maxWidth) const;

    /// Carets, glyphs and bounds of one line, with x relative to the line origin.
    FrameLine placeLine(const ClusterRange& range) const;

private:
    enum class Break : u8 { None, Soft, Hard };

    struct Unit {
        u32 glyph = 0;
        f32 advance = 0;    // Kerning with the following glyph folded in.
        bool lead = false;  // First code unit of a code point.
    };

    struct Cluster {
        u32 start = 0;  // UTF-16 offsets
        u32 end = 0;
        f32 advance = 0;
        bool whitespace = false;
        bool tab = false;
        bool control = false;
        Break breakAfter = Break::None;
    };

    explicit FtParagraph(std::shared_ptr<const FtFont> font) : font_(std::move(font)) {}

    bool shape();
    bool segment();
    f32 penAdvance(const Cluster& cluster, f32 x) const;

    std::shared_ptr<const FtFont> font_;
    std::vector<UChar> text16_;
    std::vector<Unit> units_;
    std::vector<Cluster> clusters_;
    f32 tabWidth_ = 0;
};

} // namespace scribe
