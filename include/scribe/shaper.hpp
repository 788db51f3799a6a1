#pragma once

/**
 * @file shaper.hpp
 * @brief Abstract native text-shaping service and the frame it produces.
 */

#include "scribe/types.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace scribe {

class Font;
class Pixmap;

/// @brief Typographic bounds of one shaped line, in pixels.
struct TypographicBounds {
    f32 ascent = 0;   ///< Above the baseline.
    f32 descent = 0;  ///< Below the baseline (positive).
    f32 leading = 0;  ///< Extra spacing below the descent.
    f32 width = 0;    ///< Advance width, excluding hanging trailing whitespace.
};

/// @brief A caret position on a line: a cluster boundary and its x offset.
struct CaretStop {
    u32 offset = 0;  ///< UTF-16 code-unit offset into the paragraph.
    f32 x = 0;       ///< Distance from the line origin.
};

/// @brief A glyph placed on a line.
struct PositionedGlyph {
    u32 glyph = 0;  ///< Backend glyph index.
    f32 x = 0;      ///< Pen position relative to the line origin.
};

/// @brief One line of a laid-out frame.
struct FrameLine {
    u32 start = 0;       ///< UTF-16 offset of the first code unit.
    u32 length = 0;      ///< Length in UTF-16 code units.
    TypographicBounds bounds;
    /// Ascending caret stops covering [start, start + length], both ends included.
    std::vector<CaretStop> carets;
    std::vector<PositionedGlyph> glyphs;
};

/**
 * @brief The line-broken result of shaping a paragraph into a region.
 *
 * Line origins use native coordinates: the origin of the region is at the
 * bottom-left and y grows upwards. origins[i].y is the baseline of line i.
 */
struct Frame {
    Size size;                       ///< Size of the region the frame was laid out into.
    std::vector<FrameLine> lines;    ///< Lines in text order.
    std::vector<Point> origins;      ///< One origin per line, bottom-up.
};

/**
 * @brief Shaped representation of a (font, text) pair.
 *
 * Independent of any wrap width, so it is built once per layout and reused
 * for every re-wrap. Backends derive from it to hold their native state.
 */
class ShapedParagraph {
public:
    virtual ~ShapedParagraph() = default;

    /// @brief Length of the paragraph's native string in UTF-16 code units.
    virtual u32 utf16Length() const = 0;
};

/**
 * @brief Abstract native font and shaping service.
 *
 * A Shaper resolves fonts, shapes paragraphs, breaks them into lines for a
 * given region and paints the resulting frames. TextLayout drives it and is
 * the only consumer of Frame. Concrete shapers:
 *
 *   - FtShaper: FreeType + fontconfig + ICU (Shapers::MakeFreeType())
 *
 * All methods run synchronously on the calling thread.
 */
class Shaper {
public:
    virtual ~Shaper() = default;

    /// @brief Resolve a font by family name and pixel size.
    /// @return nullptr if the family cannot be resolved or the request is malformed.
    virtual std::shared_ptr<const Font> resolveFont(std::string_view family, f32 size) = 0;

    /// @brief Load a font directly from a font file.
    /// @return nullptr if the file cannot be loaded.
    virtual std::shared_ptr<const Font> loadFont(std::string_view path, f32 size) = 0;

    /// @brief Shape a UTF-8 paragraph with a font created by this shaper.
    /// @return nullptr if the font belongs to another backend or shaping fails.
    virtual std::shared_ptr<const ShapedParagraph> buildParagraph(
        const std::shared_ptr<const Font>& font, std::string_view text) = 0;

    /// @brief Size of the frame the paragraph needs under the given constraints.
    /// @param constraints Maximum width and height; either may be infinite.
    virtual Size suggestFrameSize(const ShapedParagraph& paragraph, Size constraints) = 0;

    /// @brief Break the paragraph into lines that fit the region.
    virtual std::shared_ptr<const Frame> layoutIntoRegion(const ShapedParagraph& paragraph,
                                                          Rect region) = 0;

    /// @brief Paint a frame's glyphs into a pixmap.
    /// @param origin Top-left corner of the frame in target coordinates.
    virtual void drawFrame(const ShapedParagraph& paragraph, const Frame& frame,
                           Pixmap& target, Point origin, Color color) = 0;
};

} // namespace scribe
