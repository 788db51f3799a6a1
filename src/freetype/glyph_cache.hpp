#pragma once

/**
 * @file glyph_cache.hpp
 * @brief Glyph rasterization cache with a greyscale shelf-packed atlas.
 */

#include "scribe/types.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <unordered_map>
#include <vector>

namespace scribe {

/// @brief Placement of one rasterized glyph.
struct GlyphBitmap {
    i32 left = 0;    ///< Offset from the pen position to the bitmap's left edge.
    i32 top = 0;     ///< Offset from the baseline up to the bitmap's top edge.
    i32 width = 0;   ///< Bitmap width in pixels.
    i32 height = 0;  ///< Bitmap height in pixels.
    i32 atlasX = 0;  ///< Left edge inside the atlas.
    i32 atlasY = 0;  ///< Top edge inside the atlas.
};

/// @brief Rasterization cache for one sized FT_Face.
///
/// Glyphs are rendered on demand with FT_Render_Glyph and packed row by row
/// into a single-channel coverage atlas that grows downward when full.
/// The face is borrowed; the owning font serializes access.
class GlyphCache {
public:
    explicit GlyphCache(FT_Face face);

    /// @brief Get (or rasterize) a glyph by index.
    /// @return nullptr if FreeType fails to render the glyph.
    const GlyphBitmap* getGlyph(u32 glyph);

    /// @brief Coverage of the atlas at (x, y).
    u8 coverage(i32 x, i32 y) const { return atlas_[size_t(y) * size_t(atlasW_) + size_t(x)]; }

    i32 atlasWidth() const { return atlasW_; }
    i32 atlasHeight() const { return atlasH_; }

    /// @brief Number of glyphs rasterized so far.
    size_t glyphCount() const { return glyphs_.size(); }

private:
    bool rasterizeGlyph(u32 glyph);
    void growAtlas(i32 minHeight);

    FT_Face face_ = nullptr;

    // Declared before atlas_, which is sized from them.
    i32 atlasW_ = 512, atlasH_ = 256;
    std::vector<u8> atlas_;
    i32 cursorX_ = 1, cursorY_ = 1, rowHeight_ = 0;

    std::unordered_map<u32, GlyphBitmap> glyphs_;
};

} // namespace scribe
