#include "glyph_cache.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace scribe {

GlyphCache::GlyphCache(FT_Face face)
    : face_(face), atlas_(size_t(atlasW_) * size_t(atlasH_), 0) {
}

const GlyphBitmap* GlyphCache::getGlyph(u32 glyph) {
    auto it = glyphs_.find(glyph);
    if (it != glyphs_.end()) return &it->second;
    if (!rasterizeGlyph(glyph)) return nullptr;
    return &glyphs_[glyph];
}

void GlyphCache::growAtlas(i32 minHeight) {
    i32 newH = atlasH_;
    while (newH < minHeight) newH *= 2;
    if (newH == atlasH_) return;
    atlas_.resize(size_t(atlasW_) * size_t(newH), 0);
    atlasH_ = newH;
}

bool GlyphCache::rasterizeGlyph(u32 glyph) {
    if (FT_Load_Glyph(face_, glyph, FT_LOAD_DEFAULT)) return false;
    if (FT_Render_Glyph(face_->glyph, FT_RENDER_MODE_NORMAL)) {
        std::fprintf(stderr, "scribe GlyphCache: cannot render glyph %u\n", glyph);
        return false;
    }

    const FT_GlyphSlot slot = face_->glyph;
    const FT_Bitmap& bitmap = slot->bitmap;
    i32 w = i32(bitmap.width);
    i32 h = i32(bitmap.rows);

    GlyphBitmap gb;
    gb.left = slot->bitmap_left;
    gb.top = slot->bitmap_top;
    gb.width = std::min(w, atlasW_ - 2);
    gb.height = h;

    // Empty glyphs (spaces) take no atlas room.
    if (gb.width <= 0 || gb.height <= 0) {
        gb.width = gb.height = 0;
        glyphs_.emplace(glyph, gb);
        return true;
    }

    if (cursorX_ + gb.width + 1 > atlasW_) {
        cursorX_ = 1;
        cursorY_ += rowHeight_ + 1;
        rowHeight_ = 0;
    }
    growAtlas(cursorY_ + gb.height + 1);

    gb.atlasX = cursorX_;
    gb.atlasY = cursorY_;
    for (i32 row = 0; row < gb.height; ++row) {
        const u8* src = bitmap.buffer + row * bitmap.pitch;
        u8* dst = &atlas_[size_t(gb.atlasY + row) * size_t(atlasW_) + size_t(gb.atlasX)];
        std::memcpy(dst, src, size_t(gb.width));
    }

    cursorX_ += gb.width + 1;
    rowHeight_ = std::max(rowHeight_, gb.height);
    glyphs_.emplace(glyph, gb);
    return true;
}

} // namespace scribe
