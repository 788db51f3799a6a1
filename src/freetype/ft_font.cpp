#include "ft_font.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace scribe {

// --- FtLibrary ---

std::shared_ptr<FtLibrary> FtLibrary::Make() {
    FT_Library library = nullptr;
    FT_Error error = FT_Init_FreeType(&library);
    if (error) {
        std::fprintf(stderr, "scribe FtLibrary: FT_Init_FreeType failed (%d)\n", error);
        return nullptr;
    }
    return std::shared_ptr<FtLibrary>(new FtLibrary(library));
}

FtLibrary::~FtLibrary() {
    if (library_) FT_Done_FreeType(library_);
}

// --- FtFont ---

namespace {

f32 fromFixed(FT_Pos v) {
    return f32(v) / 64.0f;
}

FontMetrics faceMetrics(FT_Face face) {
    const FT_Size_Metrics& m = face->size->metrics;
    FontMetrics metrics;
    metrics.ascent = fromFixed(m.ascender);
    metrics.descent = -fromFixed(m.descender);
    metrics.leading = std::max(0.0f, fromFixed(m.height) - (metrics.ascent + metrics.descent));
    return metrics;
}

} // namespace

std::shared_ptr<FtFont> FtFont::Load(std::shared_ptr<FtLibrary> library, const std::string& path,
                                     long faceIndex, f32 size, std::string family) {
    if (!library) return nullptr;

    FT_Face face = nullptr;
    FT_Error error = FT_New_Face(library->get(), path.c_str(), faceIndex, &face);
    if (error) {
        std::fprintf(stderr, "scribe FtFont: cannot open '%s' (%d)\n", path.c_str(), error);
        return nullptr;
    }

    // 26.6 fixed point at 72 dpi, so one point is one pixel and fractional sizes survive.
    error = FT_Set_Char_Size(face, 0, FT_F26Dot6(size * 64.0f + 0.5f), 72, 72);
    if (error) {
        std::fprintf(stderr, "scribe FtFont: cannot size '%s' to %f (%d)\n",
                     path.c_str(), double(size), error);
        FT_Done_Face(face);
        return nullptr;
    }

    if (family.empty() && face->family_name) family = face->family_name;

    return std::shared_ptr<FtFont>(new FtFont(std::move(library), face, path,
                                              std::move(family), size, faceMetrics(face)));
}

FtFont::FtFont(std::shared_ptr<FtLibrary> library, FT_Face face, std::string path,
               std::string family, f32 size, FontMetrics metrics)
    : Font(std::move(family), size, metrics),
      library_(std::move(library)),
      face_(face),
      path_(std::move(path)),
      glyphs_(new GlyphCache(face)) {
}

FtFont::~FtFont() {
    glyphs_.reset();
    if (face_) FT_Done_Face(face_);
}

u32 FtFont::glyphIndex(u32 codepoint) const {
    return FT_Get_Char_Index(face_, FT_ULong(codepoint));
}

f32 FtFont::advance(u32 glyph) const {
    auto it = advances_.find(glyph);
    if (it != advances_.end()) return it->second;

    f32 adv = 0;
    if (FT_Load_Glyph(face_, glyph, FT_LOAD_DEFAULT) == 0) {
        adv = fromFixed(face_->glyph->advance.x);
    }
    advances_.emplace(glyph, adv);
    return adv;
}

f32 FtFont::kerning(u32 left, u32 right) const {
    if (!FT_HAS_KERNING(face_) || left == 0 || right == 0) return 0;

    FT_Vector delta;
    if (FT_Get_Kerning(face_, left, right, FT_KERNING_DEFAULT, &delta)) return 0;
    return fromFixed(delta.x);
}

} // namespace scribe
