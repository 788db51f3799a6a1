#pragma once

// FreeType-backed Font. Internal to the FreeType shaper.

#include "scribe/font.hpp"
#include "glyph_cache.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace scribe {

/// Owns the FT_Library. Shared by the shaper and every font it creates, so
/// faces never outlive their library.
class FtLibrary {
public:
    static std::shared_ptr<FtLibrary> Make();
    ~FtLibrary();

    FtLibrary(const FtLibrary&) = delete;
    FtLibrary& operator=(const FtLibrary&) = delete;

    FT_Library get() const { return library_; }

private:
    explicit FtLibrary(FT_Library library) : library_(library) {}

    FT_Library library_ = nullptr;
};

/**
 * A sized FreeType face plus its glyph advance and bitmap caches.
 *
 * Faces are shared between layouts, so every face access goes through lock().
 */
class FtFont : public Font {
public:
    /// Open face `faceIndex` of `path` at `size` pixels.
    /// Returns nullptr if FreeType cannot open or size the face.
    static std::shared_ptr<FtFont> Load(std::shared_ptr<FtLibrary> library,
                                        const std::string& path, long faceIndex,
                                        f32 size, std::string family = {});
    ~FtFont() override;

    std::unique_lock<std::mutex> lock() const { return std::unique_lock<std::mutex>(mutex_); }

    // The helpers below expect the caller to hold lock().
    u32 glyphIndex(u32 codepoint) const;
    f32 advance(u32 glyph) const;
    f32 kerning(u32 left, u32 right) const;
    GlyphCache& glyphCache() const { return *glyphs_; }

    const std::string& path() const { return path_; }

private:
    FtFont(std::shared_ptr<FtLibrary> library, FT_Face face, std::string path,
           std::string family, f32 size, FontMetrics metrics);

    std::shared_ptr<FtLibrary> library_;
    FT_Face face_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
    mutable std::unordered_map<u32, f32> advances_;
    std::unique_ptr<GlyphCache> glyphs_;
};

} // namespace scribe
