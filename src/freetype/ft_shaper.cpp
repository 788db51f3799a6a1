// FtShaper - Shaper implementation on FreeType, fontconfig and ICU.
//
// Compiled only when SCRIBE_HAS_FREETYPE is set.

#include "scribe/freetype/ft_shaper.hpp"
#include "scribe/pixmap.hpp"
#include "ft_font.hpp"
#include "ft_paragraph.hpp"

#include <fontconfig/fontconfig.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <string>

namespace scribe {

namespace {

struct FcConfigDeleter {
    void operator()(FcConfig* config) const { FcConfigDestroy(config); }
};
struct FcPatternDeleter {
    void operator()(FcPattern* pattern) const { FcPatternDestroy(pattern); }
};
using FcConfigPtr = std::unique_ptr<FcConfig, FcConfigDeleter>;
using FcPatternPtr = std::unique_ptr<FcPattern, FcPatternDeleter>;

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Generic names fontconfig maps to a configured default face.
bool isGenericFamily(std::string_view family) {
    static const char* const kGeneric[] = {"sans-serif", "sans", "serif", "monospace",
                                           "system-ui"};
    for (const char* name : kGeneric) {
        if (equalsIgnoreCase(family, name)) return true;
    }
    return false;
}

// True if any family name of the match equals the request.
bool matchesFamily(FcPattern* match, std::string_view family) {
    FcChar8* name = nullptr;
    for (int i = 0; FcPatternGetString(match, FC_FAMILY, i, &name) == FcResultMatch; ++i) {
        if (name && equalsIgnoreCase(reinterpret_cast<const char*>(name), family)) return true;
    }
    return false;
}

} // namespace

class FtShaper : public Shaper {
public:
    FtShaper(std::shared_ptr<FtLibrary> library, FcConfigPtr config)
        : library_(std::move(library)), config_(std::move(config)) {}

    std::shared_ptr<const Font> resolveFont(std::string_view family, f32 size) override;
    std::shared_ptr<const Font> loadFont(std::string_view path, f32 size) override;
    std::shared_ptr<const ShapedParagraph> buildParagraph(const std::shared_ptr<const Font>& font,
                                                          std::string_view text) override;
    Size suggestFrameSize(const ShapedParagraph& paragraph, Size constraints) override;
    std::shared_ptr<const Frame> layoutIntoRegion(const ShapedParagraph& paragraph,
                                                  Rect region) override;
    void drawFrame(const ShapedParagraph& paragraph, const Frame& frame, Pixmap& target,
                   Point origin, Color color) override;

private:
    static const FtParagraph* ownParagraph(const ShapedParagraph& paragraph) {
        return dynamic_cast<const FtParagraph*>(&paragraph);
    }

    std::shared_ptr<FtLibrary> library_;
    FcConfigPtr config_;
};

std::shared_ptr<const Font> FtShaper::resolveFont(std::string_view family, f32 size) {
    if (family.empty() || !std::isfinite(size) || size <= 0) return nullptr;

    const std::string request(family);
    FcPatternPtr pattern(FcPatternCreate());
    if (!pattern) return nullptr;
    FcPatternAddString(pattern.get(), FC_FAMILY,
                       reinterpret_cast<const FcChar8*>(request.c_str()));
    FcPatternAddDouble(pattern.get(), FC_PIXEL_SIZE, double(size));
    FcConfigSubstitute(config_.get(), pattern.get(), FcMatchPattern);
    FcDefaultSubstitute(pattern.get());

    FcResult result = FcResultNoMatch;
    FcPatternPtr match(FcFontMatch(config_.get(), pattern.get(), &result));
    if (!match || result != FcResultMatch) {
        std::fprintf(stderr, "scribe FtShaper: no match for '%s'\n", request.c_str());
        return nullptr;
    }

    // fontconfig always returns its best guess; only accept a substitute for
    // generic names.
    if (!isGenericFamily(family) && !matchesFamily(match.get(), family)) {
        std::fprintf(stderr, "scribe FtShaper: family '%s' not installed\n", request.c_str());
        return nullptr;
    }

    FcChar8* file = nullptr;
    if (FcPatternGetString(match.get(), FC_FILE, 0, &file) != FcResultMatch || !file) {
        std::fprintf(stderr, "scribe FtShaper: match for '%s' has no file\n", request.c_str());
        return nullptr;
    }
    int index = 0;
    if (FcPatternGetInteger(match.get(), FC_INDEX, 0, &index) != FcResultMatch) index = 0;

    FcChar8* resolved = nullptr;
    std::string resolvedFamily = request;
    if (FcPatternGetString(match.get(), FC_FAMILY, 0, &resolved) == FcResultMatch && resolved) {
        resolvedFamily = reinterpret_cast<const char*>(resolved);
    }

    return FtFont::Load(library_, reinterpret_cast<const char*>(file), index, size,
                        std::move(resolvedFamily));
}

std::shared_ptr<const Font> FtShaper::loadFont(std::string_view path, f32 size) {
    if (path.empty() || !std::isfinite(size) || size <= 0) return nullptr;
    return FtFont::Load(library_, std::string(path), 0, size);
}

std::shared_ptr<const ShapedParagraph> FtShaper::buildParagraph(
    const std::shared_ptr<const Font>& font, std::string_view text) {
    auto ftFont = std::dynamic_pointer_cast<const FtFont>(font);
    if (!ftFont) {
        std::fprintf(stderr, "scribe FtShaper: font was not created by this shaper\n");
        return nullptr;
    }
    return FtParagraph::Make(std::move(ftFont), text);
}

Size FtShaper::suggestFrameSize(const ShapedParagraph& paragraph, Size constraints) {
    const FtParagraph* ft = ownParagraph(paragraph);
    if (!ft) return {};

    f32 width = 0;
    f32 height = 0;
    bool overhang = false;
    for (const auto& range : ft->breakLines(constraints.w)) {
        FrameLine line = ft->placeLine(range);
        width = std::max(width, line.bounds.width);
        height += line.bounds.ascent + line.bounds.descent + line.bounds.leading;
        if (line.bounds.width > constraints.w) overhang = true;
    }
    // layoutIntoRegion() breaks again at the width reported here. The widest
    // line reproduces the same breaks only when every line fit; a cluster
    // wider than the constraint would let narrower clusters pack behind it.
    if (overhang) width = constraints.w;
    return {width, std::min(std::ceil(height), constraints.h)};
}

std::shared_ptr<const Frame> FtShaper::layoutIntoRegion(const ShapedParagraph& paragraph,
                                                        Rect region) {
    const FtParagraph* ft = ownParagraph(paragraph);
    if (!ft) return nullptr;

    auto frame = std::make_shared<Frame>();
    frame->size = region.size();

    // Baselines stack from the top; origins are reported bottom-up.
    f32 top = 0;
    for (const auto& range : ft->breakLines(region.w)) {
        FrameLine line = ft->placeLine(range);
        f32 baseline = top + line.bounds.ascent;
        frame->origins.push_back({region.x, region.h - baseline});
        top = baseline + line.bounds.descent + line.bounds.leading;
        frame->lines.push_back(std::move(line));
    }
    return frame;
}

void FtShaper::drawFrame(const ShapedParagraph& paragraph, const Frame& frame, Pixmap& target,
                         Point origin, Color color) {
    const FtParagraph* ft = ownParagraph(paragraph);
    if (!ft || !target.valid()) return;

    const FtFont& font = *ft->font();
    auto guard = font.lock();
    GlyphCache& cache = font.glyphCache();

    for (size_t i = 0; i < frame.lines.size() && i < frame.origins.size(); ++i) {
        f32 baseline = origin.y + (frame.size.h - frame.origins[i].y);
        f32 lineX = origin.x + frame.origins[i].x;
        for (const PositionedGlyph& g : frame.lines[i].glyphs) {
            const GlyphBitmap* bitmap = cache.getGlyph(g.glyph);
            if (!bitmap || bitmap->width == 0) continue;

            i32 x0 = i32(std::lround(lineX + g.x)) + bitmap->left;
            i32 y0 = i32(std::lround(baseline)) - bitmap->top;
            // Clip to the target.
            i32 sx = std::max(0, -x0);
            i32 sy = std::max(0, -y0);
            i32 ex = std::min(bitmap->width, target.width() - x0);
            i32 ey = std::min(bitmap->height, target.height() - y0);
            for (i32 y = sy; y < ey; ++y) {
                for (i32 x = sx; x < ex; ++x) {
                    u8 coverage = cache.coverage(bitmap->atlasX + x, bitmap->atlasY + y);
                    if (coverage) target.blendPixel(x0 + x, y0 + y, color, coverage);
                }
            }
        }
    }
}

// --- Factory ---

namespace Shapers {

std::shared_ptr<Shaper> MakeFreeType() {
    auto library = FtLibrary::Make();
    if (!library) return nullptr;

    FcConfigPtr config(FcInitLoadConfigAndFonts());
    if (!config) {
        std::fprintf(stderr, "scribe FtShaper: fontconfig initialization failed\n");
        return nullptr;
    }
    return std::make_shared<FtShaper>(std::move(library), std::move(config));
}

} // namespace Shapers

} // namespace scribe
