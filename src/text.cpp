#include "scribe/text.hpp"
#include "scribe/font.hpp"
#include "scribe/shaper.hpp"

#include <cmath>
#include <cstdio>
#include <string>
#include <utility>

namespace scribe {

namespace {

bool validSize(f32 size) {
    return std::isfinite(size) && size > 0;
}

} // namespace

TextFactory::TextFactory(std::shared_ptr<Shaper> shaper)
    : shaper_(std::move(shaper)) {
}

std::shared_ptr<const Font> TextFactory::newFont(std::string_view family, f32 size) const {
    if (!shaper_) {
        std::fprintf(stderr, "scribe TextFactory: no shaper\n");
        return nullptr;
    }
    if (family.empty() || !validSize(size)) {
        std::fprintf(stderr, "scribe TextFactory: invalid font request '%s' @ %f\n",
                     std::string(family).c_str(), double(size));
        return nullptr;
    }
    auto font = shaper_->resolveFont(family, size);
    if (!font) {
        std::fprintf(stderr, "scribe TextFactory: font not found: '%s'\n",
                     std::string(family).c_str());
    }
    return font;
}

std::shared_ptr<const Font> TextFactory::newFontFromFile(std::string_view path, f32 size) const {
    if (!shaper_) {
        std::fprintf(stderr, "scribe TextFactory: no shaper\n");
        return nullptr;
    }
    if (path.empty() || !validSize(size)) {
        std::fprintf(stderr, "scribe TextFactory: invalid font file request '%s' @ %f\n",
                     std::string(path).c_str(), double(size));
        return nullptr;
    }
    auto font = shaper_->loadFont(path, size);
    if (!font) {
        std::fprintf(stderr, "scribe TextFactory: failed to load font file '%s'\n",
                     std::string(path).c_str());
    }
    return font;
}

TextLayoutBuilder TextFactory::newTextLayout(std::shared_ptr<const Font> font,
                                             std::string_view text,
                                             std::optional<f32> width) const {
    return TextLayoutBuilder(shaper_, std::move(font), text, width);
}

} // namespace scribe
