#pragma once

/**
 * @file text.hpp
 * @brief Entry point binding a Shaper to font and layout creation.
 */

#include "scribe/text_layout.hpp"
#include "scribe/types.hpp"
#include <memory>
#include <optional>
#include <string_view>

namespace scribe {

class Font;
class Shaper;

/**
 * @brief Creates fonts and text layouts for one Shaper.
 *
 * Usage:
 *
 *   scribe::TextFactory text(scribe::Shapers::MakeFreeType());
 *   auto font = text.newFont("DejaVu Sans", 16.0f);
 *   auto layout = text.newTextLayout(font, "hello world", 200.0f).build();
 */
class TextFactory {
public:
    explicit TextFactory(std::shared_ptr<Shaper> shaper);

    /// @brief Resolve a font by family name and pixel size.
    /// @return nullptr if the family is not available (FontNotFound).
    std::shared_ptr<const Font> newFont(std::string_view family, f32 size) const;

    /// @brief Load a font from a font file.
    /// @return nullptr if the file cannot be loaded.
    std::shared_ptr<const Font> newFontFromFile(std::string_view path, f32 size) const;

    /// @brief Start building a layout. Call build() on the result.
    TextLayoutBuilder newTextLayout(std::shared_ptr<const Font> font, std::string_view text,
                                    std::optional<f32> width = std::nullopt) const;

    const std::shared_ptr<Shaper>& shaper() const { return shaper_; }

private:
    std::shared_ptr<Shaper> shaper_;
};

} // namespace scribe
