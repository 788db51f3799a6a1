#pragma once

/**
 * @file font.hpp
 * @brief Opaque, immutable font handle.
 */

#include "scribe/types.hpp"
#include <string>
#include <utility>

namespace scribe {

/// @brief Vertical metrics of a sized font, in pixels.
struct FontMetrics {
    f32 ascent = 0;   ///< Distance from baseline to the top of the line box (positive).
    f32 descent = 0;  ///< Distance from baseline to the bottom of the glyph box (positive).
    f32 leading = 0;  ///< Extra inter-line spacing added below the descent.
};

/**
 * @brief Opaque reference to a sized font resource.
 *
 * A Font is created by a Shaper (see TextFactory::newFont) and is immutable
 * afterwards. It is always handled through std::shared_ptr<const Font> so
 * that every TextLayout built from it keeps the backend resources alive.
 *
 * Backends derive from Font to attach their native face objects.
 */
class Font {
public:
    virtual ~Font() = default;

    Font(const Font&) = delete;
    Font& operator=(const Font&) = delete;

    /// @brief Family name as resolved by the font service.
    const std::string& family() const { return family_; }

    /// @brief Pixel size the font was built for.
    f32 size() const { return size_; }

    /// @brief Default line metrics of this font.
    const FontMetrics& metrics() const { return metrics_; }

protected:
    Font(std::string family, f32 size, FontMetrics metrics)
        : family_(std::move(family)), size_(size), metrics_(metrics) {}

private:
    std::string family_;
    f32 size_ = 0;
    FontMetrics metrics_;
};

} // namespace scribe
