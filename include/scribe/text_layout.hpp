#pragma once

/**
 * @file text_layout.hpp
 * @brief Line-broken text layout with per-line metrics and hit testing.
 */

#include "scribe/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scribe {

class Font;
struct Frame;
class Pixmap;
class ShapedParagraph;
class Shaper;

/// @brief Rounding applied to LineMetric::cumulativeHeight.
enum class HeightRounding {
    Ceil,  ///< Round up to the next whole pixel (stable scroll/selection math).
    None,  ///< Keep sub-pixel precision (high-DPI consumers).
};

/// @brief Tunables for a TextLayout.
struct TextLayoutOptions {
    HeightRounding heightRounding = HeightRounding::Ceil;
};

/// @brief Metrics of one laid-out line.
struct LineMetric {
    size_t startOffset = 0;         ///< UTF-8 offset of the first byte of the line.
    size_t endOffset = 0;           ///< UTF-8 offset one past the last byte (includes the line break).
    size_t trailingWhitespace = 0;  ///< Trailing bytes that are ' ', '\\t', '\\r' or '\\n' (ASCII only).
    f32 baseline = 0;               ///< Distance from the top of the line to its baseline (the ascent).
    f32 height = 0;                 ///< ascent + descent + leading.
    f32 cumulativeHeight = 0;       ///< Distance from the top of the layout to the bottom of this line.
};

/// @brief Result of mapping a point to a text position.
struct HitTestPoint {
    size_t textPosition = 0;  ///< UTF-8 offset of the nearest cluster boundary.
    bool isInside = false;    ///< True if the point lies on the text itself.
};

/// @brief Result of mapping a text position to a point.
struct HitTestTextPosition {
    Point point;              ///< Leading edge of the character, on the line's baseline.
    size_t textPosition = 0;  ///< The (clamped) UTF-8 offset that was tested.
    size_t line = 0;          ///< Index of the line containing the offset.
    f32 height = 0;           ///< Height of that line.
    f32 baseline = 0;         ///< Baseline of that line, relative to its top.
};

/**
 * @brief Wrap-width state of a TextLayout.
 *
 * Replaces a float sentinel with an explicit state: a layout that has never
 * been laid out compares unequal to every width, so the first request always
 * shapes.
 */
class LayoutWidth {
public:
    enum class State : u8 {
        Uninitialized,  ///< No layout pass has run yet.
        Unconstrained,  ///< No wrapping (+infinity).
        Constrained,    ///< Wrap at value().
    };

    LayoutWidth() = default;

    static LayoutWidth Unconstrained() { return LayoutWidth(State::Unconstrained, 0); }

    /// @brief Normalize a caller-supplied width.
    ///
    /// Absence and +infinity both mean Unconstrained; -0 becomes +0.
    /// @return std::nullopt for NaN or negative widths.
    static std::optional<LayoutWidth> From(std::optional<f32> width);

    State state() const { return state_; }
    f32 value() const { return value_; }

    /// @brief Maximum line width to hand to the shaper (+infinity when unconstrained).
    f32 maxWidth() const;

    /// @brief Bit-for-bit comparison; Uninitialized never compares equal.
    bool operator==(const LayoutWidth& other) const;
    bool operator!=(const LayoutWidth& other) const { return !(*this == other); }

private:
    LayoutWidth(State state, f32 value) : state_(state), value_(value) {}

    State state_ = State::Uninitialized;
    f32 value_ = 0;
};

/**
 * @brief A paragraph of text shaped with one font and broken into lines.
 *
 * Created by TextLayoutBuilder, which runs the first layout pass. The shaped
 * paragraph is built once; updateWidth() only re-wraps it. Every read
 * (lineCount, lineText, lineMetric, hit testing) works on cached state and
 * never calls the shaper.
 *
 * Offsets are UTF-8 byte offsets into text(). Copies share the immutable
 * shaped paragraph and frame and own their cached vectors.
 *
 * Not thread-safe: callers serialize updateWidth() against reads.
 */
class TextLayout {
public:
    TextLayout(const TextLayout&) = default;
    TextLayout& operator=(const TextLayout&) = default;
    TextLayout(TextLayout&&) noexcept = default;
    TextLayout& operator=(TextLayout&&) noexcept = default;
    ~TextLayout();

    /// @brief Width of the laid-out frame.
    f32 width() const { return cache_.frameSize.w; }

    /// @brief Size of the laid-out frame.
    Size size() const { return cache_.frameSize; }

    /// @brief Area painted by draw(), relative to the draw origin.
    Rect imageBounds() const { return Rect::MakeSize(cache_.frameSize); }

    /// @brief Re-wrap the paragraph at a new width.
    ///
    /// Absence means unconstrained. Requesting the width already in effect is
    /// free and never reaches the shaper, so this may be called on every resize.
    /// @return false (state untouched) if width is NaN or negative.
    bool updateWidth(std::optional<f32> width);

    /// @brief Number of lines.
    size_t lineCount() const { return cache_.lineYPositions.size(); }

    /// @brief Text of a line, including its line break.
    /// @return std::nullopt if line >= lineCount().
    std::optional<std::string_view> lineText(size_t line) const;

    /// @brief Metrics of a line.
    /// @return std::nullopt if line >= lineCount().
    std::optional<LineMetric> lineMetric(size_t line) const;

    /// @brief Map a point (layout coordinates, y down) to the nearest text position.
    HitTestPoint hitTestPoint(Point point) const;

    /// @brief Map a UTF-8 offset (clamped to the text) to its caret position.
    HitTestTextPosition hitTestTextPosition(size_t offset) const;

    /// @brief Paint the layout's glyphs.
    /// @param origin Top-left corner of the layout box in target coordinates.
    void draw(Pixmap& target, Point origin, Color color) const;

    std::string_view text() const { return text_; }
    const std::shared_ptr<const Font>& font() const { return font_; }
    const TextLayoutOptions& options() const { return options_; }
    const LayoutWidth& widthConstraint() const { return width_; }

private:
    friend class TextLayoutBuilder;

    struct Caret {
        size_t offset = 0;
        f32 x = 0;
    };

    // Everything derived from one layout pass; replaced as a unit.
    struct LayoutCache {
        std::shared_ptr<const Frame> frame;
        Size frameSize;
        std::vector<f32> lineYPositions;
        std::vector<size_t> lineOffsets;
        std::vector<std::vector<Caret>> lineCarets;
    };

    TextLayout(std::shared_ptr<Shaper> shaper, std::shared_ptr<const Font> font,
               std::string text, std::shared_ptr<const ShapedParagraph> paragraph,
               TextLayoutOptions options);

    void applyWidth(const LayoutWidth& width);
    LayoutCache relayout(const LayoutWidth& width) const;

    std::optional<std::pair<size_t, size_t>> lineRange(size_t line) const;
    f32 lineBottom(size_t line) const;
    size_t lineForY(f32 y) const;
    size_t lineForOffset(size_t offset) const;
    size_t lastHitTarget(size_t line) const;

    std::shared_ptr<Shaper> shaper_;
    std::shared_ptr<const Font> font_;
    std::string text_;
    std::shared_ptr<const ShapedParagraph> paragraph_;
    TextLayoutOptions options_;
    LayoutWidth width_;
    LayoutCache cache_;
};

/**
 * @brief Collects the inputs of a TextLayout and runs its first layout pass.
 *
 * Usage:
 *
 *   auto layout = TextLayoutBuilder(shaper, font, "hello world", 120.0f).build();
 *   for (size_t i = 0; i < layout->lineCount(); ++i) { ... }
 */
class TextLayoutBuilder {
public:
    TextLayoutBuilder(std::shared_ptr<Shaper> shaper, std::shared_ptr<const Font> font,
                      std::string_view text, std::optional<f32> width = std::nullopt);

    /// @brief Override the default TextLayoutOptions.
    TextLayoutBuilder& options(const TextLayoutOptions& options);

    /// @brief Shape the text and perform the initial layout pass.
    /// @return nullptr if the font is null or foreign to the shaper, the text is
    ///         not valid UTF-8, or the width is NaN or negative.
    std::unique_ptr<TextLayout> build() const;

private:
    std::shared_ptr<Shaper> shaper_;
    std::shared_ptr<const Font> font_;
    std::string text_;
    std::optional<f32> width_;
    TextLayoutOptions options_;
};

} // namespace scribe
