#include "scribe/shaper.hpp"
#include "scribe/text_layout.hpp"

#include <algorithm>
#include <cmath>

namespace scribe {

size_t TextLayout::lineForY(f32 y) const {
    if (std::isnan(y) || y < 0) return 0;

    for (size_t i = 0; i < lineCount(); ++i) {
        if (y < lineBottom(i)) return i;
    }
    return lineCount() - 1;
}

size_t TextLayout::lineForOffset(size_t offset) const {
    const auto& starts = cache_.lineOffsets;
    auto it = std::upper_bound(starts.begin(), starts.end(), offset);
    return it == starts.begin() ? 0 : size_t(it - starts.begin()) - 1;
}

// Furthest offset a point on this line may resolve to: the line end without
// its hard break.
size_t TextLayout::lastHitTarget(size_t line) const {
    auto range = *lineRange(line);
    size_t end = range.second;
    if (end > range.first && text_[end - 1] == '\n') {
        --end;
        if (end > range.first && text_[end - 1] == '\r') --end;
    } else if (end > range.first && text_[end - 1] == '\r') {
        --end;
    }
    return end;
}

HitTestPoint TextLayout::hitTestPoint(Point point) const {
    HitTestPoint result;
    if (lineCount() == 0) return result;

    size_t line = lineForY(point.y);
    const auto& carets = cache_.lineCarets[line];
    size_t limit = lastHitTarget(line);

    // Carets are ascending; the first one is always the line start.
    size_t count = 1;
    while (count < carets.size() && carets[count].offset <= limit) ++count;

    const Caret& first = carets.front();
    const Caret& last = carets[count - 1];
    f32 x = std::isnan(point.x) ? 0 : point.x;

    if (x <= first.x) {
        result.textPosition = first.offset;
    } else if (x >= last.x) {
        result.textPosition = last.offset;
    } else {
        auto after = std::upper_bound(carets.begin(), carets.begin() + count, x,
                                      [](f32 v, const Caret& c) { return v < c.x; });
        const Caret& before = *(after - 1);
        f32 mid = (before.x + after->x) * 0.5f;
        result.textPosition = x < mid ? before.offset : after->offset;
    }

    f32 y = point.y;
    result.isInside = !std::isnan(y) && y >= 0 && y < lineBottom(lineCount() - 1) &&
                      x >= first.x && x <= last.x;
    return result;
}

HitTestTextPosition TextLayout::hitTestTextPosition(size_t offset) const {
    HitTestTextPosition result;
    result.textPosition = std::min(offset, text_.size());
    if (lineCount() == 0) return result;

    size_t line = lineForOffset(result.textPosition);
    const auto& carets = cache_.lineCarets[line];

    // Snap to the leading edge of the cluster containing the offset.
    auto it = std::upper_bound(carets.begin(), carets.end(), result.textPosition,
                               [](size_t v, const Caret& c) { return v < c.offset; });
    const Caret& caret = it == carets.begin() ? carets.front() : *(it - 1);

    const TypographicBounds& bounds = cache_.frame->lines[line].bounds;
    result.point = {caret.x, cache_.lineYPositions[line]};
    result.line = line;
    result.height = bounds.ascent + bounds.descent + bounds.leading;
    result.baseline = bounds.ascent;
    return result;
}

} // namespace scribe
