#include "scribe/text_layout.hpp"
#include "scribe/offset_mapper.hpp"
#include "scribe/shaper.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace scribe {

namespace {

// A shaper that reports positions which do not land on character boundaries,
// or a frame without lines, would corrupt every offset handed out afterwards.
[[noreturn]] void fatalFrame(const char* what) {
    std::fprintf(stderr, "scribe TextLayout: %s\n", what);
    std::abort();
}

[[noreturn]] void fatalFrame(const char* what, u32 offset16) {
    std::fprintf(stderr, "scribe TextLayout: %s (UTF-16 offset %u)\n", what, offset16);
    std::abort();
}

bool isAsciiWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

u32 floatBits(f32 v) {
    u32 bits;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

} // namespace

// --- LayoutWidth ---

std::optional<LayoutWidth> LayoutWidth::From(std::optional<f32> width) {
    if (!width || *width == std::numeric_limits<f32>::infinity()) {
        return Unconstrained();
    }
    if (std::isnan(*width) || *width < 0) {
        return std::nullopt;
    }
    // Adding +0 turns -0 into +0 so both compare equal below.
    return LayoutWidth(State::Constrained, *width + 0.0f);
}

f32 LayoutWidth::maxWidth() const {
    if (state_ == State::Constrained) return value_;
    return std::numeric_limits<f32>::infinity();
}

bool LayoutWidth::operator==(const LayoutWidth& other) const {
    if (state_ == State::Uninitialized || other.state_ == State::Uninitialized) {
        return false;
    }
    if (state_ != other.state_) return false;
    return state_ == State::Unconstrained || floatBits(value_) == floatBits(other.value_);
}

// --- TextLayout ---

TextLayout::TextLayout(std::shared_ptr<Shaper> shaper, std::shared_ptr<const Font> font,
                       std::string text, std::shared_ptr<const ShapedParagraph> paragraph,
                       TextLayoutOptions options)
    : shaper_(std::move(shaper)),
      font_(std::move(font)),
      text_(std::move(text)),
      paragraph_(std::move(paragraph)),
      options_(options) {
}

TextLayout::~TextLayout() = default;

bool TextLayout::updateWidth(std::optional<f32> width) {
    auto normalized = LayoutWidth::From(width);
    if (!normalized) {
        std::fprintf(stderr, "scribe TextLayout: rejected wrap width %f\n",
                     double(width.value_or(0)));
        return false;
    }
    applyWidth(*normalized);
    return true;
}

void TextLayout::applyWidth(const LayoutWidth& width) {
    if (width == width_) return;

    // Build the complete cache first so a layout is never half-updated.
    LayoutCache next = relayout(width);
    cache_ = std::move(next);
    width_ = width;
}

TextLayout::LayoutCache TextLayout::relayout(const LayoutWidth& width) const {
    Size constraints{width.maxWidth(), std::numeric_limits<f32>::infinity()};
    Size suggested = shaper_->suggestFrameSize(*paragraph_, constraints);
    auto frame = shaper_->layoutIntoRegion(*paragraph_, Rect::MakeSize(suggested));

    if (!frame || frame->lines.empty()) {
        fatalFrame("shaper produced a frame without lines");
    }
    if (frame->origins.size() != frame->lines.size()) {
        std::fprintf(stderr, "scribe TextLayout: frame has %zu origins for %zu lines\n",
                     frame->origins.size(), frame->lines.size());
        fatalFrame("frame line origins do not match its lines");
    }
    if (frame->lines.front().start != 0) {
        fatalFrame("first line does not start at the beginning of the text",
                   frame->lines.front().start);
    }

    LayoutCache cache;
    cache.frameSize = suggested;

    // Native origins are bottom-up; store the distance from the top instead.
    cache.lineYPositions.reserve(frame->origins.size());
    for (const Point& origin : frame->origins) {
        cache.lineYPositions.push_back(suggested.h - origin.y);
    }

    // One forward pass over the text maps every line start and caret stop.
    OffsetMapper mapper(text_);
    cache.lineOffsets.reserve(frame->lines.size());
    cache.lineCarets.reserve(frame->lines.size());
    for (const FrameLine& line : frame->lines) {
        auto start = mapper.utf8FromUtf16(line.start);
        if (!start) {
            fatalFrame("line start does not fall on a character boundary", line.start);
        }
        cache.lineOffsets.push_back(*start);

        std::vector<Caret> carets;
        carets.reserve(line.carets.size());
        for (const CaretStop& stop : line.carets) {
            auto offset = mapper.utf8FromUtf16(stop.offset);
            if (!offset) {
                fatalFrame("caret stop does not fall on a character boundary", stop.offset);
            }
            carets.push_back({*offset, stop.x});
        }
        if (carets.empty()) {
            carets.push_back({*start, 0});
        }
        cache.lineCarets.push_back(std::move(carets));
    }

    cache.frame = std::move(frame);
    return cache;
}

std::optional<std::pair<size_t, size_t>> TextLayout::lineRange(size_t line) const {
    if (line >= lineCount()) return std::nullopt;

    size_t start = cache_.lineOffsets[line];
    size_t end = line + 1 == lineCount() ? text_.size() : cache_.lineOffsets[line + 1];
    return std::make_pair(start, end);
}

std::optional<std::string_view> TextLayout::lineText(size_t line) const {
    auto range = lineRange(line);
    if (!range) return std::nullopt;
    return std::string_view(text_).substr(range->first, range->second - range->first);
}

std::optional<LineMetric> TextLayout::lineMetric(size_t line) const {
    auto range = lineRange(line);
    if (!range) return std::nullopt;

    const TypographicBounds& bounds = cache_.frame->lines[line].bounds;
    std::string_view text = *lineText(line);

    size_t trailing = 0;
    while (trailing < text.size() && isAsciiWhitespace(text[text.size() - 1 - trailing])) {
        ++trailing;
    }

    LineMetric metric;
    metric.startOffset = range->first;
    metric.endOffset = range->second;
    metric.trailingWhitespace = trailing;
    metric.baseline = bounds.ascent;
    metric.height = bounds.ascent + bounds.descent + bounds.leading;

    f32 bottom = lineBottom(line);
    metric.cumulativeHeight =
        options_.heightRounding == HeightRounding::Ceil ? std::ceil(bottom) : bottom;
    return metric;
}

f32 TextLayout::lineBottom(size_t line) const {
    const TypographicBounds& bounds = cache_.frame->lines[line].bounds;
    return cache_.lineYPositions[line] + bounds.descent + bounds.leading;
}

void TextLayout::draw(Pixmap& target, Point origin, Color color) const {
    shaper_->drawFrame(*paragraph_, *cache_.frame, target, origin, color);
}

// --- TextLayoutBuilder ---

TextLayoutBuilder::TextLayoutBuilder(std::shared_ptr<Shaper> shaper,
                                     std::shared_ptr<const Font> font,
                                     std::string_view text, std::optional<f32> width)
    : shaper_(std::move(shaper)),
      font_(std::move(font)),
      text_(text),
      width_(width) {
}

TextLayoutBuilder& TextLayoutBuilder::options(const TextLayoutOptions& options) {
    options_ = options;
    return *this;
}

std::unique_ptr<TextLayout> TextLayoutBuilder::build() const {
    if (!shaper_ || !font_) {
        std::fprintf(stderr, "scribe TextLayoutBuilder: missing %s\n",
                     shaper_ ? "font" : "shaper");
        return nullptr;
    }
    if (!OffsetMapper::IsValidUtf8(text_)) {
        std::fprintf(stderr, "scribe TextLayoutBuilder: text is not valid UTF-8\n");
        return nullptr;
    }
    auto width = LayoutWidth::From(width_);
    if (!width) {
        std::fprintf(stderr, "scribe TextLayoutBuilder: rejected wrap width %f\n",
                     double(width_.value_or(0)));
        return nullptr;
    }

    auto paragraph = shaper_->buildParagraph(font_, text_);
    if (!paragraph) {
        std::fprintf(stderr, "scribe TextLayoutBuilder: shaper could not build paragraph\n");
        return nullptr;
    }

    std::unique_ptr<TextLayout> layout(
        new TextLayout(shaper_, font_, text_, std::move(paragraph), options_));
    layout->applyWidth(*width);
    return layout;
}

} // namespace scribe
