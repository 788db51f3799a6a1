#include "ft_paragraph.hpp"

#include <unicode/ubrk.h>
#include <unicode/uchar.h>
#include <unicode/ustring.h>
#include <unicode/utf16.h>

#include <cmath>
#include <cstdio>
#include <limits>

namespace scribe {

namespace {

struct BreakIteratorDeleter {
    void operator()(UBreakIterator* it) const { ubrk_close(it); }
};
using BreakIteratorPtr = std::unique_ptr<UBreakIterator, BreakIteratorDeleter>;

BreakIteratorPtr openBreakIterator(UBreakIteratorType type, const std::vector<UChar>& text) {
    UErrorCode status = U_ZERO_ERROR;
    BreakIteratorPtr it(ubrk_open(type, nullptr, text.data(), int32_t(text.size()), &status));
    if (U_FAILURE(status) || !it) {
        std::fprintf(stderr, "scribe FtParagraph: ubrk_open failed: %s\n", u_errorName(status));
        return nullptr;
    }
    return it;
}

bool isHardBreak(int32_t status) {
    return status >= UBRK_LINE_HARD && status < UBRK_LINE_HARD_LIMIT;
}

} // namespace

std::shared_ptr<FtParagraph> FtParagraph::Make(std::shared_ptr<const FtFont> font,
                                               std::string_view text) {
    if (!font || text.size() > size_t(std::numeric_limits<int32_t>::max())) return nullptr;

    std::shared_ptr<FtParagraph> paragraph(new FtParagraph(std::move(font)));

    if (!text.empty()) {
        // Preflight for the UTF-16 length, then convert.
        UErrorCode status = U_ZERO_ERROR;
        int32_t length16 = 0;
        u_strFromUTF8(nullptr, 0, &length16, text.data(), int32_t(text.size()), &status);
        if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
            std::fprintf(stderr, "scribe FtParagraph: u_strFromUTF8 preflight failed: %s\n",
                         u_errorName(status));
            return nullptr;
        }
        paragraph->text16_.resize(size_t(length16));
        status = U_ZERO_ERROR;
        u_strFromUTF8(paragraph->text16_.data(), length16, nullptr,
                      text.data(), int32_t(text.size()), &status);
        if (U_FAILURE(status)) {
            std::fprintf(stderr, "scribe FtParagraph: u_strFromUTF8 failed: %s\n",
                         u_errorName(status));
            return nullptr;
        }
    }

    if (!paragraph->shape() || !paragraph->segment()) return nullptr;
    return paragraph;
}

bool FtParagraph::shape() {
    auto guard = font_->lock();

    tabWidth_ = 4 * font_->advance(font_->glyphIndex(' '));

    const int32_t length = int32_t(text16_.size());
    units_.assign(text16_.size(), Unit{});

    u32 previous = 0;
    int32_t previousIndex = -1;
    int32_t i = 0;
    while (i < length) {
        int32_t lead = i;
        UChar32 c;
        U16_NEXT(text16_.data(), i, length, c);

        Unit& unit = units_[size_t(lead)];
        unit.lead = true;
        if (u_iscntrl(c)) {
            previous = 0;
            continue;
        }
        unit.glyph = font_->glyphIndex(u32(c));
        unit.advance = font_->advance(unit.glyph);

        if (previousIndex >= 0 && previous != 0) {
            units_[size_t(previousIndex)].advance += font_->kerning(previous, unit.glyph);
        }
        previous = unit.glyph;
        previousIndex = lead;
    }
    return true;
}

bool FtParagraph::segment() {
    if (text16_.empty()) return true;

    auto graphemes = openBreakIterator(UBRK_CHARACTER, text16_);
    auto lines = openBreakIterator(UBRK_LINE, text16_);
    if (!graphemes || !lines) return false;

    std::vector<Break> breaks(text16_.size() + 1, Break::None);
    for (int32_t pos = ubrk_next(lines.get()); pos != UBRK_DONE; pos = ubrk_next(lines.get())) {
        breaks[size_t(pos)] = isHardBreak(ubrk_getRuleStatus(lines.get())) ? Break::Hard
                                                                              : Break::Soft;
    }

    int32_t start = ubrk_first(graphemes.get());
    for (int32_t end = ubrk_next(graphemes.get()); end != UBRK_DONE;
         start = end, end = ubrk_next(graphemes.get())) {
        Cluster cluster;
        cluster.start = u32(start);
        cluster.end = u32(end);

        UChar32 c;
        U16_GET(text16_.data(), 0, start, int32_t(text16_.size()), c);
        cluster.tab = c == '\t';
        cluster.control = u_iscntrl(c);
        cluster.whitespace = u_isUWhiteSpace(c);
        for (int32_t i = start; i < end; ++i) cluster.advance += units_[size_t(i)].advance;
        cluster.breakAfter = breaks[size_t(end)];
        clusters_.push_back(cluster);
    }
    return true;
}

f32 FtParagraph::penAdvance(const Cluster& cluster, f32 x) const {
    if (cluster.tab) {
        if (tabWidth_ <= 0) return 0;
        return (std::floor(x / tabWidth_) + 1) * tabWidth_ - x;
    }
    return cluster.control ? 0 : cluster.advance;
}

std::vector<FtParagraph::ClusterRange> FtParagraph::breakLines(f32 maxWidth) const {
    std::vector<ClusterRange> lines;
    const size_t count = clusters_.size();
    if (count == 0) {
        lines.push_back({0, 0});
        return lines;
    }

    const size_t none = std::numeric_limits<size_t>::max();
    size_t k = 0;
    while (k < count) {
        const size_t first = k;
        size_t end = count;
        size_t lastBreak = none;
        f32 x = 0;

        for (; k < count; ++k) {
            const Cluster& cluster = clusters_[k];
            f32 w = penAdvance(cluster, x);
            // Whitespace hangs past the edge; anything else must fit unless
            // it is the first cluster of the line.
            if (!cluster.whitespace && k > first && x + w > maxWidth) {
                end = lastBreak != none ? lastBreak : k;
                break;
            }
            x += w;
            if (cluster.breakAfter == Break::Hard) {
                end = k + 1;
                break;
            }
            if (cluster.breakAfter == Break::Soft) lastBreak = k + 1;
        }

        lines.push_back({first, end});
        k = end;
    }
    return lines;
}

FrameLine FtParagraph::placeLine(const ClusterRange& range) const {
    FrameLine line;
    const FontMetrics& metrics = font_->metrics();
    line.bounds.ascent = metrics.ascent;
    line.bounds.descent = metrics.descent;
    line.bounds.leading = metrics.leading;

    if (range.first >= range.last) {
        line.start = range.first < clusters_.size() ? clusters_[range.first].start
                                                    : utf16Length();
        line.carets.push_back({line.start, 0});
        return line;
    }

    line.start = clusters_[range.first].start;
    line.length = clusters_[range.last - 1].end - line.start;

    f32 x = 0;
    f32 visible = 0;
    for (size_t k = range.first; k < range.last; ++k) {
        const Cluster& cluster = clusters_[k];
        line.carets.push_back({cluster.start, x});

        if (!cluster.whitespace && !cluster.control) {
            f32 pen = x;
            for (u32 i = cluster.start; i < cluster.end; ++i) {
                const Unit& unit = units_[i];
                if (!unit.lead) continue;
                line.glyphs.push_back({unit.glyph, pen});
                pen += unit.advance;
            }
        }

        x += penAdvance(cluster, x);
        if (!cluster.whitespace) visible = x;
    }
    line.carets.push_back({line.start + line.length, x});
    line.bounds.width = visible;
    return line;
}

} // namespace scribe
