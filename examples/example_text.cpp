/**
 * example_text.cpp - Wrap a paragraph and paint it with scribe
 *
 * Demonstrates:
 *   - Resolving a font through the FreeType shaper
 *   - Building a layout and re-wrapping it at several widths
 *   - Reading line metrics and hit testing
 *   - Painting into a Pixmap and writing it to a raw PPM file
 *
 * Build:
 *   cmake -B build -DSCRIBE_BUILD_EXAMPLES=ON && cmake --build build
 *   ./build/example_text [family]
 *
 * Output: text.ppm
 */

#include <scribe/scribe.hpp>
#include <cstdio>
#include <fstream>

// Write an RGBA pixmap to PPM
static void writePPM(const char* filename, const scribe::Pixmap& pm) {
    std::ofstream f(filename, std::ios::binary);
    f << "P6\n" << pm.width() << " " << pm.height() << "\n255\n";
    for (int y = 0; y < pm.height(); ++y) {
        for (int x = 0; x < pm.width(); ++x) {
            scribe::Color c = pm.getPixel(x, y);
            f.put(char(c.r)); f.put(char(c.g)); f.put(char(c.b));
        }
    }
    std::printf("Written: %s (%dx%d)\n", filename, pm.width(), pm.height());
}

int main(int argc, char** argv) {
    const char* family = argc > 1 ? argv[1] : "DejaVu Sans";

    auto shaper = scribe::Shapers::MakeFreeType();
    if (!shaper) {
        std::fprintf(stderr, "FreeType shaper unavailable\n");
        return 1;
    }
    scribe::TextFactory text(shaper);

    auto font = text.newFont(family, 18.0f);
    if (!font) return 1;

    const char* paragraph =
        "scribe lays out text with FreeType, fontconfig and ICU.\n"
        "Resize the box and the paragraph re-wraps without reshaping.";
    auto layout = text.newTextLayout(font, paragraph, 240.0f).build();
    if (!layout) return 1;

    for (float width : {400.0f, 240.0f, 120.0f}) {
        if (!layout->updateWidth(width)) return 1;
        std::printf("width %.0f: %zu lines, %.1f x %.1f\n", double(width), layout->lineCount(),
                    double(layout->size().w), double(layout->size().h));
    }

    if (!layout->updateWidth(240.0f)) return 1;
    for (size_t i = 0; i < layout->lineCount(); ++i) {
        auto m = *layout->lineMetric(i);
        auto line = *layout->lineText(i);
        std::printf("  [%zu] %zu..%zu bottom=%.0f \"%.*s\"\n", i, m.startOffset, m.endOffset,
                    double(m.cumulativeHeight), int(line.size() - m.trailingWhitespace),
                    line.data());
    }

    auto hit = layout->hitTestPoint({50, 30});
    std::printf("point (50, 30) -> offset %zu (inside: %s)\n", hit.textPosition,
                hit.isInside ? "yes" : "no");

    const int pad = 8;
    auto pm = scribe::Pixmap::Alloc(scribe::PixmapInfo::MakeRGBA(
        int(layout->size().w) + 2 * pad, int(layout->size().h) + 2 * pad));
    pm.clear({250, 248, 240, 255});
    layout->draw(pm, {float(pad), float(pad)}, {30, 30, 60, 255});
    writePPM("text.ppm", pm);
    return 0;
}
