#include "scribe/pixmap.hpp"
#include <cstdlib>
#include <cstring>
#include <utility>

namespace scribe {

Pixmap::Pixmap(const PixmapInfo& info, void* pixels, bool ownsPixels)
    : info_(info), pixels_(pixels), ownsPixels_(ownsPixels) {
}

Pixmap::~Pixmap() {
    reset();
}

Pixmap::Pixmap(Pixmap&& other) noexcept
    : info_(other.info_), pixels_(other.pixels_), ownsPixels_(other.ownsPixels_) {
    other.info_ = {};
    other.pixels_ = nullptr;
    other.ownsPixels_ = false;
}

Pixmap& Pixmap::operator=(Pixmap&& other) noexcept {
    if (this != &other) {
        reset();
        info_ = std::exchange(other.info_, {});
        pixels_ = std::exchange(other.pixels_, nullptr);
        ownsPixels_ = std::exchange(other.ownsPixels_, false);
    }
    return *this;
}

Pixmap Pixmap::Alloc(const PixmapInfo& info) {
    if (info.width <= 0 || info.height <= 0) return Pixmap();

    void* pixels = std::calloc(size_t(info.computeByteSize()), 1);
    if (!pixels) return Pixmap();
    return Pixmap(info, pixels, true);
}

Pixmap Pixmap::Wrap(const PixmapInfo& info, void* pixels) {
    return Pixmap(info, pixels, false);
}

void Pixmap::reset() {
    if (ownsPixels_) {
        std::free(pixels_);
    }
    pixels_ = nullptr;
    ownsPixels_ = false;
    info_ = {};
}

u32 Pixmap::pack(Color c) const {
    if (info_.format == PixelFormat::BGRA8888) {
        return (u32(c.a) << 24) | (u32(c.r) << 16) | (u32(c.g) << 8) | u32(c.b);
    }
    return (u32(c.a) << 24) | (u32(c.b) << 16) | (u32(c.g) << 8) | u32(c.r);
}

Color Pixmap::unpack(u32 p) const {
    u8 a = (p >> 24) & 0xFF;
    if (info_.format == PixelFormat::BGRA8888) {
        return {u8((p >> 16) & 0xFF), u8((p >> 8) & 0xFF), u8(p & 0xFF), a};
    }
    return {u8(p & 0xFF), u8((p >> 8) & 0xFF), u8((p >> 16) & 0xFF), a};
}

void Pixmap::clear(Color c) {
    if (!valid()) return;

    u32 pixel = pack(c);
    for (i32 y = 0; y < info_.height; ++y) {
        u32* row = rowAddr(y);
        for (i32 x = 0; x < info_.width; ++x) {
            row[x] = pixel;
        }
    }
}

Color Pixmap::getPixel(i32 x, i32 y) const {
    if (!valid() || x < 0 || x >= info_.width || y < 0 || y >= info_.height) {
        return {0, 0, 0, 0};
    }
    return unpack(rowAddr(y)[x]);
}

void Pixmap::blendPixel(i32 x, i32 y, Color c, u8 coverage) {
    if (!valid()) return;
    if (x < 0 || x >= info_.width || y < 0 || y >= info_.height) return;

    u32 a = (u32(c.a) * coverage + 127) / 255;
    if (a == 0) return;

    u32& dst = rowAddr(y)[x];
    if (a == 255) {
        dst = pack({c.r, c.g, c.b, 255});
        return;
    }

    Color d = unpack(dst);
    u32 invA = 255 - a;
    Color out;
    out.r = u8((c.r * a + d.r * invA) / 255);
    out.g = u8((c.g * a + d.g * invA) / 255);
    out.b = u8((c.b * a + d.b * invA) / 255);
    out.a = u8((a * 255 + d.a * invA) / 255);
    dst = pack(out);
}

} // namespace scribe
