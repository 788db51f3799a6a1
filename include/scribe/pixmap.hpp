#pragma once

/**
 * @file pixmap.hpp
 * @brief Pixel format, pixel buffer descriptor, and owning/non-owning pixel buffer.
 *
 * A Pixmap is the raster target that text layouts paint into.
 */

#include "scribe/types.hpp"

namespace scribe {

/// @brief Pixel format enumeration.
enum class PixelFormat {
    RGBA8888,  ///< Red-Green-Blue-Alpha, 8 bits each.
    BGRA8888,  ///< Blue-Green-Red-Alpha, 8 bits each (native on many platforms).
};

/// @brief Descriptor for pixel buffer dimensions, stride, and format.
struct PixmapInfo {
    i32 width = 0;   ///< Width in pixels.
    i32 height = 0;  ///< Height in pixels.
    i32 stride = 0;  ///< Bytes per row.
    PixelFormat format = PixelFormat::RGBA8888; ///< Pixel format.

    /// @brief Get bytes per pixel (always 4 for current formats).
    i32 bytesPerPixel() const { return 4; }

    /// @brief Compute total byte size of the pixel buffer (stride * height).
    i32 computeByteSize() const { return stride * height; }

    /// @brief Create a PixmapInfo with the given dimensions and format.
    static PixmapInfo Make(i32 w, i32 h, PixelFormat fmt) {
        PixmapInfo info;
        info.width = w;
        info.height = h;
        info.format = fmt;
        info.stride = w * 4;
        return info;
    }

    static PixmapInfo MakeRGBA(i32 w, i32 h) { return Make(w, h, PixelFormat::RGBA8888); }
    static PixmapInfo MakeBGRA(i32 w, i32 h) { return Make(w, h, PixelFormat::BGRA8888); }
};

/// @brief Owning or non-owning pixel buffer.
///
/// Use Alloc() to create an owned buffer, or Wrap() to reference external memory.
class Pixmap {
public:
    /// @brief Allocate a new zero-filled pixel buffer described by info.
    /// @return An invalid Pixmap if either dimension is not positive.
    static Pixmap Alloc(const PixmapInfo& info);

    /// @brief Wrap existing pixel memory (caller keeps ownership).
    static Pixmap Wrap(const PixmapInfo& info, void* pixels);

    Pixmap() = default;
    ~Pixmap();

    Pixmap(Pixmap&& other) noexcept;
    Pixmap& operator=(Pixmap&& other) noexcept;

    Pixmap(const Pixmap&) = delete;
    Pixmap& operator=(const Pixmap&) = delete;

    void* addr() { return pixels_; }
    const void* addr() const { return pixels_; }

    const PixmapInfo& info() const { return info_; }
    i32 width() const { return info_.width; }
    i32 height() const { return info_.height; }
    i32 stride() const { return info_.stride; }
    PixelFormat format() const { return info_.format; }

    /// @brief Check if the pixmap has valid pixel data.
    bool valid() const { return pixels_ != nullptr && info_.width > 0 && info_.height > 0; }

    /// @brief Get pointer to the start of a specific row (mutable).
    u32* rowAddr(i32 y) { return reinterpret_cast<u32*>(static_cast<u8*>(pixels_) + y * info_.stride); }
    /// @brief Get pointer to the start of a specific row (const).
    const u32* rowAddr(i32 y) const {
        return reinterpret_cast<const u32*>(static_cast<const u8*>(pixels_) + y * info_.stride);
    }

    /// @brief Fill the entire buffer with a color.
    void clear(Color c);

    /// @brief Read back the pixel at (x, y) as a Color, independent of format.
    /// @return Transparent black for coordinates outside the buffer.
    Color getPixel(i32 x, i32 y) const;

    /// @brief Source-over blend a color into the pixel at (x, y).
    ///
    /// Out-of-bounds coordinates are ignored.
    /// @param coverage Extra coverage multiplied into c.a (glyph anti-aliasing).
    void blendPixel(i32 x, i32 y, Color c, u8 coverage = 255);

    /// @brief Release pixel data and reset to empty state.
    void reset();

private:
    Pixmap(const PixmapInfo& info, void* pixels, bool ownsPixels);

    u32 pack(Color c) const;
    Color unpack(u32 p) const;

    PixmapInfo info_;
    void* pixels_ = nullptr;
    bool ownsPixels_ = false;
};

}
