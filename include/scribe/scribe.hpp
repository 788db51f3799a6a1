#pragma once

/**
 * Scribe - Text layout on native font services
 *
 * Usage:
 *
 *   #include <scribe/scribe.hpp>
 *   scribe::TextFactory text(scribe::Shapers::MakeFreeType());
 *   auto font = text.newFont("DejaVu Sans", 16.0f);
 *   auto layout = text.newTextLayout(font, "hello\nworld", 200.0f).build();
 *
 *   auto pixmap = scribe::Pixmap::Alloc(scribe::PixmapInfo::MakeRGBA(256, 64));
 *   layout->draw(pixmap, {0, 0}, {0, 0, 0, 255});
 */

// Version
#include "scribe/version.hpp"

// Core types
#include "scribe/types.hpp"

// Raster target
#include "scribe/pixmap.hpp"

// Fonts and the shaping service (abstract)
#include "scribe/font.hpp"
#include "scribe/shaper.hpp"

// FreeType shaper factory (conditional - include <scribe/freetype/ft_shaper.hpp> explicitly)
#if SCRIBE_HAS_FREETYPE
#include "scribe/freetype/ft_shaper.hpp"
#endif

// Layout
#include "scribe/offset_mapper.hpp"
#include "scribe/text_layout.hpp"
#include "scribe/text.hpp"
