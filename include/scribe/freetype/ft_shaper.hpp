#pragma once

#include "scribe/shaper.hpp"

// This header is only usable when SCRIBE_HAS_FREETYPE is defined.
// Including it without FreeType support will cause a compile error.

#if !SCRIBE_HAS_FREETYPE
#error "FreeType shaper not available. Build with -DSCRIBE_ENABLE_FREETYPE=ON"
#endif

namespace scribe {

/**
 * FreeType-specific Shaper factory functions.
 *
 * Usage:
 *   #include <scribe/freetype/ft_shaper.hpp>
 *   auto shaper = Shapers::MakeFreeType();
 */
namespace Shapers {

/**
 * Create a Shaper backed by FreeType (glyphs), fontconfig (font lookup) and
 * ICU (UTF-16, line and grapheme segmentation).
 * Returns nullptr if FreeType or fontconfig fail to initialize.
 */
std::shared_ptr<Shaper> MakeFreeType();

} // namespace Shapers

} // namespace scribe
