/**
 * @file PixelLayout.hpp
 * @brief Conversions from native framebuffer layouts to packed 4-byte pixels.
 *
 * Native capture APIs hand back buffers whose rows may be padded to an
 * alignment and whose pixels may be 24 or 32 bits wide. These helpers turn
 * them into the tightly packed layout RawFrame requires. They are pure so they
 * can be tested without a display.
 */

#pragma once
#include <vector>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace oc::pixel {

// Copies `height` rows of `width * 4` bytes out of a buffer whose rows are
// `stride` bytes apart. stride must be at least width * 4.
Result<std::vector<u8>> stripRowPadding(const u8* data,
                                        usize dataSize,
                                        u32 width,
                                        u32 height,
                                        usize stride);

// Converts an X11 ZPixmap image (little-endian BGRX/BGRA or packed BGR) into
// BGRA8. Alpha is taken from the source only when the visual depth is 32,
// otherwise it is forced opaque.
Result<std::vector<u8>> packX11Pixels(const u8* data,
                                      usize dataSize,
                                      u32 width,
                                      u32 height,
                                      usize bytesPerLine,
                                      u32 bitsPerPixel,
                                      u32 depth);

} // namespace oc::pixel
