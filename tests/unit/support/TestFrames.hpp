#pragma once
#include <vector>
#include "capture/CaptureTypes.hpp"

namespace oc::test {

// Horizontal gradient that shifts with `index`, so consecutive frames differ
inline RawFrame gradientFrame(u32 width,
                              u32 height,
                              u32 index,
                              i64 timestamp,
                              PixelFormat fmt = PixelFormat::RGBA8) {
    RawFrame f;
    f.timestamp = timestamp;
    f.width = width;
    f.height = height;
    f.format = fmt;
    f.data.resize(f.expectedSize());
    for (u32 y = 0; y < height; ++y) {
        for (u32 x = 0; x < width; ++x) {
            const usize off = (usize(y) * width + x) * kBytesPerPixel;
            f.data[off] = static_cast<u8>((x + index * 4) % 256);
            f.data[off + 1] = static_cast<u8>(y % 256);
            f.data[off + 2] = static_cast<u8>((index * 8) % 256);
            f.data[off + 3] = 255;
        }
    }
    return f;
}

inline std::vector<RawFrame> frameSequence(u32 count,
                                           u32 width,
                                           u32 height,
                                           i64 startTimestamp,
                                           i64 stepMs) {
    std::vector<RawFrame> frames;
    frames.reserve(count);
    for (u32 i = 0; i < count; ++i)
        frames.push_back(gradientFrame(width, height, i, startTimestamp + i * stepMs));
    return frames;
}

} // namespace oc::test
