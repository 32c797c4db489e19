#include "PixelLayout.hpp"
#include <cstring>
#include <string>
#include "capture/CaptureTypes.hpp"

namespace oc::pixel {

namespace {

Result<void> checkBuffer(const u8* data,
                         usize dataSize,
                         u32 height,
                         usize rowBytes,
                         usize stride) {
    if (!data)
        return Result<void>::err("Pixel buffer is null");
    if (stride < rowBytes)
        return Result<void>::err("Row stride " + std::to_string(stride) +
                                 " is smaller than row size " +
                                 std::to_string(rowBytes));
    if (height > 0 && dataSize < stride * (height - 1) + rowBytes)
        return Result<void>::err("Pixel buffer too small: " +
                                 std::to_string(dataSize) + " bytes");
    return Result<void>::ok();
}

} // namespace

Result<std::vector<u8>> stripRowPadding(const u8* data,
                                        usize dataSize,
                                        u32 width,
                                        u32 height,
                                        usize stride) {
    const usize rowBytes = static_cast<usize>(width) * kBytesPerPixel;
    if (auto ok = checkBuffer(data, dataSize, height, rowBytes, stride); !ok)
        return Result<std::vector<u8>>::err(ok.error());

    std::vector<u8> out(rowBytes * height);
    if (stride == rowBytes) {
        std::memcpy(out.data(), data, out.size());
        return Result<std::vector<u8>>::ok(std::move(out));
    }
    for (u32 y = 0; y < height; ++y) {
        std::memcpy(out.data() + y * rowBytes, data + y * stride, rowBytes);
    }
    return Result<std::vector<u8>>::ok(std::move(out));
}

Result<std::vector<u8>> packX11Pixels(const u8* data,
                                      usize dataSize,
                                      u32 width,
                                      u32 height,
                                      usize bytesPerLine,
                                      u32 bitsPerPixel,
                                      u32 depth) {
    if (bitsPerPixel != 32 && bitsPerPixel != 24) {
        return Result<std::vector<u8>>::err(
                "Unsupported X11 pixel layout: " +
                std::to_string(bitsPerPixel) + " bits per pixel");
    }

    const usize srcPixel = bitsPerPixel / 8;
    const usize rowBytes = static_cast<usize>(width) * srcPixel;
    if (auto ok = checkBuffer(data, dataSize, height, rowBytes, bytesPerLine);
        !ok)
        return Result<std::vector<u8>>::err(ok.error());

    const bool keepAlpha = bitsPerPixel == 32 && depth == 32;
    std::vector<u8> out(static_cast<usize>(width) * height * kBytesPerPixel);
    u8* dst = out.data();
    for (u32 y = 0; y < height; ++y) {
        const u8* src = data + y * bytesPerLine;
        for (u32 x = 0; x < width; ++x, src += srcPixel, dst += 4) {
            dst[0] = src[0];
            dst[1] = src[1];
            dst[2] = src[2];
            dst[3] = keepAlpha ? src[3] : 255;
        }
    }
    return Result<std::vector<u8>>::ok(std::move(out));
}

} // namespace oc::pixel
