#include "MacScreenCapture.hpp"
#include <algorithm>
#include <string>
#include <type_traits>
#include "capture/PixelLayout.hpp"
#include "core/Logger.hpp"

#include <CoreFoundation/CoreFoundation.h>
#include <CoreGraphics/CoreGraphics.h>

namespace oc {

namespace {

constexpr u32 kMaxDisplays = 32;

template <typename T>
struct CFDeleter {
    void operator()(T ref) const {
        if (ref)
            CFRelease(ref);
    }
};

using CGImagePtr =
        std::unique_ptr<std::remove_pointer_t<CGImageRef>, CFDeleter<CGImageRef>>;
using CFDataPtr =
        std::unique_ptr<std::remove_pointer_t<CFDataRef>, CFDeleter<CFDataRef>>;

CaptureResult<std::vector<CGDirectDisplayID>> activeDisplayIds() {
    using R = CaptureResult<std::vector<CGDirectDisplayID>>;
    std::vector<CGDirectDisplayID> ids(kMaxDisplays);
    uint32_t count = 0;
    CGError err = CGGetActiveDisplayList(kMaxDisplays, ids.data(), &count);
    if (err != kCGErrorSuccess) {
        return R::err(CaptureError::captureFailed(
                "Failed to get display list, error code: " +
                std::to_string(static_cast<int>(err))));
    }
    ids.resize(count);
    return R::ok(std::move(ids));
}

} // namespace

bool MacScreenCapture::hasScreenRecordingPermission() {
    CGImagePtr image(CGDisplayCreateImage(CGMainDisplayID()));
    return image != nullptr;
}

CaptureResult<std::unique_ptr<MacScreenCapture>> MacScreenCapture::create() {
    using R = CaptureResult<std::unique_ptr<MacScreenCapture>>;
    if (!hasScreenRecordingPermission()) {
        LOG_WARN("Unable to image the main display; screen recording "
                 "permission is probably missing");
        return R::err(CaptureError::permissionDenied(
                "Screen recording permission not granted. Please enable it "
                "in System Settings > Privacy & Security > Screen Recording"));
    }
    return R::ok(std::unique_ptr<MacScreenCapture>(new MacScreenCapture()));
}

CaptureResult<std::vector<Display>> MacScreenCapture::getDisplays() {
    using R = CaptureResult<std::vector<Display>>;
    auto ids = activeDisplayIds();
    if (!ids)
        return R::err(ids.error());

    const CGDirectDisplayID mainId = CGMainDisplayID();
    std::vector<Display> displays;
    for (CGDirectDisplayID id : *ids) {
        CGRect bounds = CGDisplayBounds(id);
        Display d;
        d.id = id;
        d.width = static_cast<u32>(bounds.size.width);
        d.height = static_cast<u32>(bounds.size.height);
        d.name = "Display " + std::to_string(id) + " (" +
                 std::to_string(d.width) + "x" + std::to_string(d.height) + ")";
        d.isPrimary = id == mainId;
        displays.push_back(std::move(d));
    }

    if (displays.empty())
        return R::err(CaptureError::captureFailed("No displays found"));
    return R::ok(std::move(displays));
}

CaptureResult<RawFrame> MacScreenCapture::captureFrame(u32 displayId) {
    using R = CaptureResult<RawFrame>;
    const i64 timestamp = nowMillis();

    auto ids = activeDisplayIds();
    if (!ids)
        return R::err(ids.error());
    if (std::find(ids->begin(), ids->end(), displayId) == ids->end())
        return R::err(CaptureError::displayNotFound(displayId));

    CGImagePtr image(CGDisplayCreateImage(displayId));
    if (!image) {
        return R::err(CaptureError::permissionDenied(
                "Failed to capture display. Check screen recording "
                "permissions."));
    }

    const size_t bitsPerPixel = CGImageGetBitsPerPixel(image.get());
    if (bitsPerPixel != 32) {
        return R::err(CaptureError::captureFailed(
                "Unsupported pixel format: " + std::to_string(bitsPerPixel) +
                " bits per pixel"));
    }

    const u32 width = static_cast<u32>(CGImageGetWidth(image.get()));
    const u32 height = static_cast<u32>(CGImageGetHeight(image.get()));
    const usize stride = CGImageGetBytesPerRow(image.get());

    CFDataPtr data(CGDataProviderCopyData(CGImageGetDataProvider(image.get())));
    if (!data)
        return R::err(CaptureError::captureFailed("Failed to copy image data"));

    auto pixels = pixel::stripRowPadding(CFDataGetBytePtr(data.get()),
                                         static_cast<usize>(CFDataGetLength(data.get())),
                                         width,
                                         height,
                                         stride);
    if (!pixels)
        return R::err(CaptureError::captureFailed(pixels.error().message));

    RawFrame frame;
    frame.timestamp = timestamp;
    frame.width = width;
    frame.height = height;
    frame.data = std::move(*pixels);
    frame.format = PixelFormat::BGRA8;
    return R::ok(std::move(frame));
}

} // namespace oc
