/**
 * @file MacScreenCapture.hpp
 * @brief Screen capture for macOS via CoreGraphics.
 *
 * Display ids are CGDirectDisplayIDs. Each frame is a CGDisplayCreateImage
 * snapshot copied out of its data provider; rows are copied one by one when
 * the image's bytes-per-row is wider than width * 4. Output is BGRA8.
 *
 * Screen Recording permission has no reliable query API, so it is tested by
 * imaging the main display: no image means no permission.
 *
 * @section Dependencies
 * - CoreGraphics, CoreFoundation
 */

#pragma once
#include <memory>
#include "capture/ScreenCapture.hpp"

namespace oc {

class MacScreenCapture : public ScreenCapture {
public:
    // Fails with PermissionDenied if the main display cannot be imaged
    static CaptureResult<std::unique_ptr<MacScreenCapture>> create();

    CaptureResult<std::vector<Display>> getDisplays() override;
    CaptureResult<RawFrame> captureFrame(u32 displayId) override;
    std::string_view backendName() const override {
        return "macos-coregraphics";
    }

    static bool hasScreenRecordingPermission();

private:
    MacScreenCapture() = default;
};

} // namespace oc
