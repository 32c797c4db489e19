/**
 * @file ScreenCapture.hpp
 * @brief Platform-independent screen capture contract.
 *
 * ScreenCapture is the single abstraction every OS backend implements:
 * enumerate displays, grab one frame, and track whether a continuous capture
 * session is active. Backends only provide getDisplays() and captureFrame();
 * the Idle / Capturing(displayId) state machine lives here, guarded by a
 * per-instance mutex, so every backend enforces it the same way.
 *
 * @section Dependencies
 * - CaptureTypes
 *
 * @section Patterns
 * - Template Method: startCapture()/stopCapture() call onCaptureStarted()
 *   and onCaptureStopped() so backends can set up per-session resources.
 * - Factory: createScreenCapture() returns the backend for the build target.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>
#include "CaptureTypes.hpp"

namespace oc {

class ScreenCapture {
public:
    virtual ~ScreenCapture() = default;

    ScreenCapture(const ScreenCapture&) = delete;
    ScreenCapture& operator=(const ScreenCapture&) = delete;

    // Fresh enumeration on every call; ids are valid for this process only
    virtual CaptureResult<std::vector<Display>> getDisplays() = 0;

    virtual CaptureResult<RawFrame> captureFrame(u32 displayId) = 0;

    virtual std::string_view backendName() const = 0;

    // Looks the id up in a fresh enumeration
    CaptureResult<Display> findDisplay(u32 displayId);

    CaptureResult<void> startCapture(u32 displayId);
    CaptureResult<void> stopCapture();

    bool isCapturing() const;
    std::optional<u32> currentDisplayId() const;

protected:
    ScreenCapture() = default;

    virtual CaptureResult<void> onCaptureStarted(u32 /*displayId*/) {
        return CaptureResult<void>::ok();
    }
    virtual void onCaptureStopped() {}

private:
    std::optional<u32> currentDisplay_;
    mutable std::mutex stateMutex_;
};

// Backend for the platform this library was built for
CaptureResult<std::unique_ptr<ScreenCapture>> createScreenCapture();

} // namespace oc
