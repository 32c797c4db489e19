#include "ScreenCapture.hpp"
#include <algorithm>
#include "core/Logger.hpp"

#if defined(_WIN32)
#include "platform/windows/WindowsScreenCapture.hpp"
#elif defined(__APPLE__)
#include "platform/macos/MacScreenCapture.hpp"
#elif defined(__linux__)
#include "platform/linux/LinuxScreenCapture.hpp"
#endif

namespace oc {

CaptureResult<Display> ScreenCapture::findDisplay(u32 displayId) {
    auto displays = getDisplays();
    if (!displays)
        return CaptureResult<Display>::err(displays.error());

    auto it = std::find_if(displays->begin(),
                           displays->end(),
                           [displayId](const Display& d) {
                               return d.id == displayId;
                           });
    if (it == displays->end())
        return CaptureResult<Display>::err(
                CaptureError::displayNotFound(displayId));
    return CaptureResult<Display>::ok(*it);
}

CaptureResult<void> ScreenCapture::startCapture(u32 displayId) {
    std::lock_guard lock(stateMutex_);
    if (currentDisplay_)
        return CaptureResult<void>::err(CaptureError::alreadyCapturing());

    auto display = findDisplay(displayId);
    if (!display)
        return CaptureResult<void>::err(display.error());

    if (auto started = onCaptureStarted(displayId); !started)
        return started;

    currentDisplay_ = displayId;
    LOG_INFO("{}: capture started on display {} ({})",
             backendName(),
             displayId,
             display->name);
    return CaptureResult<void>::ok();
}

CaptureResult<void> ScreenCapture::stopCapture() {
    std::lock_guard lock(stateMutex_);
    if (!currentDisplay_)
        return CaptureResult<void>::err(CaptureError::notCapturing());

    onCaptureStopped();
    LOG_INFO("{}: capture stopped on display {}",
             backendName(),
             *currentDisplay_);
    currentDisplay_.reset();
    return CaptureResult<void>::ok();
}

bool ScreenCapture::isCapturing() const {
    std::lock_guard lock(stateMutex_);
    return currentDisplay_.has_value();
}

std::optional<u32> ScreenCapture::currentDisplayId() const {
    std::lock_guard lock(stateMutex_);
    return currentDisplay_;
}

CaptureResult<std::unique_ptr<ScreenCapture>> createScreenCapture() {
    using R = CaptureResult<std::unique_ptr<ScreenCapture>>;
#if defined(_WIN32)
    auto capture = WindowsScreenCapture::create();
#elif defined(__APPLE__)
    auto capture = MacScreenCapture::create();
#elif defined(__linux__)
    auto capture = LinuxScreenCapture::create();
#else
    return R::err(CaptureError::notSupported(
            "Screen capture is not available on this platform"));
#endif
#if defined(_WIN32) || defined(__APPLE__) || defined(__linux__)
    if (!capture)
        return R::err(capture.error());
    return R::ok(std::move(*capture));
#endif
}

} // namespace oc
