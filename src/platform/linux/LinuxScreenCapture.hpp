/**
 * @file LinuxScreenCapture.hpp
 * @brief Screen capture for Linux desktops (X11, Wayland stub).
 *
 * The display server is detected from the session environment:
 * WAYLAND_DISPLAY wins over DISPLAY because XWayland also sets DISPLAY.
 *
 * On X11 monitors are enumerated through RandR (connected outputs with an
 * active CRTC) and each frame is an XGetImage of that CRTC's rectangle on the
 * root window. Without RandR the whole root window is one display.
 *
 * On Wayland a single placeholder display is reported and every capture
 * fails with NotSupported: grabbing the screen there needs the
 * xdg-desktop-portal ScreenCast interface and a PipeWire stream.
 *
 * @section Dependencies
 * - Xlib, Xrandr
 */

#pragma once
#include <memory>
#include "capture/ScreenCapture.hpp"

namespace oc {

enum class DisplayServer { X11, Wayland, Unknown };

std::string_view toString(DisplayServer server);

// Reads WAYLAND_DISPLAY and DISPLAY
DisplayServer detectDisplayServer();
DisplayServer detectDisplayServer(const char* waylandDisplay,
                                  const char* x11Display);

class LinuxScreenCapture : public ScreenCapture {
public:
    // Fails with CaptureFailed when no display server is detected
    static CaptureResult<std::unique_ptr<LinuxScreenCapture>> create();

    CaptureResult<std::vector<Display>> getDisplays() override;
    CaptureResult<RawFrame> captureFrame(u32 displayId) override;
    std::string_view backendName() const override;

    // Grabs an arbitrary root-window rectangle (X11 only). A rectangle outside
    // the screen fails with CaptureFailed.
    CaptureResult<RawFrame> captureRegion(i32 x, i32 y, u32 width, u32 height);

    DisplayServer displayServer() const {
        return server_;
    }

private:
    explicit LinuxScreenCapture(DisplayServer server) : server_(server) {}

    CaptureResult<std::vector<Display>> getDisplaysX11();
    CaptureResult<RawFrame> captureFrameX11(u32 displayId);

    DisplayServer server_;
};

} // namespace oc
