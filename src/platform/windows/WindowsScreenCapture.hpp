/**
 * @file WindowsScreenCapture.hpp
 * @brief Screen capture for Windows via DXGI Desktop Duplication.
 *
 * Displays are the desktop-attached outputs of every DXGI adapter. A display
 * id packs the adapter index in the high 16 bits and the output index in the
 * low 16 bits (see DisplayId.hpp).
 *
 * Frames come from IDXGIOutputDuplication: the desktop texture is copied into
 * a CPU-readable staging texture and read row by row using its RowPitch.
 * When duplication is unavailable (access denied, already in use by another
 * process, or no frame within one second) the same display is captured with
 * GDI BitBlt instead. Both paths produce BGRA8.
 *
 * @section Dependencies
 * - Direct3D 11, DXGI 1.2, GDI
 */

#pragma once
#include <memory>
#include <mutex>
#include "capture/ScreenCapture.hpp"

namespace oc {

class WindowsScreenCapture : public ScreenCapture {
public:
    static CaptureResult<std::unique_ptr<WindowsScreenCapture>> create();
    ~WindowsScreenCapture() override;

    CaptureResult<std::vector<Display>> getDisplays() override;
    CaptureResult<RawFrame> captureFrame(u32 displayId) override;
    std::string_view backendName() const override {
        return "windows-dxgi";
    }

protected:
    void onCaptureStopped() override;

private:
    struct Duplication;

    WindowsScreenCapture();

    // Duplication kept alive between frames of the same display
    std::unique_ptr<Duplication> duplication_;
    std::mutex duplicationMutex_;
};

} // namespace oc
