#include "WindowsScreenCapture.hpp"
#include <cstdio>
#include <string>
#include <type_traits>
#include "capture/DisplayId.hpp"
#include "capture/PixelLayout.hpp"
#include "core/Logger.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <d3d11.h>
#include <dxgi1_2.h>
#include <wrl/client.h>

using Microsoft::WRL::ComPtr;

namespace oc {

namespace {

constexpr UINT kAcquireTimeoutMs = 1000;

struct Output {
    Display display;
    RECT rect{};
};

// Failure of the duplication path, keeping the HRESULT so the caller can
// decide whether GDI is worth trying
struct DxgiFailure {
    HRESULT hr{E_FAIL};
    std::string message;
};

std::string hresultText(std::string_view what, HRESULT hr) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08lx", static_cast<unsigned long>(hr));
    return std::string(what) + " (" + buf + ")";
}

std::string narrow(const WCHAR* wide) {
    int len = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr, nullptr);
    if (len <= 1)
        return {};
    std::string out(static_cast<usize>(len - 1), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide, -1, out.data(), len, nullptr, nullptr);
    return out;
}

bool shouldFallBackToGdi(HRESULT hr) {
    return hr == E_ACCESSDENIED || hr == DXGI_ERROR_NOT_CURRENTLY_AVAILABLE ||
           hr == DXGI_ERROR_WAIT_TIMEOUT || hr == DXGI_ERROR_UNSUPPORTED ||
           hr == DXGI_ERROR_ACCESS_LOST;
}

CaptureResult<std::vector<Output>> enumerateOutputs() {
    using R = CaptureResult<std::vector<Output>>;

    ComPtr<IDXGIFactory1> factory;
    HRESULT hr = CreateDXGIFactory1(__uuidof(IDXGIFactory1),
                                    reinterpret_cast<void**>(factory.GetAddressOf()));
    if (FAILED(hr))
        return R::err(CaptureError::captureFailed(
                hresultText("Failed to create DXGI factory", hr)));

    std::vector<Output> outputs;
    ComPtr<IDXGIAdapter1> adapter;
    for (UINT a = 0; factory->EnumAdapters1(a, &adapter) != DXGI_ERROR_NOT_FOUND; ++a) {
        ComPtr<IDXGIOutput> output;
        for (UINT o = 0; adapter->EnumOutputs(o, &output) != DXGI_ERROR_NOT_FOUND; ++o) {
            DXGI_OUTPUT_DESC desc;
            hr = output->GetDesc(&desc);
            if (FAILED(hr))
                return R::err(CaptureError::captureFailed(
                        hresultText("Failed to get output description", hr)));
            if (!desc.AttachedToDesktop)
                continue;

            const RECT& rc = desc.DesktopCoordinates;
            Output out;
            out.rect = rc;
            out.display.id = packDisplayId(static_cast<u16>(a), static_cast<u16>(o));
            out.display.width = static_cast<u32>(rc.right - rc.left);
            out.display.height = static_cast<u32>(rc.bottom - rc.top);
            out.display.name = narrow(desc.DeviceName) + " (" +
                               std::to_string(out.display.width) + "x" +
                               std::to_string(out.display.height) + ")";
            out.display.isPrimary = rc.left == 0 && rc.top == 0;
            outputs.push_back(std::move(out));
        }
    }

    if (outputs.empty())
        return R::err(CaptureError::captureFailed("No displays found"));
    return R::ok(std::move(outputs));
}

CaptureResult<Output> findOutput(u32 displayId) {
    auto outputs = enumerateOutputs();
    if (!outputs)
        return CaptureResult<Output>::err(outputs.error());
    for (auto& o : *outputs) {
        if (o.display.id == displayId)
            return CaptureResult<Output>::ok(std::move(o));
    }
    return CaptureResult<Output>::err(CaptureError::displayNotFound(displayId));
}

struct DcReleaser {
    void operator()(HDC dc) const {
        if (dc)
            ReleaseDC(nullptr, dc);
    }
};
struct DcDeleter {
    void operator()(HDC dc) const {
        if (dc)
            DeleteDC(dc);
    }
};
struct GdiObjectDeleter {
    void operator()(HGDIOBJ obj) const {
        if (obj)
            DeleteObject(obj);
    }
};

using ScreenDcPtr = std::unique_ptr<std::remove_pointer_t<HDC>, DcReleaser>;
using MemoryDcPtr = std::unique_ptr<std::remove_pointer_t<HDC>, DcDeleter>;
using BitmapPtr = std::unique_ptr<std::remove_pointer_t<HBITMAP>, GdiObjectDeleter>;

CaptureResult<RawFrame> captureGdi(const Output& output) {
    using R = CaptureResult<RawFrame>;
    const i64 timestamp = nowMillis();
    const int width = static_cast<int>(output.display.width);
    const int height = static_cast<int>(output.display.height);

    ScreenDcPtr screen(GetDC(nullptr));
    if (!screen)
        return R::err(CaptureError::captureFailed("Failed to get desktop DC"));

    MemoryDcPtr mem(CreateCompatibleDC(screen.get()));
    if (!mem)
        return R::err(CaptureError::captureFailed("Failed to create compatible DC"));

    BitmapPtr bitmap(CreateCompatibleBitmap(screen.get(), width, height));
    if (!bitmap)
        return R::err(CaptureError::captureFailed("Failed to create bitmap"));

    HGDIOBJ previous = SelectObject(mem.get(), bitmap.get());
    const BOOL blitted = BitBlt(mem.get(),
                                0,
                                0,
                                width,
                                height,
                                screen.get(),
                                output.rect.left,
                                output.rect.top,
                                SRCCOPY | CAPTUREBLT);
    SelectObject(mem.get(), previous);
    if (!blitted)
        return R::err(CaptureError::captureFailed("BitBlt failed"));

    BITMAPINFO info{};
    info.bmiHeader.biSize = sizeof(BITMAPINFOHEADER);
    info.bmiHeader.biWidth = width;
    info.bmiHeader.biHeight = -height; // top-down
    info.bmiHeader.biPlanes = 1;
    info.bmiHeader.biBitCount = 32;
    info.bmiHeader.biCompression = BI_RGB;

    RawFrame frame;
    frame.timestamp = timestamp;
    frame.width = output.display.width;
    frame.height = output.display.height;
    frame.format = PixelFormat::BGRA8;
    frame.data.resize(frame.expectedSize());

    if (GetDIBits(mem.get(),
                  bitmap.get(),
                  0,
                  static_cast<UINT>(height),
                  frame.data.data(),
                  &info,
                  DIB_RGB_COLORS) == 0)
        return R::err(CaptureError::captureFailed("GetDIBits failed"));

    // BI_RGB leaves the fourth byte undefined
    for (usize i = 3; i < frame.data.size(); i += kBytesPerPixel)
        frame.data[i] = 255;

    return R::ok(std::move(frame));
}

} // namespace

struct WindowsScreenCapture::Duplication {
    u32 displayId{0};
    u32 width{0};
    u32 height{0};
    ComPtr<ID3D11Device> device;
    ComPtr<ID3D11DeviceContext> context;
    ComPtr<IDXGIOutputDuplication> duplication;
    ComPtr<ID3D11Texture2D> staging;

    static Result<std::unique_ptr<Duplication>, DxgiFailure> open(u32 displayId);
    Result<RawFrame, DxgiFailure> grab();
};

Result<std::unique_ptr<WindowsScreenCapture::Duplication>, DxgiFailure>
WindowsScreenCapture::Duplication::open(u32 displayId) {
    using R = Result<std::unique_ptr<Duplication>, DxgiFailure>;
    const auto [adapterIndex, outputIndex] = unpackDisplayId(displayId);

    ComPtr<IDXGIFactory1> factory;
    HRESULT hr = CreateDXGIFactory1(__uuidof(IDXGIFactory1),
                                    reinterpret_cast<void**>(factory.GetAddressOf()));
    if (FAILED(hr))
        return R::err({hr, hresultText("Failed to create DXGI factory", hr)});

    ComPtr<IDXGIAdapter1> adapter;
    hr = factory->EnumAdapters1(adapterIndex, &adapter);
    if (FAILED(hr))
        return R::err({hr, hresultText("Adapter not found", hr)});

    ComPtr<IDXGIOutput> output;
    hr = adapter->EnumOutputs(outputIndex, &output);
    if (FAILED(hr))
        return R::err({hr, hresultText("Output not found", hr)});

    ComPtr<IDXGIOutput1> output1;
    hr = output.As(&output1);
    if (FAILED(hr))
        return R::err({hr, hresultText("IDXGIOutput1 not available", hr)});

    DXGI_OUTPUT_DESC desc;
    hr = output->GetDesc(&desc);
    if (FAILED(hr))
        return R::err({hr, hresultText("Failed to get output description", hr)});

    auto dup = std::make_unique<Duplication>();
    dup->displayId = displayId;
    dup->width = static_cast<u32>(desc.DesktopCoordinates.right -
                                  desc.DesktopCoordinates.left);
    dup->height = static_cast<u32>(desc.DesktopCoordinates.bottom -
                                   desc.DesktopCoordinates.top);

    // The device must live on the adapter that owns the output
    D3D_FEATURE_LEVEL featureLevel;
    const D3D_FEATURE_LEVEL levels[] = {
            D3D_FEATURE_LEVEL_11_0, D3D_FEATURE_LEVEL_10_1, D3D_FEATURE_LEVEL_10_0};
    hr = D3D11CreateDevice(adapter.Get(),
                           D3D_DRIVER_TYPE_UNKNOWN,
                           nullptr,
                           0,
                           levels,
                           ARRAYSIZE(levels),
                           D3D11_SDK_VERSION,
                           &dup->device,
                           &featureLevel,
                           &dup->context);
    if (FAILED(hr))
        return R::err({hr, hresultText("Failed to create D3D11 device", hr)});

    hr = output1->DuplicateOutput(dup->device.Get(), &dup->duplication);
    if (FAILED(hr)) {
        return R::err({hr,
                       hr == E_ACCESSDENIED
                               ? hresultText("Desktop duplication access denied", hr)
                               : hresultText("Failed to duplicate output", hr)});
    }

    D3D11_TEXTURE2D_DESC tex{};
    tex.Width = dup->width;
    tex.Height = dup->height;
    tex.MipLevels = 1;
    tex.ArraySize = 1;
    tex.Format = DXGI_FORMAT_B8G8R8A8_UNORM;
    tex.SampleDesc.Count = 1;
    tex.Usage = D3D11_USAGE_STAGING;
    tex.CPUAccessFlags = D3D11_CPU_ACCESS_READ;
    hr = dup->device->CreateTexture2D(&tex, nullptr, &dup->staging);
    if (FAILED(hr))
        return R::err({hr, hresultText("Failed to create staging texture", hr)});

    return R::ok(std::move(dup));
}

Result<RawFrame, DxgiFailure> WindowsScreenCapture::Duplication::grab() {
    using R = Result<RawFrame, DxgiFailure>;
    const i64 timestamp = nowMillis();

    DXGI_OUTDUPL_FRAME_INFO frameInfo;
    ComPtr<IDXGIResource> resource;
    HRESULT hr = duplication->AcquireNextFrame(kAcquireTimeoutMs, &frameInfo, &resource);
    if (hr == DXGI_ERROR_WAIT_TIMEOUT)
        return R::err({hr, "Timeout waiting for frame"});
    if (FAILED(hr))
        return R::err({hr, hresultText("Failed to acquire frame", hr)});

    // ReleaseFrame on every exit from here on
    struct FrameGuard {
        IDXGIOutputDuplication* dup;
        ~FrameGuard() {
            dup->ReleaseFrame();
        }
    } guard{duplication.Get()};

    ComPtr<ID3D11Texture2D> texture;
    hr = resource.As(&texture);
    if (FAILED(hr))
        return R::err({hr, hresultText("Desktop resource is not a texture", hr)});

    context->CopyResource(staging.Get(), texture.Get());

    D3D11_MAPPED_SUBRESOURCE mapped;
    hr = context->Map(staging.Get(), 0, D3D11_MAP_READ, 0, &mapped);
    if (FAILED(hr))
        return R::err({hr, hresultText("Failed to map staging texture", hr)});

    auto pixels = pixel::stripRowPadding(static_cast<const u8*>(mapped.pData),
                                         static_cast<usize>(mapped.RowPitch) * height,
                                         width,
                                         height,
                                         mapped.RowPitch);
    context->Unmap(staging.Get(), 0);
    if (!pixels)
        return R::err({E_FAIL, pixels.error().message});

    RawFrame frame;
    frame.timestamp = timestamp;
    frame.width = width;
    frame.height = height;
    frame.data = std::move(*pixels);
    frame.format = PixelFormat::BGRA8;
    return R::ok(std::move(frame));
}

WindowsScreenCapture::WindowsScreenCapture() = default;
WindowsScreenCapture::~WindowsScreenCapture() = default;

CaptureResult<std::unique_ptr<WindowsScreenCapture>> WindowsScreenCapture::create() {
    return CaptureResult<std::unique_ptr<WindowsScreenCapture>>::ok(
            std::unique_ptr<WindowsScreenCapture>(new WindowsScreenCapture()));
}

CaptureResult<std::vector<Display>> WindowsScreenCapture::getDisplays() {
    auto outputs = enumerateOutputs();
    if (!outputs)
        return CaptureResult<std::vector<Display>>::err(outputs.error());

    std::vector<Display> displays;
    displays.reserve(outputs->size());
    for (auto& o : *outputs)
        displays.push_back(std::move(o.display));
    return CaptureResult<std::vector<Display>>::ok(std::move(displays));
}

CaptureResult<RawFrame> WindowsScreenCapture::captureFrame(u32 displayId) {
    using R = CaptureResult<RawFrame>;

    auto output = findOutput(displayId);
    if (!output)
        return R::err(output.error());

    DxgiFailure failure;
    {
        std::lock_guard lock(duplicationMutex_);
        if (!duplication_ || duplication_->displayId != displayId) {
            duplication_.reset();
            auto opened = Duplication::open(displayId);
            if (opened)
                duplication_ = std::move(*opened);
            else
                failure = opened.error();
        }

        if (duplication_) {
            auto frame = duplication_->grab();
            if (frame)
                return R::ok(std::move(*frame));
            failure = frame.error();
            if (failure.hr != DXGI_ERROR_WAIT_TIMEOUT)
                duplication_.reset();
        }
    }

    if (!shouldFallBackToGdi(failure.hr))
        return R::err(CaptureError::captureFailed(failure.message));

    LOG_DEBUG("Desktop duplication unavailable: {}. Falling back to GDI.",
              failure.message);
    return captureGdi(*output);
}

void WindowsScreenCapture::onCaptureStopped() {
    std::lock_guard lock(duplicationMutex_);
    duplication_.reset();
}

} // namespace oc
