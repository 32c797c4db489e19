#include "LinuxScreenCapture.hpp"
#include <cstdlib>
#include <string>
#include "capture/PixelLayout.hpp"
#include "core/Logger.hpp"

// Xlib defines macros such as None, Bool and Status; keep it last
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xrandr.h>

namespace oc {

namespace {

struct XDisplayDeleter {
    void operator()(::Display* d) const {
        if (d)
            XCloseDisplay(d);
    }
};
struct XImageDeleter {
    void operator()(XImage* img) const {
        if (img)
            XDestroyImage(img);
    }
};
struct XRRScreenResourcesDeleter {
    void operator()(XRRScreenResources* r) const {
        if (r)
            XRRFreeScreenResources(r);
    }
};
struct XRROutputInfoDeleter {
    void operator()(XRROutputInfo* o) const {
        if (o)
            XRRFreeOutputInfo(o);
    }
};
struct XRRCrtcInfoDeleter {
    void operator()(XRRCrtcInfo* c) const {
        if (c)
            XRRFreeCrtcInfo(c);
    }
};

using XDisplayPtr = std::unique_ptr<::Display, XDisplayDeleter>;
using XImagePtr = std::unique_ptr<XImage, XImageDeleter>;
using XRRScreenResourcesPtr =
        std::unique_ptr<XRRScreenResources, XRRScreenResourcesDeleter>;
using XRROutputInfoPtr = std::unique_ptr<XRROutputInfo, XRROutputInfoDeleter>;
using XRRCrtcInfoPtr = std::unique_ptr<XRRCrtcInfo, XRRCrtcInfoDeleter>;

// A display plus where it sits on the root window
struct Monitor {
    Display display;
    int x{0};
    int y{0};
};

constexpr const char* kWaylandUnsupported =
        "Wayland screen capture needs the xdg-desktop-portal ScreenCast "
        "interface and a PipeWire stream, which this build does not "
        "provide. Log in to an X11 session to record the screen.";

CaptureResult<XDisplayPtr> openDisplay() {
    XDisplayPtr dpy(XOpenDisplay(nullptr));
    if (!dpy)
        return CaptureResult<XDisplayPtr>::err(
                CaptureError::captureFailed("Failed to open X11 display"));
    return CaptureResult<XDisplayPtr>::ok(std::move(dpy));
}

Monitor rootMonitor(::Display* dpy, Window root) {
    Window rootReturn = 0;
    int x = 0;
    int y = 0;
    unsigned int width = 0;
    unsigned int height = 0;
    unsigned int border = 0;
    unsigned int depth = 0;
    if (!XGetGeometry(dpy,
                      root,
                      &rootReturn,
                      &x,
                      &y,
                      &width,
                      &height,
                      &border,
                      &depth)) {
        Screen* s = DefaultScreenOfDisplay(dpy);
        width = static_cast<unsigned int>(s->width);
        height = static_cast<unsigned int>(s->height);
    }

    Monitor m;
    m.display.id = 0;
    m.display.name = "Default Display (" + std::to_string(width) + "x" +
                     std::to_string(height) + ")";
    m.display.width = width;
    m.display.height = height;
    m.display.isPrimary = true;
    return m;
}

std::vector<Monitor> randrMonitors(::Display* dpy, Window root) {
    std::vector<Monitor> out;

    int eventBase = 0;
    int errorBase = 0;
    if (!XRRQueryExtension(dpy, &eventBase, &errorBase)) {
        LOG_DEBUG("RandR extension not available");
        return out;
    }

    // The Current variant reads cached state; the plain call re-queries every output
    XRRScreenResourcesPtr res(XRRGetScreenResourcesCurrent(dpy, root));
    if (!res)
        return out;

    const RROutput primary = XRRGetOutputPrimary(dpy, root);
    bool havePrimary = false;

    for (int i = 0; i < res->noutput; ++i) {
        const RROutput output = res->outputs[i];
        XRROutputInfoPtr info(XRRGetOutputInfo(dpy, res.get(), output));
        if (!info || info->connection != RR_Connected || info->crtc == 0)
            continue;

        XRRCrtcInfoPtr crtc(XRRGetCrtcInfo(dpy, res.get(), info->crtc));
        if (!crtc || crtc->width == 0 || crtc->height == 0)
            continue;

        std::string name = info->name && info->nameLen > 0
                ? std::string(info->name, static_cast<usize>(info->nameLen))
                : "Display " + std::to_string(i);

        Monitor m;
        m.display.id = static_cast<u32>(i);
        m.display.name = name + " (" + std::to_string(crtc->width) + "x" +
                         std::to_string(crtc->height) + ")";
        m.display.width = crtc->width;
        m.display.height = crtc->height;
        m.display.isPrimary = output == primary;
        m.x = crtc->x;
        m.y = crtc->y;
        havePrimary = havePrimary || m.display.isPrimary;
        out.push_back(std::move(m));
    }

    if (!havePrimary) {
        for (auto& m : out) {
            if (m.x == 0 && m.y == 0) {
                m.display.isPrimary = true;
                break;
            }
        }
    }
    return out;
}

std::vector<Monitor> enumerateMonitors(::Display* dpy) {
    Window root = RootWindow(dpy, DefaultScreen(dpy));
    auto monitors = randrMonitors(dpy, root);
    if (monitors.empty())
        monitors.push_back(rootMonitor(dpy, root));
    return monitors;
}

// Xlib reports protocol errors through a process-wide handler whose default
// exits the process. XErrorTrap swaps in a recording handler for its scope.
thread_local int trappedErrorCode = 0;

int recordXError(::Display* /*dpy*/, XErrorEvent* event) {
    trappedErrorCode = event->error_code;
    return 0;
}

class XErrorTrap {
public:
    explicit XErrorTrap(::Display* dpy) : dpy_(dpy) {
        trappedErrorCode = 0;
        previous_ = XSetErrorHandler(recordXError);
    }
    ~XErrorTrap() {
        XSync(dpy_, False);
        XSetErrorHandler(previous_);
    }

    XErrorTrap(const XErrorTrap&) = delete;
    XErrorTrap& operator=(const XErrorTrap&) = delete;

    // Flushes pending requests; 0 when none of them failed
    int sync() {
        XSync(dpy_, False);
        return trappedErrorCode;
    }

private:
    ::Display* dpy_;
    XErrorHandler previous_{nullptr};
};

std::string xErrorText(::Display* dpy, int code) {
    char buf[256] = {};
    XGetErrorText(dpy, code, buf, sizeof(buf));
    return buf;
}

CaptureResult<RawFrame> grabRegion(::Display* dpy,
                                   int x,
                                   int y,
                                   u32 width,
                                   u32 height,
                                   i64 timestamp) {
    using R = CaptureResult<RawFrame>;
    if (width == 0 || height == 0)
        return R::err(CaptureError::captureFailed("Empty capture region"));

    Window root = RootWindow(dpy, DefaultScreen(dpy));
    XErrorTrap trap(dpy);
    XImagePtr image(XGetImage(dpy, root, x, y, width, height, AllPlanes, ZPixmap));
    if (int code = trap.sync(); code != 0 || !image) {
        // Typically BadMatch after a monitor was unplugged or resized
        return R::err(CaptureError::captureFailed(
                "Failed to capture X11 image at " + std::to_string(x) + "," +
                std::to_string(y) + " " + std::to_string(width) + "x" +
                std::to_string(height) +
                (code != 0 ? ": " + xErrorText(dpy, code) : std::string())));
    }

    const usize dataSize = static_cast<usize>(image->bytes_per_line) *
                           static_cast<usize>(image->height);
    auto pixels = pixel::packX11Pixels(
            reinterpret_cast<const u8*>(image->data),
            dataSize,
            static_cast<u32>(image->width),
            static_cast<u32>(image->height),
            static_cast<usize>(image->bytes_per_line),
            static_cast<u32>(image->bits_per_pixel),
            static_cast<u32>(image->depth));
    if (!pixels)
        return R::err(CaptureError::captureFailed(pixels.error().message));

    RawFrame frame;
    frame.timestamp = timestamp;
    frame.width = static_cast<u32>(image->width);
    frame.height = static_cast<u32>(image->height);
    frame.data = std::move(*pixels);
    frame.format = PixelFormat::BGRA8;
    return R::ok(std::move(frame));
}

Display waylandPlaceholder() {
    Display d;
    d.id = 0;
    d.name = "Primary Display (Wayland)";
    d.width = 1920;
    d.height = 1080;
    d.isPrimary = true;
    return d;
}

} // namespace

std::string_view toString(DisplayServer server) {
    switch (server) {
    case DisplayServer::X11:
        return "X11";
    case DisplayServer::Wayland:
        return "Wayland";
    case DisplayServer::Unknown:
        break;
    }
    return "Unknown";
}

DisplayServer detectDisplayServer(const char* waylandDisplay,
                                  const char* x11Display) {
    if (waylandDisplay)
        return DisplayServer::Wayland;
    if (x11Display)
        return DisplayServer::X11;
    return DisplayServer::Unknown;
}

DisplayServer detectDisplayServer() {
    return detectDisplayServer(std::getenv("WAYLAND_DISPLAY"),
                               std::getenv("DISPLAY"));
}

CaptureResult<std::unique_ptr<LinuxScreenCapture>> LinuxScreenCapture::create() {
    using R = CaptureResult<std::unique_ptr<LinuxScreenCapture>>;
    auto server = detectDisplayServer();
    if (server == DisplayServer::Unknown) {
        return R::err(CaptureError::captureFailed(
                "No display server detected. Neither DISPLAY nor "
                "WAYLAND_DISPLAY is set."));
    }
    if (server == DisplayServer::Wayland) {
        LOG_WARN("Wayland session detected; frame capture is not supported");
    }
    LOG_INFO("Linux screen capture using {}", toString(server));
    return R::ok(std::unique_ptr<LinuxScreenCapture>(
            new LinuxScreenCapture(server)));
}

std::string_view LinuxScreenCapture::backendName() const {
    return server_ == DisplayServer::Wayland ? "linux-wayland" : "linux-x11";
}

CaptureResult<std::vector<Display>> LinuxScreenCapture::getDisplays() {
    switch (server_) {
    case DisplayServer::X11:
        return getDisplaysX11();
    case DisplayServer::Wayland:
        return CaptureResult<std::vector<Display>>::ok({waylandPlaceholder()});
    case DisplayServer::Unknown:
        break;
    }
    return CaptureResult<std::vector<Display>>::err(
            CaptureError::captureFailed("No display server detected"));
}

CaptureResult<RawFrame> LinuxScreenCapture::captureFrame(u32 displayId) {
    switch (server_) {
    case DisplayServer::X11:
        return captureFrameX11(displayId);
    case DisplayServer::Wayland:
        return CaptureResult<RawFrame>::err(
                CaptureError::notSupported(kWaylandUnsupported));
    case DisplayServer::Unknown:
        break;
    }
    return CaptureResult<RawFrame>::err(
            CaptureError::captureFailed("No display server detected"));
}

CaptureResult<std::vector<Display>> LinuxScreenCapture::getDisplaysX11() {
    auto dpy = openDisplay();
    if (!dpy)
        return CaptureResult<std::vector<Display>>::err(dpy.error());

    std::vector<Display> displays;
    for (auto& m : enumerateMonitors(dpy->get())) {
        displays.push_back(std::move(m.display));
    }
    return CaptureResult<std::vector<Display>>::ok(std::move(displays));
}

CaptureResult<RawFrame> LinuxScreenCapture::captureFrameX11(u32 displayId) {
    using R = CaptureResult<RawFrame>;
    const i64 timestamp = nowMillis();

    auto dpy = openDisplay();
    if (!dpy)
        return R::err(dpy.error());

    auto monitors = enumerateMonitors(dpy->get());
    const Monitor* target = nullptr;
    for (const auto& m : monitors) {
        if (m.display.id == displayId) {
            target = &m;
            break;
        }
    }
    if (!target)
        return R::err(CaptureError::displayNotFound(displayId));

    return grabRegion(dpy->get(),
                      target->x,
                      target->y,
                      target->display.width,
                      target->display.height,
                      timestamp);
}

CaptureResult<RawFrame> LinuxScreenCapture::captureRegion(i32 x,
                                                          i32 y,
                                                          u32 width,
                                                          u32 height) {
    using R = CaptureResult<RawFrame>;
    if (server_ != DisplayServer::X11)
        return R::err(CaptureError::notSupported(kWaylandUnsupported));

    const i64 timestamp = nowMillis();
    auto dpy = openDisplay();
    if (!dpy)
        return R::err(dpy.error());
    return grabRegion(dpy->get(), x, y, width, height, timestamp);
}

} // namespace oc
